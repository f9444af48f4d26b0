#pragma once

#include <optional>
#include <string>

namespace core::utils {

    /**
     * @brief ISO-8601 timestamp split into its wall clock and its zone designator.
     */
    struct ParsedTimestamp {
        long long wallSeconds = 0;   // civil fields counted as if they were UTC
        bool hasZone = false;
        int zoneOffsetMinutes = 0;
    };

    /**
     * @brief Parses "YYYY-MM-DD[THH:MM[:SS[.fff]]][Z|+HH:MM|-HH:MM]" ('T' or ' ').
     * @return std::nullopt when the text is not a timestamp
     */
    std::optional<ParsedTimestamp> parseIsoTimestamp(const std::string &text);

    /**
     * @brief "dd/mm/yyyy HH:MM". Zoned timestamps are shifted to displayOffsetMinutes,
     * unzoned ones are printed as written.
     */
    std::string formatDisplayDateTime(const ParsedTimestamp &timestamp, int displayOffsetMinutes);

    /**
     * @brief Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ".
     */
    std::string currentIsoTimestamp();

} // namespace core::utils
