#pragma once

#include <string>
#include <cstddef>

namespace core::utils {

    /**
     * @brief Number of UTF-8 code points; invalid bytes count as one each.
     */
    size_t codePointCount(const std::string &text);

    /**
     * @brief First `maxCodePoints` code points of `text`, never splitting a sequence.
     */
    std::string truncateCodePoints(const std::string &text, size_t maxCodePoints);

    std::string padEnd(const std::string &text, size_t width, char fill = ' ');

    std::string padStart(const std::string &text, size_t width, char fill = ' ');

    /**
     * @brief Truncate then pad on the right, so the result is exactly `width` code points.
     */
    std::string fitColumn(const std::string &text, size_t width);

} // namespace core::utils
