#pragma once

#include <string>
#include <vector>

namespace formatter {

    /**
     * @brief Layout constants shared by every printed document.
     */
    struct LayoutOptions {
        std::string operatorName = "STE DHRAIFF SERVICES";
        double defaultStationFee = 0.15;     // per seat, when the request has none
        int displayUtcOffsetMinutes = 60;    // Africa/Tunis
    };

    extern const char *const SEPARATOR;
    extern const char *const RULE;
    extern const char *const CURRENCY;

    class TicketLayout {
    public:
        explicit TicketLayout(LayoutOptions options = {});

        const LayoutOptions &getOptions() const { return options_; }

        void appendHeader(std::vector<std::string> &lines) const;

        void appendTicketFooter(std::vector<std::string> &lines) const;

        /**
         * @brief "Date: dd/mm/yyyy HH:MM", the raw text when it does not parse,
         * nothing when empty.
         */
        void appendDate(std::vector<std::string> &lines, const std::string &isoTimestamp) const;

        static std::string money(double amount);

        static std::string payable(double amount);

    private:
        LayoutOptions options_;
    };

} // namespace formatter
