#include "formatter/TicketLayout.hpp"
#include "core/utils/MoneyFormatter.hpp"
#include "core/utils/Timestamp.hpp"

namespace formatter {

    const char *const SEPARATOR = "================================";
    const char *const RULE = "--------------------------------";
    const char *const CURRENCY = " TND";

    TicketLayout::TicketLayout(LayoutOptions options)
            : options_(std::move(options)) {
    }

    void TicketLayout::appendHeader(std::vector<std::string> &lines) const {
        lines.emplace_back(SEPARATOR);
        lines.push_back(options_.operatorName);
        lines.emplace_back("TRANSPORT");
        lines.emplace_back(SEPARATOR);
    }

    void TicketLayout::appendTicketFooter(std::vector<std::string> &lines) const {
        lines.emplace_back("");
        lines.emplace_back(SEPARATOR);
        lines.emplace_back("Merci et bon voyage!");
        lines.emplace_back(SEPARATOR);
    }

    void TicketLayout::appendDate(std::vector<std::string> &lines, const std::string &isoTimestamp) const {
        if (isoTimestamp.empty()) return;

        auto parsed = core::utils::parseIsoTimestamp(isoTimestamp);
        if (!parsed) {
            lines.push_back("Date: " + isoTimestamp);
            return;
        }
        lines.push_back("Date: " + core::utils::formatDisplayDateTime(*parsed, options_.displayUtcOffsetMinutes));
    }

    std::string TicketLayout::money(double amount) {
        return core::utils::formatLineItem(amount) + CURRENCY;
    }

    std::string TicketLayout::payable(double amount) {
        return core::utils::formatPayableTotal(amount) + CURRENCY;
    }

} // namespace formatter
