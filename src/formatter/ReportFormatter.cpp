#include "formatter/ReportFormatter.hpp"
#include "core/utils/MoneyFormatter.hpp"
#include "core/utils/Utf8Text.hpp"

namespace formatter {
    using core::utils::fitColumn;
    using core::utils::formatLineItem;
    using core::utils::padStart;

    ReportFormatter::ReportFormatter(LayoutOptions options)
            : layout_(std::move(options)) {
    }

    std::vector<std::string> ReportFormatter::format(const ReportData &report) const {
        std::vector<std::string> lines;
        lines.reserve(32 + report.staffData.size());

        layout_.appendHeader(lines);
        lines.emplace_back("");
        lines.emplace_back("RAPPORT DE REVENUS");
        lines.emplace_back(RULE);
        lines.push_back("Periode: " + report.periodLabel);
        layout_.appendDate(lines, report.createdAt);
        if (!report.createdBy.empty()) {
            lines.push_back("Agent: " + report.createdBy);
        }
        lines.emplace_back(RULE);
        lines.emplace_back("");

        lines.emplace_back("RESUME DES REVENUS");
        lines.emplace_back(RULE);
        lines.push_back("Total Sieges: " + std::to_string(report.totalSeatsBooked));
        lines.push_back("Revenus Sieges: " + TicketLayout::payable(report.totalSeatIncome));
        lines.push_back("Passes Jour: " + std::to_string(report.totalDayPassesSold));
        lines.push_back("Revenus Passes: " + TicketLayout::payable(report.totalDayPassIncome));
        lines.emplace_back(RULE);
        lines.push_back("REVENUS TOTAUX: " + TicketLayout::payable(report.totalIncome));
        lines.emplace_back(RULE);
        lines.emplace_back("");

        if (!report.staffData.empty()) {
            lines.emplace_back("PERFORMANCE DU PERSONNEL");
            lines.emplace_back(RULE);
            lines.emplace_back("Personnel | Sieges | Rev.Sieges | Passes | Rev.Passes | Total");
            lines.emplace_back(RULE);

            for (const auto &staff: report.staffData) {
                lines.push_back(tableRow(staff.name,
                                         std::to_string(staff.seats),
                                         formatLineItem(staff.seatIncome),
                                         std::to_string(staff.dayPasses),
                                         formatLineItem(staff.dayPassIncome),
                                         formatLineItem(staff.income)));
            }

            lines.emplace_back(RULE);
            lines.push_back(tableRow("TOTAL",
                                     std::to_string(report.totalSeatsBooked),
                                     formatLineItem(report.totalSeatIncome),
                                     std::to_string(report.totalDayPassesSold),
                                     formatLineItem(report.totalDayPassIncome),
                                     formatLineItem(report.totalIncome)));
            lines.emplace_back(RULE);
            lines.emplace_back("");
        }

        lines.emplace_back("Document genere automatiquement");
        lines.emplace_back("par le systeme de gestion");
        return lines;
    }

    std::string ReportFormatter::tableRow(const std::string &name, const std::string &seats,
                                          const std::string &seatIncome, const std::string &passes,
                                          const std::string &passIncome, const std::string &total) {
        return fitColumn(name, NAME_WIDTH) + " | " +
               padStart(seats, COUNT_WIDTH) + " | " +
               padStart(seatIncome, AMOUNT_WIDTH) + " | " +
               padStart(passes, COUNT_WIDTH) + " | " +
               padStart(passIncome, AMOUNT_WIDTH) + " | " +
               padStart(total, AMOUNT_WIDTH);
    }

}
