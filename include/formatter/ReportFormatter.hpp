#pragma once

#include "formatter/TicketData.hpp"
#include "formatter/TicketLayout.hpp"
#include <string>
#include <vector>

namespace formatter {

    /**
     * @brief Revenue report: summary block, then one fixed-width row per staff member.
     */
    class ReportFormatter {
    public:
        static constexpr size_t NAME_WIDTH = 10;
        static constexpr size_t COUNT_WIDTH = 6;
        static constexpr size_t AMOUNT_WIDTH = 10;

        explicit ReportFormatter(LayoutOptions options = {});

        std::vector<std::string> format(const ReportData &report) const;

        static std::string tableRow(const std::string &name, const std::string &seats, const std::string &seatIncome,
                                    const std::string &passes, const std::string &passIncome,
                                    const std::string &total);

    private:
        TicketLayout layout_;
    };

}
