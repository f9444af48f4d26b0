//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "formatter/TicketData.hpp"
#include "formatter/TicketLayout.hpp"
#include <string>
#include <vector>

namespace formatter {

    /**
     * @brief Lays out booking, day pass and exit pass tickets as text lines.
     *
     * Pure: same data and options always give the same lines. The printed
     * payable total is always the caller's totalAmount, never a recomputed sum.
     */
    class TicketFormatter {
    public:
        explicit TicketFormatter(LayoutOptions options = {});

        std::vector<std::string> format(const TicketData &data, TicketKind kind) const;

        /**
         * @brief Seat count as printed: at least 1 for bookings, always 0 for day passes.
         */
        static int effectiveSeatCount(const TicketData &data, TicketKind kind);

    private:
        TicketLayout layout_;

        void formatBooking(const TicketData &data, std::vector<std::string> &lines) const;

        void formatDayPass(const TicketData &data, std::vector<std::string> &lines) const;

        void formatExitPass(const TicketData &data, std::vector<std::string> &lines) const;

        static std::string agentName(const TicketData &data);

        void appendIssuer(const TicketData &data, std::vector<std::string> &lines) const;
    };

}
