#pragma once

#include <optional>
#include <string>
#include <vector>

namespace formatter {

    enum class TicketKind {
        Booking,
        DayPass,
        ExitPass
    };

    inline std::string ticketKindToString(TicketKind kind) {
        switch (kind) {
            case TicketKind::Booking: return "booking";
            case TicketKind::DayPass: return "daypass";
            case TicketKind::ExitPass: return "exitpass";
            default: return "unknown";
        }
    }

    inline std::optional<TicketKind> ticketKindFromString(const std::string &name) {
        if (name == "booking") return TicketKind::Booking;
        if (name == "daypass") return TicketKind::DayPass;
        if (name == "exitpass") return TicketKind::ExitPass;
        return std::nullopt;
    }

    /**
     * @brief Business content of a booking, day pass or exit pass ticket.
     */
    struct TicketData {
        std::string licensePlate;
        std::string destinationName;
        std::string routeName;
        std::string stationName;
        int seatNumber = 0;
        double totalAmount = 0.0;
        std::optional<double> stationFee;   // per seat
        std::optional<double> basePrice;    // per seat
        std::optional<int> vehicleCapacity;
        std::optional<int> exitPassCount;
        std::string createdBy;
        std::string createdAt;              // ISO-8601
        std::string staffFirstName;
        std::string staffLastName;
    };

    struct StaffRow {
        std::string name;
        long long seats = 0;
        double seatIncome = 0.0;
        long long dayPasses = 0;
        double dayPassIncome = 0.0;
        double income = 0.0;
    };

    /**
     * @brief Revenue summary for one period, already aggregated by the caller.
     */
    struct ReportData {
        std::string periodLabel;
        long long totalSeatsBooked = 0;
        double totalSeatIncome = 0.0;
        long long totalDayPassesSold = 0;
        double totalDayPassIncome = 0.0;
        double totalIncome = 0.0;
        std::vector<StaffRow> staffData;
        std::string createdBy;
        std::string createdAt;
    };

} // namespace formatter
