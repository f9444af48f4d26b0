#include "core/escpos/EscPosCommandBuilder.hpp"
#include "formatter/TicketFormatter.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace formatter;

namespace {
    const std::string SEP(32, '=');
    const std::string LINE(32, '-');

    TicketData bookingData() {
        TicketData data;
        data.licensePlate = "123 TU 456";
        data.destinationName = "Monastir";
        data.stationName = "Station Ksar Hellal";
        data.routeName = "Ksar Hellal - Monastir";
        data.seatNumber = 3;
        data.totalAmount = 15.45;
        data.stationFee = 0.15;
        data.basePrice = 5.0;
        data.createdBy = "Agent Test";
        data.createdAt = "2025-10-15T08:30:00.000Z";
        return data;
    }

    bool contains(const std::vector<std::string> &lines, const std::string &line) {
        return std::find(lines.begin(), lines.end(), line) != lines.end();
    }

    bool containsPrefix(const std::vector<std::string> &lines, const std::string &prefix) {
        return std::any_of(lines.begin(), lines.end(), [&](const std::string &l) {
            return l.compare(0, prefix.size(), prefix) == 0;
        });
    }
}

TEST(TicketFormatterTest, BookingTicketLayout) {
    TicketFormatter formatter;
    auto lines = formatter.format(bookingData(), TicketKind::Booking);

    std::vector<std::string> expected{
        SEP,
        "STE DHRAIFF SERVICES",
        "TRANSPORT",
        SEP,
        "",
        "BILLET CLIENT",
        LINE,
        "Vehicule: 123 TU 456",
        "Destination: Monastir",
        "Station: Station Ksar Hellal",
        "Sieges: 3",
        "Prix par siege: 5.00 TND",
        "Prix base: 15.00 TND",
        "Frais: 0.45 TND",
        LINE,
        "Montant TTC: 15.450 TND",
        LINE,
        "Date: 15/10/2025 09:30",
        "Agent: Agent Test",
        "",
        SEP,
        "Merci et bon voyage!",
        SEP
    };
    EXPECT_EQ(lines, expected);
}

TEST(TicketFormatterTest, BookingTotalIsNeverRecomputed) {
    TicketData data = bookingData();
    data.totalAmount = 99.999;

    auto lines = TicketFormatter().format(data, TicketKind::Booking);
    EXPECT_TRUE(contains(lines, "Montant TTC: 99.999 TND"));
    EXPECT_TRUE(contains(lines, "Prix base: 15.00 TND"));
}

TEST(TicketFormatterTest, BookingDefaultsFeeAndSeatCount) {
    TicketData data = bookingData();
    data.stationFee.reset();
    data.basePrice.reset();
    data.seatNumber = 0;
    data.totalAmount = 2.15;

    auto lines = TicketFormatter().format(data, TicketKind::Booking);
    EXPECT_TRUE(contains(lines, "Sieges: 1"));
    EXPECT_TRUE(contains(lines, "Frais: 0.15 TND"));
    EXPECT_FALSE(containsPrefix(lines, "Prix base:"));
    EXPECT_FALSE(containsPrefix(lines, "Prix par siege:"));
}

TEST(TicketFormatterTest, OperatorNameIsConfigurable) {
    LayoutOptions options;
    options.operatorName = "LOUAGE SFAX";
    auto lines = TicketFormatter(options).format(bookingData(), TicketKind::Booking);
    EXPECT_EQ(lines[1], "LOUAGE SFAX");
}

TEST(TicketFormatterTest, DayPass) {
    TicketData data;
    data.licensePlate = "789 TU 012";
    data.destinationName = "Toutes destinations";
    data.routeName = "Pass Journee";
    data.stationName = "Station Ksar Hellal";
    data.seatNumber = 5;
    data.totalAmount = 2.0;
    data.createdBy = "Agent Test";
    data.createdAt = "2025-10-15T08:30:00Z";

    auto lines = TicketFormatter().format(data, TicketKind::DayPass);

    EXPECT_EQ(lines[5], "PASS JOURNEE");
    EXPECT_TRUE(contains(lines, "Route: Pass Journee"));
    EXPECT_TRUE(contains(lines, "Montant: 2.000 TND"));
    EXPECT_FALSE(containsPrefix(lines, "Sieges"));
    EXPECT_FALSE(containsPrefix(lines, "Frais"));

    auto valid = std::find(lines.begin(), lines.end(), "Valide toute la journee");
    ASSERT_NE(valid, lines.end());
    EXPECT_EQ(*(valid + 1), "");
    EXPECT_EQ(*(valid + 2), SEP);
    EXPECT_EQ(lines.back(), SEP);
}

TEST(TicketFormatterTest, DayPassFallsBackToDestinationForRoute) {
    TicketData data;
    data.destinationName = "Sousse";
    data.totalAmount = 2.0;

    auto lines = TicketFormatter().format(data, TicketKind::DayPass);
    EXPECT_TRUE(contains(lines, "Route: Sousse"));
    EXPECT_EQ(TicketFormatter::effectiveSeatCount(data, TicketKind::DayPass), 0);
}

TEST(TicketFormatterTest, ExitPassWithBookedSeats) {
    TicketData data;
    data.licensePlate = "345 TU 678";
    data.destinationName = "Sousse";
    data.stationName = "Station Ksar Hellal";
    data.seatNumber = 4;
    data.basePrice = 5.0;
    data.vehicleCapacity = 8;
    data.totalAmount = 20.0;
    data.exitPassCount = 12;

    auto lines = TicketFormatter().format(data, TicketKind::ExitPass);

    EXPECT_EQ(lines[5], "AUTORISATION DE SORTIE");
    EXPECT_TRUE(contains(lines, "Sortie No: 12"));
    EXPECT_TRUE(contains(lines, "Sieges reserves: 4"));
    EXPECT_TRUE(contains(lines, "Prix de base: 20.00 TND"));
    EXPECT_TRUE(contains(lines, "Montant Total: 20.000 TND"));
    EXPECT_FALSE(containsPrefix(lines, "Frais de service"));
    EXPECT_TRUE(contains(lines, "Sortie autorisee"));
}

TEST(TicketFormatterTest, ExitPassForEmptyVehicleChargesFullCapacity) {
    TicketData data;
    data.licensePlate = "345 TU 678";
    data.seatNumber = 8;
    data.vehicleCapacity = 8;
    data.basePrice = 5.0;
    data.totalAmount = 1.2;

    auto lines = TicketFormatter().format(data, TicketKind::ExitPass);

    EXPECT_TRUE(contains(lines, "Capacite vehicule: 8 sieges"));
    EXPECT_TRUE(contains(lines, "Frais de service: 1.20 TND"));
    EXPECT_TRUE(contains(lines, "Montant Total: 1.200 TND"));
    EXPECT_FALSE(containsPrefix(lines, "Sieges reserves"));
}

TEST(TicketFormatterTest, ExitPassWithUnknownCapacityUsesSeatBranch) {
    TicketData data;
    data.seatNumber = 8;
    data.basePrice = 2.5;
    data.totalAmount = 20.0;

    auto lines = TicketFormatter().format(data, TicketKind::ExitPass);

    EXPECT_TRUE(contains(lines, "Sieges reserves: 8"));
    EXPECT_TRUE(contains(lines, "Prix de base: 20.00 TND"));
    EXPECT_FALSE(containsPrefix(lines, "Capacite vehicule"));
    EXPECT_FALSE(containsPrefix(lines, "Sortie No"));
}

TEST(TicketFormatterTest, StaffNameTakesPrecedenceOverCreatedBy) {
    TicketData data = bookingData();
    data.staffFirstName = "Ali";
    data.staffLastName = "Ben Salah";

    auto lines = TicketFormatter().format(data, TicketKind::Booking);
    EXPECT_TRUE(contains(lines, "Agent: Ali Ben Salah"));
    EXPECT_FALSE(contains(lines, "Agent: Agent Test"));

    data.staffLastName.clear();
    lines = TicketFormatter().format(data, TicketKind::Booking);
    EXPECT_TRUE(contains(lines, "Agent: Agent Test"));
}

TEST(TicketFormatterTest, UnparseableDateIsPrintedRaw) {
    TicketData data = bookingData();
    data.createdAt = "hier soir";

    auto lines = TicketFormatter().format(data, TicketKind::Booking);
    EXPECT_TRUE(contains(lines, "Date: hier soir"));
}

TEST(TicketFormatterTest, FormatThenEncodeIsDeterministic) {
    TicketFormatter formatter;
    auto first = core::escpos::EscPosCommandBuilder::encode(formatter.format(bookingData(), TicketKind::Booking));
    auto second = core::escpos::EscPosCommandBuilder::encode(formatter.format(bookingData(), TicketKind::Booking));
    EXPECT_EQ(first, second);
}

TEST(TicketFormatterTest, KindNames) {
    EXPECT_EQ(ticketKindFromString("booking"), TicketKind::Booking);
    EXPECT_EQ(ticketKindFromString("daypass"), TicketKind::DayPass);
    EXPECT_EQ(ticketKindFromString("exitpass"), TicketKind::ExitPass);
    EXPECT_FALSE(ticketKindFromString("statistics").has_value());
    EXPECT_EQ(ticketKindToString(TicketKind::DayPass), "daypass");
}
