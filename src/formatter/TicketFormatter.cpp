//
// Created by Andrea on 15/10/2025.
//

#include "formatter/TicketFormatter.hpp"

namespace formatter {

    TicketFormatter::TicketFormatter(LayoutOptions options)
            : layout_(std::move(options)) {
    }

    std::vector<std::string> TicketFormatter::format(const TicketData &data, TicketKind kind) const {
        std::vector<std::string> lines;
        lines.reserve(32);

        layout_.appendHeader(lines);
        lines.emplace_back("");

        switch (kind) {
            case TicketKind::Booking:
                formatBooking(data, lines);
                break;
            case TicketKind::DayPass:
                formatDayPass(data, lines);
                break;
            case TicketKind::ExitPass:
                formatExitPass(data, lines);
                break;
        }

        layout_.appendTicketFooter(lines);
        return lines;
    }

    int TicketFormatter::effectiveSeatCount(const TicketData &data, TicketKind kind) {
        switch (kind) {
            case TicketKind::Booking:
                return data.seatNumber > 0 ? data.seatNumber : 1;
            case TicketKind::DayPass:
                return 0;
            default:
                return data.seatNumber > 0 ? data.seatNumber : 0;
        }
    }

    void TicketFormatter::formatBooking(const TicketData &data, std::vector<std::string> &lines) const {
        const int seats = effectiveSeatCount(data, TicketKind::Booking);
        const double stationFee = data.stationFee.value_or(layout_.getOptions().defaultStationFee);

        lines.emplace_back("BILLET CLIENT");
        lines.emplace_back(RULE);
        if (!data.licensePlate.empty()) {
            lines.push_back("Vehicule: " + data.licensePlate);
        }
        if (!data.destinationName.empty()) {
            lines.push_back("Destination: " + data.destinationName);
        }
        if (!data.stationName.empty()) {
            lines.push_back("Station: " + data.stationName);
        }
        lines.push_back("Sieges: " + std::to_string(seats));
        if (data.basePrice) {
            lines.push_back("Prix par siege: " + TicketLayout::money(*data.basePrice));
            lines.push_back("Prix base: " + TicketLayout::money(*data.basePrice * seats));
        }
        lines.push_back("Frais: " + TicketLayout::money(stationFee * seats));
        lines.emplace_back(RULE);
        lines.push_back("Montant TTC: " + TicketLayout::payable(data.totalAmount));
        lines.emplace_back(RULE);
        appendIssuer(data, lines);
    }

    void TicketFormatter::formatDayPass(const TicketData &data, std::vector<std::string> &lines) const {
        lines.emplace_back("PASS JOURNEE");
        lines.emplace_back(RULE);
        if (!data.licensePlate.empty()) {
            lines.push_back("Vehicule: " + data.licensePlate);
        }
        const std::string &route = data.routeName.empty() ? data.destinationName : data.routeName;
        if (!route.empty()) {
            lines.push_back("Route: " + route);
        }
        if (!data.stationName.empty()) {
            lines.push_back("Station: " + data.stationName);
        }
        lines.emplace_back(RULE);
        lines.push_back("Montant: " + TicketLayout::payable(data.totalAmount));
        lines.emplace_back(RULE);
        appendIssuer(data, lines);
        lines.emplace_back(RULE);
        lines.emplace_back("Valide toute la journee");
    }

    void TicketFormatter::formatExitPass(const TicketData &data, std::vector<std::string> &lines) const {
        const int seats = effectiveSeatCount(data, TicketKind::ExitPass);

        lines.emplace_back("AUTORISATION DE SORTIE");
        lines.emplace_back(RULE);
        if (!data.licensePlate.empty()) {
            lines.push_back("Vehicule: " + data.licensePlate);
        }
        if (!data.destinationName.empty()) {
            lines.push_back("Destination: " + data.destinationName);
        }
        if (!data.stationName.empty()) {
            lines.push_back("Station: " + data.stationName);
        }
        if (data.exitPassCount) {
            lines.push_back("Sortie No: " + std::to_string(*data.exitPassCount));
        }
        lines.emplace_back(RULE);

        const bool emptyVehicle = data.vehicleCapacity && *data.vehicleCapacity > 0 && seats == *data.vehicleCapacity;
        if (emptyVehicle) {
            // Departing without bookings: flat service fee on every seat of the vehicle
            const int capacity = *data.vehicleCapacity;
            const double fee = data.stationFee.value_or(layout_.getOptions().defaultStationFee);
            lines.push_back("Capacite vehicule: " + std::to_string(capacity) + " sieges");
            lines.push_back("Frais de service: " + TicketLayout::money(fee * capacity));
        } else if (seats > 0) {
            lines.push_back("Sieges reserves: " + std::to_string(seats));
            if (data.basePrice) {
                lines.push_back("Prix de base: " + TicketLayout::money(*data.basePrice * seats));
            }
        }

        lines.push_back("Montant Total: " + TicketLayout::payable(data.totalAmount));
        lines.emplace_back(RULE);
        appendIssuer(data, lines);
        lines.emplace_back(RULE);
        lines.emplace_back("Sortie autorisee");
    }

    std::string TicketFormatter::agentName(const TicketData &data) {
        if (!data.staffFirstName.empty() && !data.staffLastName.empty()) {
            return data.staffFirstName + " " + data.staffLastName;
        }
        return data.createdBy;
    }

    void TicketFormatter::appendIssuer(const TicketData &data, std::vector<std::string> &lines) const {
        layout_.appendDate(lines, data.createdAt);
        const std::string agent = agentName(data);
        if (!agent.empty()) {
            lines.push_back("Agent: " + agent);
        }
    }

}
