#pragma once

#include "../BaseModel.hpp"
#include "../JsonFields.hpp"
#include "core/utils/Timestamp.hpp"
#include "formatter/TicketData.hpp"
#include <optional>
#include <string>

namespace connector::models::printer {

    /**
     * @brief Body of POST /print/booking|daypass|exitpass.
     *
     * fromJson() throws core::types::ValidationException on missing totalAmount,
     * wrongly typed fields or an unparseable createdAt. A missing createdAt is
     * stamped with the current time.
     */
    class TicketRequest : public BaseModel {
    public:
        formatter::TicketData ticket;
        std::optional<core::types::PrinterEndpoint> printerConfig;

        TicketRequest() = default;

        explicit TicketRequest(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            nlohmann::json json{
                {"licensePlate",    ticket.licensePlate},
                {"destinationName", ticket.destinationName},
                {"routeName",       ticket.routeName},
                {"stationName",     ticket.stationName},
                {"seatNumber",      ticket.seatNumber},
                {"totalAmount",     ticket.totalAmount},
                {"createdBy",       ticket.createdBy},
                {"createdAt",       ticket.createdAt},
                {"staffFirstName",  ticket.staffFirstName},
                {"staffLastName",   ticket.staffLastName}
            };
            if (ticket.stationFee) json["stationFee"] = *ticket.stationFee;
            if (ticket.basePrice) json["basePrice"] = *ticket.basePrice;
            if (ticket.vehicleCapacity) json["vehicleCapacity"] = *ticket.vehicleCapacity;
            if (ticket.exitPassCount) json["exitPassCount"] = *ticket.exitPassCount;
            if (printerConfig) {
                json["printerConfig"] = {{"ip", printerConfig->host}, {"port", printerConfig->port}};
            }
            return json;
        }

        void fromJson(const nlohmann::json &json) override {
            if (!json.is_object()) {
                throw core::types::ValidationException("ticket body must be a JSON object");
            }

            ticket = formatter::TicketData{};
            ticket.licensePlate = fields::optionalString(json, "licensePlate");
            ticket.destinationName = fields::optionalString(json, "destinationName");
            ticket.routeName = fields::optionalString(json, "routeName");
            ticket.stationName = fields::optionalString(json, "stationName");
            ticket.seatNumber = fields::optionalInt(json, "seatNumber").value_or(0);
            ticket.totalAmount = fields::requiredNumber(json, "totalAmount");
            ticket.stationFee = fields::optionalNumber(json, "stationFee");
            ticket.basePrice = fields::optionalNumber(json, "basePrice");

            if (auto capacity = fields::optionalInt(json, "vehicleCapacity")) {
                ticket.vehicleCapacity = *capacity;
            }
            if (auto count = fields::optionalInt(json, "exitPassCount")) {
                ticket.exitPassCount = *count;
            }

            ticket.createdBy = fields::optionalString(json, "createdBy");
            ticket.createdAt = fields::optionalString(json, "createdAt");
            if (ticket.createdAt.empty()) {
                ticket.createdAt = core::utils::currentIsoTimestamp();
            } else if (!core::utils::parseIsoTimestamp(ticket.createdAt)) {
                throw core::types::ValidationException("createdAt is not an ISO-8601 timestamp: " + ticket.createdAt);
            }

            ticket.staffFirstName = fields::optionalString(json, "staffFirstName");
            ticket.staffLastName = fields::optionalString(json, "staffLastName");

            printerConfig.reset();
            if (!fields::isAbsent(json, "printerConfig")) {
                printerConfig = fields::endpointFrom(json.at("printerConfig"));
            }
        }

        bool isValid() const override {
            return ticket.seatNumber >= 0 && ticket.totalAmount >= 0.0 &&
                   (!ticket.stationFee || *ticket.stationFee >= 0.0) &&
                   (!ticket.basePrice || *ticket.basePrice >= 0.0) &&
                   (!ticket.vehicleCapacity || *ticket.vehicleCapacity >= 0);
        }

        std::string getTypeName() const override {
            return "TicketRequest";
        }
    };

}
