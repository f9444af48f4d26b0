#pragma once

#include "../BaseModel.hpp"
#include "../JsonFields.hpp"
#include <string>

namespace connector::models::printer {

    /**
     * @brief Printer record served by GET /config/{id}: stored endpoint plus fixed capabilities.
     */
    class PrinterSettings : public BaseModel {
    public:
        std::string id;
        std::string name = "Local Printer";
        std::string ip;
        int port = 9100;
        int width = 48;
        int timeout = 5000;
        std::string model = "ESC/POS";
        bool enabled = true;
        bool isDefault = false;

        PrinterSettings() = default;

        PrinterSettings(const std::string &id, const core::types::PrinterEndpoint &endpoint, int timeoutMs,
                        bool isDefault)
                : id(id), ip(endpoint.host), port(endpoint.port), timeout(timeoutMs), isDefault(isDefault) {}

        explicit PrinterSettings(const nlohmann::json &json) { fromJson(json); }

        core::types::PrinterEndpoint endpoint() const {
            return core::types::PrinterEndpoint{ip, port};
        }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            return nlohmann::json{
                {"id",        id},
                {"name",      name},
                {"ip",        ip},
                {"port",      port},
                {"width",     width},
                {"timeout",   timeout},
                {"model",     model},
                {"enabled",   enabled},
                {"isDefault", isDefault}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            id = fields::optionalString(json, "id");
            if (!fields::isAbsent(json, "name")) name = fields::optionalString(json, "name");
            ip = fields::optionalString(json, "ip");
            port = fields::optionalInt(json, "port").value_or(9100);
            width = fields::optionalInt(json, "width").value_or(48);
            timeout = fields::optionalInt(json, "timeout").value_or(5000);
            if (!fields::isAbsent(json, "model")) model = fields::optionalString(json, "model");
            enabled = json.value("enabled", true);
            isDefault = json.value("isDefault", false);
        }

        bool isValid() const override {
            return !id.empty() && !ip.empty() && port >= 1 && port <= 65535;
        }

        std::string getTypeName() const override {
            return "PrinterSettings";
        }
    };

}
