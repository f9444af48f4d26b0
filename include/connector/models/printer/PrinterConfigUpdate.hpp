#pragma once

#include "../BaseModel.hpp"
#include "../JsonFields.hpp"
#include <string>

namespace connector::models::printer {

    /**
     * @brief Body of PUT /config/{id}: {ip|host, port}. Other PrinterSettings fields are ignored.
     */
    class PrinterConfigUpdate : public BaseModel {
    public:
        core::types::PrinterEndpoint endpoint;

        PrinterConfigUpdate() = default;

        explicit PrinterConfigUpdate(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            return nlohmann::json{
                {"ip",   endpoint.host},
                {"port", endpoint.port}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            endpoint = fields::endpointFrom(json);
        }

        bool isValid() const override {
            return !endpoint.host.empty() && endpoint.port >= 1 && endpoint.port <= 65535;
        }

        std::string getTypeName() const override {
            return "PrinterConfigUpdate";
        }
    };

}
