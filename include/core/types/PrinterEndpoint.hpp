#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace core::types {

    struct PrinterEndpoint {
        std::string host;
        int port = 9100;

        std::string key() const {
            return host + ":" + std::to_string(port);
        }

        bool operator==(const PrinterEndpoint &other) const {
            return host == other.host && port == other.port;
        }

        bool operator!=(const PrinterEndpoint &other) const {
            return !(*this == other);
        }
    };

    inline void to_json(nlohmann::json &j, const PrinterEndpoint &e) {
        j = nlohmann::json{
                {"host", e.host},
                {"port", e.port}
        };
    }

    inline void from_json(const nlohmann::json &j, PrinterEndpoint &e) {
        j.at("host").get_to(e.host);
        j.at("port").get_to(e.port);
    }

}
