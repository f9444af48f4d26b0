#pragma once

#include "core/types/Error.hpp"
#include "core/types/PrinterEndpoint.hpp"
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace connector::models::fields {

    // Desktop clients send numbers either as JSON numbers or as numeric strings.

    inline bool isAbsent(const nlohmann::json &json, const std::string &key) {
        return !json.contains(key) || json.at(key).is_null();
    }

    inline std::string optionalString(const nlohmann::json &json, const std::string &key) {
        if (isAbsent(json, key)) return "";
        const auto &value = json.at(key);
        if (value.is_string()) return value.get<std::string>();
        if (value.is_number()) return value.dump();
        throw core::types::ValidationException(key + " must be a string");
    }

    inline std::optional<double> optionalNumber(const nlohmann::json &json, const std::string &key) {
        if (isAbsent(json, key)) return std::nullopt;
        const auto &value = json.at(key);

        double number = 0.0;
        if (value.is_number()) {
            number = value.get<double>();
        } else if (value.is_string() && !value.get<std::string>().empty()) {
            const std::string text = value.get<std::string>();
            size_t consumed = 0;
            try {
                number = std::stod(text, &consumed);
            } catch (const std::exception &) {
                consumed = 0;
            }
            if (consumed != text.size()) {
                throw core::types::ValidationException(key + " must be a number, got \"" + text + "\"");
            }
        } else {
            throw core::types::ValidationException(key + " must be a number");
        }

        if (!std::isfinite(number)) {
            throw core::types::ValidationException(key + " must be finite");
        }
        return number;
    }

    inline double requiredNumber(const nlohmann::json &json, const std::string &key) {
        auto value = optionalNumber(json, key);
        if (!value) {
            throw core::types::ValidationException(key + " is required");
        }
        return *value;
    }

    inline std::optional<long long> optionalInteger(const nlohmann::json &json, const std::string &key) {
        auto value = optionalNumber(json, key);
        if (!value) return std::nullopt;
        if (std::trunc(*value) != *value) {
            throw core::types::ValidationException(key + " must be an integer");
        }
        // Beyond 2^53 a double no longer holds every integer exactly.
        constexpr double EXACT_LIMIT = 9007199254740992.0;
        if (*value > EXACT_LIMIT || *value < -EXACT_LIMIT) {
            throw core::types::ValidationException(key + " is out of range");
        }
        return static_cast<long long>(*value);
    }

    inline std::optional<int> optionalInt(const nlohmann::json &json, const std::string &key) {
        auto value = optionalInteger(json, key);
        if (!value) return std::nullopt;
        if (*value > std::numeric_limits<int>::max() || *value < std::numeric_limits<int>::min()) {
            throw core::types::ValidationException(key + " is out of range: " + std::to_string(*value));
        }
        return static_cast<int>(*value);
    }

    /**
     * @brief Reads {ip|host, port}; port defaults to 9100.
     */
    inline core::types::PrinterEndpoint endpointFrom(const nlohmann::json &json) {
        if (!json.is_object()) {
            throw core::types::ValidationException("printer endpoint must be an object");
        }

        core::types::PrinterEndpoint endpoint;
        endpoint.host = optionalString(json, "ip");
        if (endpoint.host.empty()) {
            endpoint.host = optionalString(json, "host");
        }

        auto port = optionalInt(json, "port");
        if (port) {
            if (*port < 0 || *port > 65535) {
                throw core::types::ValidationException("port must be in [1, 65535], got " + std::to_string(*port));
            }
            endpoint.port = *port;
        }
        return endpoint;
    }

} // namespace connector::models::fields
