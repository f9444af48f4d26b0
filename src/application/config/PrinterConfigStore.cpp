//
// Created by Andrea on 15/10/2025.
//

#include "application/config/PrinterConfigStore.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <cctype>
#include <regex>

namespace core::config {

    PrinterConfigStore::PrinterConfigStore(EndpointDefaults defaults)
            : defaults_(std::move(defaults)) {
    }

    types::PrinterEndpoint PrinterConfigStore::get(const std::string &printerId) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto stored = load(printerId);
        if (!stored) {
            return defaults_.current;
        }

        if (!defaults_.legacyHost.empty() && stored->host == defaults_.legacyHost) {
            Logger::logInfo("[PrinterConfigStore] Migrating " + printerId + " from " + defaults_.legacyHost +
                            " to " + defaults_.current.host);
            stored->host = defaults_.current.host;
            try {
                save(printerId, *stored);
            } catch (const std::exception &e) {
                Logger::logWarning("[PrinterConfigStore] Migration not persisted: " + std::string(e.what()));
            }
        }
        return *stored;
    }

    PrinterConfigStore::ValidationResult PrinterConfigStore::set(const std::string &printerId,
                                                                 const types::PrinterEndpoint &endpoint) {
        ValidationResult result = validateEndpoint(endpoint);
        if (printerId.empty()) {
            result.errors.emplace_back("printer id must not be empty");
            result.isValid = false;
        }
        if (!result.isValid) {
            Logger::logWarning("[PrinterConfigStore] Rejected " + endpoint.key() + " for " + printerId);
            return result;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        try {
            save(printerId, endpoint);
        } catch (const std::exception &e) {
            Logger::logError("[PrinterConfigStore] " + std::string(e.what()));
            result.errors.emplace_back(e.what());
            result.isValid = false;
            return result;
        }

        Logger::logInfo("[PrinterConfigStore] " + printerId + " -> " + endpoint.key());
        return result;
    }

    PrinterConfigStore::ValidationResult PrinterConfigStore::validateEndpoint(const types::PrinterEndpoint &endpoint) {
        ValidationResult result;

        if (endpoint.host.empty()) {
            result.errors.emplace_back("host must not be empty");
        } else if (!isValidIpv4(endpoint.host) && !isValidHostname(endpoint.host)) {
            result.errors.push_back("invalid host: " + endpoint.host);
        }

        if (endpoint.port < 1 || endpoint.port > 65535) {
            result.errors.push_back("port must be in [1, 65535], got " + std::to_string(endpoint.port));
        }

        result.isValid = result.errors.empty();
        return result;
    }

    bool PrinterConfigStore::isValidIpv4(const std::string &host) {
        static const std::regex ipv4Regex(
            R"(^(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$)");
        return std::regex_match(host, ipv4Regex);
    }

    bool PrinterConfigStore::isValidHostname(const std::string &host) {
        if (host.empty() || host.size() > 253) return false;

        // Dotted digits are an address, never a name ("999.999.999.999")
        bool numericOnly = true;
        for (char c: host) {
            if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.') {
                numericOnly = false;
                break;
            }
        }
        if (numericOnly) return false;

        static const std::regex labelRegex(R"(^[A-Za-z0-9](?:[A-Za-z0-9-]{0,61}[A-Za-z0-9])?$)");
        size_t start = 0;
        while (true) {
            size_t dot = host.find('.', start);
            std::string label = host.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            if (!std::regex_match(label, labelRegex)) return false;
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
        return true;
    }

} // namespace core::config
