//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "application/config/ConfigManager.hpp"
#include "core/types/PrinterEndpoint.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace core::config {
    struct EndpointDefaults {
        types::PrinterEndpoint current{"192.168.192.12", 9100};
        std::string legacyHost = "192.168.192.168"; // shipped default before the network change
    };

    /**
     * @brief Thread-safe holder of the printer address per printer id.
     *
     * get() and set() are serialized, so readers see either the previous or the
     * new endpoint. Backends only implement raw load/save.
     */
    class PrinterConfigStore {
    public:
        using ValidationResult = ConfigManager::ValidationResult;

        virtual ~PrinterConfigStore() = default;

        /**
         * @brief Stored endpoint, the default when none is stored.
         *
         * A stored legacy default host is rewritten to the current default host
         * and persisted before being returned.
         */
        types::PrinterEndpoint get(const std::string &printerId);

        /**
         * @brief Validates then persists; on any error the previous value is kept.
         */
        ValidationResult set(const std::string &printerId, const types::PrinterEndpoint &endpoint);

        const EndpointDefaults &getDefaults() const { return defaults_; }

        static ValidationResult validateEndpoint(const types::PrinterEndpoint &endpoint);

        static bool isValidIpv4(const std::string &host);

        static bool isValidHostname(const std::string &host);

    protected:
        explicit PrinterConfigStore(EndpointDefaults defaults);

        virtual std::optional<types::PrinterEndpoint> load(const std::string &printerId) = 0;

        /**
         * @throws types::StorageException when the value could not be persisted
         */
        virtual void save(const std::string &printerId, const types::PrinterEndpoint &endpoint) = 0;

    private:
        std::mutex mutex_;
        EndpointDefaults defaults_;
    };
} // namespace core::config
