#pragma once

#include "../PrinterConfigStore.hpp"
#include <map>

namespace core::config {

    /**
     * @brief Non-durable store, used by tests and when no storage path is configured.
     */
    class InMemoryPrinterConfigStore : public PrinterConfigStore {
    public:
        explicit InMemoryPrinterConfigStore(EndpointDefaults defaults = {});

        /**
         * @brief Puts a raw value in place, bypassing validation.
         */
        void seed(const std::string &printerId, const types::PrinterEndpoint &endpoint);

    protected:
        std::optional<types::PrinterEndpoint> load(const std::string &printerId) override;

        void save(const std::string &printerId, const types::PrinterEndpoint &endpoint) override;

    private:
        std::mutex entriesMutex_;
        std::map<std::string, types::PrinterEndpoint> entries_;
    };

} // namespace core::config
