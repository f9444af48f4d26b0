#include "application/config/impl/InMemoryPrinterConfigStore.hpp"

namespace core::config {

    InMemoryPrinterConfigStore::InMemoryPrinterConfigStore(EndpointDefaults defaults)
            : PrinterConfigStore(std::move(defaults)) {
    }

    void InMemoryPrinterConfigStore::seed(const std::string &printerId, const types::PrinterEndpoint &endpoint) {
        std::lock_guard<std::mutex> lock(entriesMutex_);
        entries_[printerId] = endpoint;
    }

    std::optional<types::PrinterEndpoint> InMemoryPrinterConfigStore::load(const std::string &printerId) {
        std::lock_guard<std::mutex> lock(entriesMutex_);
        auto it = entries_.find(printerId);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    void InMemoryPrinterConfigStore::save(const std::string &printerId, const types::PrinterEndpoint &endpoint) {
        std::lock_guard<std::mutex> lock(entriesMutex_);
        entries_[printerId] = endpoint;
    }

} // namespace core::config
