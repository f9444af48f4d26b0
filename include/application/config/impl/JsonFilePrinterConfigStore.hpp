#pragma once

#include "../PrinterConfigStore.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace core::config {

    /**
     * @brief Durable store backed by one JSON document: { "<printerId>": {"host": ..., "port": ...} }.
     *
     * The document is read once at construction; every save rewrites it through
     * a temporary file renamed over the original.
     */
    class JsonFilePrinterConfigStore : public PrinterConfigStore {
    public:
        explicit JsonFilePrinterConfigStore(std::string path, EndpointDefaults defaults = {});

        const std::string &getPath() const { return path_; }

    protected:
        std::optional<types::PrinterEndpoint> load(const std::string &printerId) override;

        void save(const std::string &printerId, const types::PrinterEndpoint &endpoint) override;

    private:
        std::string path_;
        nlohmann::json document_;

        void readDocument();

        void writeDocument(const nlohmann::json &document) const;
    };

} // namespace core::config
