#include "application/config/impl/JsonFilePrinterConfigStore.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace core::config {

    JsonFilePrinterConfigStore::JsonFilePrinterConfigStore(std::string path, EndpointDefaults defaults)
            : PrinterConfigStore(std::move(defaults)), path_(std::move(path)), document_(nlohmann::json::object()) {
        readDocument();
    }

    std::optional<types::PrinterEndpoint> JsonFilePrinterConfigStore::load(const std::string &printerId) {
        auto it = document_.find(printerId);
        if (it == document_.end()) return std::nullopt;

        try {
            return it->get<types::PrinterEndpoint>();
        } catch (const nlohmann::json::exception &e) {
            Logger::logWarning("[JsonFilePrinterConfigStore] Ignoring malformed entry " + printerId + ": " + e.what());
            return std::nullopt;
        }
    }

    void JsonFilePrinterConfigStore::save(const std::string &printerId, const types::PrinterEndpoint &endpoint) {
        nlohmann::json updated = document_;
        updated[printerId] = endpoint;
        writeDocument(updated);
        document_ = std::move(updated);
    }

    void JsonFilePrinterConfigStore::readDocument() {
        if (!fs::exists(path_)) {
            Logger::logInfo("[JsonFilePrinterConfigStore] No stored printers at " + path_ + ", using defaults");
            return;
        }

        try {
            std::ifstream file(path_);
            nlohmann::json parsed;
            file >> parsed;
            if (!parsed.is_object()) {
                Logger::logWarning("[JsonFilePrinterConfigStore] " + path_ + " is not a JSON object, ignoring");
                return;
            }
            document_ = std::move(parsed);
            Logger::logInfo("[JsonFilePrinterConfigStore] Loaded " + std::to_string(document_.size()) +
                            " printer(s) from " + path_);
        } catch (const std::exception &e) {
            Logger::logError("[JsonFilePrinterConfigStore] Failed to read " + path_ + ": " + e.what());
        }
    }

    void JsonFilePrinterConfigStore::writeDocument(const nlohmann::json &document) const {
        fs::path target(path_);
        std::error_code ec;
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                throw types::StorageException("cannot create " + target.parent_path().string() + ": " + ec.message());
            }
        }

        fs::path temp = target;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::out | std::ios::trunc);
            if (!out.is_open()) {
                throw types::StorageException("cannot open " + temp.string());
            }
            out << document.dump(2) << '\n';
            out.flush();
            if (!out) {
                throw types::StorageException("cannot write " + temp.string());
            }
        }

        fs::rename(temp, target, ec);
        if (ec) {
            fs::remove(temp, ec);
            throw types::StorageException("cannot replace " + target.string());
        }
    }

} // namespace core::config
