//
// Created by Andrea on 14/10/2025.
//

#include "application/config/ConfigManager.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>

namespace core::config {
    namespace {
        const char *const ENV_PREFIX = "PRINT_SERVICE_";
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    ConfigManager::ConfigManager() {
        setDefaults();
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        std::lock_guard<std::mutex> lock(configMutex_);
        configPath_ = configPath;
        setDefaults();

        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        try {
            std::ifstream file(configPath);
            nlohmann::json json;
            file >> json;

            // Flatten JSON into key-value pairs
            std::function<void(const nlohmann::json &, const std::string &)> flatten;
            flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                    if (it.value().is_object()) {
                        flatten(it.value(), key);
                    } else if (it.value().is_string()) {
                        config_[key] = it.value().get<std::string>();
                    } else {
                        config_[key] = it.value().dump();
                    }
                }
            };

            flatten(json, "");

            Logger::logInfo("[ConfigManager] Loaded " + std::to_string(config_.size()) + " settings from " + configPath);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config: " + std::string(e.what()));
            setDefaults();
        }
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        const char *envVars[] = {
            "PRINT_SERVICE_HTTP_BIND_ADDRESS", "PRINT_SERVICE_HTTP_PORT", "PRINT_SERVICE_HTTP_IO_THREADS",
            "PRINT_SERVICE_HTTP_HANDLER_THREADS",
            "PRINT_SERVICE_DELIVERY_TIMEOUT_MS", "PRINT_SERVICE_DELIVERY_CLOSE_GRACE_MS",
            "PRINT_SERVICE_TICKET_OPERATOR_NAME", "PRINT_SERVICE_TICKET_STATION_FEE",
            "PRINT_SERVICE_TICKET_UTC_OFFSET_MINUTES",
            "PRINT_SERVICE_ESCPOS_CHARACTER_TABLE", "PRINT_SERVICE_ESCPOS_FEED_LINES",
            "PRINT_SERVICE_STORE_PATH", "PRINT_SERVICE_STORE_PRINTER_ID", "PRINT_SERVICE_STORE_DEFAULT_HOST",
            "PRINT_SERVICE_STORE_DEFAULT_PORT", "PRINT_SERVICE_STORE_LEGACY_HOST",
            "PRINT_SERVICE_LOG_DIR", "PRINT_SERVICE_LOG_MAX_FILE_MB", "PRINT_SERVICE_LOG_MAX_FILES",
            "PRINT_SERVICE_LOG_RETENTION_DAYS"
        };

        int loaded = 0;
        for (const char *envVar: envVars) {
            const char *value = std::getenv(envVar);
            if (value) {
                // PRINT_SERVICE_HTTP_PORT -> http.port
                std::string key = std::string(envVar).substr(std::string(ENV_PREFIX).size());
                std::transform(key.begin(), key.end(), key.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                std::replace(key.begin(), key.end(), '_', '.');

                config_[key] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    bool ConfigManager::reload() {
        std::string path;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            path = configPath_;
        }
        if (path.empty()) return false;

        try {
            loadFromFile(path);
            loadFromEnv();
            return true;
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Reload failed: " + std::string(e.what()));
            return false;
        }
    }

    void ConfigManager::reset() {
        std::lock_guard<std::mutex> lock(configMutex_);
        configPath_.clear();
        setDefaults();
    }

    HttpConfig ConfigManager::getHttpConfig() const {
        HttpConfig config;
        config.bindAddress = get<std::string>("http.bind.address", config.bindAddress);
        config.port = get<int>("http.port", config.port);
        config.ioThreads = get<int>("http.io.threads", config.ioThreads);
        config.handlerThreads = get<int>("http.handler.threads", config.handlerThreads);
        return config;
    }

    DeliveryConfig ConfigManager::getDeliveryConfig() const {
        DeliveryConfig config;
        config.timeoutMs = get<int>("delivery.timeout.ms", config.timeoutMs);
        config.closeGraceMs = get<int>("delivery.close.grace.ms", config.closeGraceMs);
        return config;
    }

    TicketConfig ConfigManager::getTicketConfig() const {
        TicketConfig config;
        config.operatorName = get<std::string>("ticket.operator.name", config.operatorName);
        config.defaultStationFee = get<double>("ticket.station.fee", config.defaultStationFee);
        config.utcOffsetMinutes = get<int>("ticket.utc.offset.minutes", config.utcOffsetMinutes);
        config.characterTable = get<int>("escpos.character.table", config.characterTable);
        config.feedLines = get<int>("escpos.feed.lines", config.feedLines);
        return config;
    }

    StoreConfig ConfigManager::getStoreConfig() const {
        StoreConfig config;
        config.path = get<std::string>("store.path", config.path);
        config.printerId = get<std::string>("store.printer.id", config.printerId);
        config.defaultHost = get<std::string>("store.default.host", config.defaultHost);
        config.defaultPort = get<int>("store.default.port", config.defaultPort);
        config.legacyHost = get<std::string>("store.legacy.host", config.legacyHost);
        return config;
    }

    LogConfig ConfigManager::getLogConfig() const {
        LogConfig config;
        config.directory = get<std::string>("log.dir", config.directory);
        config.maxFileMb = get<int>("log.max.file.mb", config.maxFileMb);
        config.maxFiles = get<int>("log.max.files", config.maxFiles);
        config.retentionDays = get<int>("log.retention.days", config.retentionDays);
        return config;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        int httpPort = get<int>("http.port", -1);
        if (httpPort < 1 || httpPort > 65535) {
            result.errors.push_back("http.port must be in [1, 65535]");
        }

        if (get<int>("http.io.threads", 0) < 1) {
            result.errors.push_back("http.io.threads must be >= 1");
        }

        if (get<int>("http.handler.threads", 0) < 1) {
            result.errors.push_back("http.handler.threads must be >= 1");
        }

        if (get<int>("delivery.timeout.ms", -1) < 100) {
            result.errors.push_back("delivery.timeout.ms must be >= 100");
        }

        if (get<int>("delivery.close.grace.ms", -1) < 0) {
            result.errors.push_back("delivery.close.grace.ms must be >= 0");
        }

        if (get<double>("ticket.station.fee", -1.0) < 0.0) {
            result.errors.push_back("ticket.station.fee must be >= 0");
        }

        int table = get<int>("escpos.character.table", -1);
        if (table < 0 || table > 255) {
            result.errors.push_back("escpos.character.table must be in [0, 255]");
        }

        int feed = get<int>("escpos.feed.lines", -1);
        if (feed < 0 || feed > 32) {
            result.errors.push_back("escpos.feed.lines must be in [0, 32]");
        }

        if (get<std::string>("store.path", "").empty()) {
            result.errors.push_back("store.path must not be empty");
        }

        int storePort = get<int>("store.default.port", -1);
        if (storePort < 1 || storePort > 65535) {
            result.errors.push_back("store.default.port must be in [1, 65535]");
        }

        if (get<int>("log.max.file.mb", 0) < 1) {
            result.errors.push_back("log.max.file.mb must be >= 1");
        }

        if (get<int>("log.max.files", 0) < 1) {
            result.errors.push_back("log.max.files must be >= 1");
        }

        if (get<int>("log.retention.days", 0) < 1) {
            result.errors.push_back("log.retention.days must be >= 1");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    // Caller holds configMutex_.
    void ConfigManager::setDefaults() {
        config_.clear();

        config_["http.bind.address"] = "127.0.0.1";
        config_["http.port"] = "8105";
        config_["http.io.threads"] = "2";
        config_["http.handler.threads"] = "4";

        config_["delivery.timeout.ms"] = "5000";
        config_["delivery.close.grace.ms"] = "200";

        config_["ticket.operator.name"] = "STE DHRAIFF SERVICES";
        config_["ticket.station.fee"] = "0.15";
        config_["ticket.utc.offset.minutes"] = "60";
        config_["escpos.character.table"] = "2";
        config_["escpos.feed.lines"] = "4";

        config_["store.path"] = "data/printers.json";
        config_["store.printer.id"] = "printer1";
        config_["store.default.host"] = "192.168.192.12";
        config_["store.default.port"] = "9100";
        config_["store.legacy.host"] = "192.168.192.168";

        config_["log.dir"] = "logs";
        config_["log.max.file.mb"] = "50";
        config_["log.max.files"] = "10";
        config_["log.retention.days"] = "7";
    }
} // namespace core::config
