//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <string>
#include <unordered_map>
#include <mutex>
#include <vector>

namespace core::config {
    struct HttpConfig {
        std::string bindAddress = "127.0.0.1";
        int port = 8105;
        int ioThreads = 2;
        int handlerThreads = 4;
    };

    struct DeliveryConfig {
        int timeoutMs = 5000;
        int closeGraceMs = 200;
    };

    struct TicketConfig {
        std::string operatorName = "STE DHRAIFF SERVICES";
        double defaultStationFee = 0.15;
        int utcOffsetMinutes = 60;
        int characterTable = 2;
        int feedLines = 4;
    };

    struct StoreConfig {
        std::string path = "data/printers.json";
        std::string printerId = "printer1";
        std::string defaultHost = "192.168.192.12";
        int defaultPort = 9100;
        std::string legacyHost = "192.168.192.168";
    };

    struct LogConfig {
        std::string directory = "logs";
        int maxFileMb = 50;
        int maxFiles = 10;
        int retentionDays = 7;
    };

    /**
     * @brief Service settings: defaults, then config.json, then PRINT_SERVICE_* environment.
     *
     * Nested JSON objects are flattened to dotted keys ("http.port").
     * Environment names map the same way: PRINT_SERVICE_HTTP_PORT -> http.port.
     */
    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        // Load configuration
        void loadFromFile(const std::string &configPath = "config.json");

        void loadFromEnv();

        bool reload();

        void reset();

        // Configuration access
        HttpConfig getHttpConfig() const;

        DeliveryConfig getDeliveryConfig() const;

        TicketConfig getTicketConfig() const;

        StoreConfig getStoreConfig() const;

        LogConfig getLogConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        ConfigManager();

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;
        std::string configPath_;

        void setDefaults();
    };

    // Template specializations
    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }

    template<>
    inline double ConfigManager::get<double>(const std::string &key, const double &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stod(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }
} // namespace core::config
