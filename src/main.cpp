#include "application/config/ConfigManager.hpp"
#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>

// Global shutdown mechanism
std::atomic<bool> running{true};
std::condition_variable shutdownCondition;
std::mutex shutdownMutex;

void handleSignal(int) {
    running = false;
}

void waitForShutdownSignal() {
    std::unique_lock<std::mutex> lock(shutdownMutex);
    while (running.load()) {
        shutdownCondition.wait_for(lock, std::chrono::milliseconds(200));
    }
}

int main(int argc, char *argv[]) {
    const std::string configPath = argc > 1 ? argv[1] : "config.json";

    try {
        // Log settings come from the config file, before the rest is wired
        auto &config = core::config::ConfigManager::getInstance();
        config.loadFromFile(configPath);
        config.loadFromEnv();
        const auto logConfig = config.getLogConfig();
        Logger::Options logOptions;
        logOptions.directory = logConfig.directory;
        logOptions.maxFileBytes = static_cast<size_t>(std::max(logConfig.maxFileMb, 1)) * 1024 * 1024;
        logOptions.maxFiles = static_cast<size_t>(std::max(logConfig.maxFiles, 1));
        logOptions.retentionDays = std::max(logConfig.retentionDays, 1);
        Logger::init(logOptions);

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        ApplicationController app(configPath);
        if (!app.initialize()) {
            Logger::logError("Application initialization failed");
            Logger::shutdown();
            return 1;
        }

        waitForShutdownSignal();
        Logger::logInfo("Received shutdown signal");

        app.shutdown();
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        Logger::shutdown();
        return 1;
    }

    Logger::shutdown();
    return 0;
}
