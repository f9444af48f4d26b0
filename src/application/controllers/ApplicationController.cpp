//
// Created by Andrea on 23/08/2025.
//

#include "application/controllers/ApplicationController.hpp"
#include "application/config/impl/JsonFilePrinterConfigStore.hpp"
#include "core/network/impl/TcpDeliveryChannel.hpp"
#include "logger/Logger.hpp"

using core::config::ConfigManager;

ApplicationController::ApplicationController(std::string configPath)
        : configPath_(std::move(configPath)),
          isRunning_(false),
          initializationComplete_(false) {
}

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize() {
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] STARTING TICKET PRINT SERVICE");
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] Build Date: " + std::string(__DATE__) + " " + std::string(__TIME__));

    Logger::logInfo("[ApplicationController] [1/5] Loading configuration...");
    if (!initializeConfiguration()) {
        Logger::logError("[ApplicationController] Configuration FAILED");
        return false;
    }

    Logger::logInfo("[ApplicationController] [2/5] Opening printer configuration store...");
    if (!initializeStore()) {
        Logger::logError("[ApplicationController] Printer configuration store FAILED");
        return false;
    }

    Logger::logInfo("[ApplicationController] [3/5] Starting dispatch queue...");
    if (!initializeDispatch()) {
        Logger::logError("[ApplicationController] Dispatch queue FAILED");
        shutdown();
        return false;
    }

    Logger::logInfo("[ApplicationController] [4/5] Starting HTTP server...");
    if (!initializeHttp()) {
        Logger::logError("[ApplicationController] HTTP server FAILED");
        shutdown();
        return false;
    }

    Logger::logInfo("[ApplicationController] [5/5] Starting System Monitor...");
    monitor_ = std::make_unique<SystemMonitor>(dispatchQueue_, printerController_, httpServer_);
    monitor_->start();

    printInitializationSummary();

    initializationComplete_ = true;
    isRunning_ = true;

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] SYSTEM READY - WAITING FOR PRINT REQUESTS");
    Logger::logInfo("===============================================");
    return true;
}

void ApplicationController::shutdown() {
    if (!isRunning_ && !initializationComplete_ && !dispatchQueue_ && !httpServer_) {
        return;
    }

    Logger::logInfo("[ApplicationController] SHUTTING DOWN");
    isRunning_ = false;
    initializationComplete_ = false;

    if (monitor_) {
        monitor_->stop();
        monitor_.reset();
    }

    // Server first: its handlers may still be waiting on the queue
    if (httpServer_) {
        httpServer_->stop();
        httpServer_.reset();
    }
    printerController_.reset();

    if (dispatchQueue_) {
        dispatchQueue_->stop();
        dispatchQueue_.reset();
    }
    deliveryChannel_.reset();
    configStore_.reset();

    Logger::logInfo("[ApplicationController] SHUTDOWN COMPLETE");
}

unsigned short ApplicationController::getHttpPort() const {
    return httpServer_ ? httpServer_->getPort() : 0;
}

bool ApplicationController::initializeConfiguration() {
    auto &config = ConfigManager::getInstance();
    config.loadFromFile(configPath_);
    config.loadFromEnv();

    auto validation = config.validate();
    if (!validation.isValid) {
        for (const auto &error: validation.errors) {
            Logger::logError("[ApplicationController]   " + error);
        }
        return false;
    }
    return true;
}

bool ApplicationController::initializeStore() {
    try {
        const auto storeConfig = ConfigManager::getInstance().getStoreConfig();

        core::config::EndpointDefaults defaults;
        defaults.current = core::types::PrinterEndpoint{storeConfig.defaultHost, storeConfig.defaultPort};
        defaults.legacyHost = storeConfig.legacyHost;

        configStore_ = std::make_shared<core::config::JsonFilePrinterConfigStore>(storeConfig.path, defaults);
        Logger::logInfo("[ApplicationController]   Printer " + storeConfig.printerId + " -> " +
                        configStore_->get(storeConfig.printerId).key());
        return true;
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] Store initialization failed: " + std::string(e.what()));
        return false;
    }
}

bool ApplicationController::initializeDispatch() {
    try {
        const auto delivery = ConfigManager::getInstance().getDeliveryConfig();

        deliveryChannel_ = std::make_shared<core::TcpDeliveryChannel>(
                std::chrono::milliseconds(delivery.timeoutMs), std::chrono::milliseconds(delivery.closeGraceMs));
        dispatchQueue_ = std::make_shared<core::PrintDispatchQueue>(deliveryChannel_);
        dispatchQueue_->start();

        if (!dispatchQueue_->isRunning()) {
            Logger::logError("[ApplicationController] Dispatch queue failed to start");
            return false;
        }
        return true;
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] Dispatch initialization failed: " + std::string(e.what()));
        return false;
    }
}

bool ApplicationController::initializeHttp() {
    try {
        auto &config = ConfigManager::getInstance();
        const auto httpConfig = config.getHttpConfig();
        const auto ticketConfig = config.getTicketConfig();

        connector::controllers::PrinterController::Settings settings;
        settings.layout.operatorName = ticketConfig.operatorName;
        settings.layout.defaultStationFee = ticketConfig.defaultStationFee;
        settings.layout.displayUtcOffsetMinutes = ticketConfig.utcOffsetMinutes;
        settings.encoder.characterTable = static_cast<uint8_t>(ticketConfig.characterTable);
        settings.encoder.feedLines = ticketConfig.feedLines;
        settings.defaultPrinterId = config.getStoreConfig().printerId;
        settings.deliveryTimeoutMs = config.getDeliveryConfig().timeoutMs;

        printerController_ = std::make_shared<connector::controllers::PrinterController>(
                configStore_, dispatchQueue_, deliveryChannel_, settings);

        connector::server::HttpServer::Options options;
        options.bindAddress = httpConfig.bindAddress;
        options.port = static_cast<unsigned short>(httpConfig.port);
        options.ioThreads = httpConfig.ioThreads;
        options.handlerThreads = httpConfig.handlerThreads;

        auto controller = printerController_;
        httpServer_ = std::make_shared<connector::server::HttpServer>(
                options, [controller](const connector::server::HttpServer::Request &request) {
                    return controller->handle(request);
                });
        httpServer_->start();
        return true;
    } catch (const std::exception &e) {
        // Typically the port is already taken by another instance
        Logger::logError("[ApplicationController] HTTP initialization failed: " + std::string(e.what()));
        httpServer_.reset();
        return false;
    }
}

void ApplicationController::printInitializationSummary() {
    auto &config = ConfigManager::getInstance();
    const auto httpConfig = config.getHttpConfig();
    const auto delivery = config.getDeliveryConfig();
    const auto storeConfig = config.getStoreConfig();

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] INITIALIZATION SUMMARY");
    Logger::logInfo("===============================================");
    Logger::logInfo("  HTTP: " + httpConfig.bindAddress + ":" + std::to_string(getHttpPort()));
    Logger::logInfo("  Store: " + storeConfig.path + " (printer " + storeConfig.printerId + ")");
    Logger::logInfo("  Delivery timeout: " + std::to_string(delivery.timeoutMs) + "ms, close grace: " +
                    std::to_string(delivery.closeGraceMs) + "ms");
    Logger::logInfo("  Dispatch queue: " +
                    std::string(dispatchQueue_ && dispatchQueue_->isRunning() ? "RUNNING" : "STOPPED"));
    Logger::logInfo("  System Monitor: " + std::string(monitor_ ? "ACTIVE" : "INACTIVE"));
    Logger::logInfo("===============================================");
}
