//
// Created by Andrea on 23/08/2025.
//

#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "application/config/ConfigManager.hpp"
#include "application/config/PrinterConfigStore.hpp"
#include "application/monitor/SystemMonitor.hpp"
#include "connector/controllers/PrinterController.hpp"
#include "connector/server/HttpServer.hpp"
#include "core/network/DeliveryChannel.hpp"
#include "core/queue/PrintDispatchQueue.hpp"

/**
 * @class ApplicationController
 * @brief Wires and owns the ticket print service.
 *
 * Initialization sequence:
 * 1. Configuration (config file, environment, validation)
 * 2. Printer configuration store
 * 3. Delivery channel and dispatch queue
 * 4. HTTP controller and server
 * 5. System monitor
 */
class ApplicationController {
public:
    explicit ApplicationController(std::string configPath = "config.json");

    ~ApplicationController();

    /**
     * @return true when every stage started; false leaves nothing running
     */
    bool initialize();

    /**
     * @brief Stops components in reverse initialization order.
     */
    void shutdown();

    bool isRunning() const { return isRunning_; }

    /**
     * @brief Port the HTTP server is bound to, 0 before initialize().
     */
    unsigned short getHttpPort() const;

private:
    std::string configPath_;

    std::shared_ptr<core::config::PrinterConfigStore> configStore_;
    std::shared_ptr<core::DeliveryChannel> deliveryChannel_;
    std::shared_ptr<core::PrintDispatchQueue> dispatchQueue_;
    std::shared_ptr<connector::controllers::PrinterController> printerController_;
    std::shared_ptr<connector::server::HttpServer> httpServer_;
    std::unique_ptr<SystemMonitor> monitor_;

    std::atomic<bool> isRunning_;
    std::atomic<bool> initializationComplete_;

    bool initializeConfiguration();

    bool initializeStore();

    bool initializeDispatch();

    bool initializeHttp();

    void printInitializationSummary();
};
