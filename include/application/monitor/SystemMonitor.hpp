//
// Created by Andrea on 23/08/2025.
//

#pragma once

#include "connector/controllers/PrinterController.hpp"
#include "connector/server/HttpServer.hpp"
#include "core/queue/PrintDispatchQueue.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

/**
 * @brief Background status reporter.
 *
 * Periodically logs dispatch and request counters and restarts the dispatch
 * queue if it stopped while the service is still up.
 */
class SystemMonitor {
public:
    SystemMonitor(std::shared_ptr<core::PrintDispatchQueue> dispatchQueue,
                  std::shared_ptr<connector::controllers::PrinterController> controller,
                  std::shared_ptr<connector::server::HttpServer> server,
                  std::chrono::seconds reportInterval = std::chrono::seconds(60));

    ~SystemMonitor();

    void start();

    void stop();

    bool isRunning() const;

    /**
     * @brief One status pass; called by the loop and usable on demand.
     */
    void checkNow();

private:
    std::atomic<bool> running_{false};
    std::thread monitorThread_;

    std::shared_ptr<core::PrintDispatchQueue> dispatchQueue_;
    std::shared_ptr<connector::controllers::PrinterController> controller_;
    std::shared_ptr<connector::server::HttpServer> server_;
    std::chrono::seconds reportInterval_;

    void monitorLoop();

    void reportStats() const;
};
