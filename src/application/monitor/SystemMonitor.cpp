#include "application/monitor/SystemMonitor.hpp"
#include "logger/Logger.hpp"
#include <utility>

SystemMonitor::SystemMonitor(std::shared_ptr<core::PrintDispatchQueue> dispatchQueue,
                             std::shared_ptr<connector::controllers::PrinterController> controller,
                             std::shared_ptr<connector::server::HttpServer> server,
                             std::chrono::seconds reportInterval)
        : dispatchQueue_(std::move(dispatchQueue)),
          controller_(std::move(controller)),
          server_(std::move(server)),
          reportInterval_(reportInterval) {
}

SystemMonitor::~SystemMonitor() {
    stop();
}

void SystemMonitor::start() {
    if (running_) {
        Logger::logWarning("[SystemMonitor] Already running");
        return;
    }

    running_ = true;
    monitorThread_ = std::thread([this]() {
        try {
            monitorLoop();
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Monitor thread crashed: " + std::string(e.what()));
        }
    });

    Logger::logInfo("[SystemMonitor] Started, reporting every " + std::to_string(reportInterval_.count()) + "s");
}

void SystemMonitor::stop() {
    if (!running_) return;

    running_ = false;
    if (monitorThread_.joinable()) {
        monitorThread_.join();
    }

    Logger::logInfo("[SystemMonitor] Stopped");
}

bool SystemMonitor::isRunning() const {
    return running_;
}

void SystemMonitor::checkNow() {
    if (dispatchQueue_ && !dispatchQueue_->isRunning() && server_ && server_->isRunning()) {
        Logger::logWarning("[SystemMonitor] Dispatch queue stopped while serving - restarting");
        dispatchQueue_->start();
    }
    reportStats();
}

void SystemMonitor::monitorLoop() {
    Logger::logInfo("[SystemMonitor] Monitor loop started");
    long long elapsed = 0;

    while (running_) {
        std::this_thread::sleep_for(std::chrono::seconds(1));

        try {
            if (++elapsed >= reportInterval_.count()) {
                checkNow();
                elapsed = 0;
            }
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Loop error: " + std::string(e.what()));
        }
    }
}

void SystemMonitor::reportStats() const {
    Logger::logInfo("[SystemMonitor] ===== Print Service Status =====");

    if (server_) {
        Logger::logInfo("[SystemMonitor] HTTP server: " + std::string(server_->isRunning() ? "LISTENING" : "DOWN") +
                        " on port " + std::to_string(server_->getPort()));
    }

    if (dispatchQueue_) {
        auto stats = dispatchQueue_->getStatistics();
        Logger::logInfo("[SystemMonitor] Dispatch queue: " +
                        std::string(dispatchQueue_->isRunning() ? "RUNNING" : "STOPPED"));
        Logger::logInfo("  Enqueued: " + std::to_string(stats.totalEnqueued));
        Logger::logInfo("  Delivered: " + std::to_string(stats.totalDelivered));
        Logger::logInfo("  Failed: " + std::to_string(stats.totalFailed));
        Logger::logInfo("  Pending: " + std::to_string(stats.pendingJobs));
        Logger::logInfo("  Printer lanes: " + std::to_string(stats.lanes));
    } else {
        Logger::logError("[SystemMonitor] Dispatch queue: NOT AVAILABLE");
    }

    if (controller_) {
        auto stats = controller_->getStatistics();
        Logger::logInfo("[SystemMonitor] Requests:");
        Logger::logInfo("  Received: " + std::to_string(stats.requestsReceived));
        Logger::logInfo("  Printed: " + std::to_string(stats.printsSucceeded));
        Logger::logInfo("  Print failures: " + std::to_string(stats.printsFailed));
        Logger::logInfo("  Rejected: " + std::to_string(stats.validationErrors));
        Logger::logInfo("  Internal errors: " + std::to_string(stats.internalErrors));

        if (stats.printsFailed > 0 && stats.printsSucceeded == 0) {
            Logger::logWarning("[SystemMonitor] No successful print yet - check the printer address");
        }
    }

    Logger::logInfo("[SystemMonitor] ================================");
}
