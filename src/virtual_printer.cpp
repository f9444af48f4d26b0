#include "core/escpos/EscPosDecoder.hpp"
#include "core/network/PrintJobArchive.hpp"
#include "core/network/PrinterEmulator.hpp"
#include "logger/Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

// Usage: virtual_printer [port] [logDir]
// Stands in for the station's network thermal printer during development.

std::atomic<bool> running{true};

void handleSignal(int) {
    running = false;
}

int main(int argc, char *argv[]) {
    unsigned short port = 9100;
    std::string logDir = "virtual-printer-logs";

    if (argc > 1) {
        try {
            int requested = std::stoi(argv[1]);
            if (requested < 1 || requested > 65535) throw std::out_of_range("port");
            port = static_cast<unsigned short>(requested);
        } catch (const std::exception &) {
            std::cerr << "Invalid port: " << argv[1] << std::endl;
            std::cerr << "Usage: " << argv[0] << " [port] [logDir]" << std::endl;
            return 2;
        }
    }
    if (argc > 2) {
        logDir = argv[2];
    }

    Logger::Options logOptions;
    logOptions.directory = logDir;
    logOptions.filePrefix = "virtual_printer";
    Logger::init(logOptions);
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    core::PrintJobArchive archive(logDir);
    core::PrinterEmulator emulator("0.0.0.0", port);

    emulator.setJobCallback([&archive](const core::ReceivedJob &job) {
        const auto lines = core::escpos::EscPosDecoder::decode(job.data);

        Logger::logInfo("[VirtualPrinter] ===== PRINT JOB #" + std::to_string(job.sequence) + " =====");
        for (const auto &line: lines) {
            if (!line.empty()) Logger::logInfo("[VirtualPrinter] | " + line);
        }
        Logger::logInfo("[VirtualPrinter] ================================");

        try {
            Logger::logInfo("[VirtualPrinter] Print job saved to: " + archive.save(job));
        } catch (const std::exception &e) {
            Logger::logError("[VirtualPrinter] " + std::string(e.what()));
        }
    });

    try {
        emulator.start();
    } catch (const std::exception &e) {
        Logger::logError("[VirtualPrinter] Cannot listen on port " + std::to_string(port) + ": " + e.what());
        Logger::logError("[VirtualPrinter] Another printer or simulator may already use it");
        Logger::shutdown();
        return 1;
    }

    Logger::logInfo("[VirtualPrinter] VIRTUAL THERMAL PRINTER ONLINE on 0.0.0.0:" +
                    std::to_string(emulator.getPort()) + ", jobs saved under " + logDir);
    Logger::logInfo("[VirtualPrinter] Point the print service at this host, port " +
                    std::to_string(emulator.getPort()) + ". Ctrl+C to stop");

    while (running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Logger::logInfo("[VirtualPrinter] Shutting down, total print jobs processed: " +
                    std::to_string(emulator.getJobCount()));
    emulator.stop();
    Logger::shutdown();
    return 0;
}
