//
// Created by Andrea on 14/10/2025.
//

#include "logger/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

std::ofstream Logger::logFile_;
std::mutex Logger::logMutex_;
Logger::Options Logger::options_;
std::string Logger::currentLogPath_;
size_t Logger::currentLogSize_ = 0;
std::thread Logger::cleanupThread_;
std::atomic<bool> Logger::shutdownRequested_{false};
std::mutex Logger::cleanupMutex_;
std::condition_variable Logger::cleanupCondition_;

namespace {
    std::string localTime(const char *format) {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);

        std::tm local{};
        localtime_r(&in_time_t, &local);

        std::stringstream ss;
        ss << std::put_time(&local, format);
        return ss.str();
    }
}

void Logger::init(const Options &options) {
    std::string banner;
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        options_ = options;
        if (options_.directory.empty()) options_.directory = "logs";
        if (options_.filePrefix.empty()) options_.filePrefix = "ticket_printer";
        options_.maxFileBytes = std::max<size_t>(options_.maxFileBytes, 1);
        options_.maxFiles = std::max<size_t>(options_.maxFiles, 1);

        openNewLogFile();
        pruneLogs(options_);
        banner = "[Logger] Writing to " + currentLogPath_ + " (rotation at " + std::to_string(options_.maxFileBytes) +
                 " bytes, keeping " + std::to_string(options_.maxFiles) + " files)";
    }
    shutdownRequested_ = false;
    startCleanupThread();
    std::cout << banner << std::endl;
}

void Logger::init(const std::string &logDirectory) {
    Options options;
    options.directory = logDirectory;
    init(options);
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(cleanupMutex_);
        shutdownRequested_ = true;
    }
    cleanupCondition_.notify_all();
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::logInfo(const std::string &message) {
    log("INFO", message);
}

void Logger::logWarning(const std::string &message) {
    log("WARNING", message);
}

void Logger::logError(const std::string &message) {
    log("ERROR", message);
}

std::string Logger::currentLogPath() {
    std::lock_guard<std::mutex> lock(logMutex_);
    return currentLogPath_;
}

void Logger::log(const std::string &level, const std::string &message) {
    if (message.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    std::string formatted = "[" + level + "] [" + currentTimestamp() + "] " + message;

    std::lock_guard<std::mutex> lock(logMutex_);
    (level == "ERROR" ? std::cerr : std::cout) << formatted << std::endl;

    if (!logFile_.is_open()) return;

    if (currentLogSize_ > 0 && currentLogSize_ + formatted.size() + 1 > options_.maxFileBytes) {
        openNewLogFile();
        pruneLogs(options_);
        if (!logFile_.is_open()) return;
    }
    logFile_ << formatted << std::endl;
    currentLogSize_ += formatted.size() + 1;
}

void Logger::openNewLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }

    std::error_code ec;
    fs::create_directories(options_.directory, ec);
    if (ec) {
        std::cerr << "[Logger] Cannot create log directory " << options_.directory << ": " << ec.message()
                  << std::endl;
    }

    currentLogPath_ = nextLogFilename();
    logFile_.open(currentLogPath_, std::ios::out | std::ios::trunc);
    currentLogSize_ = 0;

    if (!logFile_.is_open()) {
        std::cerr << "[Logger] ERROR: Cannot open log file: " << currentLogPath_ << std::endl;
    }
}

// Rotations within the same second get a _1, _2... suffix instead of truncating.
std::string Logger::nextLogFilename() {
    const std::string base = options_.filePrefix + "_" + localTime("%Y%m%d_%H%M%S");
    fs::path candidate = fs::path(options_.directory) / (base + ".log");
    for (int n = 1; fs::exists(candidate); ++n) {
        candidate = fs::path(options_.directory) / (base + "_" + std::to_string(n) + ".log");
    }
    return candidate.string();
}

void Logger::pruneLogs(const Options &options) {
    try {
        if (!fs::exists(options.directory)) return;

        const auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24 * options.retentionDays);
        std::vector<std::pair<fs::file_time_type, fs::path>> kept;

        for (const auto &entry: fs::directory_iterator(options.directory)) {
            const std::string name = entry.path().filename().string();
            if (entry.path().extension() != ".log" || name.rfind(options.filePrefix + "_", 0) != 0) continue;

            auto writeTime = fs::last_write_time(entry);
            if (writeTime < cutoff) {
                fs::remove(entry);
            } else {
                kept.emplace_back(writeTime, entry.path());
            }
        }

        if (kept.size() <= options.maxFiles) return;

        // Same mtime: the later name was created later.
        std::sort(kept.begin(), kept.end());
        for (size_t i = 0; i < kept.size() - options.maxFiles; ++i) {
            fs::remove(kept[i].second);
        }
    } catch (const std::exception &e) {
        std::cerr << "[Logger] Cleanup error: " << e.what() << std::endl;
    }
}

void Logger::startCleanupThread() {
    if (cleanupThread_.joinable()) return;

    cleanupThread_ = std::thread([]() {
        std::unique_lock<std::mutex> lock(cleanupMutex_);
        while (!cleanupCondition_.wait_for(lock, std::chrono::hours(1),
                                           [] { return shutdownRequested_.load(); })) {
            lock.unlock();
            Options options;
            {
                std::lock_guard<std::mutex> logLock(logMutex_);
                options = options_;
            }
            pruneLogs(options);
            lock.lock();
        }
    });
}

std::string Logger::currentTimestamp() {
    return localTime("%Y-%m-%d %H:%M:%S");
}
