//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Process-wide logger.
 *
 * Without init() messages only go to the console. After init() they are also
 * appended to `<directory>/<filePrefix>_YYYYmmdd_HHMMSS.log`; a file past
 * maxFileBytes is replaced by a new one, and files of this prefix beyond
 * maxFiles or older than retentionDays are removed.
 */
class Logger {
public:
    struct Options {
        std::string directory = "logs";
        std::string filePrefix = "ticket_printer";
        size_t maxFileBytes = 50 * 1024 * 1024;
        size_t maxFiles = 10;
        int retentionDays = 7;
    };

    static void init(const Options &options);

    static void init(const std::string &logDirectory = "logs");

    static void shutdown();

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

    static std::string currentLogPath();

private:
    static std::ofstream logFile_;
    static std::mutex logMutex_;
    static Options options_;
    static std::string currentLogPath_;
    static size_t currentLogSize_;
    static std::thread cleanupThread_;
    static std::atomic<bool> shutdownRequested_;
    static std::mutex cleanupMutex_;
    static std::condition_variable cleanupCondition_;

    static void log(const std::string &level, const std::string &message);

    // Both expect logMutex_ held.
    static void openNewLogFile();

    static std::string nextLogFilename();

    static void pruneLogs(const Options &options);

    static void startCleanupThread();

    static std::string currentTimestamp();
};
