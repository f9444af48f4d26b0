//
// Created by Andrea on 15/10/2025.
//

#pragma once

#include "core/escpos/EscPosCommandBuilder.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace core {

    /**
     * @brief One print job as seen by the emulated printer: every byte of one connection.
     */
    struct ReceivedJob {
        size_t sequence = 0;
        std::string peer;
        escpos::Bytes data;
        std::chrono::steady_clock::time_point connectedAt;
        std::chrono::steady_clock::time_point completedAt;
    };

    /**
     * @brief Raw TCP listener that behaves like a network thermal printer.
     *
     * Accepts connections, collects bytes until the client ends its side, and
     * stores each connection as a job. Used by the virtual printer tool and as
     * the mock printer in tests.
     */
    class PrinterEmulator {
    public:
        using JobCallback = std::function<void(const ReceivedJob &)>;

        explicit PrinterEmulator(std::string bindAddress = "0.0.0.0", unsigned short port = 9100);

        ~PrinterEmulator();

        PrinterEmulator(const PrinterEmulator &) = delete;

        PrinterEmulator &operator=(const PrinterEmulator &) = delete;

        /**
         * @brief Binds and starts the accept loop on a background thread.
         * @throws boost::system::system_error when the port cannot be bound
         */
        void start();

        void stop();

        bool isRunning() const { return running_.load(); }

        /**
         * @brief Bound port; meaningful after start(), resolves port 0 to the real one.
         */
        unsigned short getPort() const { return boundPort_.load(); }

        void setJobCallback(JobCallback callback);

        /**
         * @brief Keeps each connection open this long after the client's EOF.
         */
        void setCloseDelay(std::chrono::milliseconds delay) { closeDelay_ = delay; }

        std::vector<ReceivedJob> getJobs() const;

        size_t getJobCount() const;

        bool waitForJobs(size_t count, std::chrono::milliseconds timeout) const;

        /**
         * @brief Highest number of simultaneously open client connections seen.
         */
        size_t getMaxConcurrentConnections() const { return maxConcurrent_.load(); }

    private:
        class Connection;

        std::string bindAddress_;
        unsigned short requestedPort_;
        std::atomic<unsigned short> boundPort_{0};
        std::chrono::milliseconds closeDelay_{0};

        boost::asio::io_context io_;
        std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
        std::thread ioThread_;
        std::atomic<bool> running_{false};

        mutable std::mutex jobsMutex_;
        mutable std::condition_variable jobsCondition_;
        std::vector<ReceivedJob> jobs_;
        JobCallback callback_;

        std::atomic<size_t> activeConnections_{0};
        std::atomic<size_t> maxConcurrent_{0};

        void doAccept();

        void onConnectionOpened();

        void onJobCompleted(ReceivedJob job);

        void onConnectionClosed();
    };

} // namespace core
