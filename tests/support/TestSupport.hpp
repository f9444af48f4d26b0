#pragma once

#include "core/network/DeliveryChannel.hpp"
#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace testsupport {

    /**
     * @brief Fresh directory under the system temp dir, removed on destruction.
     */
    class TempDir {
    public:
        TempDir() {
            const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
            std::string name = std::string("ticket_printer_") + (info ? info->test_suite_name() : "suite") + "_" +
                               (info ? info->name() : "test") + "_" +
                               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
            path_ = std::filesystem::temp_directory_path() / name;
            std::filesystem::create_directories(path_);
        }

        ~TempDir() {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        const std::filesystem::path &path() const { return path_; }

        std::string file(const std::string &name) const { return (path_ / name).string(); }

    private:
        std::filesystem::path path_;
    };

    /**
     * @brief A loopback port nothing listens on.
     */
    inline unsigned short closedLoopbackPort() {
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor acceptor(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
        unsigned short port = acceptor.local_endpoint().port();
        acceptor.close();
        return port;
    }

    /**
     * @brief Loopback listener that never accepts, so connected peers are never read.
     *
     * The kernel completes handshakes from the backlog; a write larger than the
     * socket buffers then blocks until the sender gives up.
     */
    class StalledPeer {
    public:
        StalledPeer() : acceptor_(io_, {boost::asio::ip::make_address("127.0.0.1"), 0}) {}

        unsigned short port() const { return acceptor_.local_endpoint().port(); }

    private:
        boost::asio::io_context io_;
        boost::asio::ip::tcp::acceptor acceptor_;
    };

    inline core::escpos::Bytes oversizedPayload(size_t megabytes = 32) {
        return core::escpos::Bytes(megabytes * 1024 * 1024, 'A');
    }

    /**
     * @brief Scriptable DeliveryChannel recording what it was asked to send.
     */
    class FakeDeliveryChannel : public core::DeliveryChannel {
    public:
        struct Delivery {
            core::types::PrinterEndpoint endpoint;
            core::escpos::Bytes payload;
        };

        using Behaviour = std::function<core::types::DeliveryResult(const core::types::PrinterEndpoint &,
                                                                    const core::escpos::Bytes &)>;

        core::types::DeliveryResult deliver(const core::types::PrinterEndpoint &endpoint,
                                            const core::escpos::Bytes &data) override {
            const std::string key = endpoint.key();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                int active = ++inFlight_[key];
                if (active > maxInFlight_[key]) maxInFlight_[key] = active;
                deliveries_.push_back({endpoint, data});
            }

            Behaviour behaviour;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                behaviour = behaviour_;
            }
            auto result = behaviour ? behaviour(endpoint, data) : core::types::DeliveryResult::success();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --inFlight_[key];
                finished_.push_back({endpoint, data});
            }
            condition_.notify_all();
            return result;
        }

        core::types::DeliveryResult probe(const core::types::PrinterEndpoint &endpoint) override {
            std::lock_guard<std::mutex> lock(mutex_);
            probes_.push_back(endpoint);
            return probeResult_;
        }

        void setBehaviour(Behaviour behaviour) {
            std::lock_guard<std::mutex> lock(mutex_);
            behaviour_ = std::move(behaviour);
        }

        void setProbeResult(core::types::DeliveryResult result) {
            std::lock_guard<std::mutex> lock(mutex_);
            probeResult_ = std::move(result);
        }

        std::vector<Delivery> deliveries() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return deliveries_;
        }

        std::vector<Delivery> finished() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return finished_;
        }

        std::vector<core::types::PrinterEndpoint> probes() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return probes_;
        }

        int maxInFlight(const std::string &key) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = maxInFlight_.find(key);
            return it == maxInFlight_.end() ? 0 : it->second;
        }

        bool waitForFinished(size_t count, std::chrono::milliseconds timeout) const {
            std::unique_lock<std::mutex> lock(mutex_);
            return condition_.wait_for(lock, timeout, [&]() { return finished_.size() >= count; });
        }

    private:
        mutable std::mutex mutex_;
        mutable std::condition_variable condition_;
        Behaviour behaviour_;
        core::types::DeliveryResult probeResult_ = core::types::DeliveryResult::success("connected");
        std::vector<Delivery> deliveries_;
        std::vector<Delivery> finished_;
        std::vector<core::types::PrinterEndpoint> probes_;
        std::map<std::string, int> inFlight_;
        std::map<std::string, int> maxInFlight_;
    };

    /**
     * @brief One-shot gate a test opens to release blocked threads.
     */
    class Gate {
    public:
        void open() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                open_ = true;
            }
            condition_.notify_all();
        }

        bool wait(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            return condition_.wait_for(lock, timeout, [&]() { return open_; });
        }

    private:
        std::mutex mutex_;
        std::condition_variable condition_;
        bool open_ = false;
    };

    inline std::string bytesToString(const core::escpos::Bytes &bytes) {
        return std::string(bytes.begin(), bytes.end());
    }

} // namespace testsupport
