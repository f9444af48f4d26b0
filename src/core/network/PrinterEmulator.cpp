//
// Created by Andrea on 15/10/2025.
//

#include "core/network/PrinterEmulator.hpp"
#include "logger/Logger.hpp"
#include <array>

namespace core {
    using boost::asio::ip::tcp;

    class PrinterEmulator::Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(PrinterEmulator &owner, tcp::socket socket)
                : owner_(owner), socket_(std::move(socket)), closeTimer_(socket_.get_executor()) {
            job_.connectedAt = std::chrono::steady_clock::now();
            boost::system::error_code ec;
            auto remote = socket_.remote_endpoint(ec);
            job_.peer = ec ? "unknown" : remote.address().to_string() + ":" + std::to_string(remote.port());
        }

        void start() {
            owner_.onConnectionOpened();
            Logger::logInfo("[PrinterEmulator] Client connected: " + job_.peer);
            read();
        }

    private:
        PrinterEmulator &owner_;
        tcp::socket socket_;
        boost::asio::steady_timer closeTimer_;
        std::array<uint8_t, 4096> buffer_{};
        ReceivedJob job_;

        void read() {
            auto self = shared_from_this();
            socket_.async_read_some(boost::asio::buffer(buffer_),
                                    [this, self](const boost::system::error_code &ec, std::size_t n) {
                                        if (!ec) {
                                            job_.data.insert(job_.data.end(), buffer_.begin(), buffer_.begin() + n);
                                            read();
                                            return;
                                        }
                                        if (ec != boost::asio::error::eof) {
                                            Logger::logWarning("[PrinterEmulator] Read error from " + job_.peer +
                                                               ": " + ec.message());
                                        }
                                        finish();
                                    });
        }

        void finish() {
            job_.completedAt = std::chrono::steady_clock::now();
            if (!job_.data.empty()) {
                owner_.onJobCompleted(job_);
            } else {
                Logger::logInfo("[PrinterEmulator] No data received from " + job_.peer);
            }

            if (owner_.closeDelay_.count() <= 0) {
                close();
                return;
            }
            auto self = shared_from_this();
            closeTimer_.expires_after(owner_.closeDelay_);
            closeTimer_.async_wait([this, self](const boost::system::error_code &) { close(); });
        }

        void close() {
            boost::system::error_code ignored;
            socket_.shutdown(tcp::socket::shutdown_both, ignored);
            socket_.close(ignored);
            owner_.onConnectionClosed();
        }
    };

    PrinterEmulator::PrinterEmulator(std::string bindAddress, unsigned short port)
            : bindAddress_(std::move(bindAddress)), requestedPort_(port) {
    }

    PrinterEmulator::~PrinterEmulator() {
        stop();
    }

    void PrinterEmulator::start() {
        if (running_) {
            Logger::logWarning("[PrinterEmulator] Already running");
            return;
        }

        tcp::endpoint endpoint(boost::asio::ip::make_address(bindAddress_), requestedPort_);
        acceptor_ = std::make_unique<tcp::acceptor>(io_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen();
        boundPort_ = acceptor_->local_endpoint().port();

        io_.restart();
        doAccept();
        running_ = true;
        ioThread_ = std::thread([this]() {
            try {
                io_.run();
            } catch (const std::exception &e) {
                Logger::logError("[PrinterEmulator] I/O thread crashed: " + std::string(e.what()));
                running_ = false;
            }
        });

        Logger::logInfo("[PrinterEmulator] Listening on " + bindAddress_ + ":" + std::to_string(boundPort_.load()));
    }

    void PrinterEmulator::stop() {
        if (!running_ && !ioThread_.joinable()) return;
        running_ = false;

        boost::asio::post(io_, [this]() {
            boost::system::error_code ignored;
            if (acceptor_) acceptor_->close(ignored);
        });
        io_.stop();
        if (ioThread_.joinable()) {
            ioThread_.join();
        }
        acceptor_.reset();
        Logger::logInfo("[PrinterEmulator] Stopped after " + std::to_string(getJobCount()) + " job(s)");
    }

    void PrinterEmulator::setJobCallback(JobCallback callback) {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        callback_ = std::move(callback);
    }

    std::vector<ReceivedJob> PrinterEmulator::getJobs() const {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        return jobs_;
    }

    size_t PrinterEmulator::getJobCount() const {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        return jobs_.size();
    }

    bool PrinterEmulator::waitForJobs(size_t count, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(jobsMutex_);
        return jobsCondition_.wait_for(lock, timeout, [&]() { return jobs_.size() >= count; });
    }

    void PrinterEmulator::doAccept() {
        acceptor_->async_accept([this](const boost::system::error_code &ec, tcp::socket socket) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    Logger::logError("[PrinterEmulator] Accept failed: " + ec.message());
                }
                return;
            }
            std::make_shared<Connection>(*this, std::move(socket))->start();
            doAccept();
        });
    }

    void PrinterEmulator::onConnectionOpened() {
        size_t active = ++activeConnections_;
        size_t seen = maxConcurrent_.load();
        while (active > seen && !maxConcurrent_.compare_exchange_weak(seen, active)) {
        }
    }

    void PrinterEmulator::onJobCompleted(ReceivedJob job) {
        JobCallback callback;
        {
            std::lock_guard<std::mutex> lock(jobsMutex_);
            job.sequence = jobs_.size() + 1;
            jobs_.push_back(job);
            callback = callback_;
        }
        jobsCondition_.notify_all();

        Logger::logInfo("[PrinterEmulator] Job #" + std::to_string(job.sequence) + " received: " +
                        std::to_string(job.data.size()) + " bytes from " + job.peer);

        if (callback) {
            try {
                callback(job);
            } catch (const std::exception &e) {
                Logger::logError("[PrinterEmulator] Job callback failed: " + std::string(e.what()));
            }
        }
    }

    void PrinterEmulator::onConnectionClosed() {
        --activeConnections_;
    }

} // namespace core
