#include "core/network/impl/TcpDeliveryChannel.hpp"
#include "logger/Logger.hpp"
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <array>
#include <functional>
#include <optional>

namespace core {
    using boost::asio::ip::tcp;

    namespace {
        enum class Stage {
            Connecting,
            Writing,
            Draining
        };
    }

    TcpDeliveryChannel::TcpDeliveryChannel(std::chrono::milliseconds timeout, std::chrono::milliseconds closeGrace)
            : timeout_(timeout), closeGrace_(closeGrace) {
    }

    types::DeliveryResult TcpDeliveryChannel::deliver(const types::PrinterEndpoint &endpoint,
                                                      const escpos::Bytes &data) {
        Logger::logInfo("[TcpDeliveryChannel] Sending " + std::to_string(data.size()) + " bytes to " +
                        endpoint.key());
        auto result = run(endpoint, &data);
        if (result.isSuccess()) {
            Logger::logInfo("[TcpDeliveryChannel] Job handed to " + endpoint.key());
        } else {
            Logger::logError("[TcpDeliveryChannel] Delivery to " + endpoint.key() + " failed: " +
                             result.message + (result.detail.empty() ? "" : " (" + result.detail + ")"));
        }
        return result;
    }

    types::DeliveryResult TcpDeliveryChannel::probe(const types::PrinterEndpoint &endpoint) {
        Logger::logInfo("[TcpDeliveryChannel] Probing " + endpoint.key());
        auto result = run(endpoint, nullptr);
        if (!result.isSuccess()) {
            Logger::logWarning("[TcpDeliveryChannel] Probe of " + endpoint.key() + " failed: " + result.message);
        }
        return result;
    }

    types::DeliveryResult TcpDeliveryChannel::run(const types::PrinterEndpoint &endpoint, const escpos::Bytes *data) {
        boost::asio::io_context io;
        tcp::resolver resolver(io);
        tcp::socket socket(io);
        boost::asio::steady_timer deadline(io);
        std::array<char, 256> drainBuffer{};

        Stage stage = Stage::Connecting;
        bool timedOut = false;
        std::optional<types::DeliveryResult> result;

        // First outcome wins; later socket events cannot resolve the job twice.
        auto finish = [&](types::DeliveryResult outcome) {
            if (!result) result = std::move(outcome);
        };

        auto closeSocket = [&]() {
            boost::system::error_code ignored;
            socket.close(ignored);
        };

        std::function<void()> drain = [&]() {
            socket.async_read_some(boost::asio::buffer(drainBuffer),
                                   [&](const boost::system::error_code &ec, std::size_t) {
                                       if (ec) {
                                           // EOF: the printer closed its side, transfer complete
                                           deadline.cancel();
                                           closeSocket();
                                           return;
                                       }
                                       drain();
                                   });
        };

        auto onWritten = [&](const boost::system::error_code &ec, std::size_t written) {
            if (ec) {
                deadline.cancel();
                closeSocket();
                finish(timedOut ? types::DeliveryResult::timeout("write did not complete")
                                : types::DeliveryResult::writeFailed(ec.message()));
                return;
            }

            finish(types::DeliveryResult::success("sent " + std::to_string(written) + " bytes"));
            stage = Stage::Draining;

            boost::system::error_code ignored;
            socket.shutdown(tcp::socket::shutdown_send, ignored);

            deadline.expires_after(closeGrace_);
            deadline.async_wait([&](const boost::system::error_code &timerEc) {
                if (timerEc == boost::asio::error::operation_aborted) return;
                closeSocket();
            });
            drain();
        };

        auto onConnected = [&](const boost::system::error_code &ec, const tcp::endpoint &) {
            if (ec) {
                deadline.cancel();
                finish(timedOut ? types::DeliveryResult::timeout("connect did not complete")
                                : types::DeliveryResult::unreachable(ec.message()));
                return;
            }

            if (data == nullptr) {
                deadline.cancel();
                closeSocket();
                finish(types::DeliveryResult::success("connected"));
                return;
            }

            stage = Stage::Writing;
            boost::asio::async_write(socket, boost::asio::buffer(*data), onWritten);
        };

        deadline.expires_after(timeout_);
        deadline.async_wait([&](const boost::system::error_code &ec) {
            if (ec == boost::asio::error::operation_aborted) return;
            if (stage == Stage::Draining) {
                closeSocket();
                return;
            }
            timedOut = true;
            resolver.cancel();
            closeSocket();
        });

        resolver.async_resolve(endpoint.host, std::to_string(endpoint.port),
                               [&](const boost::system::error_code &ec, const tcp::resolver::results_type &results) {
                                   if (ec) {
                                       deadline.cancel();
                                       finish(timedOut ? types::DeliveryResult::timeout("resolve did not complete")
                                                       : types::DeliveryResult::unreachable(ec.message()));
                                       return;
                                   }
                                   boost::asio::async_connect(socket, results, onConnected);
                               });

        try {
            io.run();
        } catch (const std::exception &e) {
            Logger::logError("[TcpDeliveryChannel] I/O loop failed: " + std::string(e.what()));
            finish(data == nullptr ? types::DeliveryResult::unreachable(e.what())
                                   : types::DeliveryResult::writeFailed(e.what()));
        }

        if (!result) {
            return types::DeliveryResult::timeout("no completion before deadline");
        }
        return *result;
    }

} // namespace core
