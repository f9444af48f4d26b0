#pragma once

#include "../DeliveryChannel.hpp"
#include <chrono>

namespace core {

/**
 * @brief DeliveryChannel over a raw TCP socket using Boost.Asio
 *
 * Each call runs its own io_context on the calling thread. The deadline covers
 * resolve, connect and write; after the write completes the send side is shut
 * down and the peer gets `closeGrace` to close before the socket is dropped.
 */
    class TcpDeliveryChannel : public DeliveryChannel {
    public:
        explicit TcpDeliveryChannel(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
                                    std::chrono::milliseconds closeGrace = std::chrono::milliseconds(200));

        types::DeliveryResult deliver(const types::PrinterEndpoint &endpoint, const escpos::Bytes &data) override;

        types::DeliveryResult probe(const types::PrinterEndpoint &endpoint) override;

        std::chrono::milliseconds getTimeout() const { return timeout_; }

    private:
        std::chrono::milliseconds timeout_;
        std::chrono::milliseconds closeGrace_;

        /**
         * @brief Shared connect/write/drain sequence; `data` == nullptr means probe.
         */
        types::DeliveryResult run(const types::PrinterEndpoint &endpoint, const escpos::Bytes *data);
    };

} // namespace core
