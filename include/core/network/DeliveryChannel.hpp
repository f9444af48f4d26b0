//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include "core/escpos/EscPosCommandBuilder.hpp"
#include "core/types/PrinterEndpoint.hpp"
#include "core/types/Result.hpp"

namespace core {

/**
 * @brief Transport that carries an encoded job to a network printer.
 */
    class DeliveryChannel {
    public:
        virtual ~DeliveryChannel() = default;

        /**
         * @brief Sends the whole buffer to the endpoint.
         * @param endpoint Printer address.
         * @param data Encoded ESC/POS job.
         * @return Success once every byte was handed to the socket layer.
         */
        virtual types::DeliveryResult deliver(const types::PrinterEndpoint &endpoint, const escpos::Bytes &data) = 0;

        /**
         * @brief Opens and closes a connection without sending anything.
         */
        virtual types::DeliveryResult probe(const types::PrinterEndpoint &endpoint) = 0;
    };

} // namespace core
