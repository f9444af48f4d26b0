#pragma once

#include "core/escpos/EscPosCommandBuilder.hpp"
#include "core/types/PrinterEndpoint.hpp"
#include <memory>
#include <string>

namespace core {

    /**
     * @brief Encoded print job, immutable once built.
     */
    struct EncodedJob {
        const std::string label;
        const types::PrinterEndpoint endpoint;
        const escpos::Bytes payload;
    };

    inline std::shared_ptr<const EncodedJob> makeEncodedJob(std::string label, types::PrinterEndpoint endpoint,
                                                            escpos::Bytes payload) {
        return std::make_shared<const EncodedJob>(
            EncodedJob{std::move(label), std::move(endpoint), std::move(payload)});
    }

} // namespace core
