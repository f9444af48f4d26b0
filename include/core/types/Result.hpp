#pragma once

#include <string>

namespace core::types {

    enum class DeliveryCode {
        Success,
        Unreachable,
        WriteFailed,
        Timeout,
        Cancelled
    };

    /**
     * @brief Outcome of one delivery (or probe) against a printer endpoint.
     *
     * Success means the whole buffer was handed to the socket layer; the
     * printer itself never acknowledges a job.
     */
    struct DeliveryResult {
        DeliveryCode code;
        std::string message;
        std::string detail;

        inline bool isSuccess() const {
            return code == DeliveryCode::Success;
        }

        inline bool isUnreachable() const {
            return code == DeliveryCode::Unreachable;
        }

        inline bool isTimeout() const {
            return code == DeliveryCode::Timeout;
        }

        static inline DeliveryResult success(const std::string &msg = "sent") {
            return {DeliveryCode::Success, msg, ""};
        }

        static inline DeliveryResult unreachable(const std::string &detail = "") {
            return {DeliveryCode::Unreachable, "printer unreachable", detail};
        }

        static inline DeliveryResult writeFailed(const std::string &detail = "") {
            return {DeliveryCode::WriteFailed, "write failed", detail};
        }

        static inline DeliveryResult timeout(const std::string &detail = "") {
            return {DeliveryCode::Timeout, "timeout", detail};
        }

        static inline DeliveryResult cancelled(const std::string &detail = "") {
            return {DeliveryCode::Cancelled, "cancelled", detail};
        }
    };

    inline std::string deliveryCodeToString(DeliveryCode code) {
        switch (code) {
            case DeliveryCode::Success: return "SUCCESS";
            case DeliveryCode::Unreachable: return "UNREACHABLE";
            case DeliveryCode::WriteFailed: return "WRITE_FAILED";
            case DeliveryCode::Timeout: return "TIMEOUT";
            case DeliveryCode::Cancelled: return "CANCELLED";
            default: return "UNKNOWN";
        }
    }

}
