//
// Created by Andrea on 16/10/2025.
//

#pragma once

#include "application/config/PrinterConfigStore.hpp"
#include "core/escpos/EscPosCommandBuilder.hpp"
#include "core/network/DeliveryChannel.hpp"
#include "core/queue/PrintDispatchQueue.hpp"
#include "formatter/ReportFormatter.hpp"
#include "formatter/TicketFormatter.hpp"
#include <boost/beast/http.hpp>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace connector::controllers {

    namespace http = boost::beast::http;

    /**
     * @brief Request handling for the printer HTTP API.
     *
     * Routes are accepted both bare ("/print/booking") and under "/api/printer".
     * Every failure is turned into a JSON {error} response; nothing escapes handle().
     */
    class PrinterController {
    public:
        using Request = http::request<http::string_body>;
        using Response = http::response<http::string_body>;

        struct Settings {
            formatter::LayoutOptions layout;
            core::escpos::EncoderOptions encoder;
            std::string defaultPrinterId = "printer1";
            int deliveryTimeoutMs = 5000;
        };

        static constexpr const char *ROUTE_PREFIX = "/api/printer";

        PrinterController(std::shared_ptr<core::config::PrinterConfigStore> store,
                          std::shared_ptr<core::PrintDispatchQueue> dispatchQueue,
                          std::shared_ptr<core::DeliveryChannel> channel,
                          Settings settings);

        Response handle(const Request &request);

        struct Statistics {
            size_t requestsReceived = 0;
            size_t printsSucceeded = 0;
            size_t printsFailed = 0;
            size_t validationErrors = 0;
            size_t internalErrors = 0;
        };

        Statistics getStatistics() const;

    private:
        std::shared_ptr<core::config::PrinterConfigStore> store_;
        std::shared_ptr<core::PrintDispatchQueue> dispatchQueue_;
        std::shared_ptr<core::DeliveryChannel> channel_;
        Settings settings_;
        formatter::TicketFormatter ticketFormatter_;
        formatter::ReportFormatter reportFormatter_;

        mutable Statistics stats_;
        mutable std::mutex statsMutex_;

        Response route(const Request &request, const std::vector<std::string> &segments);

        Response getConfig(const Request &request, const std::string &printerId);

        Response putConfig(const Request &request, const std::string &printerId);

        Response testConnection(const Request &request, const std::string &printerId);

        Response printTicket(const Request &request, formatter::TicketKind kind);

        Response printStatistics(const Request &request);

        /**
         * @brief Encodes the lines, queues them for the endpoint and waits for the outcome.
         */
        Response dispatch(const Request &request, const std::string &label, const std::vector<std::string> &lines,
                          const core::types::PrinterEndpoint &endpoint, const std::string &successMessage);

        core::types::PrinterEndpoint resolveEndpoint(const std::optional<core::types::PrinterEndpoint> &requested);

        std::string printerIdOrDefault(const std::string &printerId) const;

        static std::vector<std::string> splitPath(const std::string &target);

        static nlohmann::json parseBody(const Request &request);

        static std::string describeFailure(const core::types::DeliveryResult &result,
                                           const core::types::PrinterEndpoint &endpoint);

        static Response makeJson(const Request &request, http::status status, const nlohmann::json &body);

        static Response makeError(const Request &request, http::status status, const std::string &message);

        static void applyCors(Response &response);

        void count(size_t Statistics::*counter);
    };

} // namespace connector::controllers
