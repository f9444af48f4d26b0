//
// Created by Andrea on 16/10/2025.
//

#include "connector/controllers/PrinterController.hpp"
#include "connector/models/printer/PrinterConfigUpdate.hpp"
#include "connector/models/printer/PrinterSettings.hpp"
#include "connector/models/printer/StatisticsReportRequest.hpp"
#include "connector/models/printer/TicketRequest.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <stdexcept>

namespace connector::controllers {

    namespace {
        std::string successMessageFor(formatter::TicketKind kind) {
            switch (kind) {
                case formatter::TicketKind::Booking: return "booking ticket printed successfully";
                case formatter::TicketKind::DayPass: return "day pass ticket printed successfully";
                case formatter::TicketKind::ExitPass: return "exit pass ticket printed successfully";
                default: return "ticket printed successfully";
            }
        }

        std::string joinErrors(const std::vector<std::string> &errors) {
            std::string joined;
            for (const auto &error: errors) {
                if (!joined.empty()) joined += "; ";
                joined += error;
            }
            return joined;
        }
    }

    PrinterController::PrinterController(std::shared_ptr<core::config::PrinterConfigStore> store,
                                         std::shared_ptr<core::PrintDispatchQueue> dispatchQueue,
                                         std::shared_ptr<core::DeliveryChannel> channel,
                                         Settings settings)
        : store_(std::move(store)), dispatchQueue_(std::move(dispatchQueue)), channel_(std::move(channel)),
          settings_(std::move(settings)), ticketFormatter_(settings_.layout), reportFormatter_(settings_.layout) {
        if (!store_) {
            throw std::invalid_argument("PrinterConfigStore cannot be null");
        }
        if (!dispatchQueue_) {
            throw std::invalid_argument("PrintDispatchQueue cannot be null");
        }
        if (!channel_) {
            throw std::invalid_argument("DeliveryChannel cannot be null");
        }

        Logger::logInfo("[PrinterController] Ready, default printer: " + settings_.defaultPrinterId);
    }

    PrinterController::Response PrinterController::handle(const Request &request) {
        count(&Statistics::requestsReceived);

        const std::string method(request.method_string());
        const std::string target(request.target());
        Logger::logInfo("[PrinterController] " + method + " " + target);

        try {
            if (request.method() == http::verb::options) {
                return makeJson(request, http::status::ok, nlohmann::json::object());
            }
            return route(request, splitPath(target));
        } catch (const core::types::ValidationException &e) {
            count(&Statistics::validationErrors);
            Logger::logWarning("[PrinterController] Rejected " + target + ": " + e.what());
            return makeError(request, http::status::bad_request, e.what());
        } catch (const nlohmann::json::exception &e) {
            count(&Statistics::validationErrors);
            Logger::logWarning("[PrinterController] Malformed body for " + target + ": " + e.what());
            return makeError(request, http::status::bad_request, std::string("Invalid JSON: ") + e.what());
        } catch (const std::exception &e) {
            count(&Statistics::internalErrors);
            Logger::logError("[PrinterController] " + method + " " + target + " failed: " + e.what());
            return makeError(request, http::status::internal_server_error, "Internal server error");
        }
    }

    PrinterController::Statistics PrinterController::getStatistics() const {
        std::lock_guard<std::mutex> lock(statsMutex_);
        return stats_;
    }

    PrinterController::Response PrinterController::route(const Request &request,
                                                         const std::vector<std::string> &segments) {
        const auto method = request.method();
        const size_t size = segments.size();

        if (size == 1 && segments[0] == "health" && method == http::verb::get) {
            return makeJson(request, http::status::ok, {{"status", "ok"}, {"service", "printer-service"}});
        }

        if (size >= 1 && size <= 2 && segments[0] == "config") {
            const std::string printerId = size == 2 ? segments[1] : "";
            if (method == http::verb::get) return getConfig(request, printerId);
            if (method == http::verb::put) return putConfig(request, printerId);
        }

        if (size >= 1 && size <= 2 && segments[0] == "test" && method == http::verb::post) {
            return testConnection(request, size == 2 ? segments[1] : "");
        }

        if (size == 2 && segments[0] == "print" && method == http::verb::post) {
            if (segments[1] == "statistics") {
                return printStatistics(request);
            }
            if (auto kind = formatter::ticketKindFromString(segments[1])) {
                return printTicket(request, *kind);
            }
        }

        return makeError(request, http::status::not_found, "Not found");
    }

    PrinterController::Response PrinterController::getConfig(const Request &request, const std::string &printerId) {
        const std::string id = printerIdOrDefault(printerId);
        models::printer::PrinterSettings settings(id, store_->get(id), settings_.deliveryTimeoutMs,
                                                  id == settings_.defaultPrinterId);
        return makeJson(request, http::status::ok, settings.toJson());
    }

    PrinterController::Response PrinterController::putConfig(const Request &request, const std::string &printerId) {
        const std::string id = printerIdOrDefault(printerId);
        models::printer::PrinterConfigUpdate update(parseBody(request));

        auto result = store_->set(id, update.endpoint);
        if (!result.isValid) {
            count(&Statistics::validationErrors);
            return makeError(request, http::status::bad_request, joinErrors(result.errors));
        }

        models::printer::PrinterSettings settings(id, update.endpoint, settings_.deliveryTimeoutMs,
                                                  id == settings_.defaultPrinterId);
        return makeJson(request, http::status::ok, {
                            {"message", "printer configuration updated successfully"},
                            {"printer", settings.toJson()}
                        });
    }

    PrinterController::Response PrinterController::testConnection(const Request &request,
                                                                  const std::string &printerId) {
        const auto endpoint = store_->get(printerIdOrDefault(printerId));
        const auto result = channel_->probe(endpoint);

        return makeJson(request, http::status::ok, {
                            {"connected", result.isSuccess()},
                            {"error", result.isSuccess() ? "" : describeFailure(result, endpoint)}
                        });
    }

    PrinterController::Response PrinterController::printTicket(const Request &request, formatter::TicketKind kind) {
        models::printer::TicketRequest ticketRequest(parseBody(request));
        ticketRequest.requireValid("ticket amounts and counts must not be negative");

        const auto endpoint = resolveEndpoint(ticketRequest.printerConfig);
        const auto lines = ticketFormatter_.format(ticketRequest.ticket, kind);
        const std::string label = formatter::ticketKindToString(kind) + " " + ticketRequest.ticket.licensePlate;

        return dispatch(request, label, lines, endpoint, successMessageFor(kind));
    }

    PrinterController::Response PrinterController::printStatistics(const Request &request) {
        models::printer::StatisticsReportRequest reportRequest(parseBody(request));
        reportRequest.requireValid("report totals must not be negative");

        const auto endpoint = resolveEndpoint(reportRequest.printerConfig);
        const auto lines = reportFormatter_.format(reportRequest.report);

        return dispatch(request, "statistics " + reportRequest.report.periodLabel, lines, endpoint,
                        "statistics report printed successfully");
    }

    PrinterController::Response PrinterController::dispatch(const Request &request, const std::string &label,
                                                            const std::vector<std::string> &lines,
                                                            const core::types::PrinterEndpoint &endpoint,
                                                            const std::string &successMessage) {
        auto job = core::makeEncodedJob(label, endpoint, core::escpos::EscPosCommandBuilder::encode(
                                            lines, settings_.encoder));
        Logger::logInfo("[PrinterController] Queueing '" + label + "' (" + std::to_string(job->payload.size()) +
                        " bytes) for " + endpoint.key());

        auto result = dispatchQueue_->enqueue(job).get();
        if (result.isSuccess()) {
            count(&Statistics::printsSucceeded);
            return makeJson(request, http::status::ok, {{"message", successMessage}});
        }

        count(&Statistics::printsFailed);
        const std::string reason = describeFailure(result, endpoint);
        Logger::logError("[PrinterController] '" + label + "' not printed: " + reason);
        return makeError(request, http::status::bad_gateway, reason);
    }

    core::types::PrinterEndpoint PrinterController::resolveEndpoint(
        const std::optional<core::types::PrinterEndpoint> &requested) {
        if (!requested) {
            return store_->get(settings_.defaultPrinterId);
        }

        auto validation = core::config::PrinterConfigStore::validateEndpoint(*requested);
        if (!validation.isValid) {
            throw core::types::ValidationException("printerConfig: " + joinErrors(validation.errors));
        }
        return *requested;
    }

    std::string PrinterController::printerIdOrDefault(const std::string &printerId) const {
        return printerId.empty() ? settings_.defaultPrinterId : printerId;
    }

    std::vector<std::string> PrinterController::splitPath(const std::string &target) {
        std::string path = target.substr(0, target.find('?'));

        const std::string prefix(ROUTE_PREFIX);
        if (path.compare(0, prefix.size(), prefix) == 0 &&
            (path.size() == prefix.size() || path[prefix.size()] == '/')) {
            path.erase(0, prefix.size());
        }

        std::vector<std::string> segments;
        size_t start = 0;
        while (start <= path.size()) {
            size_t slash = path.find('/', start);
            if (slash == std::string::npos) slash = path.size();
            if (slash > start) {
                segments.push_back(path.substr(start, slash - start));
            }
            start = slash + 1;
        }
        return segments;
    }

    nlohmann::json PrinterController::parseBody(const Request &request) {
        if (request.body().empty()) {
            throw core::types::ValidationException("request body is empty");
        }
        return nlohmann::json::parse(request.body());
    }

    std::string PrinterController::describeFailure(const core::types::DeliveryResult &result,
                                                   const core::types::PrinterEndpoint &endpoint) {
        std::string reason = result.message + " at " + endpoint.key();
        if (!result.detail.empty()) {
            reason += " (" + result.detail + ")";
        }
        return reason;
    }

    PrinterController::Response PrinterController::makeJson(const Request &request, http::status status,
                                                             const nlohmann::json &body) {
        Response response{status, request.version()};
        response.set(http::field::content_type, "application/json");
        applyCors(response);
        response.keep_alive(request.keep_alive());
        // Parser messages may quote raw request bytes.
        response.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        response.prepare_payload();
        return response;
    }

    PrinterController::Response PrinterController::makeError(const Request &request, http::status status,
                                                              const std::string &message) {
        return makeJson(request, status, {{"error", message}});
    }

    void PrinterController::applyCors(Response &response) {
        response.set(http::field::access_control_allow_origin, "*");
        response.set(http::field::access_control_allow_methods, "GET, POST, PUT, OPTIONS");
        response.set(http::field::access_control_allow_headers, "Content-Type");
    }

    void PrinterController::count(size_t Statistics::*counter) {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++(stats_.*counter);
    }

} // namespace connector::controllers
