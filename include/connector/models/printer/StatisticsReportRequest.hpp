#pragma once

#include "../BaseModel.hpp"
#include "../JsonFields.hpp"
#include "core/utils/Timestamp.hpp"
#include "formatter/TicketData.hpp"
#include <optional>
#include <string>

namespace connector::models::printer {

    /**
     * @brief Body of POST /print/statistics.
     */
    class StatisticsReportRequest : public BaseModel {
    public:
        formatter::ReportData report;
        std::optional<core::types::PrinterEndpoint> printerConfig;

        StatisticsReportRequest() = default;

        explicit StatisticsReportRequest(const nlohmann::json &json) { fromJson(json); }

        // BaseModel implementation
        nlohmann::json toJson() const override {
            nlohmann::json staff = nlohmann::json::array();
            for (const auto &row: report.staffData) {
                staff.push_back({
                    {"name",          row.name},
                    {"seats",         row.seats},
                    {"seatIncome",    row.seatIncome},
                    {"dayPasses",     row.dayPasses},
                    {"dayPassIncome", row.dayPassIncome},
                    {"income",        row.income}
                });
            }

            nlohmann::json json{
                {"periodLabel",        report.periodLabel},
                {"totalSeatsBooked",   report.totalSeatsBooked},
                {"totalSeatIncome",    report.totalSeatIncome},
                {"totalDayPassesSold", report.totalDayPassesSold},
                {"totalDayPassIncome", report.totalDayPassIncome},
                {"totalIncome",        report.totalIncome},
                {"staffData",          staff},
                {"createdBy",          report.createdBy},
                {"createdAt",          report.createdAt}
            };
            if (printerConfig) {
                json["printerConfig"] = {{"ip", printerConfig->host}, {"port", printerConfig->port}};
            }
            return json;
        }

        void fromJson(const nlohmann::json &json) override {
            if (!json.is_object()) {
                throw core::types::ValidationException("report body must be a JSON object");
            }

            report = formatter::ReportData{};
            report.periodLabel = fields::optionalString(json, "periodLabel");
            report.totalSeatsBooked = fields::optionalInteger(json, "totalSeatsBooked").value_or(0);
            report.totalSeatIncome = fields::optionalNumber(json, "totalSeatIncome").value_or(0.0);
            report.totalDayPassesSold = fields::optionalInteger(json, "totalDayPassesSold").value_or(0);
            report.totalDayPassIncome = fields::optionalNumber(json, "totalDayPassIncome").value_or(0.0);
            report.totalIncome = fields::optionalNumber(json, "totalIncome").value_or(0.0);

            if (!fields::isAbsent(json, "staffData")) {
                const auto &rows = json.at("staffData");
                if (!rows.is_array()) {
                    throw core::types::ValidationException("staffData must be an array");
                }
                for (const auto &row: rows) {
                    if (!row.is_object()) {
                        throw core::types::ValidationException("staffData entries must be objects");
                    }
                    formatter::StaffRow staff;
                    staff.name = fields::optionalString(row, "name");
                    staff.seats = fields::optionalInteger(row, "seats").value_or(0);
                    staff.seatIncome = fields::optionalNumber(row, "seatIncome").value_or(0.0);
                    staff.dayPasses = fields::optionalInteger(row, "dayPasses").value_or(0);
                    staff.dayPassIncome = fields::optionalNumber(row, "dayPassIncome").value_or(0.0);
                    staff.income = fields::optionalNumber(row, "income").value_or(0.0);
                    report.staffData.push_back(std::move(staff));
                }
            }

            report.createdBy = fields::optionalString(json, "createdBy");
            report.createdAt = fields::optionalString(json, "createdAt");
            if (report.createdAt.empty()) {
                report.createdAt = core::utils::currentIsoTimestamp();
            } else if (!core::utils::parseIsoTimestamp(report.createdAt)) {
                throw core::types::ValidationException("createdAt is not an ISO-8601 timestamp: " + report.createdAt);
            }

            printerConfig.reset();
            if (!fields::isAbsent(json, "printerConfig")) {
                printerConfig = fields::endpointFrom(json.at("printerConfig"));
            }
        }

        bool isValid() const override {
            if (report.totalSeatsBooked < 0 || report.totalSeatIncome < 0.0 || report.totalDayPassesSold < 0 ||
                report.totalDayPassIncome < 0.0 || report.totalIncome < 0.0) {
                return false;
            }
            for (const auto &row: report.staffData) {
                if (row.seats < 0 || row.dayPasses < 0 || row.seatIncome < 0.0 ||
                    row.dayPassIncome < 0.0 || row.income < 0.0) {
                    return false;
                }
            }
            return true;
        }

        std::string getTypeName() const override {
            return "StatisticsReportRequest";
        }
    };

}
