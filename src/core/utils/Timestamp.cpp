#include "core/utils/Timestamp.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace core::utils {

    namespace {
        // Howard Hinnant's days_from_civil
        long long daysFromCivil(long long y, unsigned m, unsigned d) {
            y -= m <= 2;
            const long long era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<long long>(doe) - 719468;
        }

        bool readDigits(const std::string &text, size_t &pos, size_t count, int &out) {
            if (pos + count > text.size()) return false;
            int value = 0;
            for (size_t i = 0; i < count; ++i) {
                char c = text[pos + i];
                if (c < '0' || c > '9') return false;
                value = value * 10 + (c - '0');
            }
            pos += count;
            out = value;
            return true;
        }

        bool expect(const std::string &text, size_t &pos, char c) {
            if (pos < text.size() && text[pos] == c) {
                ++pos;
                return true;
            }
            return false;
        }

        unsigned daysInMonth(int year, int month) {
            static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            return (month == 2 && leap) ? 29 : days[month - 1];
        }
    }

    std::optional<ParsedTimestamp> parseIsoTimestamp(const std::string &text) {
        size_t pos = 0;
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

        if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
            !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
            !readDigits(text, pos, 2, day)) {
            return std::nullopt;
        }
        if (month < 1 || month > 12 || day < 1 || static_cast<unsigned>(day) > daysInMonth(year, month)) {
            return std::nullopt;
        }

        if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
            ++pos;
            if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') || !readDigits(text, pos, 2, minute)) {
                return std::nullopt;
            }
            if (expect(text, pos, ':') && !readDigits(text, pos, 2, second)) {
                return std::nullopt;
            }
            if (expect(text, pos, '.')) {
                size_t start = pos;
                while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') ++pos;
                if (pos == start) return std::nullopt;
            }
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }

        ParsedTimestamp parsed;
        if (pos < text.size()) {
            if (text[pos] == 'Z' || text[pos] == 'z') {
                ++pos;
                parsed.hasZone = true;
            } else if (text[pos] == '+' || text[pos] == '-') {
                int sign = text[pos] == '-' ? -1 : 1;
                ++pos;
                int offH = 0, offM = 0;
                if (!readDigits(text, pos, 2, offH)) return std::nullopt;
                expect(text, pos, ':');
                if (!readDigits(text, pos, 2, offM)) return std::nullopt;
                parsed.hasZone = true;
                parsed.zoneOffsetMinutes = sign * (offH * 60 + offM);
            }
        }
        if (pos != text.size()) {
            return std::nullopt;
        }

        parsed.wallSeconds = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400LL
                             + hour * 3600LL + minute * 60LL + second;
        return parsed;
    }

    std::string formatDisplayDateTime(const ParsedTimestamp &timestamp, int displayOffsetMinutes) {
        long long seconds = timestamp.wallSeconds;
        if (timestamp.hasZone) {
            seconds = seconds - timestamp.zoneOffsetMinutes * 60LL + displayOffsetMinutes * 60LL;
        }

        std::time_t t = static_cast<std::time_t>(seconds);
        std::tm fields{};
        gmtime_r(&t, &fields);

        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%02d/%02d/%04d %02d:%02d",
                      fields.tm_mday, fields.tm_mon + 1, fields.tm_year + 1900, fields.tm_hour, fields.tm_min);
        return buffer;
    }

    std::string currentIsoTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm fields{};
        gmtime_r(&t, &fields);

        char buffer[40];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      fields.tm_year + 1900, fields.tm_mon + 1, fields.tm_mday,
                      fields.tm_hour, fields.tm_min, fields.tm_sec, static_cast<int>(millis));
        return buffer;
    }

} // namespace core::utils
