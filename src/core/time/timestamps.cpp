#include "core/time/timestamps.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace hostlink::core::time {

namespace {

bool read_two_digits(const std::string& text, std::size_t pos, int& out) {
    if (pos + 2 > text.size() ||
        std::isdigit(static_cast<unsigned char>(text[pos])) == 0 ||
        std::isdigit(static_cast<unsigned char>(text[pos + 1])) == 0) {
        return false;
    }
    out = (text[pos] - '0') * 10 + (text[pos + 1] - '0');
    return true;
}

}  // namespace

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

std::string format_iso8601(const std::chrono::system_clock::time_point time) {
    const auto since_epoch =
        std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch());
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis = since_epoch - seconds;
    if (millis.count() < 0) {
        seconds -= std::chrono::seconds(1);
        millis += std::chrono::seconds(1);
    }

    const std::time_t raw = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    gmtime_r(&raw, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", date,
                  static_cast<int>(millis.count()));
    return out;
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(
    const std::string& text) {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month,
                    &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 60 || hour < 0 || minute < 0 || second < 0) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    int offset_minutes = 0;
    if (pos < text.size()) {
        const char designator = text[pos];
        if (designator == 'Z' || designator == 'z') {
            ++pos;
        } else if (designator == '+' || designator == '-') {
            int offset_hours = 0;
            int offset_mins = 0;
            if (!read_two_digits(text, pos + 1, offset_hours) ||
                pos + 3 >= text.size() || text[pos + 3] != ':' ||
                !read_two_digits(text, pos + 4, offset_mins)) {
                return std::nullopt;
            }
            offset_minutes = offset_hours * 60 + offset_mins;
            if (designator == '-') {
                offset_minutes = -offset_minutes;
            }
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm utc{};
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;
    const std::time_t seconds = timegm(&utc);

    return std::chrono::system_clock::time_point(
               std::chrono::seconds(seconds) - std::chrono::minutes(offset_minutes)) +
           std::chrono::milliseconds(millis);
}

}  // namespace hostlink::core::time
