#include "roomsync/date.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <ctime>

namespace roomsync {

using json = nlohmann::json;

int64_t to_millis(timestamp_t t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

timestamp_t from_millis(int64_t millis) {
    return timestamp_t(std::chrono::milliseconds(millis));
}

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's algorithm)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // namespace

std::string to_iso8601(timestamp_t t) {
    int64_t millis = to_millis(t);
    int64_t secs = millis / 1000;
    int ms = static_cast<int>(millis % 1000);
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }

    std::time_t tt = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return buf;
}

std::optional<timestamp_t> from_iso8601(const std::string& s) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    int64_t millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (s[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int i = digits; i < 3; ++i) millis *= 10;
    }

    int64_t offset_secs = 0;
    if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
        ++pos;
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        int oh = 0, om = 0;
        if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
            return std::nullopt;
        }
        offset_secs = (oh * 3600 + om * 60) * (s[pos] == '-' ? -1 : 1);
        pos += 6;
    }
    if (pos != s.size()) return std::nullopt;

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_secs;
    return from_millis(secs * 1000 + millis);
}

json to_date_wrapper(timestamp_t t) {
    return json{{"$date", to_millis(t)}};
}

std::optional<timestamp_t> parse_date(const json& value) {
    if (value.is_string()) {
        return from_iso8601(value.get<std::string>());
    }
    if (value.is_object()) {
        auto it = value.find("$date");
        if (it != value.end() && it->is_number()) {
            return from_millis(it->get<int64_t>());
        }
    }
    return std::nullopt;
}

// ============================================================================
// server_clock
// ============================================================================

server_clock::server_clock()
    : source_([] { return std::chrono::system_clock::now(); }) {}

server_clock::server_clock(time_source source)
    : source_(std::move(source)) {}

timestamp_t server_clock::now() const {
    return source_() + offset();
}

void server_clock::set_server_time(timestamp_t server_now) {
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(server_now - source_());
    offset_ms_.store(delta.count(), std::memory_order_relaxed);
}

} // namespace roomsync
