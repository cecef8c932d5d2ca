#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <functional>

namespace roomsync {

// ============================================================================
// Date codecs
// ============================================================================

int64_t to_millis(timestamp_t t);
timestamp_t from_millis(int64_t millis);

/// "2018-05-03T12:34:56.789Z" (UTC, millisecond precision)
std::string to_iso8601(timestamp_t t);

/// Accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z" and "+HH:MM"/"-HH:MM" offsets.
std::optional<timestamp_t> from_iso8601(const std::string& s);

/// {"$date": millis}, the legacy channel's date wrapper
nlohmann::json to_date_wrapper(timestamp_t t);

/// Decodes either an ISO-8601 string or a {"$date": millis} wrapper.
std::optional<timestamp_t> parse_date(const nlohmann::json& value);

// ============================================================================
// Server clock
// ============================================================================
//
// Watermarks are compared against server-side update times, so "now" is the
// local clock corrected by the offset between server and device.

class server_clock {
public:
    using time_source = std::function<timestamp_t()>;

    server_clock();
    explicit server_clock(time_source source);

    timestamp_t now() const;

    /// Record the server's current time; subsequent now() calls follow it.
    void set_server_time(timestamp_t server_now);

    std::chrono::milliseconds offset() const {
        return std::chrono::milliseconds(offset_ms_.load(std::memory_order_relaxed));
    }

private:
    time_source source_;
    std::atomic<int64_t> offset_ms_{0};
};

} // namespace roomsync

#endif // __cplusplus
