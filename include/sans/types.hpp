#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sans {

using Clock = std::chrono::steady_clock;

/// Case-insensitive ordering for HTTP header names
struct HeaderNameLess {
    using is_transparent = void;
    bool operator()(std::string_view lhs, std::string_view rhs) const;
};

using Headers = std::map<std::string, std::string, HeaderNameLess>;

/// Look up a header value, returning std::nullopt when absent
std::optional<std::string> find_header(const Headers& headers, std::string_view name);

/// Merge `extra` into `headers`, overwriting existing names
void merge_headers(Headers& headers, const Headers& extra);

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    Headers headers;
    std::string body;
};

struct HttpResponse {
    long status_code = 0;
    std::string url;
    Headers headers;
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }

    /// Media type from Content-Type without parameters, lower-cased ("text/xml")
    std::string content_type() const;

    /// Throw the most specific HttpStatusException subclass for 4xx/5xx statuses
    void raise_for_status() const;
};

/// Remote-advertised quota as last observed.
///
/// `remaining` and `reset_at` are always replaced together.
struct QuotaState {
    int64_t remaining = 0;
    std::optional<Clock::time_point> reset_at;  // nullopt: reset time unknown
    Clock::time_point window_seen;              // local capture time
};

/// Explicit "do not send before" instruction from the server
struct ThrottleOverride {
    Clock::time_point retry_not_before;
};

/// Fixed minimum spacing between grants of one limiter
struct PacingFloor {
    std::chrono::milliseconds min_interval{0};
    std::optional<Clock::time_point> last_granted_at;
};

/// Quota fields pulled out of a single response by a QuotaExtractor
struct QuotaReading {
    std::optional<int64_t> remaining;
    std::optional<std::chrono::milliseconds> reset_in;
    std::optional<std::chrono::milliseconds> retry_after;
    std::string error;  // non-empty when a quota field was present but unparsable

    bool malformed() const { return !error.empty(); }
    bool complete() const { return remaining.has_value() && reset_in.has_value(); }
};

enum class SignalKind {
    THROTTLED,            // server asked us to wait; absorbed into scheduling
    AUTH_REJECTED,        // cached credential refused; invalidated
    MALFORMED_QUOTA_DATA  // quota headers missing/unparsable; conservative fallback applied
};

struct LimiterSignal {
    SignalKind kind;
    std::optional<Clock::time_point> retry_at;  // THROTTLED and MALFORMED_QUOTA_DATA
    std::string detail;
};

const char* to_string(SignalKind kind);

}  // namespace sans
