#pragma once

#include "sans/types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sans {

/// Names of the response headers that carry quota information
struct QuotaHeaders {
    std::string remaining = "RateLimit-Remaining";
    std::string reset = "RateLimit-Reset";  // seconds until the window resets
    std::string retry_after = "Retry-After";
};

/// Pulls quota fields out of a response. Header naming is API-specific, so the
/// limiter only ever sees the extracted reading.
using QuotaExtractor = std::function<QuotaReading(long status_code, const Headers& headers)>;

/// Longest delay accepted from a server or a config file. Larger values are
/// treated as malformed rather than scheduled.
inline constexpr std::chrono::milliseconds kMaxDelay = std::chrono::hours(24 * 7);

/// Extractor for APIs that report quota as integer/decimal seconds in headers
QuotaExtractor make_header_extractor(QuotaHeaders names = {});

/// Parse a non-negative number of seconds ("3", "0.5"); nullopt if invalid or above kMaxDelay
std::optional<std::chrono::milliseconds> parse_seconds(std::string_view text);

/// Parse a non-negative integer count; nullopt if invalid
std::optional<int64_t> parse_count(std::string_view text);

}  // namespace sans
