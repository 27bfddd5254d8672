#pragma once

#include "sans/rate_limiter.hpp"

#include <chrono>
#include <optional>

namespace sans {

/// Mandatory spacing between telegram sends.
/// Defaults follow the NationStates API terms: one standard telegram per 30s,
/// one recruitment telegram per 180s.
struct TelegramPacing {
    std::chrono::milliseconds standard_interval{30000};
    std::chrono::milliseconds recruitment_interval{180000};
};

/// RateLimiter with a fixed floor between grants on top of the quota headers.
///
/// The floor is measured from grant time: a granted slot counts as used even
/// if the caller never sends, so a burst of callers cannot slip through.
class TelegramRateLimiter : public RateLimiter {
public:
    explicit TelegramRateLimiter(bool recruitment, TelegramPacing pacing = {}, Config config = {});

    [[nodiscard]] bool recruitment() const { return recruitment_; }

    [[nodiscard]] std::chrono::milliseconds min_interval() const { return min_interval_; }

    /// Time of the most recent grant, if any
    [[nodiscard]] std::optional<Clock::time_point> last_granted_at() const;

private:
    const bool recruitment_;
    const std::chrono::milliseconds min_interval_;
};

}  // namespace sans
