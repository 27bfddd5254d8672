#include "sans/telegram_rate_limiter.hpp"

#include <spdlog/spdlog.h>

namespace sans {

namespace {

std::chrono::milliseconds select_interval(bool recruitment, const TelegramPacing& pacing) {
    return recruitment ? pacing.recruitment_interval : pacing.standard_interval;
}

}  // namespace

TelegramRateLimiter::TelegramRateLimiter(bool recruitment, TelegramPacing pacing, Config config)
    : RateLimiter(std::move(config), PacingFloor{select_interval(recruitment, pacing), std::nullopt}),
      recruitment_(recruitment),
      min_interval_(select_interval(recruitment, pacing)) {
    spdlog::debug(
        "TelegramRateLimiter: {} telegrams spaced at least {}ms apart",
        recruitment_ ? "recruitment" : "standard",
        min_interval_.count()
    );
}

std::optional<Clock::time_point> TelegramRateLimiter::last_granted_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return floor_->last_granted_at;
}

}  // namespace sans
