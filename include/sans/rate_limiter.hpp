#pragma once

#include "sans/async.hpp"
#include "sans/authorizer.hpp"
#include "sans/quota.hpp"
#include "sans/types.hpp"

#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace sans {

class RateLimiter;

/// Configuration for RateLimiter
struct RateLimiterConfig {
    QuotaExtractor extractor = make_header_extractor();
    long throttle_status = 429;                     // "too many requests"
    std::chrono::milliseconds fallback_delay{1000};  // applied when quota data is missing or unparsable
};

/// Admission grant issued by a RateLimiter.
///
/// While a Permit is alive its limiter issues no other grant, so the holder
/// should keep it until the response has been fed back through observe().
/// Released on destruction.
class Permit {
public:
    Permit() = default;
    ~Permit() { release(); }

    Permit(Permit&& other) noexcept
        : limiter_(std::exchange(other.limiter_, nullptr)), granted_at_(other.granted_at_) {}

    Permit& operator=(Permit&& other) noexcept {
        if (this != &other) {
            release();
            limiter_ = std::exchange(other.limiter_, nullptr);
            granted_at_ = other.granted_at_;
        }
        return *this;
    }

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    /// Let the next queued caller proceed. Idempotent.
    void release();

    [[nodiscard]] bool held() const { return limiter_ != nullptr; }
    [[nodiscard]] Clock::time_point granted_at() const { return granted_at_; }

private:
    friend class RateLimiter;
    Permit(RateLimiter* limiter, Clock::time_point granted_at) : limiter_(limiter), granted_at_(granted_at) {}

    RateLimiter* limiter_ = nullptr;
    Clock::time_point granted_at_{};
};

/// Admission authority for one remote quota.
///
/// Grants are strictly serialised and issued in arrival order. A dedicated
/// dispatcher thread computes every admission decision; blocking callers wait
/// on a future, coroutine callers are resumed through their Scheduler.
///
/// The limiter must outlive every Permit and every pending acquire.
class RateLimiter : public Authorizer {
public:
    using Config = RateLimiterConfig;
    using SignalCallback = std::function<void(const LimiterSignal&)>;

    class AcquireAwaiter;

    explicit RateLimiter(Config config = {});
    ~RateLimiter() override;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Block the calling thread until admitted
    Permit acquire();

    /// Block until admitted; throws CancelledException if `stop` is requested first
    Permit acquire(std::stop_token stop);

    /// Block for at most `timeout`; std::nullopt if not admitted in time
    std::optional<Permit> try_acquire_for(std::chrono::milliseconds timeout);

    /// Suspend the awaiting coroutine until admitted.
    /// Resumption is posted to `scheduler`. Throws CancelledException on stop.
    AcquireAwaiter acquire_async(Scheduler& scheduler, std::stop_token stop = {});

    /// The base limiter carries no credentials
    Headers prepare_request() override { return {}; }

    void observe(const HttpResponse& response) override;

    /// Update quota and throttling state from a response's status and headers
    void observe(long status_code, const Headers& headers);

    /// Snapshot of the last observed (and optimistically decremented) quota
    [[nodiscard]] std::optional<QuotaState> quota() const;

    /// Earliest time the next grant may happen, or std::nullopt if it may happen now
    [[nodiscard]] std::optional<Clock::time_point> deferred_until() const;

    /// Number of callers currently queued for admission
    [[nodiscard]] std::size_t waiting() const;

    /// Set callback for throttling/auth/quota signals.
    /// Called from the thread that invoked observe(), never with internal locks held.
    void set_signal_callback(SignalCallback callback);

    [[nodiscard]] const Config& config() const { return config_; }

protected:
    RateLimiter(Config config, PacingFloor floor);

    /// Deliver a signal to the registered callback (caller must not hold mutex_)
    void emit(const LimiterSignal& signal);

    /// Guards all admission, quota and credential state
    mutable std::mutex mutex_;

    std::optional<PacingFloor> floor_;

private:
    friend class Permit;

    // A caller waiting for admission
    struct Ticket {
        enum class State { PENDING, GRANTED, CANCELLED };

        uint64_t sequence = 0;
        State state = State::PENDING;
        bool queued = false;
        Clock::time_point granted_at{};
        std::function<void()> on_resolve;  // invoked exactly once, outside the lock
    };

    std::shared_ptr<Ticket> enqueue(std::function<void()> on_resolve);

    /// Queue a prepared ticket. Returns false if it was cancelled beforehand.
    bool submit(const std::shared_ptr<Ticket>& ticket);

    /// Remove a pending ticket. Returns true only when the caller must resolve it;
    /// false if it was already granted or was never queued.
    bool cancel(const std::shared_ptr<Ticket>& ticket);

    /// Turn a resolved ticket into a Permit, or throw CancelledException
    Permit claim(const std::shared_ptr<Ticket>& ticket);

    void release_permit();
    void dispatch_loop();

    /// Earliest admissible time given current state (mutex_ held)
    Clock::time_point next_allowed_locked(Clock::time_point now) const;

    /// Consume the admission slot at `now` (mutex_ held)
    void grant_locked(Ticket& ticket, Clock::time_point now);

    Config config_;
    std::optional<QuotaState> quota_;
    std::optional<ThrottleOverride> throttle_;
    std::deque<std::shared_ptr<Ticket>> queue_;
    uint64_t next_sequence_ = 0;
    bool permit_outstanding_ = false;
    bool running_ = true;
    SignalCallback signal_callback_;

    std::condition_variable cv_;
    std::thread dispatcher_;
};

/// Awaitable returned by RateLimiter::acquire_async()
class RateLimiter::AcquireAwaiter {
public:
    AcquireAwaiter(RateLimiter& limiter, Scheduler& scheduler, std::stop_token stop)
        : limiter_(limiter), scheduler_(scheduler), stop_(std::move(stop)) {}

    AcquireAwaiter(const AcquireAwaiter&) = delete;
    AcquireAwaiter& operator=(const AcquireAwaiter&) = delete;

    bool await_ready() const noexcept { return false; }

    bool await_suspend(std::coroutine_handle<> handle);

    Permit await_resume();

private:
    RateLimiter& limiter_;
    Scheduler& scheduler_;
    std::stop_token stop_;
    std::shared_ptr<Ticket> ticket_;
    std::optional<std::stop_callback<std::function<void()>>> stop_callback_;
};

}  // namespace sans
