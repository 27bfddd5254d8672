#include "sans/rate_limiter.hpp"

#include "sans/exceptions.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

namespace sans {

namespace {

int64_t millis_until(Clock::time_point when, Clock::time_point now) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(when - now).count();
}

// Custom extractors are not bound by parse_seconds, so cap their delays here too
void drop_out_of_range(std::optional<std::chrono::milliseconds>& delay, const char* field, std::string& error) {
    if (delay && (delay->count() < 0 || *delay > kMaxDelay)) {
        if (error.empty()) {
            error = fmt::format("{} of {}ms is out of range", field, delay->count());
        }
        delay.reset();
    }
}

}  // namespace

void Permit::release() {
    if (auto* limiter = std::exchange(limiter_, nullptr)) {
        limiter->release_permit();
    }
}

RateLimiter::RateLimiter(Config config) : config_(std::move(config)) {
    dispatcher_ = std::thread([this]() { dispatch_loop(); });
}

RateLimiter::RateLimiter(Config config, PacingFloor floor) : floor_(floor), config_(std::move(config)) {
    dispatcher_ = std::thread([this]() { dispatch_loop(); });
}

RateLimiter::~RateLimiter() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

Permit RateLimiter::acquire() { return acquire(std::stop_token{}); }

Permit RateLimiter::acquire(std::stop_token stop) {
    // Shared with the dispatcher, which may still be inside set_value() when we wake
    auto resolved = std::make_shared<std::promise<void>>();
    auto future = resolved->get_future();

    auto ticket = enqueue([resolved]() { resolved->set_value(); });

    {
        std::stop_callback on_stop(stop, [this, &ticket, resolved]() {
            if (cancel(ticket)) {
                resolved->set_value();
            }
        });
        future.wait();
    }

    return claim(ticket);
}

std::optional<Permit> RateLimiter::try_acquire_for(std::chrono::milliseconds timeout) {
    auto resolved = std::make_shared<std::promise<void>>();
    auto future = resolved->get_future();

    auto ticket = enqueue([resolved]() { resolved->set_value(); });

    if (future.wait_for(timeout) == std::future_status::timeout) {
        if (cancel(ticket)) {
            spdlog::debug("RateLimiter: request #{} timed out after {}ms", ticket->sequence, timeout.count());
            return std::nullopt;
        }
        // Granted while we were giving up; the dispatcher is about to resolve us
        future.wait();
    }

    return claim(ticket);
}

RateLimiter::AcquireAwaiter RateLimiter::acquire_async(Scheduler& scheduler, std::stop_token stop) {
    return AcquireAwaiter{*this, scheduler, std::move(stop)};
}

bool RateLimiter::AcquireAwaiter::await_suspend(std::coroutine_handle<> handle) {
    auto* limiter = &limiter_;
    auto* scheduler = &scheduler_;
    auto resume = [scheduler, handle]() { scheduler->post([handle]() { handle.resume(); }); };

    auto ticket = std::make_shared<Ticket>();
    ticket->on_resolve = resume;
    ticket_ = ticket;

    // Armed before the ticket is queued. Once queued the coroutine may be
    // resumed on another thread, so nothing below may touch this awaiter.
    stop_callback_.emplace(stop_, std::function<void()>([limiter, ticket, resume]() {
                               if (limiter->cancel(ticket)) {
                                   resume();
                               }
                           }));

    // Not queued when the stop token fired first; continue inline and throw
    return limiter->submit(ticket);
}

Permit RateLimiter::AcquireAwaiter::await_resume() {
    stop_callback_.reset();
    return limiter_.claim(ticket_);
}

void RateLimiter::observe(const HttpResponse& response) { observe(response.status_code, response.headers); }

void RateLimiter::observe(long status_code, const Headers& headers) {
    QuotaReading reading = config_.extractor(status_code, headers);
    drop_out_of_range(reading.reset_in, "quota reset", reading.error);
    drop_out_of_range(reading.retry_after, "retry delay", reading.error);
    std::vector<LimiterSignal> signals;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();

        bool throttled = status_code == config_.throttle_status;
        bool retry_after = reading.retry_after && reading.retry_after->count() > 0;
        if (throttled || retry_after) {
            auto delay = reading.retry_after.value_or(config_.fallback_delay);
            throttle_ = ThrottleOverride{now + delay};
            spdlog::info("RateLimiter: throttled by server, retrying in {}ms", delay.count());
            signals.push_back(
                {SignalKind::THROTTLED, throttle_->retry_not_before, fmt::format("status {}", status_code)}
            );
        }

        if (reading.malformed() || !reading.complete()) {
            // Unknown quota: allow nothing until the fallback delay has passed
            quota_ = QuotaState{0, now + config_.fallback_delay, now};
            std::string detail = reading.malformed() ? reading.error : "quota information missing";
            spdlog::warn("RateLimiter: {}; pacing conservatively for {}ms", detail, config_.fallback_delay.count());
            signals.push_back({SignalKind::MALFORMED_QUOTA_DATA, quota_->reset_at, std::move(detail)});
        } else {
            quota_ = QuotaState{*reading.remaining, now + *reading.reset_in, now};
            spdlog::debug(
                "RateLimiter: quota remaining={} reset in {}ms", quota_->remaining, reading.reset_in->count()
            );
        }
    }
    cv_.notify_all();

    for (const auto& signal : signals) {
        emit(signal);
    }
}

std::optional<QuotaState> RateLimiter::quota() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quota_;
}

std::optional<Clock::time_point> RateLimiter::deferred_until() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    auto at = next_allowed_locked(now);
    if (at <= now) {
        return std::nullopt;
    }
    return at;
}

std::size_t RateLimiter::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void RateLimiter::set_signal_callback(SignalCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    signal_callback_ = std::move(callback);
}

void RateLimiter::emit(const LimiterSignal& signal) {
    SignalCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = signal_callback_;
    }
    if (callback) {
        callback(signal);
    }
}

std::shared_ptr<RateLimiter::Ticket> RateLimiter::enqueue(std::function<void()> on_resolve) {
    auto ticket = std::make_shared<Ticket>();
    ticket->on_resolve = std::move(on_resolve);
    submit(ticket);
    return ticket;
}

bool RateLimiter::submit(const std::shared_ptr<Ticket>& ticket) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ticket->state != Ticket::State::PENDING) {
            return false;
        }
        ticket->sequence = next_sequence_++;
        ticket->queued = true;
        queue_.push_back(ticket);
        spdlog::trace("RateLimiter: request #{} queued ({} waiting)", ticket->sequence, queue_.size());
    }
    cv_.notify_all();
    return true;
}

bool RateLimiter::cancel(const std::shared_ptr<Ticket>& ticket) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ticket->state != Ticket::State::PENDING) {
            return false;
        }
        ticket->state = Ticket::State::CANCELLED;
        if (!ticket->queued) {
            // Never reached the queue, so nobody is waiting on on_resolve
            return false;
        }
        queue_.erase(std::remove(queue_.begin(), queue_.end(), ticket), queue_.end());
        spdlog::debug("RateLimiter: request #{} cancelled", ticket->sequence);
    }
    // The head of the queue may have changed
    cv_.notify_all();
    return true;
}

Permit RateLimiter::claim(const std::shared_ptr<Ticket>& ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ticket->state != Ticket::State::GRANTED) {
        throw CancelledException();
    }
    return Permit(this, ticket->granted_at);
}

void RateLimiter::release_permit() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        permit_outstanding_ = false;
    }
    cv_.notify_all();
}

Clock::time_point RateLimiter::next_allowed_locked(Clock::time_point now) const {
    auto at = now;

    if (quota_ && quota_->remaining <= 0 && quota_->reset_at && *quota_->reset_at > now) {
        at = *quota_->reset_at;
    }

    if (throttle_ && throttle_->retry_not_before > at) {
        at = throttle_->retry_not_before;
    }

    if (floor_ && floor_->last_granted_at) {
        at = std::max(at, *floor_->last_granted_at + floor_->min_interval);
    }

    return at;
}

void RateLimiter::grant_locked(Ticket& ticket, Clock::time_point now) {
    if (throttle_ && throttle_->retry_not_before <= now) {
        throttle_.reset();
    }

    if (quota_) {
        if (quota_->reset_at && *quota_->reset_at <= now) {
            // The window has rolled over; the old count no longer says anything
            quota_.reset();
        } else if (quota_->remaining > 0) {
            --quota_->remaining;
        }
    }

    if (floor_) {
        floor_->last_granted_at = now;
    }

    ticket.state = Ticket::State::GRANTED;
    ticket.granted_at = now;
    permit_outstanding_ = true;
}

void RateLimiter::dispatch_loop() {
    spdlog::debug("RateLimiter: dispatcher started");

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (queue_.empty() || permit_outstanding_) {
            cv_.wait(lock);
            continue;
        }

        auto now = Clock::now();
        auto at = next_allowed_locked(now);
        if (at > now) {
            spdlog::debug(
                "RateLimiter: waiting {}ms before request #{}", millis_until(at, now), queue_.front()->sequence
            );
            cv_.wait_until(lock, at);
            continue;
        }

        auto ticket = queue_.front();
        queue_.pop_front();
        grant_locked(*ticket, now);
        spdlog::debug(
            "RateLimiter: granted request #{} (remaining {})",
            ticket->sequence,
            quota_ ? std::to_string(quota_->remaining) : std::string("unknown")
        );

        auto on_resolve = std::move(ticket->on_resolve);
        lock.unlock();
        on_resolve();
        lock.lock();
    }

    // Wake anyone still queued so they fail instead of hanging
    std::deque<std::shared_ptr<Ticket>> abandoned;
    abandoned.swap(queue_);
    for (auto& ticket : abandoned) {
        ticket->state = Ticket::State::CANCELLED;
    }
    lock.unlock();

    if (!abandoned.empty()) {
        spdlog::warn("RateLimiter: shutting down with {} queued requests", abandoned.size());
    }
    for (auto& ticket : abandoned) {
        ticket->on_resolve();
    }

    spdlog::debug("RateLimiter: dispatcher stopped");
}

}  // namespace sans
