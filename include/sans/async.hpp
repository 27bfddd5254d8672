#pragma once

#include <coroutine>
#include <exception>
#include <functional>
#include <optional>
#include <utility>

namespace sans {

template <typename T>
class Task;

/// Cooperative scheduler that coroutines are resumed on.
///
/// post() may be called from any thread. The callback runs on a thread the
/// scheduler chooses, not necessarily the one that posted it.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual void post(std::function<void()> callback) = 0;
};

namespace detail {

/// State every Task promise carries: the awaiting coroutine and a failure slot
class PromiseBase {
public:
    /// Hands control to the awaiting coroutine, if any, when the task finishes
    struct FinalAwaiter {
        bool await_ready() const noexcept { return false; }

        template <typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> finished) noexcept {
            auto continuation = static_cast<PromiseBase&>(finished.promise()).continuation_;
            return continuation ? continuation : std::noop_coroutine();
        }

        void await_resume() noexcept {}
    };

    std::suspend_always initial_suspend() noexcept { return {}; }
    FinalAwaiter final_suspend() noexcept { return {}; }

    void unhandled_exception() noexcept { failure_ = std::current_exception(); }

    void set_continuation(std::coroutine_handle<> continuation) noexcept { continuation_ = continuation; }

protected:
    void rethrow_failure() const {
        if (failure_) {
            std::rethrow_exception(failure_);
        }
    }

private:
    std::exception_ptr failure_;
    std::coroutine_handle<> continuation_;
};

template <typename T>
class TaskPromise : public PromiseBase {
public:
    Task<T> get_return_object() noexcept;

    void return_value(T value) { value_.emplace(std::move(value)); }

    /// Move the result out, or rethrow what the body threw. Call once.
    T take_result() {
        rethrow_failure();
        return std::move(*value_);
    }

private:
    std::optional<T> value_;
};

template <>
class TaskPromise<void> : public PromiseBase {
public:
    Task<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void take_result() { rethrow_failure(); }
};

}  // namespace detail

/// Lazily started awaitable task.
///
/// A Task that suspends on an external event (a limiter grant, a transport
/// completion) must be driven by an EventLoop; get_result() only suits tasks
/// that never leave the calling thread.
template <typename T = void>
class Task {
public:
    using promise_type = detail::TaskPromise<T>;
    using Handle = std::coroutine_handle<promise_type>;

    explicit Task(Handle handle) : handle_(handle) {}

    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~Task() { destroy(); }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool await_ready() const noexcept { return false; }

    /// Start the task; it resumes `continuation` when it finishes
    std::coroutine_handle<> await_suspend(std::coroutine_handle<> continuation) noexcept {
        handle_.promise().set_continuation(continuation);
        return handle_;
    }

    T await_resume() { return handle_.promise().take_result(); }

    void resume() {
        if (handle_ && !handle_.done()) {
            handle_.resume();
        }
    }

    bool done() const { return handle_.done(); }

    /// Drive the task on the calling thread until it finishes
    T get_result() {
        while (!handle_.done()) {
            handle_.resume();
        }
        return handle_.promise().take_result();
    }

private:
    void destroy() {
        if (handle_) {
            handle_.destroy();
        }
    }

    Handle handle_;
};

namespace detail {

template <typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{Task<T>::Handle::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{Task<void>::Handle::from_promise(*this)};
}

}  // namespace detail

}  // namespace sans
