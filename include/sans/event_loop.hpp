#pragma once

#include "sans/async.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <type_traits>

namespace sans {

/// Single-threaded run loop for cooperatively scheduled tasks.
///
/// Tasks spawned on the loop run on the thread that calls run(). Other
/// threads (the limiter's dispatcher, transport workers) hand work back to
/// the loop through post().
class EventLoop : public Scheduler {
public:
    EventLoop() = default;
    ~EventLoop() override = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(std::function<void()> callback) override;

    /// Keep a task alive on this loop and schedule its first resumption
    void spawn(Task<void> task);

    /// Run posted callbacks until every spawned task has finished
    void run();

    /// Spawn a task and run the loop until it has produced its result
    template <typename T>
    T run_until_complete(Task<T> task) {
        if constexpr (std::is_void_v<T>) {
            spawn(std::move(task));
            run();
            rethrow_first_failure();
        } else {
            std::optional<T> result;
            spawn([](Task<T> inner, std::optional<T>& out) -> Task<void> {
                out.emplace(co_await inner);
            }(std::move(task), result));
            run();
            rethrow_first_failure();
            return std::move(*result);
        }
    }

    /// Number of spawned tasks that have not completed yet
    [[nodiscard]] std::size_t pending_tasks() const;

private:
    void reap_finished();
    void rethrow_first_failure();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    std::list<Task<void>> tasks_;
    std::exception_ptr failure_;
};

}  // namespace sans
