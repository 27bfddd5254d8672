#include "sans/event_loop.hpp"

#include <spdlog/spdlog.h>

namespace sans {

void EventLoop::post(std::function<void()> callback) {
    // Notify under the lock: once the last callback is queued the loop may
    // finish and be destroyed as soon as the poster lets go of the mutex
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(callback));
    cv_.notify_one();
}

void EventLoop::spawn(Task<void> task) {
    Task<void>* slot = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
        slot = &tasks_.back();
    }
    // std::list keeps the element address stable until it is reaped
    post([slot]() { slot->resume(); });
}

void EventLoop::run() {
    while (true) {
        std::function<void()> callback;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            reap_finished();
            if (queue_.empty() && tasks_.empty()) {
                break;
            }
            cv_.wait(lock, [this]() { return !queue_.empty(); });
            callback = std::move(queue_.front());
            queue_.pop_front();
        }
        callback();
    }
}

std::size_t EventLoop::pending_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t pending = 0;
    for (const auto& task : tasks_) {
        if (!task.done()) {
            ++pending;
        }
    }
    return pending;
}

void EventLoop::reap_finished() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (!it->done()) {
            ++it;
            continue;
        }
        try {
            it->get_result();
        } catch (const std::exception& e) {
            spdlog::debug("EventLoop: task finished with exception: {}", e.what());
            if (!failure_) {
                failure_ = std::current_exception();
            }
        }
        it = tasks_.erase(it);
    }
}

void EventLoop::rethrow_first_failure() {
    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure = std::exchange(failure_, nullptr);
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

}  // namespace sans
