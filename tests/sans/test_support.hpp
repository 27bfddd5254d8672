#pragma once

#include "sans/transport.hpp"
#include "sans/types.hpp"

#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sans::test {

/// Quota headers as the NationStates API sends them
inline Headers quota_headers(const std::string& remaining, const std::string& reset) {
    return Headers{{"RateLimit-Remaining", remaining}, {"RateLimit-Reset", reset}};
}

inline HttpResponse make_response(long status, Headers headers, std::string body = {}) {
    HttpResponse response;
    response.status_code = status;
    response.headers = std::move(headers);
    response.body = std::move(body);
    return response;
}

/// Poll `condition` until it holds or `timeout` passes
inline bool
wait_for(const std::function<bool()>& condition, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

/// Transport that records requests and replays scripted responses.
/// With nothing scripted it answers 200 with a generous quota.
class FakeTransport : public Transport {
public:
    HttpResponse perform(const HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);

        if (responses_.empty()) {
            auto response = make_response(200, quota_headers("49", "30"), "<WORLD/>");
            response.url = request.url;
            return response;
        }

        auto next = std::move(responses_.front());
        responses_.pop_front();
        if (next.failure) {
            std::rethrow_exception(next.failure);
        }
        next.response.url = request.url;
        return next.response;
    }

    void push(HttpResponse response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back({std::move(response), nullptr});
    }

    /// Make the next perform() throw `failure`
    void push_failure(std::exception_ptr failure) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back({{}, std::move(failure)});
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    struct Scripted {
        HttpResponse response;
        std::exception_ptr failure;
    };

    mutable std::mutex mutex_;
    std::vector<HttpRequest> requests_;
    std::deque<Scripted> responses_;
};

}  // namespace sans::test
