#include "sans/client.hpp"

#include "sans/exceptions.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <coroutine>
#include <exception>
#include <thread>

namespace sans {

namespace {

std::string strip_query(const std::string& url) { return url.substr(0, url.find('?')); }

/// Runs a blocking transport call on its own thread and resumes the awaiting
/// coroutine through its scheduler
class TransportCall {
public:
    TransportCall(std::shared_ptr<Transport> transport, Scheduler& scheduler, HttpRequest request)
        : transport_(std::move(transport)), scheduler_(scheduler), request_(std::move(request)) {}

    bool await_ready() const noexcept { return false; }

    void await_suspend(std::coroutine_handle<> handle) {
        std::thread([this, handle, transport = transport_, scheduler = &scheduler_]() {
            try {
                response_ = transport->perform(request_);
            } catch (...) {
                error_ = std::current_exception();
            }
            scheduler->post([handle]() { handle.resume(); });
        }).detach();
    }

    HttpResponse await_resume() {
        if (error_) {
            std::rethrow_exception(error_);
        }
        return std::move(response_);
    }

private:
    std::shared_ptr<Transport> transport_;
    Scheduler& scheduler_;
    HttpRequest request_;
    HttpResponse response_;
    std::exception_ptr error_;
};

}  // namespace

Client::Client(Config config, RateLimiter& limiter, std::shared_ptr<Transport> transport)
    : config_(std::move(config)), limiter_(limiter), transport_(std::move(transport)) {
    if (!config_.user_agent.empty()) {
        user_agent_ = fmt::format("{} sans/{}", config_.user_agent, kVersion);
    }
    if (!transport_) {
        transport_ = std::make_shared<CurlTransport>(config_.timeout);
    }
}

bool Client::is_api_request(const HttpRequest& request) const {
    return strip_query(request.url) == config_.api_url;
}

Client::PreparedRequest Client::prepare(const HttpRequest& request, Authorizer* credentials) const {
    if (user_agent_.empty()) {
        throw AgentNotSetException();
    }

    PreparedRequest prepared{request, false};
    prepared.request.headers.insert_or_assign("User-Agent", user_agent_);

    if (credentials) {
        Headers fields = credentials->prepare_request();
        if (!fields.empty()) {
            merge_headers(prepared.request.headers, fields);
            prepared.authenticated = true;
            // Authenticated requests must not be served from a cache
            if (prepared.request.method == "GET") {
                prepared.request.method = "POST";
            }
        }
    }
    return prepared;
}

void Client::finish(
    const PreparedRequest& sent,
    const HttpResponse& response,
    RateLimiter& limiter,
    Authorizer& credentials
) const {
    limiter.observe(response);
    if (&credentials != &limiter) {
        credentials.observe(response);
    }

    if (sent.authenticated && response.status_code == 403) {
        throw AuthRejectedException(strip_query(sent.request.url));
    }
}

HttpResponse Client::send(const HttpRequest& request) { return send(request, limiter_, limiter_); }

HttpResponse Client::send(const HttpRequest& request, RateLimiter& limiter) { return send(request, limiter, limiter); }

HttpResponse Client::send(const HttpRequest& request, RateLimiter& limiter, Authorizer& credentials) {
    if (!is_api_request(request)) {
        spdlog::debug("Client: {} {} bypasses the limiter", request.method, strip_query(request.url));
        return transport_->perform(prepare(request, nullptr).request);
    }

    Permit permit = limiter.acquire();
    PreparedRequest prepared = prepare(request, &credentials);
    HttpResponse response = transport_->perform(prepared.request);
    finish(prepared, response, limiter, credentials);
    return response;
}

Task<HttpResponse> Client::send_async(HttpRequest request, Scheduler& scheduler) {
    co_return co_await send_async(std::move(request), scheduler, limiter_, limiter_);
}

Task<HttpResponse> Client::send_async(HttpRequest request, Scheduler& scheduler, RateLimiter& limiter) {
    co_return co_await send_async(std::move(request), scheduler, limiter, limiter);
}

Task<HttpResponse>
Client::send_async(HttpRequest request, Scheduler& scheduler, RateLimiter& limiter, Authorizer& credentials) {
    if (!is_api_request(request)) {
        spdlog::debug("Client: {} {} bypasses the limiter", request.method, strip_query(request.url));
        co_return co_await TransportCall(transport_, scheduler, prepare(request, nullptr).request);
    }

    Permit permit = co_await limiter.acquire_async(scheduler);
    PreparedRequest prepared = prepare(request, &credentials);
    HttpResponse response = co_await TransportCall(transport_, scheduler, prepared.request);
    finish(prepared, response, limiter, credentials);
    co_return response;
}

}  // namespace sans
