#pragma once

#include "sans/async.hpp"
#include "sans/authorizer.hpp"
#include "sans/rate_limiter.hpp"
#include "sans/transport.hpp"
#include "sans/types.hpp"
#include "sans/url.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace sans {

inline constexpr const char* kVersion = "0.1.0";

struct ClientConfig {
    std::string user_agent;  // required by the API terms; nation name and contact recommended
    std::string api_url = kApiUrl;
    std::chrono::milliseconds timeout{30000};
};

/// Paced client for the NationStates API.
///
/// Requests aimed at the API endpoint go through a RateLimiter: acquire,
/// attach credentials, send, feed the response back, release. Anything else
/// (data dumps) is sent straight away.
class Client {
public:
    using Config = ClientConfig;

    /// `limiter` paces every API request that doesn't name its own limiter.
    /// A null `transport` selects CurlTransport.
    Client(Config config, RateLimiter& limiter, std::shared_ptr<Transport> transport = nullptr);

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    HttpResponse send(const HttpRequest& request);

    /// Pace and authorise through `limiter` (e.g. an AuthRateLimiter or TelegramRateLimiter)
    HttpResponse send(const HttpRequest& request, RateLimiter& limiter);

    /// Pace through `limiter`, take credentials from `credentials`
    HttpResponse send(const HttpRequest& request, RateLimiter& limiter, Authorizer& credentials);

    Task<HttpResponse> send_async(HttpRequest request, Scheduler& scheduler);

    Task<HttpResponse> send_async(HttpRequest request, Scheduler& scheduler, RateLimiter& limiter);

    Task<HttpResponse>
    send_async(HttpRequest request, Scheduler& scheduler, RateLimiter& limiter, Authorizer& credentials);

    /// True if the request targets the API endpoint (and is therefore paced)
    [[nodiscard]] bool is_api_request(const HttpRequest& request) const;

    /// User-Agent as sent, including the library suffix
    [[nodiscard]] const std::string& user_agent() const { return user_agent_; }

    [[nodiscard]] RateLimiter& limiter() { return limiter_; }

private:
    struct PreparedRequest {
        HttpRequest request;
        bool authenticated = false;  // credential headers were attached
    };

    /// Copy of `request` with User-Agent and, if any, credential headers
    PreparedRequest prepare(const HttpRequest& request, Authorizer* credentials) const;

    /// Feed the response back; throws AuthRejectedException if credentials were refused
    void finish(
        const PreparedRequest& sent,
        const HttpResponse& response,
        RateLimiter& limiter,
        Authorizer& credentials
    ) const;

    Config config_;
    std::string user_agent_;
    RateLimiter& limiter_;
    std::shared_ptr<Transport> transport_;
};

}  // namespace sans
