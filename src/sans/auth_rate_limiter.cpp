#include "sans/auth_rate_limiter.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sans {

AuthRateLimiter::AuthRateLimiter(std::string identity, std::string password, Config config, CredentialHeaders headers)
    : AuthRateLimiter(
          Credential{std::move(identity), std::move(password), std::nullopt, std::nullopt},
          std::move(config),
          std::move(headers)
      ) {}

AuthRateLimiter::AuthRateLimiter(Credential credential, Config config, CredentialHeaders headers)
    : RateLimiter(std::move(config)), credential_(std::move(credential)), headers_(std::move(headers)) {}

Headers AuthRateLimiter::prepare_request() {
    std::lock_guard<std::mutex> lock(mutex_);

    Headers fields;
    if (credential_.cached_token) {
        fields.emplace(headers_.token, *credential_.cached_token);
    } else if (!credential_.plaintext_secret.empty()) {
        fields.emplace(headers_.password, credential_.plaintext_secret);
    }
    if (credential_.cached_pin) {
        fields.emplace(headers_.pin, *credential_.cached_pin);
    }
    credential_sent_ = !fields.empty();
    return fields;
}

void AuthRateLimiter::observe(const HttpResponse& response) {
    RateLimiter::observe(response);

    bool credential_sent = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        credential_sent = std::exchange(credential_sent_, false);
    }

    if (response.status_code == 403) {
        // A 403 for a request that carried no credential says nothing about the session
        if (!credential_sent) {
            return;
        }
        invalidate();
        auto who = identity();
        spdlog::warn("AuthRateLimiter: credential for {} rejected", who);
        emit({SignalKind::AUTH_REJECTED, std::nullopt, std::move(who)});
        return;
    }

    if (!response.ok()) {
        return;
    }

    auto token = find_header(response.headers, headers_.token);
    auto pin = find_header(response.headers, headers_.pin);

    std::lock_guard<std::mutex> lock(mutex_);
    if (token && !token->empty()) {
        if (!credential_.cached_token) {
            spdlog::debug("AuthRateLimiter: session token issued for {}", credential_.identity);
        }
        credential_.cached_token = *token;
    }
    if (pin && !pin->empty()) {
        credential_.cached_pin = *pin;
    }
}

void AuthRateLimiter::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (credential_.cached_token || credential_.cached_pin) {
        spdlog::debug("AuthRateLimiter: clearing cached session for {}", credential_.identity);
    }
    credential_.cached_token.reset();
    credential_.cached_pin.reset();
}

void AuthRateLimiter::reset_credential(std::string identity, std::string password) {
    std::lock_guard<std::mutex> lock(mutex_);
    credential_.identity = std::move(identity);
    credential_.plaintext_secret = std::move(password);
    credential_.cached_token.reset();
    credential_.cached_pin.reset();
    credential_sent_ = false;
}

std::string AuthRateLimiter::identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credential_.identity;
}

std::optional<std::string> AuthRateLimiter::autologin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credential_.cached_token;
}

bool AuthRateLimiter::has_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credential_.cached_token.has_value();
}

}  // namespace sans
