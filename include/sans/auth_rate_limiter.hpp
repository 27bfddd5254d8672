#pragma once

#include "sans/rate_limiter.hpp"

#include <optional>
#include <string>

namespace sans {

/// Header names used to exchange credentials with the server
struct CredentialHeaders {
    std::string password = "X-Password";
    std::string token = "X-Autologin";
    std::string pin = "X-Pin";
};

/// Session credential for one identity (nation)
struct Credential {
    std::string identity;
    std::string plaintext_secret;
    std::optional<std::string> cached_token;  // autologin token issued by the server
    std::optional<std::string> cached_pin;    // session pin issued by the server
};

/// RateLimiter that also carries a session credential.
///
/// Once the server hands out an autologin token the plaintext secret is no
/// longer sent; an authentication rejection clears the cached session so the
/// next request falls back to the plaintext secret. observe() pairs with the
/// preceding prepare_request(): a 403 only counts as a rejection when that
/// request carried credential fields.
class AuthRateLimiter : public RateLimiter {
public:
    AuthRateLimiter(std::string identity, std::string password, Config config = {}, CredentialHeaders headers = {});

    /// Resume a session from a previously issued autologin token
    AuthRateLimiter(Credential credential, Config config = {}, CredentialHeaders headers = {});

    Headers prepare_request() override;

    using RateLimiter::observe;
    void observe(const HttpResponse& response) override;

    /// Drop the cached token and pin
    void invalidate();

    /// Switch to a new identity and plaintext secret, dropping any cached session
    void reset_credential(std::string identity, std::string password);

    [[nodiscard]] std::string identity() const;

    /// Current autologin token, so callers can persist the session
    [[nodiscard]] std::optional<std::string> autologin() const;

    [[nodiscard]] bool has_session() const;

private:
    Credential credential_;         // guarded by mutex_
    bool credential_sent_ = false;  // last prepare_request() carried credential fields; guarded by mutex_
    CredentialHeaders headers_;
};

}  // namespace sans
