#pragma once

#include "sans/types.hpp"

#include <string>

namespace sans {

/// Anything that can decorate an outgoing request with credentials and learn
/// from the response. Implemented by every limiter and by StaticCredential.
class Authorizer {
public:
    virtual ~Authorizer() = default;

    /// Credential headers to merge into the next outgoing request
    virtual Headers prepare_request() = 0;

    /// Feed back the response to the request prepared above
    virtual void observe(const HttpResponse& response) = 0;
};

/// Plain secret sent on every request, with no session caching
class StaticCredential : public Authorizer {
public:
    explicit StaticCredential(std::string password, std::string header_name = "X-Password")
        : password_(std::move(password)), header_name_(std::move(header_name)) {}

    Headers prepare_request() override { return Headers{{header_name_, password_}}; }

    void observe(const HttpResponse& /*response*/) override {}

private:
    std::string password_;
    std::string header_name_;
};

}  // namespace sans
