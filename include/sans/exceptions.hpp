#pragma once

#include <chrono>
#include <exception>
#include <string>

namespace sans {

// Base exception for all sans errors
class SansException : public std::exception {
public:
    explicit SansException(const std::string& message) : message_(message) {}

    const char* what() const noexcept override { return message_.c_str(); }

    const std::string& message() const { return message_; }

private:
    std::string message_;
};

class AgentNotSetException : public SansException {
public:
    AgentNotSetException() : SansException("User-Agent is not set; the NationStates API requires one") {}
};

class ConfigException : public SansException {
public:
    explicit ConfigException(const std::string& message) : SansException("Configuration error: " + message) {}
};

// Authentication-related exceptions
class AuthenticationException : public SansException {
public:
    explicit AuthenticationException(const std::string& message) : SansException(message) {}
};

class AuthRejectedException : public AuthenticationException {
public:
    explicit AuthRejectedException(const std::string& identity)
        : AuthenticationException("Authentication rejected for " + identity + "; cached session cleared") {}
};

// Admission-related exceptions
class CancelledException : public SansException {
public:
    CancelledException() : SansException("Admission wait cancelled") {}
};

// Network-related exceptions
class TransportException : public SansException {
public:
    explicit TransportException(const std::string& message) : SansException("Transport error: " + message) {}
};

// HTTP status exceptions, narrowed by HttpResponse::raise_for_status()
class HttpStatusException : public SansException {
public:
    HttpStatusException(long status_code, const std::string& url)
        : SansException("HTTP " + std::to_string(status_code) + " for " + url), status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

class ClientErrorException : public HttpStatusException {
public:
    using HttpStatusException::HttpStatusException;
};

class BadRequestException : public ClientErrorException {
public:
    explicit BadRequestException(const std::string& url) : ClientErrorException(400, url) {}
};

class ForbiddenException : public ClientErrorException {
public:
    explicit ForbiddenException(const std::string& url) : ClientErrorException(403, url) {}
};

class NotFoundException : public ClientErrorException {
public:
    explicit NotFoundException(const std::string& url) : ClientErrorException(404, url) {}
};

class ConflictException : public ClientErrorException {
public:
    explicit ConflictException(const std::string& url) : ClientErrorException(409, url) {}
};

class TeapotException : public ClientErrorException {
public:
    explicit TeapotException(const std::string& url) : ClientErrorException(418, url) {}
};

class TooManyRequestsException : public ClientErrorException {
public:
    TooManyRequestsException(const std::string& url, std::chrono::seconds retry_after)
        : ClientErrorException(429, url), retry_after_(retry_after) {}

    std::chrono::seconds retry_after() const { return retry_after_; }

private:
    std::chrono::seconds retry_after_;
};

class ServerErrorException : public HttpStatusException {
public:
    using HttpStatusException::HttpStatusException;
};

}  // namespace sans
