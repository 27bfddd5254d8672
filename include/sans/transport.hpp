#pragma once

#include "sans/types.hpp"

#include <curl/curl.h>

#include <chrono>
#include <mutex>

namespace sans {

/// Sends one HTTP request and returns the complete response.
/// Throws TransportException when no response could be obtained.
class Transport {
public:
    virtual ~Transport() = default;

    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

/// Transport backed by a reusable libcurl easy handle
class CurlTransport : public Transport {
public:
    explicit CurlTransport(std::chrono::milliseconds timeout = std::chrono::milliseconds{30000});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse perform(const HttpRequest& request) override;

private:
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata);

    CURL* curl_;
    std::chrono::milliseconds timeout_;
    std::mutex mutex_;  // one request at a time per easy handle
};

}  // namespace sans
