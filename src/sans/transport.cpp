#include "sans/transport.hpp"

#include "sans/exceptions.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <string>

namespace sans {

namespace {

void init_curl_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Frees the header list on every exit path
struct HeaderList {
    curl_slist* list = nullptr;
    ~HeaderList() {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

// Query strings can carry telegram keys, so only the path is logged
std::string loggable_url(const std::string& url) { return url.substr(0, url.find('?')); }

}  // namespace

CurlTransport::CurlTransport(std::chrono::milliseconds timeout) : curl_(nullptr), timeout_(timeout) {
    init_curl_once();
    curl_ = curl_easy_init();
    if (!curl_) {
        throw TransportException("curl_easy_init failed");
    }
}

CurlTransport::~CurlTransport() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

size_t CurlTransport::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

size_t CurlTransport::header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* headers = static_cast<Headers*>(userdata);

    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a new header block (redirects, 100-continue)
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        auto start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? std::string{} : value.substr(start);
        headers->insert_or_assign(std::move(key), std::move(value));
    }

    return total;
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count() / 2));

    if (request.method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method == "HEAD") {
        curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    HeaderList header_list;
    for (const auto& [name, value] : request.headers) {
        std::string header = name + ": " + value;
        header_list.list = curl_slist_append(header_list.list, header.c_str());
    }
    if (header_list.list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list.list);
    }

    HttpResponse response;
    response.url = request.url;
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response.headers);

    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        spdlog::error(
            "CurlTransport: {} {} failed: {}", request.method, loggable_url(request.url), curl_easy_strerror(res)
        );
        throw TransportException(curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status_code);
    spdlog::debug("CurlTransport: {} {} -> {}", request.method, loggable_url(request.url), response.status_code);
    return response;
}

}  // namespace sans
