#include "sans/types.hpp"

#include "sans/exceptions.hpp"
#include "sans/quota.hpp"

#include <algorithm>
#include <cctype>

namespace sans {

bool HeaderNameLess::operator()(std::string_view lhs, std::string_view rhs) const {
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) < std::tolower(static_cast<unsigned char>(b));
    });
}

std::optional<std::string> find_header(const Headers& headers, std::string_view name) {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

void merge_headers(Headers& headers, const Headers& extra) {
    for (const auto& [name, value] : extra) {
        headers.insert_or_assign(name, value);
    }
}

std::string HttpResponse::content_type() const {
    auto value = find_header(headers, "Content-Type");
    if (!value) {
        return "text/plain";
    }

    std::string media = value->substr(0, value->find(';'));
    auto first = media.find_first_not_of(" \t");
    auto last = media.find_last_not_of(" \t");
    if (first == std::string::npos) {
        return "text/plain";
    }
    media = media.substr(first, last - first + 1);
    std::transform(media.begin(), media.end(), media.begin(), [](unsigned char c) { return std::tolower(c); });
    return media;
}

void HttpResponse::raise_for_status() const {
    if (status_code < 400) {
        return;
    }

    switch (status_code) {
        case 400:
            throw BadRequestException(url);
        case 403:
            throw ForbiddenException(url);
        case 404:
            throw NotFoundException(url);
        case 409:
            throw ConflictException(url);
        case 418:
            throw TeapotException(url);
        case 429: {
            auto retry = parse_seconds(find_header(headers, "Retry-After").value_or("0"));
            auto seconds =
                std::chrono::duration_cast<std::chrono::seconds>(retry.value_or(std::chrono::milliseconds{0}));
            throw TooManyRequestsException(url, seconds);
        }
        default:
            break;
    }

    if (status_code < 500) {
        throw ClientErrorException(status_code, url);
    }
    if (status_code < 600) {
        throw ServerErrorException(status_code, url);
    }
    throw HttpStatusException(status_code, url);
}

const char* to_string(SignalKind kind) {
    switch (kind) {
        case SignalKind::THROTTLED:
            return "throttled";
        case SignalKind::AUTH_REJECTED:
            return "auth-rejected";
        case SignalKind::MALFORMED_QUOTA_DATA:
            return "malformed-quota-data";
    }
    return "unknown";
}

}  // namespace sans
