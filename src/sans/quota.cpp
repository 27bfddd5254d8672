#include "sans/quota.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <stdexcept>

namespace sans {

namespace {

std::string_view trim(std::string_view text) {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

}  // namespace

std::optional<std::chrono::milliseconds> parse_seconds(std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }

    std::string copy(text);
    std::size_t consumed = 0;
    double seconds = 0.0;
    try {
        seconds = std::stod(copy, &consumed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    if (consumed != copy.size() || !std::isfinite(seconds) || seconds < 0.0) {
        return std::nullopt;
    }
    if (seconds > std::chrono::duration<double>(kMaxDelay).count()) {
        return std::nullopt;
    }
    return std::chrono::milliseconds{static_cast<int64_t>(std::ceil(seconds * 1000.0))};
}

std::optional<int64_t> parse_count(std::string_view text) {
    text = trim(text);
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) {
        return std::nullopt;
    }
    return value;
}

QuotaExtractor make_header_extractor(QuotaHeaders names) {
    return [names = std::move(names)](long /*status_code*/, const Headers& headers) {
        QuotaReading reading;

        if (auto value = find_header(headers, names.remaining)) {
            reading.remaining = parse_count(*value);
            if (!reading.remaining) {
                reading.error = fmt::format("{}: '{}' is not a count", names.remaining, *value);
            }
        }

        if (auto value = find_header(headers, names.reset)) {
            reading.reset_in = parse_seconds(*value);
            if (!reading.reset_in && reading.error.empty()) {
                reading.error = fmt::format("{}: '{}' is not a duration", names.reset, *value);
            }
        }

        if (auto value = find_header(headers, names.retry_after)) {
            reading.retry_after = parse_seconds(*value);
            if (!reading.retry_after && reading.error.empty()) {
                reading.error = fmt::format("{}: '{}' is not a duration", names.retry_after, *value);
            }
        }

        return reading;
    };
}

}  // namespace sans
