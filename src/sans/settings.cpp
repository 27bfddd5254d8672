#include "sans/settings.hpp"

#include "sans/exceptions.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sans {

namespace {

std::filesystem::path get_xdg_config_home() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config";
    }
    return ".config";
}

std::chrono::milliseconds read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    auto value = j.at(key).get<int64_t>();
    if (value < 0) {
        throw ConfigException(fmt::format("'{}' must not be negative", key));
    }
    if (value > kMaxDelay.count()) {
        throw ConfigException(fmt::format("'{}' must not exceed {}ms", key, kMaxDelay.count()));
    }
    return std::chrono::milliseconds{value};
}

}  // namespace

RateLimiterConfig Settings::limiter_config() const {
    RateLimiterConfig config;
    config.extractor = make_header_extractor(quota_headers);
    config.fallback_delay = fallback_delay;
    return config;
}

std::filesystem::path get_config_dir() { return get_xdg_config_home() / "sans"; }

std::filesystem::path get_config_path() { return get_config_dir() / "config.json"; }

Settings parse_settings(const std::string& json_text) {
    Settings settings;

    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            throw ConfigException("top level must be an object");
        }

        settings.client.user_agent = j.value("user_agent", settings.client.user_agent);
        settings.client.api_url = j.value("api_url", settings.client.api_url);
        settings.client.timeout = read_millis(j, "timeout_ms", settings.client.timeout);
        settings.fallback_delay = read_millis(j, "fallback_delay_ms", settings.fallback_delay);
        settings.telegram.standard_interval =
            read_millis(j, "telegram_interval_ms", settings.telegram.standard_interval);
        settings.telegram.recruitment_interval =
            read_millis(j, "recruitment_interval_ms", settings.telegram.recruitment_interval);

        if (j.contains("quota_headers")) {
            const auto& headers = j.at("quota_headers");
            if (!headers.is_object()) {
                throw ConfigException("'quota_headers' must be an object");
            }
            settings.quota_headers.remaining = headers.value("remaining", settings.quota_headers.remaining);
            settings.quota_headers.reset = headers.value("reset", settings.quota_headers.reset);
            settings.quota_headers.retry_after = headers.value("retry_after", settings.quota_headers.retry_after);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException(e.what());
    }

    if (settings.client.api_url.empty()) {
        throw ConfigException("'api_url' must not be empty");
    }
    if (settings.client.timeout.count() == 0) {
        throw ConfigException("'timeout_ms' must be positive");
    }

    return settings;
}

Settings load_settings(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::debug("Config file not found: {}", path.string());
        return Settings{};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException("cannot open " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    Settings settings = parse_settings(buffer.str());
    spdlog::debug("Loaded config from {}", path.string());
    return settings;
}

Settings load_settings() { return load_settings(get_config_path()); }

void save_settings(const Settings& settings, const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    nlohmann::json j;
    j["user_agent"] = settings.client.user_agent;
    j["api_url"] = settings.client.api_url;
    j["timeout_ms"] = settings.client.timeout.count();
    j["fallback_delay_ms"] = settings.fallback_delay.count();
    j["telegram_interval_ms"] = settings.telegram.standard_interval.count();
    j["recruitment_interval_ms"] = settings.telegram.recruitment_interval.count();
    j["quota_headers"] = {
        {"remaining", settings.quota_headers.remaining},
        {"reset", settings.quota_headers.reset},
        {"retry_after", settings.quota_headers.retry_after},
    };

    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigException("cannot write " + path.string());
    }

    file << j.dump(2) << std::endl;
    spdlog::info("Configuration saved to {}", path.string());
}

}  // namespace sans
