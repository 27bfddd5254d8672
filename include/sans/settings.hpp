#pragma once

#include "sans/client.hpp"
#include "sans/quota.hpp"
#include "sans/rate_limiter.hpp"
#include "sans/telegram_rate_limiter.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace sans {

/// Everything read from the configuration file
struct Settings {
    ClientConfig client;
    QuotaHeaders quota_headers;
    std::chrono::milliseconds fallback_delay{1000};
    TelegramPacing telegram;

    /// Limiter configuration using the configured quota headers and fallback delay
    RateLimiterConfig limiter_config() const;
};

/// Get XDG config directory (~/.config/sans)
std::filesystem::path get_config_dir();

/// Get config file path (~/.config/sans/config.json)
std::filesystem::path get_config_path();

/// Parse settings from JSON text. Keys that are absent keep their defaults.
/// Throws ConfigException on malformed JSON or invalid values.
Settings parse_settings(const std::string& json_text);

/// Load settings from `path`; defaults if the file does not exist
Settings load_settings(const std::filesystem::path& path);

/// Load settings from get_config_path()
Settings load_settings();

/// Write settings as JSON, creating parent directories as needed
void save_settings(const Settings& settings, const std::filesystem::path& path);

}  // namespace sans
