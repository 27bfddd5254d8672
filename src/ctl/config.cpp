#include "config.hpp"

#include "sans/exceptions.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <iostream>

namespace sans::ctl {

void setup_logging(int verbosity, const std::string& log_file) {
    if (!log_file.empty()) {
        try {
            auto file_logger = spdlog::basic_logger_mt("file_logger", log_file, true);
            spdlog::set_default_logger(file_logger);
        } catch (const spdlog::spdlog_ex& e) {
            // If we can't set up file logging, just continue with console
            std::cerr << "Warning: Could not set up file logging: " << e.what() << "\n";
        }
    }

    set_verbosity(verbosity);
}

void set_verbosity(int verbosity) {
    if (verbosity >= 3) {
        spdlog::set_level(spdlog::level::trace);
    } else if (verbosity == 2) {
        spdlog::set_level(spdlog::level::debug);
    } else if (verbosity == 1) {
        spdlog::set_level(spdlog::level::info);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

std::optional<Settings> load_cli_settings(const std::string& path) {
    try {
        if (path.empty()) {
            return load_settings();
        }
        return load_settings(path);
    } catch (const ConfigException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return std::nullopt;
    }
}

}  // namespace sans::ctl
