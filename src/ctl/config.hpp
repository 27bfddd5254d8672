#pragma once

#include "sans/settings.hpp"

#include <optional>
#include <string>

namespace sans::ctl {

/// Configure the spdlog default logger.
/// verbosity 0 = warnings, 1 = info, 2 = debug, 3+ = trace. A non-empty
/// `log_file` sends output there instead of stderr.
void setup_logging(int verbosity, const std::string& log_file);

/// Change the log level only (for later console rounds)
void set_verbosity(int verbosity);

/// Load settings from `path` if given, otherwise from the XDG config path.
/// Prints the error and returns std::nullopt if the file is invalid.
std::optional<Settings> load_cli_settings(const std::string& path);

}  // namespace sans::ctl
