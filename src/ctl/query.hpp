#pragma once

#include "sans/client.hpp"
#include "sans/types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace sans::ctl {

/// Build a world API request from console arguments.
/// "key=value" becomes a query parameter (repeated keys are space-joined),
/// anything else is a shard name.
HttpRequest build_query(const std::vector<std::string>& args, const std::string& api_url);

/// Value of a query parameter in `url`, or empty if absent
std::string query_param(const std::string& url, const std::string& key);

/// Print request line and headers the way curl -v does. Credential values are masked.
void print_request(std::ostream& out, const HttpRequest& request);

void print_response_head(std::ostream& out, const HttpResponse& response);

/// Read a line from stdin with optional echo disabled (for passwords)
std::string read_line(const std::string& prompt, bool hide_input = false);

}  // namespace sans::ctl
