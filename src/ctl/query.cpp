#include "query.hpp"

#include "sans/url.hpp"

#include <fmt/format.h>

#include <termios.h>
#include <unistd.h>
#include <cctype>
#include <iostream>
#include <map>

namespace sans::ctl {

namespace {

bool is_secret_header(const std::string& name) {
    static const Headers secrets{{"X-Password", ""}, {"X-Autologin", ""}, {"X-Pin", ""}};
    return secrets.contains(name);
}

std::string url_decode(const std::string& text) {
    std::string result;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '+') {
            result += ' ';
        } else if (text[i] == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            result += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            result += text[i];
        }
    }
    return result;
}

std::string request_target(const std::string& url) {
    auto scheme = url.find("://");
    auto path = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    return path == std::string::npos ? "/" : url.substr(path);
}

}  // namespace

HttpRequest build_query(const std::vector<std::string>& args, const std::string& api_url) {
    std::vector<Shard> shards;
    std::map<std::string, std::string> joined;
    Params params;

    for (const auto& arg : args) {
        auto eq = arg.find('=');
        if (eq == std::string::npos || eq == 0) {
            shards.emplace_back(arg);
            continue;
        }

        auto key = arg.substr(0, eq);
        auto value = arg.substr(eq + 1);
        auto [it, inserted] = joined.try_emplace(key, value);
        if (inserted) {
            params.emplace_back(key, value);
        } else {
            it->second += " " + value;
            for (auto& [k, v] : params) {
                if (k == key) {
                    v = it->second;
                }
            }
        }
    }

    return world(shards, params, api_url);
}

std::string query_param(const std::string& url, const std::string& key) {
    auto question = url.find('?');
    if (question == std::string::npos) {
        return {};
    }

    std::string query = url.substr(question + 1);
    std::size_t start = 0;
    while (start <= query.size()) {
        auto end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }
        auto pair = query.substr(start, end - start);
        auto eq = pair.find('=');
        if (eq != std::string::npos && url_decode(pair.substr(0, eq)) == key) {
            return url_decode(pair.substr(eq + 1));
        }
        start = end + 1;
    }
    return {};
}

void print_request(std::ostream& out, const HttpRequest& request) {
    out << fmt::format("> {} {} HTTP/1.1\n", request.method, request_target(request.url));
    for (const auto& [name, value] : request.headers) {
        out << fmt::format("> {}: {}\n", name, is_secret_header(name) ? "********" : value);
    }
    out << ">\n";
}

void print_response_head(std::ostream& out, const HttpResponse& response) {
    out << fmt::format("< HTTP/1.1 {}\n", response.status_code);
    for (const auto& [name, value] : response.headers) {
        out << fmt::format("< {}: {}\n", name, is_secret_header(name) ? "********" : value);
    }
    out << "<\n";
}

std::string read_line(const std::string& prompt, bool hide_input) {
    std::cerr << prompt << std::flush;

    termios oldt{};
    if (hide_input) {
        tcgetattr(STDIN_FILENO, &oldt);
        termios newt = oldt;
        newt.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    }

    std::string line;
    std::getline(std::cin, line);

    if (hide_input) {
        tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
        std::cerr << std::endl;
    }

    return line;
}

}  // namespace sans::ctl
