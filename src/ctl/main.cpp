#include "config.hpp"
#include "query.hpp"

#include "sans/auth_rate_limiter.hpp"
#include "sans/client.hpp"
#include "sans/exceptions.hpp"

#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

/// Options of one console round
struct RoundOptions {
    std::string agent;
    bool auth = false;
    bool quit = false;
    int verbosity = 0;
    std::vector<std::string> query;
};

/// Send one query and print the response. Returns a process exit status.
int run_query(
    sans::Client& client,
    sans::AuthRateLimiter& limiter,
    const RoundOptions& options,
    const std::string& api_url
) {
    auto request = sans::ctl::build_query(options.query, api_url);

    if (options.auth) {
        auto password = sans::ctl::read_line("Password: ", true);
        limiter.reset_credential(sans::ctl::query_param(request.url, "nation"), std::move(password));
    }

    if (options.verbosity > 0) {
        sans::HttpRequest shown = request;
        shown.headers.insert_or_assign("User-Agent", client.user_agent());
        sans::ctl::print_request(std::cerr, shown);
    }

    try {
        auto response = client.send(request);

        if (options.verbosity > 0) {
            sans::ctl::print_response_head(std::cerr, response);
        }

        std::cout << response.body;
        if (!response.body.empty() && response.body.back() != '\n') {
            std::cout << '\n';
        }
        std::cout << std::flush;
        return response.ok() ? 0 : 1;

    } catch (const sans::AgentNotSetException& e) {
        std::cerr << "Error: " << e.what() << "\nSet one with -A \"<nation name or contact>\".\n";
    } catch (const sans::AuthRejectedException& e) {
        std::cerr << "Error: " << e.what() << "\nRun again with --auth to enter the password.\n";
    } catch (const sans::SansException& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"sans - NationStates API console"};
    app.footer("Remaining arguments build the request: key=value sets a parameter, anything else is a shard.");
    app.set_version_flag("--version", std::string("sans ") + sans::kVersion);

    RoundOptions options;
    std::string config_path;
    std::string log_file;

    app.add_option("-A,--agent", options.agent, "Set the script's User-Agent");
    app.add_flag("--auth", options.auth, "Prompt for a password for using private shards");
    app.add_flag("--quit,--exit", options.quit, "Quit the console after this request");
    app.add_flag("-v,--verbose", options.verbosity, "Print request and response headers; repeat for more logging");
    app.add_option("--config", config_path, "Configuration file (default: ~/.config/sans/config.json)");
    app.add_option("--log-file", log_file, "Write logs to this file instead of stderr");
    app.add_option("query", options.query, "key=value parameters and shard names");

    CLI11_PARSE(app, argc, argv);

    auto settings = sans::ctl::load_cli_settings(config_path);
    if (!settings) {
        return 1;
    }
    sans::ctl::setup_logging(options.verbosity, log_file);

    // A single limiter paces every request and carries the session once --auth is used
    sans::AuthRateLimiter limiter("", "", settings->limiter_config());
    limiter.set_signal_callback([](const sans::LimiterSignal& signal) {
        spdlog::info("Limiter signal: {} {}", sans::to_string(signal.kind), signal.detail);
    });

    std::string agent = options.agent.empty() ? settings->client.user_agent : options.agent;
    auto make_client = [&](const std::string& user_agent) {
        auto config = settings->client;
        config.user_agent = user_agent;
        return config;
    };
    std::optional<sans::Client> client;
    client.emplace(make_client(agent), limiter);

    int status = 0;
    bool first_round = true;
    while (true) {
        if (!first_round) {
            sans::ctl::set_verbosity(options.verbosity);
        }
        first_round = false;

        if (!options.agent.empty() && options.agent != agent) {
            if (agent.empty()) {
                agent = options.agent;
                client.emplace(make_client(agent), limiter);
                std::cerr << "Agent set: " << client->user_agent() << "\n";
            } else {
                std::cerr << "You can't change the agent in the middle of the script.\n";
            }
        }

        if (options.query.empty()) {
            std::cerr << (options.quit ? "No query provided. Exiting...\n" : "No query provided.\n");
            status = 0;
        } else {
            status = run_query(*client, limiter, options, settings->client.api_url);
        }

        if (options.quit) {
            return status;
        }

        // Next round: read another command line from the console
        while (true) {
            auto line = sans::ctl::read_line("\n>>> sans ");
            if (!std::cin || line.empty()) {
                return status;
            }

            options = RoundOptions{};
            try {
                app.parse(line, false);
                break;
            } catch (const CLI::ParseError& e) {
                app.exit(e);
            }
        }
    }
}
