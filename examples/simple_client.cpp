/**
 * Simple example demonstrating sans client usage
 *
 * This example shows how to:
 * 1. Configure a Client with a User-Agent and a shared RateLimiter
 * 2. Send paced requests from several threads
 * 3. Send requests from coroutines on an EventLoop
 * 4. Use an AuthRateLimiter for private shards
 *
 * Usage:
 *   ./simple_client <user_agent> [nation] [password]
 */

#include "sans/auth_rate_limiter.hpp"
#include "sans/client.hpp"
#include "sans/event_loop.hpp"
#include "sans/exceptions.hpp"
#include "sans/url.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Coroutine that fetches a few shards one after another
sans::Task<void> fetch_world(sans::Client& client, sans::Scheduler& scheduler) {
    for (const char* shard : {"numnations", "featuredregion", "lasteventid"}) {
        auto request = sans::world({shard});
        auto response = co_await client.send_async(std::move(request), scheduler);
        spdlog::info("{}: HTTP {} ({} bytes)", shard, response.status_code, response.body.size());
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <user_agent> [nation] [password]\n";
        return 1;
    }

    spdlog::set_level(spdlog::level::debug);

    sans::ClientConfig config;
    config.user_agent = argv[1];
    std::string nation = argc > 2 ? argv[2] : "testlandia";

    sans::RateLimiter limiter;
    limiter.set_signal_callback([](const sans::LimiterSignal& signal) {
        spdlog::warn("Limiter signal: {} {}", sans::to_string(signal.kind), signal.detail);
    });

    try {
        sans::Client client(config, limiter);

        // Blocking callers on several threads share one quota
        spdlog::info("=== Threads ===");
        std::vector<std::thread> threads;
        for (const char* shard : {"name", "region", "population", "motto"}) {
            threads.emplace_back([&client, &nation, shard]() {
                try {
                    auto response = client.send(sans::nation(nation, {shard}));
                    response.raise_for_status();
                    spdlog::info("{}: {}", shard, response.body);
                } catch (const sans::SansException& e) {
                    spdlog::error("{}: {}", shard, e.what());
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        // Coroutines on an event loop use the same limiter
        spdlog::info("=== Coroutines ===");
        sans::EventLoop loop;
        loop.run_until_complete(fetch_world(client, loop));

        if (auto quota = limiter.quota()) {
            spdlog::info("Quota: {} requests left in this window", quota->remaining);
        }

        // Private shards need a password; the autologin token replaces it afterwards
        if (argc > 3) {
            spdlog::info("=== Private shards ===");
            sans::AuthRateLimiter auth(nation, argv[3]);
            auto response = client.send(sans::nation(nation, {"ping"}), auth);
            response.raise_for_status();
            spdlog::info("Logged in, session {}", auth.has_session() ? "issued" : "not issued");

            response = client.send(sans::nation(nation, {"notices"}), auth);
            std::cout << response.body << std::endl;
        }

        std::cout << "\nExample completed successfully!" << std::endl;

    } catch (const sans::AuthRejectedException& e) {
        spdlog::error("Authentication failed: {}", e.what());
        return 1;
    } catch (const sans::SansException& e) {
        spdlog::error("Request failed: {}", e.what());
        return 1;
    }

    return 0;
}
