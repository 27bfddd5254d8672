#pragma once

#include "sans/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sans {

inline constexpr const char* kSiteUrl = "https://www.nationstates.net";
inline constexpr const char* kApiUrl = "https://www.nationstates.net/cgi-bin/api.cgi";

/// Ordered query parameters
using Params = std::vector<std::pair<std::string, std::string>>;

/// A shard name plus the parameters it needs (e.g. census scale)
struct Shard {
    std::string q;
    Params params;

    Shard(std::string name) : q(std::move(name)) {}
    Shard(const char* name) : q(name) {}
    Shard(std::string name, Params extra) : q(std::move(name)), params(std::move(extra)) {}
};

Shard shard(std::string q, Params params = {});

/// Percent-encode for a query component; spaces become '+'
std::string url_encode(const std::string& text);

/// Build "key=value&..." from ordered parameters
std::string encode_query(const Params& params);

/// World API request. `params` come first, then `q` (any `q` in `params`
/// followed by the shard names), then shard parameters, which replace
/// same-named entries.
HttpRequest world(const std::vector<Shard>& shards = {}, const Params& params = {}, const std::string& base = kApiUrl);

HttpRequest nation(const std::string& name, const std::vector<Shard>& shards = {}, const Params& params = {});

HttpRequest region(const std::string& name, const std::vector<Shard>& shards = {}, const Params& params = {});

/// World Assembly request; `council` must be 1 or 2
HttpRequest wa(int council, const std::vector<Shard>& shards = {}, const Params& params = {});

/// Private command (c=...) on behalf of `nation`
HttpRequest command(const std::string& nation, const std::string& c, const Params& params = {});

/// Telegram send (a=sendtg)
HttpRequest telegram(const std::string& client, const std::string& tgid, const std::string& key, const std::string& to);

HttpRequest nations_dump(std::optional<std::chrono::year_month_day> date = std::nullopt);

HttpRequest regions_dump(std::optional<std::chrono::year_month_day> date = std::nullopt);

HttpRequest cards_dump(int season);

}  // namespace sans
