#include "sans/url.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace sans {

namespace {

void set_param(Params& params, const std::string& key, const std::string& value) {
    for (auto& [existing_key, existing_value] : params) {
        if (existing_key == key) {
            existing_value = value;
            return;
        }
    }
    params.emplace_back(key, value);
}

HttpRequest get(std::string url) {
    HttpRequest request;
    request.method = "GET";
    request.url = std::move(url);
    return request;
}

Params with_param(const Params& params, const std::string& key, const std::string& value) {
    Params result;
    result.emplace_back(key, value);
    for (const auto& [k, v] : params) {
        set_param(result, k, v);
    }
    return result;
}

std::string format_date(const std::chrono::year_month_day& date) {
    return fmt::format(
        "{:04}-{:02}-{:02}",
        static_cast<int>(date.year()),
        static_cast<unsigned>(date.month()),
        static_cast<unsigned>(date.day())
    );
}

}  // namespace

Shard shard(std::string q, Params params) { return Shard{std::move(q), std::move(params)}; }

std::string url_encode(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (unsigned char c : text) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
            c == '.' || c == '~') {
            result += static_cast<char>(c);
        } else if (c == ' ') {
            result += '+';
        } else {
            result += fmt::format("%{:02X}", c);
        }
    }
    return result;
}

std::string encode_query(const Params& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += url_encode(key);
        query += '=';
        query += url_encode(value);
    }
    return query;
}

HttpRequest world(const std::vector<Shard>& shards, const Params& params, const std::string& base) {
    std::string q;
    auto append_q = [&q](const std::string& part) {
        if (part.empty()) {
            return;
        }
        if (!q.empty()) {
            q += ' ';
        }
        q += part;
    };

    for (const auto& [key, value] : params) {
        if (key == "q") {
            append_q(value);
        }
    }

    Params query;
    for (const auto& [key, value] : params) {
        if (key != "q") {
            set_param(query, key, value);
        }
    }
    for (const auto& s : shards) {
        append_q(s.q);
    }
    if (!q.empty()) {
        set_param(query, "q", q);
    }
    for (const auto& s : shards) {
        for (const auto& [key, value] : s.params) {
            set_param(query, key, value);
        }
    }

    if (query.empty()) {
        return get(base);
    }
    return get(base + "?" + encode_query(query));
}

HttpRequest nation(const std::string& name, const std::vector<Shard>& shards, const Params& params) {
    return world(shards, with_param(params, "nation", name));
}

HttpRequest region(const std::string& name, const std::vector<Shard>& shards, const Params& params) {
    return world(shards, with_param(params, "region", name));
}

HttpRequest wa(int council, const std::vector<Shard>& shards, const Params& params) {
    if (council != 1 && council != 2) {
        throw std::invalid_argument(fmt::format("World Assembly council must be 1 or 2, got {}", council));
    }
    return world(shards, with_param(params, "wa", std::to_string(council)));
}

HttpRequest command(const std::string& nation, const std::string& c, const Params& params) {
    Params merged{{"nation", nation}, {"c", c}};
    for (const auto& [key, value] : params) {
        set_param(merged, key, value);
    }
    return world({}, merged);
}

HttpRequest
telegram(const std::string& client, const std::string& tgid, const std::string& key, const std::string& to) {
    return world({}, {{"a", "sendtg"}, {"client", client}, {"tgid", tgid}, {"key", key}, {"to", to}});
}

HttpRequest nations_dump(std::optional<std::chrono::year_month_day> date) {
    if (date) {
        return get(fmt::format("{}/archive/nations/{}-nations-xml.gz", kSiteUrl, format_date(*date)));
    }
    return get(fmt::format("{}/pages/nations.xml.gz", kSiteUrl));
}

HttpRequest regions_dump(std::optional<std::chrono::year_month_day> date) {
    if (date) {
        return get(fmt::format("{}/archive/regions/{}-regions-xml.gz", kSiteUrl, format_date(*date)));
    }
    return get(fmt::format("{}/pages/regions.xml.gz", kSiteUrl));
}

HttpRequest cards_dump(int season) { return get(fmt::format("{}/pages/cardlist_S{}.xml.gz", kSiteUrl, season)); }

}  // namespace sans
