#include "app_config.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace shopping_assistance {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_field(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) target = j[key].get<T>();
}

bool is_bare_host(const std::string& d) {
    if (d.empty() || d.front() == '.' || d.back() == '.' || d.find('.') == std::string::npos) return false;
    return std::all_of(d.begin(), d.end(), [](unsigned char c) {
        return std::islower(c) || std::isdigit(c) || c == '-' || c == '.';
    });
}

void require_positive(int value, const std::string& name) {
    if (value <= 0) throw ConfigurationError(name + " must be positive, got " + std::to_string(value));
}

} // namespace

AppConfig AppConfig::load(const std::string& path) {
    if (!fs::exists(path)) {
        spdlog::warn("⚠️ Config {} not found, using defaults", path);
        return AppConfig{};
    }
    std::ifstream file(path);
    if (!file) throw ConfigurationError("cannot open config file " + path);
    try {
        return from_json(json::parse(file));
    } catch (const json::exception& e) {
        throw ConfigurationError("malformed config " + path + ": " + e.what());
    }
}

AppConfig AppConfig::from_json(const json& j) {
    AppConfig c;
    try {
        read_field(j, "host", c.host);
        read_field(j, "port", c.port);
        read_field(j, "log_level", c.log_level);
        read_field(j, "request_timeout_ms", c.request_timeout_ms);
        read_field(j, "worker_threads", c.worker_threads);
        read_field(j, "allowed_domains", c.allowed_domains);

        if (j.contains("catalog")) {
            const auto& s = j["catalog"];
            read_field(s, "enabled", c.catalog.enabled);
            read_field(s, "index_path", c.catalog.index_path);
            read_field(s, "dimension", c.catalog.dimension);
            read_field(s, "timeout_ms", c.catalog.timeout_ms);
            read_field(s, "embedding_model", c.catalog.embedding_model);
        }
        if (j.contains("web")) {
            read_field(j["web"], "enabled", c.web.enabled);
            read_field(j["web"], "timeout_ms", c.web.timeout_ms);
        }
        if (j.contains("lookup")) {
            read_field(j["lookup"], "enabled", c.lookup.enabled);
            read_field(j["lookup"], "timeout_ms", c.lookup.timeout_ms);
            read_field(j["lookup"], "max_in_flight", c.lookup.max_in_flight);
        }
        if (j.contains("retrieval")) {
            const auto& s = j["retrieval"];
            read_field(s, "top_k", c.top_k);
            read_field(s, "top_n", c.top_n);
            read_field(s, "price_precedence", c.price_precedence);
            read_field(s, "apply_budget_filter", c.apply_budget_filter);
        }
        if (j.contains("router")) read_field(j["router"], "use_llm", c.router_use_llm);
        if (j.contains("answerer")) read_field(j["answerer"], "use_llm", c.answerer_use_llm);
        if (j.contains("llm")) read_field(j["llm"], "model", c.llm_model);
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid config value: ") + e.what());
    }
    return c;
}

void AppConfig::validate(const KeyManager& keys) {
    if (allowed_domains.empty()) throw ConfigurationError("allowed_domains must not be empty");
    for (const auto& d : allowed_domains) {
        if (!is_bare_host(d)) {
            throw ConfigurationError("allowed_domains entry '" + d + "' is not a bare lowercase host");
        }
    }

    require_positive(port, "port");
    require_positive(request_timeout_ms, "request_timeout_ms");
    require_positive(worker_threads, "worker_threads");
    require_positive(catalog.timeout_ms, "catalog.timeout_ms");
    require_positive(catalog.dimension, "catalog.dimension");
    require_positive(web.timeout_ms, "web.timeout_ms");
    require_positive(lookup.timeout_ms, "lookup.timeout_ms");
    require_positive(lookup.max_in_flight, "lookup.max_in_flight");
    require_positive(top_k, "retrieval.top_k");
    require_positive(top_n, "retrieval.top_n");

    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        throw ConfigurationError("unknown log_level '" + log_level + "'");
    }
    if (price_precedence != "catalog" && price_precedence != "web") {
        throw ConfigurationError("retrieval.price_precedence must be 'catalog' or 'web'");
    }
    if (!catalog.enabled && !web.enabled) {
        throw ConfigurationError("at least one of catalog and web search must be enabled");
    }
    if (web.enabled && keys.get_web_search_key().empty()) {
        throw ConfigurationError("web search enabled but no web search key (TAVILY_API_KEY)");
    }
    if (catalog.enabled && keys.get_current_key().empty()) {
        throw ConfigurationError("catalog enabled but no embedding key (OPENAI_API_KEY)");
    }
    if ((router_use_llm || answerer_use_llm) && keys.get_llm_key().empty()) {
        throw ConfigurationError("LLM features enabled but no ANTHROPIC_API_KEY");
    }
    if (web.enabled && lookup.enabled && keys.get_price_lookup_key().empty()) {
        spdlog::warn("⚠️ No RAINFOREST_API_KEY, authoritative price lookup disabled");
        lookup.enabled = false;
    }
    // Lookups run inside the web task, so they have to fit in its budget.
    if (web.enabled && lookup.enabled && lookup.timeout_ms >= web.timeout_ms) {
        throw ConfigurationError("lookup.timeout_ms (" + std::to_string(lookup.timeout_ms) +
                                 ") must be below web.timeout_ms (" + std::to_string(web.timeout_ms) + ")");
    }
}

RetrievalOptions AppConfig::retrieval_options() const {
    RetrievalOptions o;
    o.top_k = top_k;
    o.top_n = top_n;
    o.catalog_timeout = std::chrono::milliseconds(catalog.timeout_ms);
    o.web_timeout = std::chrono::milliseconds(web.timeout_ms);
    o.price_precedence = price_precedence == "web" ? PricePrecedence::Web : PricePrecedence::Catalog;
    o.apply_budget_filter = apply_budget_filter;
    return o;
}

} // namespace shopping_assistance
