#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "KeyManager.hpp"
#include "retrieval_engine.hpp"

namespace shopping_assistance {

struct CatalogConfig {
    bool enabled = true;
    std::string index_path = "data/processed/faiss_index";
    int dimension = 1536;
    int timeout_ms = 8000;
    std::string embedding_model = "text-embedding-3-small";
};

struct WebConfig {
    bool enabled = true;
    int timeout_ms = 8000;
};

struct LookupConfig {
    bool enabled = true;
    int timeout_ms = 5000;
    int max_in_flight = 4;
};

struct AppConfig {
    std::string host = "127.0.0.1";
    int port = 5003;
    std::string log_level = "info";
    int request_timeout_ms = 30000;
    int worker_threads = 8;

    std::vector<std::string> allowed_domains = {"amazon.com", "walmart.com", "target.com"};
    CatalogConfig catalog;
    WebConfig web;
    LookupConfig lookup;

    int top_k = 5;
    int top_n = 10;
    std::string price_precedence = "catalog";
    bool apply_budget_filter = true;

    bool router_use_llm = false;
    bool answerer_use_llm = false;
    std::string llm_model = "claude-sonnet-4-20250514";

    // Missing file -> defaults. Unreadable or mistyped JSON -> ConfigurationError.
    static AppConfig load(const std::string& path);
    static AppConfig from_json(const nlohmann::json& j);

    // Throws ConfigurationError. May switch lookup off (with a warning) when it has no key.
    void validate(const KeyManager& keys);

    RetrievalOptions retrieval_options() const;
};

} // namespace shopping_assistance
