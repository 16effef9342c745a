#pragma once
#include <cstdlib>
#include <fstream>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace shopping_assistance {

// Credentials for the external collaborators. Embedding keys form a rotating pool.
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> embedding_pool_;
    mutable std::shared_mutex pool_mutex_;
    size_t current_index_ = 0;
    std::string web_search_key_;
    std::string price_lookup_key_;
    std::string llm_key_;

    static std::string env_or(const char* name, const std::string& fallback) {
        const char* value = std::getenv(name);
        return (value && *value) ? std::string(value) : fallback;
    }

public:
    // Searches the usual locations for keys.json, then applies environment overrides.
    KeyManager() {
        refresh_key_pool();
    }

    // Loads exactly the given vault. No file or environment lookup.
    explicit KeyManager(const nlohmann::json& vault) {
        std::unique_lock lock(pool_mutex_);
        load_vault(vault);
    }

    void refresh_key_pool() {
        std::unique_lock lock(pool_mutex_);

        std::vector<std::string> search_paths = {
            "keys.json",
            "../keys.json",
            "build/keys.json",
            "Release/keys.json",
            "../../keys.json"
        };

        std::ifstream f;
        std::string found_path;
        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
        }

        if (found_path.empty()) {
            spdlog::warn("⚠️ keys.json not found, relying on environment variables");
        } else {
            try {
                load_vault(nlohmann::json::parse(f));
            } catch (const std::exception& e) {
                spdlog::error("💥 Failed to parse {}: {}", found_path, e.what());
            }
        }

        std::string env_embedding = env_or("OPENAI_API_KEY", "");
        if (!env_embedding.empty()) {
            embedding_pool_.insert(embedding_pool_.begin(), {env_embedding, true, 0});
        }
        web_search_key_ = env_or("TAVILY_API_KEY", env_or("WEB_SEARCH_API_KEY", web_search_key_));
        price_lookup_key_ = env_or("RAINFOREST_API_KEY", price_lookup_key_);
        llm_key_ = env_or("ANTHROPIC_API_KEY", llm_key_);

        spdlog::info("🔑 Vault loaded: {} embedding keys, web search {}, price lookup {}, llm {}",
                     embedding_pool_.size(),
                     web_search_key_.empty() ? "OFFLINE" : "READY",
                     price_lookup_key_.empty() ? "OFFLINE" : "READY",
                     llm_key_.empty() ? "OFFLINE" : "READY");
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex_);
        size_t count = 0;
        for (const auto& k : embedding_pool_) {
            if (k.is_active) count++;
        }
        return count;
    }

    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex_);
        if (embedding_pool_.empty()) return "";
        return embedding_pool_[current_index_ % embedding_pool_.size()].key;
    }

    std::string get_web_search_key() const {
        std::shared_lock lock(pool_mutex_);
        return web_search_key_;
    }

    std::string get_price_lookup_key() const {
        std::shared_lock lock(pool_mutex_);
        return price_lookup_key_;
    }

    std::string get_llm_key() const {
        std::shared_lock lock(pool_mutex_);
        return llm_key_;
    }

    // Counts the failure against the current key and moves to the next active one.
    // A key that keeps failing is retired; once every key is retired the pool is re-armed.
    void report_rate_limit() {
        std::unique_lock lock(pool_mutex_);
        if (embedding_pool_.empty()) return;

        const size_t n = embedding_pool_.size();
        auto& current = embedding_pool_[current_index_ % n];
        current.fail_count++;
        if (current.fail_count > 2 && current.is_active) {
            current.is_active = false;
            spdlog::warn("⚠️ Embedding key #{} decommissioned", current_index_ % n);
        }

        for (size_t step = 1; step <= n; ++step) {
            size_t candidate = (current_index_ + step) % n;
            if (embedding_pool_[candidate].is_active) {
                current_index_ = candidate;
                return;
            }
        }

        spdlog::error("💥 Every embedding key is decommissioned, re-arming the pool");
        for (auto& k : embedding_pool_) {
            k.is_active = true;
            k.fail_count = 0;
        }
        current_index_ = (current_index_ + 1) % n;
    }

private:
    // Caller holds the unique lock.
    void load_vault(const nlohmann::json& j) {
        embedding_pool_.clear();
        if (j.contains("openai") && j["openai"].is_array()) {
            for (const auto& k : j["openai"]) {
                if (k.is_string()) embedding_pool_.push_back({k.get<std::string>(), true, 0});
            }
        } else if (j.contains("openai") && j["openai"].is_string()) {
            embedding_pool_.push_back({j["openai"].get<std::string>(), true, 0});
        }
        web_search_key_ = j.value("tavily", "");
        price_lookup_key_ = j.value("rainforest", "");
        llm_key_ = j.value("anthropic", "");
    }
};

} // namespace shopping_assistance
