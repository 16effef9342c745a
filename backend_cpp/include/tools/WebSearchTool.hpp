#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "cache_manager.hpp"
#include "KeyManager.hpp"
#include "tools/SearchCollaborators.hpp"

namespace shopping_assistance {

// Tavily search restricted to the allowlisted retail domains.
class TavilyWebSearch : public IWebSearch {
public:
    TavilyWebSearch(std::shared_ptr<KeyManager> key_manager, int timeout_ms);

    std::vector<WebHit> search(const std::string& query_text,
                               const std::vector<std::string>& allowed_domains,
                               int top_k) override;

    // Rows that are not objects are skipped; fields of the wrong type read as empty.
    static std::vector<WebHit> parse_results(const nlohmann::json& body);

private:
    std::shared_ptr<KeyManager> key_manager_;
    int timeout_ms_;
    const std::string endpoint_ = "https://api.tavily.com/search";
};

// Rainforest product lookup by ASIN. Successful lookups are cached.
class RainforestPriceLookup : public IPriceLookup {
public:
    RainforestPriceLookup(std::shared_ptr<KeyManager> key_manager,
                          std::shared_ptr<CacheManager> cache_manager,
                          int timeout_ms);

    std::optional<LookupResult> lookup(const std::string& item_code) override;

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<CacheManager> cache_manager_;
    int timeout_ms_;
    const std::string endpoint_ = "https://api.rainforestapi.com/request";
};

} // namespace shopping_assistance
