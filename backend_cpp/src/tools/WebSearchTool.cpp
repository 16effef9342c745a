#include "tools/WebSearchTool.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace shopping_assistance {

using json = nlohmann::json;

namespace {

std::optional<double> number_or_numeric_string(const json& j) {
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) {
        try {
            return std::stod(j.get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string string_field(const json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

std::string trimmed(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

TavilyWebSearch::TavilyWebSearch(std::shared_ptr<KeyManager> key_manager, int timeout_ms)
    : key_manager_(std::move(key_manager)), timeout_ms_(timeout_ms) {}

std::vector<WebHit> TavilyWebSearch::search(const std::string& query_text,
                                            const std::vector<std::string>& allowed_domains,
                                            int top_k) {
    const std::string api_key = key_manager_->get_web_search_key();
    if (api_key.empty()) throw SourceUnavailableError("web", "web search API key not configured");

    spdlog::info("🛰️ Web search: '{}' across {} domains", query_text, allowed_domains.size());

    json payload = {
        {"api_key", api_key},
        {"query", query_text},
        {"max_results", top_k},
        {"include_domains", allowed_domains},
        {"include_answer", false},
        {"include_raw_content", false}
    };

    auto r = cpr::Post(cpr::Url{endpoint_},
                       cpr::Header{{"Content-Type", "application/json"},
                                   {"Authorization", "Bearer " + api_key}},
                       cpr::Body{payload.dump()},
                       cpr::Timeout{timeout_ms_});

    if (r.error) throw SourceUnavailableError("web", "transport error: " + r.error.message);
    if (r.status_code != 200) {
        spdlog::error("❌ Web search provider error [{}]: {}", r.status_code, r.text.substr(0, 300));
        throw SourceUnavailableError("web", "HTTP " + std::to_string(r.status_code));
    }

    try {
        return parse_results(json::parse(r.text));
    } catch (const json::exception& e) {
        throw SourceUnavailableError("web", std::string("malformed response: ") + e.what());
    }
}

std::vector<WebHit> TavilyWebSearch::parse_results(const json& body) {
    std::vector<WebHit> hits;
    if (!body.is_object() || !body.contains("results") || !body["results"].is_array()) return hits;

    for (const auto& item : body["results"]) {
        if (!item.is_object()) {
            spdlog::debug("skipping non-object web result");
            continue;
        }
        WebHit hit;
        hit.title = trimmed(string_field(item, "title"));
        hit.url = trimmed(string_field(item, "url"));
        std::string snippet = string_field(item, "content");
        if (snippet.empty()) snippet = string_field(item, "snippet");
        hit.snippet = trimmed(snippet);
        if (item.contains("score")) hit.score = number_or_numeric_string(item["score"]);
        if (item.contains("price")) hit.price = number_or_numeric_string(item["price"]);
        hits.push_back(std::move(hit));
    }
    return hits;
}

RainforestPriceLookup::RainforestPriceLookup(std::shared_ptr<KeyManager> key_manager,
                                             std::shared_ptr<CacheManager> cache_manager,
                                             int timeout_ms)
    : key_manager_(std::move(key_manager)),
      cache_manager_(std::move(cache_manager)),
      timeout_ms_(timeout_ms) {}

std::optional<LookupResult> RainforestPriceLookup::lookup(const std::string& item_code) {
    if (item_code.empty()) return std::nullopt;
    if (auto cached = cache_manager_->get_lookup(item_code)) return cached;

    const std::string api_key = key_manager_->get_price_lookup_key();
    if (api_key.empty()) throw SourceUnavailableError("lookup", "price lookup API key not configured");

    auto r = cpr::Get(cpr::Url{endpoint_},
                      cpr::Parameters{{"api_key", api_key},
                                      {"type", "product"},
                                      {"amazon_domain", "amazon.com"},
                                      {"asin", item_code}},
                      cpr::Timeout{timeout_ms_});

    if (r.error) throw SourceUnavailableError("lookup", "transport error: " + r.error.message);
    if (r.status_code != 200) {
        throw SourceUnavailableError("lookup", "HTTP " + std::to_string(r.status_code));
    }

    try {
        auto body = json::parse(r.text);
        if (!body.contains("product") || !body["product"].is_object()) return std::nullopt;
        const auto& product = body["product"];

        LookupResult result;
        if (product.contains("title") && product["title"].is_string()) {
            result.title = product["title"].get<std::string>();
        }
        if (product.contains("price") && product["price"].is_object() && product["price"].contains("value")) {
            result.price = number_or_numeric_string(product["price"]["value"]);
        }
        if (!result.title && !result.price) return std::nullopt;

        cache_manager_->set_lookup(item_code, result);
        return result;
    } catch (const json::exception& e) {
        throw SourceUnavailableError("lookup", std::string("malformed response: ") + e.what());
    }
}

} // namespace shopping_assistance
