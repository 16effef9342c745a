#include "agent/AgentTypes.hpp"

namespace shopping_assistance {

using json = nlohmann::json;

namespace {

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

std::string to_string(IntentType type) {
    switch (type) {
        case IntentType::ProductQuery: return "product_query";
        case IntentType::OutOfScope: return "out_of_scope";
        case IntentType::Clarification: return "clarification";
    }
    return "product_query";
}

std::string to_string(SearchStrategy strategy) {
    switch (strategy) {
        case SearchStrategy::CatalogOnly: return "catalog_only";
        case SearchStrategy::WebOnly: return "web_only";
        case SearchStrategy::Hybrid: return "hybrid";
    }
    return "hybrid";
}

std::string to_string(ResultSource source) {
    return source == ResultSource::Catalog ? "catalog" : "web";
}

void to_json(json& j, const ReconciledResult& r) {
    j = json{
        {"title", r.title},
        {"url", optional_to_json(r.url)},
        {"snippet", optional_to_json(r.snippet)},
        {"price", optional_to_json(r.price)},
        {"score", optional_to_json(r.score)},
        {"source", to_string(r.source)},
        {"rank", r.rank}
    };
}

void to_json(json& j, const Citation& c) {
    j = json{
        {"index", c.index},
        {"title", c.title},
        {"url", optional_to_json(c.url)},
        {"price", optional_to_json(c.price)}
    };
}

} // namespace shopping_assistance
