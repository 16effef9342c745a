#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace shopping_assistance {

enum class IntentType { ProductQuery, OutOfScope, Clarification };
enum class SearchStrategy { CatalogOnly, WebOnly, Hybrid };
enum class ResultSource { Catalog, Web };

struct Intent {
    IntentType type = IntentType::ProductQuery;
    std::set<std::string> safety_flags;
};

struct Constraints {
    std::optional<double> max_price;
    std::optional<std::string> category;
    std::set<std::string> keywords;
};

// One hit from either backend, already in canonical shape.
// identity_key: catalog product id, or scheme://host/path for web pages.
struct RawResult {
    std::string identity_key;
    std::string title;
    std::optional<std::string> url;
    std::optional<std::string> snippet;
    std::optional<double> price;
    std::optional<double> score;
    ResultSource source = ResultSource::Catalog;
};

struct ReconciledResult : RawResult {
    int rank = 0;
};

struct Citation {
    int index = 0; // 1-based, equals rank + 1
    std::string title;
    std::optional<std::string> url;
    std::optional<double> price;
};

// Request-scoped record threaded through Router -> Planner -> Retriever -> Answerer.
struct ConversationState {
    std::string query;
    Intent intent;
    Constraints constraints;
    SearchStrategy strategy = SearchStrategy::Hybrid;
    std::vector<RawResult> raw_catalog_results;
    std::vector<RawResult> raw_web_results;
    std::vector<ReconciledResult> reconciled_results;
    std::string final_answer;
    std::vector<Citation> citations;
    std::vector<std::string> log;

    std::vector<std::string> degraded_sources;
    bool sources_exhausted = false; // every dispatched source failed
    std::optional<std::string> error;
};

std::string to_string(IntentType type);
std::string to_string(SearchStrategy strategy);
std::string to_string(ResultSource source);

void to_json(nlohmann::json& j, const ReconciledResult& r);
void to_json(nlohmann::json& j, const Citation& c);

} // namespace shopping_assistance
