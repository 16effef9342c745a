#pragma once
#include <atomic>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "agent/AgentTypes.hpp"

namespace shopping_assistance {

// Lowercase alphanumeric tokens; '$' amounts are kept whole ("$15").
std::vector<std::string> tokenize(const std::string& text);

struct PlannerOptions {
    bool catalog_enabled = true;
    bool web_enabled = true;
};

// Pure transformation of the state: no collaborators are called here.
class Planner {
public:
    explicit Planner(PlannerOptions options = {}) : options_(options) {}

    void plan(ConversationState& state);

    // "under $15", "below 20 dollars", "$30 or less", ...
    static std::optional<double> extract_budget(const std::string& query);
    static std::optional<std::string> detect_category(const std::vector<std::string>& tokens);
    static std::set<std::string> extract_keywords(const std::string& query);

    size_t invocation_count() const { return invocations_.load(); }

private:
    PlannerOptions options_;
    std::atomic<size_t> invocations_{0};
};

} // namespace shopping_assistance
