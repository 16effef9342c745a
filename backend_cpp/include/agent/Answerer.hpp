#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "agent/AgentTypes.hpp"
#include "tools/SearchCollaborators.hpp"

namespace shopping_assistance {

struct AnswererOptions {
    bool use_llm = false;     // let the LLM write the longer explanation
    size_t spoken_items = 2;  // items named in the spoken summary
};

class Answerer {
public:
    explicit Answerer(std::shared_ptr<ITextGenerator> llm = nullptr, AnswererOptions options = {});
    virtual ~Answerer() = default;

    virtual void answer(ConversationState& state);

    // One citation per reconciled result, index = rank + 1.
    static std::vector<Citation> build_citations(const std::vector<ReconciledResult>& results);

    // Every "[n]" marker in the text.
    static std::set<int> referenced_citation_indices(const std::string& text);

    size_t invocation_count() const { return invocations_.load(); }

    static const char* kSourcesUnavailableMessage;
    static const char* kClarificationMessage;

private:
    std::string no_results_answer(const ConversationState& state) const;
    std::string spoken_summary(const ConversationState& state) const;
    std::string listing_explanation(const ConversationState& state) const;
    std::optional<std::string> llm_explanation(ConversationState& state) const;

    std::shared_ptr<ITextGenerator> llm_;
    AnswererOptions options_;
    std::atomic<size_t> invocations_{0};
};

} // namespace shopping_assistance
