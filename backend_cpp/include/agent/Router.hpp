#pragma once
#include <atomic>
#include <memory>
#include <set>
#include <string>
#include "agent/AgentTypes.hpp"
#include "tools/SearchCollaborators.hpp"

namespace shopping_assistance {

class IIntentClassifier {
public:
    virtual ~IIntentClassifier() = default;
    virtual Intent classify(const std::string& query) = 0;
};

// Deterministic rules: off-topic phrasing with no shopping signal is out of scope.
class KeywordIntentClassifier : public IIntentClassifier {
public:
    Intent classify(const std::string& query) override;
};

// Asks the LLM for {"type": ..., "safety_flags": [...]}. Throws when the answer is unusable.
class LlmIntentClassifier : public IIntentClassifier {
public:
    explicit LlmIntentClassifier(std::shared_ptr<ITextGenerator> llm) : llm_(std::move(llm)) {}
    Intent classify(const std::string& query) override;

private:
    std::shared_ptr<ITextGenerator> llm_;
};

std::set<std::string> detect_safety_flags(const std::string& query);

// Flags that make a request out of scope regardless of classification.
bool is_blocking_flag(const std::string& flag);

class Router {
public:
    explicit Router(std::shared_ptr<IIntentClassifier> classifier);

    void route(ConversationState& state);

    // Conditional edge after routing: false ends the pipeline.
    bool should_continue(const ConversationState& state) const;

    size_t invocation_count() const { return invocations_.load(); }

    static const char* kDeclineMessage;

private:
    std::shared_ptr<IIntentClassifier> classifier_;
    std::atomic<size_t> invocations_{0};
};

} // namespace shopping_assistance
