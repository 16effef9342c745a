#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "agent/AgentTypes.hpp"
#include "agent/Answerer.hpp"
#include "agent/Planner.hpp"
#include "agent/Router.hpp"
#include "CancellationToken.hpp"
#include "retrieval_engine.hpp"

namespace shopping_assistance {

// Router -> (continue | end) -> Planner -> Retriever -> Answerer.
// Stages are shared across requests; each run owns its ConversationState.
class ShoppingAgent {
public:
    ShoppingAgent(std::shared_ptr<Router> router,
                  std::shared_ptr<Planner> planner,
                  std::shared_ptr<RetrievalEngine> retriever,
                  std::shared_ptr<Answerer> answerer);

    // Never throws. Stage failures become an apologetic answer plus state.error.
    ConversationState run(const std::string& query,
                          const CancellationToken& token = CancellationToken()) const;

    // {"query", "results", "error", "answer", "citations", "intent", "strategy", "log"}
    static nlohmann::json to_response_json(const ConversationState& state);

    static const char* kFailureMessage;
    static const char* kCancelledMessage;

private:
    std::shared_ptr<Router> router_;
    std::shared_ptr<Planner> planner_;
    std::shared_ptr<RetrievalEngine> retriever_;
    std::shared_ptr<Answerer> answerer_;
};

} // namespace shopping_assistance
