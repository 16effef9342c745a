#include "agent/ShoppingAgent.hpp"
#include <chrono>
#include <ctime>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "LogManager.hpp"
#include "SystemMonitor.hpp"

namespace shopping_assistance {

using json = nlohmann::json;

namespace {

void discard_results(ConversationState& state) {
    state.raw_catalog_results.clear();
    state.raw_web_results.clear();
    state.reconciled_results.clear();
    state.citations.clear();
}

// Wraps anything a stage throws so the boundary knows which stage failed.
template <typename Fn>
void run_stage(const char* name, Fn&& fn) {
    try {
        fn();
    } catch (const TerminalPipelineError&) {
        throw;
    } catch (const std::exception& e) {
        throw TerminalPipelineError(name, e.what());
    }
}

} // namespace

const char* ShoppingAgent::kFailureMessage =
    "Sorry, something went wrong while handling your request and I could not complete this "
    "search. Please try again.";

const char* ShoppingAgent::kCancelledMessage = "The search was cancelled before it completed.";

ShoppingAgent::ShoppingAgent(std::shared_ptr<Router> router,
                             std::shared_ptr<Planner> planner,
                             std::shared_ptr<RetrievalEngine> retriever,
                             std::shared_ptr<Answerer> answerer)
    : router_(std::move(router)),
      planner_(std::move(planner)),
      retriever_(std::move(retriever)),
      answerer_(std::move(answerer)) {}

ConversationState ShoppingAgent::run(const std::string& query, const CancellationToken& token) const {
    auto start = std::chrono::steady_clock::now();
    ConversationState state;
    state.query = query;

    try {
        run_stage("router", [&] { router_->route(state); });

        if (router_->should_continue(state)) {
            run_stage("planner", [&] { planner_->plan(state); });

            if (!token.is_cancelled()) retriever_->retrieve(state, token);

            if (token.is_cancelled()) {
                discard_results(state);
                state.final_answer = kCancelledMessage;
                state.error = "request cancelled";
                state.log.push_back("pipeline: cancelled");
                spdlog::warn("⚠️ Query cancelled: '{}'", query);
            } else {
                run_stage("answerer", [&] { answerer_->answer(state); });
                if (state.reconciled_results.empty() && state.sources_exhausted &&
                    !state.degraded_sources.empty()) {
                    state.error = "all search sources are unavailable";
                }
            }
        } else {
            state.log.push_back("pipeline: ended after router");
        }
    } catch (const TerminalPipelineError& e) {
        discard_results(state);
        state.final_answer = kFailureMessage;
        state.error = e.what();
        state.log.push_back(std::string("pipeline: ") + e.what());
        spdlog::error("❌ Pipeline failure in {}: {}", e.stage(), e.what());
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    SystemMonitor::global_queries_served.fetch_add(1);

    LogManager::instance().add_log({
        static_cast<long long>(std::time(nullptr)), state.query, to_string(state.intent.type),
        to_string(state.strategy), state.reconciled_results.size(), state.final_answer,
        state.error.value_or(""), state.log, duration
    });
    spdlog::info("✅ Answered '{}' with {} results in {:.2f} ms", query, state.reconciled_results.size(), duration);
    return state;
}

json ShoppingAgent::to_response_json(const ConversationState& state) {
    json results = json::array();
    json citations = json::array();
    if (!state.error) {
        for (const auto& r : state.reconciled_results) results.push_back(r);
        for (const auto& c : state.citations) citations.push_back(c);
    }
    return {
        {"query", state.query},
        {"results", results},
        {"error", state.error ? json(*state.error) : json(nullptr)},
        {"answer", state.final_answer},
        {"citations", citations},
        {"intent", to_string(state.intent.type)},
        {"strategy", to_string(state.strategy)},
        {"log", state.log}
    };
}

} // namespace shopping_assistance
