#include <gtest/gtest.h>
#include "agent/Answerer.hpp"
#include "fakes.hpp"

using namespace shopping_assistance;
using shopping_assistance::testing::FakeTextGenerator;

namespace {

ReconciledResult ranked(int rank, std::string title, std::optional<double> price, ResultSource source,
                        std::optional<std::string> url = std::nullopt) {
    ReconciledResult r;
    r.identity_key = "key-" + std::to_string(rank);
    r.title = std::move(title);
    r.price = price;
    r.score = 1.0 - 0.1 * rank;
    r.source = source;
    r.url = std::move(url);
    r.rank = rank;
    return r;
}

ConversationState state_with_results() {
    ConversationState state;
    state.query = "eco stainless steel cleaner under $15";
    state.reconciled_results = {
        ranked(0, "Eco Steel Cleaner", 12.99, ResultSource::Catalog),
        ranked(1, "Steel Shine Spray", 13.5, ResultSource::Web, std::string("https://www.target.com/p/s/-/A-1")),
        ranked(2, "Green Polish", std::nullopt, ResultSource::Web, std::string("https://www.walmart.com/ip/g/2")),
    };
    return state;
}

void expect_citations_consistent(const ConversationState& state) {
    ASSERT_EQ(state.citations.size(), state.reconciled_results.size());
    for (size_t i = 0; i < state.citations.size(); ++i) {
        EXPECT_EQ(state.citations[i].index, state.reconciled_results[i].rank + 1);
        EXPECT_EQ(state.citations[i].title, state.reconciled_results[i].title);
    }
    for (int n : Answerer::referenced_citation_indices(state.final_answer)) {
        EXPECT_GE(n, 1);
        EXPECT_LE(n, static_cast<int>(state.citations.size()));
    }
}

} // namespace

TEST(Answerer, CitesEveryResultInRankOrder) {
    Answerer answerer;
    auto state = state_with_results();
    answerer.answer(state);

    expect_citations_consistent(state);
    EXPECT_EQ(Answerer::referenced_citation_indices(state.final_answer), (std::set<int>{1, 2, 3}));
    EXPECT_NE(state.final_answer.find("The top pick is Eco Steel Cleaner [1] at $12.99"), std::string::npos);
    EXPECT_NE(state.final_answer.find("[3] Green Polish - price not listed (web, www.walmart.com)"),
              std::string::npos);
    EXPECT_EQ(state.citations[1].url, std::optional<std::string>("https://www.target.com/p/s/-/A-1"));
}

TEST(Answerer, BracketsInTitlesCannotForgeCitations) {
    Answerer answerer;
    ConversationState state;
    state.query = "cleaner [9]";
    state.reconciled_results = {ranked(0, "Cleaner [42] Pack", 5.0, ResultSource::Catalog)};
    answerer.answer(state);
    expect_citations_consistent(state);
    EXPECT_EQ(Answerer::referenced_citation_indices(state.final_answer), std::set<int>{1});
}

TEST(Answerer, NoResults) {
    Answerer answerer;
    ConversationState state;
    state.query = "unobtainium widget";
    answerer.answer(state);
    EXPECT_TRUE(state.citations.empty());
    EXPECT_NE(state.final_answer.find("couldn't find any matching results"), std::string::npos);
    EXPECT_TRUE(Answerer::referenced_citation_indices(state.final_answer).empty());
}

TEST(Answerer, NoResultsMentionsBudget) {
    Answerer answerer;
    ConversationState state;
    state.query = "laptop under $15";
    state.constraints.max_price = 15.0;
    answerer.answer(state);
    EXPECT_NE(state.final_answer.find("under $15.00"), std::string::npos);
}

TEST(Answerer, AllSourcesDown) {
    Answerer answerer;
    ConversationState state;
    state.query = "cleaner";
    state.sources_exhausted = true;
    state.degraded_sources = {"catalog", "web"};
    answerer.answer(state);
    EXPECT_EQ(state.final_answer, Answerer::kSourcesUnavailableMessage);
}

TEST(Answerer, ClarificationPrompt) {
    Answerer answerer;
    ConversationState state;
    state.intent.type = IntentType::Clarification;
    answerer.answer(state);
    EXPECT_EQ(state.final_answer, Answerer::kClarificationMessage);
}

TEST(Answerer, DegradedSourceIsMentioned) {
    Answerer answerer;
    auto state = state_with_results();
    state.degraded_sources = {"web"};
    answerer.answer(state);
    EXPECT_NE(state.final_answer.find("Live web results were unavailable"), std::string::npos);
}

TEST(Answerer, SafetyNotes) {
    Answerer answerer;
    auto state = state_with_results();
    state.intent.safety_flags = {"medical"};
    answerer.answer(state);
    EXPECT_NE(state.final_answer.find("check with a professional"), std::string::npos);
}

TEST(Answerer, UsesModelExplanationWhenCitationsValid) {
    auto llm = std::make_shared<FakeTextGenerator>();
    llm->reply = "[1] is the best value; [2] is a close second.";
    Answerer answerer(llm, AnswererOptions{true, 2});
    auto state = state_with_results();
    answerer.answer(state);

    EXPECT_EQ(llm->calls, 1);
    EXPECT_NE(state.final_answer.find("[1] is the best value"), std::string::npos);
    EXPECT_EQ(state.final_answer.find("All results:"), std::string::npos);
    EXPECT_NE(llm->last_prompt.find("[3] Green Polish | price not listed"), std::string::npos);
    expect_citations_consistent(state);
}

TEST(Answerer, RejectsModelExplanationWithUnknownMarkers) {
    auto llm = std::make_shared<FakeTextGenerator>();
    llm->reply = "Go with [7].";
    Answerer answerer(llm, AnswererOptions{true, 2});
    auto state = state_with_results();
    answerer.answer(state);

    EXPECT_EQ(state.final_answer.find("[7]"), std::string::npos);
    EXPECT_NE(state.final_answer.find("All results:"), std::string::npos);
    expect_citations_consistent(state);
}

TEST(Answerer, ModelOutageFallsBackToListing) {
    auto llm = std::make_shared<FakeTextGenerator>();
    llm->fail = true;
    Answerer answerer(llm, AnswererOptions{true, 2});
    auto state = state_with_results();
    answerer.answer(state);
    EXPECT_NE(state.final_answer.find("All results:"), std::string::npos);
    expect_citations_consistent(state);
}
