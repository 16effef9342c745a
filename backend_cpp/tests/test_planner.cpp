#include <gtest/gtest.h>
#include "agent/Planner.hpp"

using namespace shopping_assistance;

namespace {

ConversationState plan(Planner& planner, const std::string& query) {
    ConversationState state;
    state.query = query;
    planner.plan(state);
    return state;
}

} // namespace

TEST(Tokenize, KeepsDollarAmountsWhole) {
    std::vector<std::string> expected = {"eco", "friendly", "$12.99", "cleaner"};
    EXPECT_EQ(tokenize("Eco-Friendly $12.99 cleaner."), expected);
}

TEST(ExtractBudget, CommonPhrasings) {
    EXPECT_DOUBLE_EQ(*Planner::extract_budget("eco stainless steel cleaner under $15"), 15.0);
    EXPECT_DOUBLE_EQ(*Planner::extract_budget("headphones below 20 dollars"), 20.0);
    EXPECT_DOUBLE_EQ(*Planner::extract_budget("a budget of $40 for a kettle"), 40.0);
    EXPECT_DOUBLE_EQ(*Planner::extract_budget("desk lamp $30 or less"), 30.0);
    EXPECT_DOUBLE_EQ(*Planner::extract_budget("Dog leash UNDER $12.50"), 12.5);
}

TEST(ExtractBudget, AbsentOrImplausible) {
    EXPECT_FALSE(Planner::extract_budget("stainless steel cleaner").has_value());
    EXPECT_FALSE(Planner::extract_budget("a $15 cleaner").has_value());
    EXPECT_FALSE(Planner::extract_budget("tv under $20000").has_value());
}

TEST(ExtractBudget, SizesAndCountsAreNotBudgets) {
    EXPECT_FALSE(Planner::extract_budget("laptop sleeve for laptops under 15 inches").has_value());
    EXPECT_FALSE(Planner::extract_budget("tent for under 4 people").has_value());
    EXPECT_FALSE(Planner::extract_budget("dumbbells up to 50 lbs").has_value());
    EXPECT_DOUBLE_EQ(*Planner::extract_budget("monitor under 27 inches under $200"), 200.0);
    EXPECT_DOUBLE_EQ(*Planner::extract_budget("headphones under 50"), 50.0);
    EXPECT_DOUBLE_EQ(*Planner::extract_budget("tent under 80 for camping"), 80.0);
}

TEST(DetectCategory, Lexicon) {
    EXPECT_EQ(*Planner::detect_category(tokenize("stainless steel cleaner")), "cleaning");
    EXPECT_EQ(*Planner::detect_category(tokenize("wireless earbuds")), "electronics");
    EXPECT_FALSE(Planner::detect_category(tokenize("something nice")).has_value());
}

TEST(ExtractKeywords, DropsStopwordsAndAmounts) {
    std::set<std::string> expected = {"eco", "stainless", "steel", "cleaner"};
    EXPECT_EQ(Planner::extract_keywords("I want an eco stainless steel cleaner under $15"), expected);
}

TEST(Planner, HybridWhenKeywordsPresent) {
    Planner planner;
    auto state = plan(planner, "eco stainless steel cleaner under $15");
    EXPECT_EQ(state.strategy, SearchStrategy::Hybrid);
    EXPECT_DOUBLE_EQ(*state.constraints.max_price, 15.0);
    EXPECT_EQ(*state.constraints.category, "cleaning");
    EXPECT_EQ(state.constraints.keywords.size(), 4u);
    ASSERT_FALSE(state.log.empty());
    EXPECT_NE(state.log.back().find("strategy=hybrid"), std::string::npos);
}

TEST(Planner, CatalogOnlyWithoutKeywords) {
    Planner planner;
    auto state = plan(planner, "under $20");
    EXPECT_EQ(state.strategy, SearchStrategy::CatalogOnly);
    EXPECT_TRUE(state.constraints.keywords.empty());
}

TEST(Planner, DisabledSourcesShapeStrategy) {
    Planner catalog_only_planner(PlannerOptions{true, false});
    EXPECT_EQ(plan(catalog_only_planner, "dish soap").strategy, SearchStrategy::CatalogOnly);

    Planner web_only_planner(PlannerOptions{false, true});
    EXPECT_EQ(plan(web_only_planner, "dish soap").strategy, SearchStrategy::WebOnly);
    EXPECT_EQ(web_only_planner.invocation_count(), 1u);
}
