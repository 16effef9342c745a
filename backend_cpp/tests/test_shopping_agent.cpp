#include <gtest/gtest.h>
#include "agent/ShoppingAgent.hpp"
#include "fakes.hpp"
#include "LogManager.hpp"

using namespace shopping_assistance;
using namespace shopping_assistance::testing;

namespace {

class ExplodingAnswerer : public Answerer {
public:
    void answer(ConversationState&) override { throw std::runtime_error("template missing"); }
};

class ShoppingAgentTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeCatalogSearch> catalog = std::make_shared<FakeCatalogSearch>();
    std::shared_ptr<FakeWebSearch> web = std::make_shared<FakeWebSearch>();
    std::shared_ptr<FakePriceLookup> lookup = std::make_shared<FakePriceLookup>();
    std::shared_ptr<ThreadPool> pool = std::make_shared<ThreadPool>(4);
    std::shared_ptr<ThreadPool> lookup_pool = std::make_shared<ThreadPool>(2);

    std::shared_ptr<Router> router = std::make_shared<Router>(std::make_shared<KeywordIntentClassifier>());
    std::shared_ptr<Planner> planner = std::make_shared<Planner>();
    std::shared_ptr<RetrievalEngine> retriever;
    std::shared_ptr<Answerer> answerer = std::make_shared<Answerer>();

    void SetUp() override {
        LogManager::instance().clear();
        retriever = std::make_shared<RetrievalEngine>(
            std::make_shared<CatalogSearchAdapter>(catalog),
            std::make_shared<WebSearchAdapter>(web, lookup, DomainPolicy(), lookup_pool),
            pool);
    }

    ShoppingAgent agent() const { return ShoppingAgent(router, planner, retriever, answerer); }
};

} // namespace

TEST_F(ShoppingAgentTest, EndToEndHybridQuery) {
    catalog->hits = {catalog_hit("SKU-1", "Eco Stainless Steel Cleaner", 12.99, 0.82,
                                 std::string("https://www.amazon.com/dp/B08XYZ1234"))};
    web->hits = {
        web_hit("Steel Shine Eco Cleaner", "https://www.target.com/p/steel-shine/-/A-7", "Now $13.50", 0.74),
        web_hit("Eco Cleaner", "https://www.amazon.com/dp/B08XYZ1234", "", 0.7),
        web_hit("Deluxe Steel Kit", "https://www.walmart.com/ip/deluxe/9", "Only $29.99", 0.6),
        web_hit("Eco Cleaner on eBay $3", "https://www.ebay.com/itm/1", "", 0.99),
    };

    lookup->products["B08XYZ1234"] = LookupResult{std::string("Amazon Eco Cleaner 16oz"), 12.49};

    auto state = agent().run("eco stainless steel cleaner under $15");

    EXPECT_EQ(state.intent.type, IntentType::ProductQuery);
    EXPECT_EQ(state.strategy, SearchStrategy::Hybrid);
    EXPECT_DOUBLE_EQ(*state.constraints.max_price, 15.0);
    EXPECT_FALSE(state.error.has_value());

    ASSERT_EQ(state.reconciled_results.size(), 2u);
    EXPECT_EQ(state.reconciled_results[0].identity_key, "SKU-1");
    EXPECT_DOUBLE_EQ(*state.reconciled_results[0].price, 12.99);
    EXPECT_EQ(state.reconciled_results[0].title, "Eco Stainless Steel Cleaner");
    EXPECT_DOUBLE_EQ(*state.reconciled_results[0].score, 0.82);
    EXPECT_EQ(state.reconciled_results[1].identity_key, "https://www.target.com/p/steel-shine/-/A-7");
    EXPECT_DOUBLE_EQ(*state.reconciled_results[1].price, 13.5);
    // The unpriced amazon hit was looked up, then merged into the catalog item.
    EXPECT_EQ(lookup->calls, 1);
    ASSERT_EQ(state.raw_web_results.size(), 3u);

    ASSERT_EQ(state.citations.size(), 2u);
    EXPECT_EQ(state.citations[0].index, 1);
    EXPECT_EQ(state.citations[1].index, 2);
    for (int n : Answerer::referenced_citation_indices(state.final_answer)) {
        EXPECT_GE(n, 1);
        EXPECT_LE(n, 2);
    }
    EXPECT_EQ(LogManager::instance().size(), 1u);
}

TEST_F(ShoppingAgentTest, OutOfScopeShortCircuits) {
    auto state = agent().run("what's the weather in Paris tomorrow");

    EXPECT_EQ(state.intent.type, IntentType::OutOfScope);
    EXPECT_EQ(state.final_answer, Router::kDeclineMessage);
    EXPECT_TRUE(state.reconciled_results.empty());
    EXPECT_TRUE(state.citations.empty());
    EXPECT_FALSE(state.error.has_value());

    EXPECT_EQ(planner->invocation_count(), 0u);
    EXPECT_EQ(retriever->invocation_count(), 0u);
    EXPECT_EQ(answerer->invocation_count(), 0u);
    EXPECT_EQ(catalog->calls, 0);
    EXPECT_EQ(web->calls, 0);
}

TEST_F(ShoppingAgentTest, EmptyQueryAsksForDetails) {
    auto state = agent().run("");
    EXPECT_EQ(state.intent.type, IntentType::Clarification);
    EXPECT_EQ(state.final_answer, Answerer::kClarificationMessage);
    EXPECT_EQ(catalog->calls, 0);
    EXPECT_EQ(web->calls, 0);
    EXPECT_FALSE(state.error.has_value());
}

TEST_F(ShoppingAgentTest, OneSourceDownIsNotAnError) {
    catalog->hits = {catalog_hit("SKU-1", "Dish Soap", 4.99, 0.7)};
    web->fail = true;
    auto state = agent().run("dish soap");
    EXPECT_FALSE(state.error.has_value());
    EXPECT_EQ(state.reconciled_results.size(), 1u);
    EXPECT_EQ(state.degraded_sources, std::vector<std::string>{"web"});
}

TEST_F(ShoppingAgentTest, AllSourcesDownSetsError) {
    catalog->fail = true;
    web->fail = true;
    auto state = agent().run("dish soap");
    ASSERT_TRUE(state.error.has_value());
    EXPECT_EQ(*state.error, "all search sources are unavailable");
    EXPECT_EQ(state.final_answer, Answerer::kSourcesUnavailableMessage);
    EXPECT_TRUE(state.reconciled_results.empty());
}

TEST_F(ShoppingAgentTest, StageFailureIsTerminal) {
    catalog->hits = {catalog_hit("SKU-1", "Dish Soap", 4.99, 0.7)};
    answerer = std::make_shared<ExplodingAnswerer>();

    auto state = agent().run("dish soap");
    ASSERT_TRUE(state.error.has_value());
    EXPECT_NE(state.error->find("answerer failed"), std::string::npos);
    EXPECT_EQ(state.final_answer, ShoppingAgent::kFailureMessage);
    EXPECT_TRUE(state.reconciled_results.empty());
    EXPECT_TRUE(state.citations.empty());

    auto response = ShoppingAgent::to_response_json(state);
    EXPECT_TRUE(response["results"].empty());
    EXPECT_TRUE(response["error"].is_string());
}

TEST_F(ShoppingAgentTest, CancelledRequestDiscardsResults) {
    catalog->hits = {catalog_hit("SKU-1", "Dish Soap", 4.99, 0.7)};
    CancellationToken token;
    token.cancel();

    auto state = agent().run("dish soap", token);
    EXPECT_EQ(catalog->calls, 0);
    EXPECT_TRUE(state.reconciled_results.empty());
    ASSERT_TRUE(state.error.has_value());
    EXPECT_EQ(state.final_answer, ShoppingAgent::kCancelledMessage);
}

TEST_F(ShoppingAgentTest, ResponseJsonShape) {
    catalog->hits = {catalog_hit("SKU-1", "Dish Soap", 4.99, 0.7)};
    web->fail = true;
    auto response = ShoppingAgent::to_response_json(agent().run("dish soap"));

    EXPECT_EQ(response["query"], "dish soap");
    EXPECT_TRUE(response["error"].is_null());
    ASSERT_EQ(response["results"].size(), 1u);
    const auto& first = response["results"][0];
    EXPECT_EQ(first["title"], "Dish Soap");
    EXPECT_EQ(first["source"], "catalog");
    EXPECT_EQ(first["rank"], 0);
    EXPECT_TRUE(first["url"].is_null());
    EXPECT_DOUBLE_EQ(first["price"].get<double>(), 4.99);
    EXPECT_EQ(response["citations"][0]["index"], 1);
    EXPECT_EQ(response["intent"], "product_query");
    EXPECT_EQ(response["strategy"], "hybrid");
    EXPECT_TRUE(response["log"].is_array());
    EXPECT_FALSE(response["answer"].get<std::string>().empty());
}
