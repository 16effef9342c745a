#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "errors.hpp"
#include "faiss_vector_store.hpp"
#include "tools/WebSearchTool.hpp"

using namespace shopping_assistance;
using json = nlohmann::json;

TEST(TavilyResults, ReadsTitleUrlSnippetAndScore) {
    auto hits = TavilyWebSearch::parse_results(json::parse(R"({
        "results": [
            {"title": " Eco Cleaner ", "url": "https://www.amazon.com/dp/B08XYZ1234",
             "content": "Now $13.50", "score": 0.91},
            {"title": "Polish", "url": "https://www.walmart.com/ip/p/1", "snippet": "fallback text",
             "score": "0.4", "price": 9.5}
        ]
    })"));
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].title, "Eco Cleaner");
    EXPECT_EQ(hits[0].snippet, "Now $13.50");
    EXPECT_DOUBLE_EQ(*hits[0].score, 0.91);
    EXPECT_FALSE(hits[0].price.has_value());
    EXPECT_EQ(hits[1].snippet, "fallback text");
    EXPECT_DOUBLE_EQ(*hits[1].score, 0.4);
    EXPECT_DOUBLE_EQ(*hits[1].price, 9.5);
}

TEST(TavilyResults, BadRowsDoNotSinkTheResponse) {
    auto hits = TavilyWebSearch::parse_results(json::parse(R"({
        "results": [
            "not an object",
            42,
            {"title": null, "url": "https://www.target.com/p/x/-/A-1", "content": null, "score": null},
            {"title": ["odd"], "url": 7, "price": {"value": 3}}
        ]
    })"));
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].title, "");
    EXPECT_EQ(hits[0].url, "https://www.target.com/p/x/-/A-1");
    EXPECT_EQ(hits[0].snippet, "");
    EXPECT_FALSE(hits[0].score.has_value());
    EXPECT_EQ(hits[1].title, "");
    EXPECT_EQ(hits[1].url, "");
    EXPECT_FALSE(hits[1].price.has_value());
}

TEST(TavilyResults, MissingResultsArray) {
    EXPECT_TRUE(TavilyWebSearch::parse_results(json::object()).empty());
    EXPECT_TRUE(TavilyWebSearch::parse_results(json{{"results", nullptr}}).empty());
    EXPECT_TRUE(TavilyWebSearch::parse_results(json::array()).empty());
}

TEST(ProductRecord, ReadsMetadataRow) {
    auto r = ProductRecord::from_json(json{{"product_id", 17}, {"title", "Steel Cleaner"},
                                           {"price", "$12.99"}, {"url", "https://www.amazon.com/dp/B0"}});
    EXPECT_EQ(r.product_id, "17");
    EXPECT_EQ(r.title, "Steel Cleaner");
    EXPECT_DOUBLE_EQ(*r.price, 12.99);
    EXPECT_EQ(*r.url, "https://www.amazon.com/dp/B0");
    EXPECT_FALSE(r.is_placeholder());
}

TEST(ProductRecord, WrongTypesReadAsEmpty) {
    auto r = ProductRecord::from_json(json{{"product_id", nullptr}, {"title", nullptr},
                                           {"price", "call us"}, {"url", nullptr}});
    EXPECT_EQ(r.product_id, "");
    EXPECT_EQ(r.title, "");
    EXPECT_FALSE(r.price.has_value());
    EXPECT_FALSE(r.url.has_value());
    EXPECT_TRUE(r.is_placeholder());

    EXPECT_TRUE(ProductRecord::from_json(json("a string row")).is_placeholder());
    EXPECT_TRUE(ProductRecord::from_json(json::array({1, 2})).is_placeholder());
}

TEST(FaissVectorStore, UnreadableIndexIsConfigurationError) {
    auto dir = std::filesystem::temp_directory_path() / "shopping_assistance_bad_index";
    std::filesystem::create_directories(dir);
    {
        std::ofstream(dir / "faiss.index") << "not a faiss index";
        std::ofstream(dir / "metadata.json") << "[]";
    }

    FaissVectorStore store(8);
    EXPECT_THROW(store.load(dir.string()), ConfigurationError);
    EXPECT_FALSE(store.is_loaded());
    EXPECT_THROW(store.load((dir / "missing").string()), ConfigurationError);
    std::filesystem::remove_all(dir);
}
