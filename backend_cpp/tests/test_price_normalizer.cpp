#include <gtest/gtest.h>
#include "price_normalizer.hpp"

using namespace shopping_assistance;

TEST(ExtractPrice, DollarSign) {
    auto p = extract_price("$12.99");
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(*p, 12.99);
}

TEST(ExtractPrice, CurrencyCodeAndWords) {
    EXPECT_DOUBLE_EQ(*extract_price("USD 12"), 12.0);
    EXPECT_DOUBLE_EQ(*extract_price("only 8.50 USD today"), 8.5);
    EXPECT_DOUBLE_EQ(*extract_price("costs 12 dollars"), 12.0);
}

TEST(ExtractPrice, FindsPriceInsideSentence) {
    EXPECT_DOUBLE_EQ(*extract_price("Eco Cleaner - Now $13.50 with free returns"), 13.5);
}

TEST(ExtractPrice, CurrencyCodeAtEndOfSentence) {
    auto p = extract_price("Price: USD 12.99.");
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(*p, 12.99);

    auto q = extract_price("USD 12.");
    ASSERT_TRUE(q.has_value());
    EXPECT_DOUBLE_EQ(*q, 12.0);

    EXPECT_FALSE(extract_price("USD 12.999").has_value());
}

TEST(ExtractPrice, ThousandsSeparator) {
    EXPECT_DOUBLE_EQ(*extract_price("Espresso machine $1,299.00"), 1299.0);
}

TEST(ExtractPrice, NoPriceMentioned) {
    EXPECT_FALSE(extract_price("Free shipping").has_value());
    EXPECT_FALSE(extract_price("").has_value());
    EXPECT_FALSE(extract_price("Pack of 12, 500ml bottles").has_value());
}

TEST(ExtractPrice, ImplausibleAmountsAreRejected) {
    EXPECT_FALSE(extract_price("$15000").has_value());
    EXPECT_FALSE(extract_price("$0.00").has_value());
}

TEST(ExtractPrice, SkipsImplausibleMatchAndKeepsLooking) {
    EXPECT_DOUBLE_EQ(*extract_price("Compare at $20000, ours $19.99"), 19.99);
}

TEST(PlausiblePrice, Bounds) {
    EXPECT_TRUE(is_plausible_price(0.01));
    EXPECT_TRUE(is_plausible_price(9999.99));
    EXPECT_FALSE(is_plausible_price(0.0));
    EXPECT_FALSE(is_plausible_price(-3.0));
    EXPECT_FALSE(is_plausible_price(kMaxPlausiblePrice));
}

TEST(NormalizeUrl, DropsQueryFragmentAndTrailingSlash) {
    EXPECT_EQ(*normalize_url("HTTPS://WWW.Amazon.com/dp/B08XYZ1234/?ref=sr_1#reviews"),
              "https://www.amazon.com/dp/B08XYZ1234");
    EXPECT_EQ(*normalize_url("https://www.target.com"), "https://www.target.com/");
}

TEST(NormalizeUrl, RejectsNonHttp) {
    EXPECT_FALSE(normalize_url("ftp://amazon.com/dp/B08XYZ1234").has_value());
    EXPECT_FALSE(normalize_url("not a url").has_value());
    EXPECT_FALSE(normalize_url("https:///missing-host").has_value());
}

TEST(ParseUrl, StripsUserinfoAndPort) {
    auto parsed = parse_url("https://user:pw@Shop.Amazon.com:8443/gp/product/B000000001?x=1");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->host, "shop.amazon.com");
    EXPECT_EQ(parsed->path, "/gp/product/B000000001");
}

TEST(DomainPolicy, AllowsExactHostAndSubdomains) {
    EXPECT_TRUE(is_allowed_domain("https://amazon.com/dp/B08XYZ1234"));
    EXPECT_TRUE(is_allowed_domain("https://www.walmart.com/ip/123"));
    EXPECT_TRUE(is_allowed_domain("https://www.target.com/p/x/-/A-1"));
}

TEST(DomainPolicy, RejectsLookalikeHosts) {
    EXPECT_FALSE(is_allowed_domain("https://amazon.com.evil.tld/dp/B08XYZ1234"));
    EXPECT_FALSE(is_allowed_domain("https://notamazon.com/dp/B08XYZ1234"));
    EXPECT_FALSE(is_allowed_domain("https://ebay.com/itm/1"));
    EXPECT_FALSE(is_allowed_domain("amazon.com/dp/B08XYZ1234"));
}

TEST(DomainPolicy, CustomAllowlist) {
    DomainPolicy policy(std::vector<std::string>{"Walmart.com"});
    EXPECT_TRUE(policy.is_allowed_domain("https://www.walmart.com/ip/1"));
    EXPECT_FALSE(policy.is_allowed_domain("https://www.amazon.com/dp/B08XYZ1234"));
    EXPECT_EQ(*policy.matched_domain("https://www.walmart.com/ip/1"), "walmart.com");
}

TEST(ProductPage, MarketplacePatterns) {
    EXPECT_TRUE(is_product_page("https://www.amazon.com/Eco-Cleaner/dp/B08XYZ1234"));
    EXPECT_TRUE(is_product_page("https://www.amazon.com/gp/product/B08XYZ1234"));
    EXPECT_TRUE(is_product_page("https://www.walmart.com/ip/Eco-Cleaner/55512345"));
    EXPECT_TRUE(is_product_page("https://www.target.com/p/eco-cleaner/-/A-81234567"));
}

TEST(ProductPage, ListingsAndSearchPagesAreNot) {
    EXPECT_FALSE(is_product_page("https://www.amazon.com/s?k=eco+cleaner"));
    EXPECT_FALSE(is_product_page("https://www.amazon.com/dp/SHORT"));
    EXPECT_FALSE(is_product_page("https://www.walmart.com/search?q=cleaner"));
    EXPECT_FALSE(is_product_page("https://www.target.com/c/cleaning-supplies"));
    EXPECT_FALSE(is_product_page("https://amazon.com.evil.tld/dp/B08XYZ1234"));
}

TEST(ItemCode, ExtractsUppercasedAsin) {
    EXPECT_EQ(*extract_item_code("https://www.amazon.com/x/dp/b08xyz1234?th=1"), "B08XYZ1234");
    EXPECT_EQ(*extract_item_code("https://amazon.com/gp/aw/d/B000000001"), "B000000001");
}

TEST(ItemCode, OnlyForAmazonProductPages) {
    EXPECT_FALSE(extract_item_code("https://www.walmart.com/ip/B08XYZ1234").has_value());
    EXPECT_FALSE(extract_item_code("https://www.amazon.com/s?k=B08XYZ1234").has_value());
}
