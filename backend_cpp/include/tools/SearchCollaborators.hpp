#pragma once
#include <optional>
#include <string>
#include <vector>

namespace shopping_assistance {

// Narrow contracts for the external collaborators. Implementations report
// failures by throwing SourceUnavailableError.

struct CatalogHit {
    std::string id;
    std::string title;
    std::optional<double> price;
    std::optional<std::string> url;
    std::optional<double> score;
};

struct WebHit {
    std::string title;
    std::string url;
    std::string snippet;
    std::optional<double> score;
    std::optional<double> price; // only when the provider returns a typed price
};

struct LookupResult {
    std::optional<std::string> title;
    std::optional<double> price;
};

class ICatalogSearch {
public:
    virtual ~ICatalogSearch() = default;
    virtual std::vector<CatalogHit> search(const std::string& query_text, int top_k) = 0;
};

class IWebSearch {
public:
    virtual ~IWebSearch() = default;
    virtual std::vector<WebHit> search(const std::string& query_text,
                                       const std::vector<std::string>& allowed_domains,
                                       int top_k) = 0;
};

class IPriceLookup {
public:
    virtual ~IPriceLookup() = default;
    virtual std::optional<LookupResult> lookup(const std::string& item_code) = 0;
};

class ITextGenerator {
public:
    virtual ~ITextGenerator() = default;
    virtual std::string generate(const std::string& prompt) = 0;
};

} // namespace shopping_assistance
