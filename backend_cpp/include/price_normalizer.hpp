#pragma once
#include <optional>
#include <string>
#include <vector>

namespace shopping_assistance {

// Prices outside (0, kMaxPlausiblePrice) are treated as noise.
constexpr double kMaxPlausiblePrice = 10000.0;

bool is_plausible_price(double value);

// Finds "$12.99", "USD 12.99", "12.99 USD" or "12 dollars" in free text.
// Never throws; anything unparsable or out of range yields nullopt.
std::optional<double> extract_price(const std::string& text);

struct ParsedUrl {
    std::string scheme; // lowercase, http or https
    std::string host;   // lowercase, no port, no userinfo
    std::string path;   // starts with '/'
};

std::optional<ParsedUrl> parse_url(const std::string& url);

// scheme://host/path with query and fragment dropped. Used as the web identity key.
std::optional<std::string> normalize_url(const std::string& url);

std::vector<std::string> default_allowed_domains();

// Allowlist plus per-marketplace product-page patterns.
class DomainPolicy {
public:
    explicit DomainPolicy(std::vector<std::string> allowed_domains = default_allowed_domains());

    // The allowlist entry the URL's host equals or is a proper subdomain of.
    std::optional<std::string> matched_domain(const std::string& url) const;

    bool is_allowed_domain(const std::string& url) const;
    bool is_product_page(const std::string& url) const;

    // Amazon ASIN (10 alphanumerics, upper-cased) for allowlisted amazon.com pages.
    std::optional<std::string> extract_item_code(const std::string& url) const;

    const std::vector<std::string>& allowed_domains() const { return allowed_domains_; }

private:
    std::vector<std::string> allowed_domains_;
};

// Shortcuts over the default allowlist.
bool is_allowed_domain(const std::string& url);
bool is_product_page(const std::string& url);
std::optional<std::string> extract_item_code(const std::string& url);

} // namespace shopping_assistance
