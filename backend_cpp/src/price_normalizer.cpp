#include "price_normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace shopping_assistance {

namespace {

const std::string kNumber = R"(((?:\d{1,3}(?:,\d{3})+|\d+)(?:\.\d{1,2})?))";

const std::vector<std::regex>& price_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\$\s*)" + kNumber, std::regex::icase),
        std::regex(R"(\bUSD\s*)" + kNumber + R"((?!\d)(?!\.\d))", std::regex::icase),
        std::regex(R"(\b)" + kNumber + R"(\s*USD\b)", std::regex::icase),
        std::regex(R"(\b)" + kNumber + R"(\s*dollars?\b)", std::regex::icase),
    };
    return patterns;
}

struct ProductPattern {
    std::regex path;
    bool carries_item_code;
};

const std::unordered_map<std::string, std::vector<ProductPattern>>& product_patterns() {
    static const std::unordered_map<std::string, std::vector<ProductPattern>> patterns = {
        {"amazon.com", {
            {std::regex(R"(/dp/([A-Z0-9]{10})(?![A-Z0-9]))", std::regex::icase), true},
            {std::regex(R"(/gp/product/([A-Z0-9]{10})(?![A-Z0-9]))", std::regex::icase), true},
            {std::regex(R"(/gp/aw/d/([A-Z0-9]{10})(?![A-Z0-9]))", std::regex::icase), true},
            {std::regex(R"(/gp/offer-listing/([A-Z0-9]{10})(?![A-Z0-9]))", std::regex::icase), true},
        }},
        {"walmart.com", {
            {std::regex(R"(/ip/)", std::regex::icase), false},
            {std::regex(R"(/checkout/)", std::regex::icase), false},
        }},
        {"target.com", {
            {std::regex(R"(/p/)", std::regex::icase), false},
            {std::regex(R"(/-/A-\d+)", std::regex::icase), false},
        }},
    };
    return patterns;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_host_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.';
}

std::optional<double> parse_amount(std::string digits) {
    digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());
    char* end = nullptr;
    double value = std::strtod(digits.c_str(), &end);
    if (end == digits.c_str() || !std::isfinite(value)) return std::nullopt;
    return value;
}

} // namespace

bool is_plausible_price(double value) {
    return std::isfinite(value) && value > 0.0 && value < kMaxPlausiblePrice;
}

std::optional<double> extract_price(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        for (const auto& pattern : price_patterns()) {
            for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
                 it != std::sregex_iterator(); ++it) {
                auto value = parse_amount((*it)[1].str());
                if (value && is_plausible_price(*value)) return value;
            }
        }
    } catch (const std::regex_error& e) {
        spdlog::debug("price extraction skipped ({}): {}", e.what(), text.substr(0, 80));
    }
    return std::nullopt;
}

std::optional<ParsedUrl> parse_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    ParsedUrl parsed;
    parsed.scheme = to_lower(url.substr(0, scheme_end));
    if (parsed.scheme != "http" && parsed.scheme != "https") return std::nullopt;

    size_t authority_start = scheme_end + 3;
    size_t authority_end = url.find_first_of("/?#", authority_start);
    std::string authority = url.substr(authority_start, authority_end == std::string::npos
                                                           ? std::string::npos
                                                           : authority_end - authority_start);

    // user:pass@host -> host
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    auto colon = authority.find(':');
    if (colon != std::string::npos) authority = authority.substr(0, colon);

    std::string host = to_lower(authority);
    while (!host.empty() && host.back() == '.') host.pop_back();
    if (host.empty() || !std::all_of(host.begin(), host.end(), is_host_char)) return std::nullopt;
    parsed.host = host;

    if (authority_end != std::string::npos && url[authority_end] == '/') {
        size_t path_end = url.find_first_of("?#", authority_end);
        parsed.path = url.substr(authority_end, path_end == std::string::npos
                                                    ? std::string::npos
                                                    : path_end - authority_end);
    } else {
        parsed.path = "/";
    }
    return parsed;
}

std::optional<std::string> normalize_url(const std::string& url) {
    auto parsed = parse_url(url);
    if (!parsed) return std::nullopt;
    std::string path = parsed->path;
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    return parsed->scheme + "://" + parsed->host + path;
}

std::vector<std::string> default_allowed_domains() {
    return {"amazon.com", "walmart.com", "target.com"};
}

DomainPolicy::DomainPolicy(std::vector<std::string> allowed_domains)
    : allowed_domains_(std::move(allowed_domains)) {
    for (auto& d : allowed_domains_) d = to_lower(d);
}

std::optional<std::string> DomainPolicy::matched_domain(const std::string& url) const {
    auto parsed = parse_url(url);
    if (!parsed) return std::nullopt;
    const std::string& host = parsed->host;
    for (const auto& allowed : allowed_domains_) {
        if (host == allowed) return allowed;
        if (host.size() > allowed.size() + 1 &&
            host.compare(host.size() - allowed.size(), allowed.size(), allowed) == 0 &&
            host[host.size() - allowed.size() - 1] == '.') {
            return allowed;
        }
    }
    return std::nullopt;
}

bool DomainPolicy::is_allowed_domain(const std::string& url) const {
    return matched_domain(url).has_value();
}

bool DomainPolicy::is_product_page(const std::string& url) const {
    auto domain = matched_domain(url);
    if (!domain) return false;
    auto it = product_patterns().find(*domain);
    if (it == product_patterns().end()) return false;

    auto parsed = parse_url(url);
    if (!parsed) return false;
    return std::any_of(it->second.begin(), it->second.end(), [&](const ProductPattern& p) {
        return std::regex_search(parsed->path, p.path);
    });
}

std::optional<std::string> DomainPolicy::extract_item_code(const std::string& url) const {
    auto domain = matched_domain(url);
    if (!domain || *domain != "amazon.com") return std::nullopt;
    auto parsed = parse_url(url);
    if (!parsed) return std::nullopt;

    for (const auto& p : product_patterns().at("amazon.com")) {
        std::smatch m;
        if (p.carries_item_code && std::regex_search(parsed->path, m, p.path)) {
            std::string code = m[1].str();
            std::transform(code.begin(), code.end(), code.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return code;
        }
    }
    return std::nullopt;
}

namespace {
const DomainPolicy& default_policy() {
    static const DomainPolicy policy;
    return policy;
}
} // namespace

bool is_allowed_domain(const std::string& url) { return default_policy().is_allowed_domain(url); }
bool is_product_page(const std::string& url) { return default_policy().is_product_page(url); }
std::optional<std::string> extract_item_code(const std::string& url) {
    return default_policy().extract_item_code(url);
}

} // namespace shopping_assistance
