#include "agent/Planner.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <unordered_map>
#include <unordered_set>
#include <spdlog/spdlog.h>
#include "price_normalizer.hpp"

namespace shopping_assistance {

namespace {

const std::unordered_set<std::string>& stopwords() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "the", "and", "or", "for", "with", "without", "of", "to", "in", "on", "at",
        "by", "from", "is", "are", "be", "it", "its", "this", "that", "these", "those",
        "i", "me", "my", "we", "our", "you", "your", "can", "could", "would", "should",
        "want", "need", "looking", "look", "find", "show", "get", "buy", "some", "any",
        "please", "what", "which", "where", "recommend", "suggest", "good", "best", "one",
        "under", "below", "less", "than", "over", "above", "around", "about", "max",
        "maximum", "most", "up", "budget", "cheaper", "no", "more",
        "dollar", "dollars", "usd", "bucks", "price", "priced", "cost", "costs",
    };
    return words;
}

// category -> trigger words
const std::vector<std::pair<std::string, std::vector<std::string>>>& category_lexicon() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> lexicon = {
        {"cleaning", {"cleaner", "cleaners", "cleaning", "detergent", "wipes", "disinfectant",
                      "sponge", "mop", "polish", "degreaser", "soap"}},
        {"toys", {"toy", "toys", "puzzle", "lego", "doll", "blocks", "game", "games"}},
        {"kitchen", {"pan", "pot", "knife", "knives", "blender", "kettle", "cookware",
                     "utensil", "utensils", "skillet", "toaster"}},
        {"electronics", {"headphones", "earbuds", "charger", "cable", "speaker", "laptop",
                         "phone", "tablet", "monitor", "keyboard", "mouse", "camera"}},
        {"personal_care", {"shampoo", "conditioner", "toothpaste", "toothbrush", "lotion",
                           "deodorant", "razor", "sunscreen"}},
        {"office", {"pen", "pens", "notebook", "stapler", "paper", "binder", "desk"}},
        {"pet", {"dog", "cat", "leash", "litter", "kibble", "aquarium"}},
    };
    return lexicon;
}

// Groups: 1 currency prefix, 2 amount, 3 currency suffix, 4 the word right after.
const std::regex& budget_before_amount() {
    static const std::regex re(
        R"(\b(?:under|below|less than|cheaper than|no more than|not more than|at most|max(?:imum)?|up to|budget(?: of)?)\s*(?:of\s*)?(\$|usd\s*)?\s*(\d+(?:\.\d{1,2})?)\s*(dollars?|usd|bucks)?(?:\s*([a-z]+|"|'))?)",
        std::regex::icase);
    return re;
}

// A bare number followed by one of these is a size or a count, not a budget.
const std::unordered_set<std::string>& non_currency_units() {
    static const std::unordered_set<std::string> units = {
        "\"", "'", "in", "inch", "inches", "ft", "feet", "foot", "cm", "mm", "m", "meters",
        "lb", "lbs", "pound", "pounds", "kg", "g", "oz", "ounce", "ounces", "gallon", "gallons",
        "l", "liter", "liters", "ml", "qt", "quart", "quarts", "w", "watt", "watts", "v", "volt",
        "volts", "mah", "gb", "tb", "mb", "hz", "people", "person", "persons", "players", "kids",
        "seats", "seater", "pieces", "pcs", "pc", "pack", "count", "ct", "year", "years", "yr",
        "yrs", "month", "months", "hour", "hours", "hr", "hrs", "minutes", "min", "mph", "x",
    };
    return units;
}

std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::regex& budget_after_amount() {
    static const std::regex re(
        R"((?:\$\s*|usd\s*)?(\d+(?:\.\d{1,2})?)\s*(?:dollars?|usd|bucks)?\s*(?:or less|or under|or below|max(?:imum)?|tops)\b)",
        std::regex::icase);
    return re;
}

bool is_number(const std::string& token) {
    return !token.empty() && std::all_of(token.begin(), token.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '.' || c == '$';
    });
}

} // namespace

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || ((c == '.' || c == '$') && !current.empty()) ||
            (c == '$' && current.empty())) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);

    for (auto& t : tokens) {
        while (!t.empty() && t.back() == '.') t.pop_back();
    }
    tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                [](const std::string& t) { return t.empty() || t == "$"; }),
                 tokens.end());
    return tokens;
}

std::optional<double> Planner::extract_budget(const std::string& query) {
    try {
        for (auto it = std::sregex_iterator(query.begin(), query.end(), budget_before_amount());
             it != std::sregex_iterator(); ++it) {
            const auto& m = *it;
            bool has_currency = m[1].matched || m[3].matched;
            if (!has_currency && m[4].matched && non_currency_units().count(lowered(m[4].str()))) {
                continue;
            }
            double value = std::strtod(m[2].str().c_str(), nullptr);
            if (is_plausible_price(value)) return value;
        }

        std::smatch m;
        if (std::regex_search(query, m, budget_after_amount())) {
            double value = std::strtod(m[1].str().c_str(), nullptr);
            if (is_plausible_price(value)) return value;
        }
    } catch (const std::regex_error& e) {
        spdlog::debug("budget extraction skipped: {}", e.what());
    }
    return std::nullopt;
}

std::optional<std::string> Planner::detect_category(const std::vector<std::string>& tokens) {
    for (const auto& [category, triggers] : category_lexicon()) {
        for (const auto& t : tokens) {
            if (std::find(triggers.begin(), triggers.end(), t) != triggers.end()) return category;
        }
    }
    return std::nullopt;
}

std::set<std::string> Planner::extract_keywords(const std::string& query) {
    std::set<std::string> keywords;
    for (const auto& t : tokenize(query)) {
        if (is_number(t) || stopwords().count(t)) continue;
        keywords.insert(t);
    }
    return keywords;
}

void Planner::plan(ConversationState& state) {
    invocations_.fetch_add(1);

    Constraints c;
    c.max_price = extract_budget(state.query);
    c.category = detect_category(tokenize(state.query));
    c.keywords = extract_keywords(state.query);
    state.constraints = c;

    SearchStrategy strategy = c.keywords.empty() ? SearchStrategy::CatalogOnly : SearchStrategy::Hybrid;
    if (!options_.web_enabled) {
        strategy = SearchStrategy::CatalogOnly;
    } else if (!options_.catalog_enabled) {
        strategy = SearchStrategy::WebOnly;
    }
    state.strategy = strategy;

    std::string budget = c.max_price ? std::to_string(*c.max_price) : "none";
    state.log.push_back("planner: strategy=" + to_string(strategy) +
                        " max_price=" + budget +
                        " category=" + c.category.value_or("none") +
                        " keywords=" + std::to_string(c.keywords.size()));
    spdlog::info("🧭 Plan: {} (budget {}, category {}, {} keywords)",
                 to_string(strategy), budget, c.category.value_or("none"), c.keywords.size());
}

} // namespace shopping_assistance
