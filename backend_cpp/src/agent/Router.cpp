#include "agent/Router.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "agent/Planner.hpp"

namespace shopping_assistance {

namespace {

const std::vector<std::string>& shopping_signals() {
    static const std::vector<std::string> words = {
        "buy", "purchase", "price", "prices", "cheap", "cheapest", "affordable", "budget",
        "deal", "deals", "sale", "shop", "shopping", "order", "recommend", "recommendation",
        "product", "products", "brand", "review", "reviews", "gift", "under", "dollars", "usd",
        "amazon", "walmart", "target",
    };
    return words;
}

const std::vector<std::string>& off_topic_phrases() {
    static const std::vector<std::string> phrases = {
        "weather", "forecast", "news", "joke", "capital of", "who is", "who was", "what time",
        "translate", "poem", "write code", "homework", "stock price", "score of", "recipe for",
        "movie", "politics", "election", "meaning of life", "tell me about yourself",
    };
    return phrases;
}

const std::vector<std::pair<std::string, std::vector<std::string>>>& safety_lexicon() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> lexicon = {
        {"weapons", {"gun", "guns", "firearm", "ammo", "ammunition", "explosive", "explosives",
                     "grenade", "silencer"}},
        {"drugs", {"cocaine", "heroin", "meth", "fentanyl", "narcotics"}},
        {"medical", {"medicine", "medication", "prescription", "supplement", "supplements",
                     "vitamin", "vitamins", "pain relief"}},
        {"child_safety", {"baby", "infant", "toddler", "crib", "car seat", "3 year old",
                          "kids", "child"}},
    };
    return lexicon;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_word(const std::vector<std::string>& tokens, const std::string& word) {
    return std::find(tokens.begin(), tokens.end(), word) != tokens.end();
}

// Words that turn "gun" into a tool or a toy.
const std::vector<std::string>& gun_compound_qualifiers() {
    static const std::vector<std::string> words = {
        "glue", "nail", "staple", "water", "heat", "massage", "caulk", "caulking", "grease",
        "spray", "paint", "bubble", "squirt", "nerf", "toy", "foam", "dart", "tape", "label",
        "price", "soldering", "rivet", "brad", "air", "hvlp", "temperature", "thermometer",
    };
    return words;
}

bool is_gun_compound(const std::vector<std::string>& tokens, size_t i) {
    if (tokens[i] != "gun" && tokens[i] != "guns") return false;
    return i > 0 && contains_word(gun_compound_qualifiers(), tokens[i - 1]);
}

// Multi-word entries are matched as substrings, single words as tokens.
bool matches_term(const std::string& lowered, const std::vector<std::string>& tokens,
                  const std::string& term) {
    if (term.find(' ') != std::string::npos) return lowered.find(term) != std::string::npos;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] == term && !is_gun_compound(tokens, i)) return true;
    }
    return false;
}

nlohmann::json extract_json(const std::string& raw) {
    auto start = raw.find('{');
    auto end = raw.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        throw std::runtime_error("no JSON object in classifier reply");
    }
    return nlohmann::json::parse(raw.substr(start, end - start + 1));
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

const char* Router::kDeclineMessage =
    "Sorry, I can only help with shopping and product questions. "
    "Try asking me to find a product, for example \"eco-friendly dish soap under $10\".";

std::set<std::string> detect_safety_flags(const std::string& query) {
    std::string lowered = to_lower(query);
    auto tokens = tokenize(lowered);
    std::set<std::string> flags;
    for (const auto& [flag, terms] : safety_lexicon()) {
        for (const auto& term : terms) {
            if (matches_term(lowered, tokens, term)) {
                flags.insert(flag);
                break;
            }
        }
    }
    return flags;
}

bool is_blocking_flag(const std::string& flag) {
    return flag == "weapons" || flag == "drugs";
}

Intent KeywordIntentClassifier::classify(const std::string& query) {
    Intent intent;
    std::string lowered = to_lower(query);
    auto tokens = tokenize(lowered);

    bool shopping = Planner::extract_budget(query).has_value() ||
                    Planner::detect_category(tokens).has_value();
    for (const auto& w : shopping_signals()) {
        if (shopping) break;
        shopping = contains_word(tokens, w);
    }

    bool off_topic = std::any_of(off_topic_phrases().begin(), off_topic_phrases().end(),
                                 [&](const std::string& p) { return matches_term(lowered, tokens, p); });

    intent.type = (off_topic && !shopping) ? IntentType::OutOfScope : IntentType::ProductQuery;
    return intent;
}

Intent LlmIntentClassifier::classify(const std::string& query) {
    std::string prompt =
        "Classify the user's message for a shopping assistant.\n"
        "Return ONLY a JSON object: {\"type\": \"product_query\" | \"out_of_scope\" | \"clarification\", "
        "\"safety_flags\": [\"weapons\" | \"drugs\" | \"medical\" | \"child_safety\"]}\n"
        "- product_query: the user wants to find, compare or buy a product.\n"
        "- clarification: it is about shopping but too vague to search.\n"
        "- out_of_scope: anything else.\n\n"
        "MESSAGE: " + query + "\n";

    auto reply = extract_json(llm_->generate(prompt));
    std::string type = reply.value("type", "");

    Intent intent;
    if (type == "product_query") intent.type = IntentType::ProductQuery;
    else if (type == "out_of_scope") intent.type = IntentType::OutOfScope;
    else if (type == "clarification") intent.type = IntentType::Clarification;
    else throw std::runtime_error("unknown intent type '" + type + "'");

    if (reply.contains("safety_flags") && reply["safety_flags"].is_array()) {
        for (const auto& f : reply["safety_flags"]) {
            if (f.is_string()) intent.safety_flags.insert(f.get<std::string>());
        }
    }
    return intent;
}

Router::Router(std::shared_ptr<IIntentClassifier> classifier)
    : classifier_(std::move(classifier)) {}

void Router::route(ConversationState& state) {
    invocations_.fetch_add(1);

    if (is_blank(state.query)) {
        state.intent.type = IntentType::Clarification;
        state.log.push_back("router: empty query -> clarification");
        return;
    }

    Intent intent;
    try {
        if (!classifier_) throw std::runtime_error("no classifier configured");
        intent = classifier_->classify(state.query);
    } catch (const std::exception& e) {
        // Fail open: an unavailable classifier must not block shopping queries.
        intent = Intent{};
        state.log.push_back(std::string("router: classifier unavailable (") + e.what() +
                            "), defaulting to product_query");
        spdlog::warn("⚠️ Intent classification unavailable: {}", e.what());
    }

    auto flags = detect_safety_flags(state.query);
    intent.safety_flags.insert(flags.begin(), flags.end());
    if (std::any_of(intent.safety_flags.begin(), intent.safety_flags.end(), is_blocking_flag)) {
        intent.type = IntentType::OutOfScope;
    }
    state.intent = intent;

    std::string flag_list;
    for (const auto& f : intent.safety_flags) flag_list += (flag_list.empty() ? "" : ",") + f;
    state.log.push_back("router: intent=" + to_string(intent.type) +
                        (flag_list.empty() ? "" : " flags=" + flag_list));

    if (intent.type == IntentType::OutOfScope) {
        state.raw_catalog_results.clear();
        state.raw_web_results.clear();
        state.reconciled_results.clear();
        state.citations.clear();
        state.final_answer = kDeclineMessage;
        spdlog::info("🚫 Out-of-scope query declined: '{}'", state.query);
    }
}

bool Router::should_continue(const ConversationState& state) const {
    return state.intent.type != IntentType::OutOfScope;
}

} // namespace shopping_assistance
