#include "agent/Answerer.hpp"
#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <regex>
#include <sstream>
#include <spdlog/spdlog.h>
#include "price_normalizer.hpp"

namespace shopping_assistance {

namespace {

// Brackets are reserved for citation markers.
std::string sanitize(std::string text) {
    std::replace(text.begin(), text.end(), '[', '(');
    std::replace(text.begin(), text.end(), ']', ')');
    return text;
}

std::string format_price(const std::optional<double>& price) {
    if (!price) return "price not listed";
    std::ostringstream out;
    out << "$" << std::fixed << std::setprecision(2) << *price;
    return out.str();
}

std::string display_title(const ReconciledResult& r) {
    return r.title.empty() ? std::string("an unnamed item") : sanitize(r.title);
}

std::string origin_of(const ReconciledResult& r) {
    if (r.source == ResultSource::Catalog) return "catalog";
    if (r.url) {
        if (auto parsed = parse_url(*r.url)) return "web, " + parsed->host;
    }
    return "web";
}

} // namespace

const char* Answerer::kSourcesUnavailableMessage =
    "Sorry, I could not complete this search right now because the product sources are "
    "unavailable. Please try again in a moment.";

const char* Answerer::kClarificationMessage =
    "Could you tell me a bit more about what you're looking for? "
    "For example the kind of product and your budget.";

Answerer::Answerer(std::shared_ptr<ITextGenerator> llm, AnswererOptions options)
    : llm_(std::move(llm)), options_(options) {}

std::vector<Citation> Answerer::build_citations(const std::vector<ReconciledResult>& results) {
    std::vector<Citation> citations;
    citations.reserve(results.size());
    for (const auto& r : results) {
        citations.push_back({r.rank + 1, r.title, r.url, r.price});
    }
    return citations;
}

std::set<int> Answerer::referenced_citation_indices(const std::string& text) {
    static const std::regex marker(R"(\[(\d{1,6})\])");
    std::set<int> indices;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), marker);
         it != std::sregex_iterator(); ++it) {
        indices.insert(static_cast<int>(std::strtol((*it)[1].str().c_str(), nullptr, 10)));
    }
    return indices;
}

void Answerer::answer(ConversationState& state) {
    invocations_.fetch_add(1);

    state.citations = build_citations(state.reconciled_results);

    if (state.reconciled_results.empty()) {
        state.final_answer = no_results_answer(state);
        state.log.push_back("answerer: no results to cite");
        return;
    }

    std::string explanation;
    if (options_.use_llm && llm_) {
        if (auto written = llm_explanation(state)) explanation = *written;
    }
    if (explanation.empty()) explanation = listing_explanation(state);

    state.final_answer = spoken_summary(state) + "\n\n" + explanation;

    if (state.intent.safety_flags.count("medical")) {
        state.final_answer += "\n\nFor health products, read the label and check with a "
                              "professional if you are unsure.";
    }
    if (state.intent.safety_flags.count("child_safety")) {
        state.final_answer += "\n\nPlease check the manufacturer's age rating before buying.";
    }

    state.log.push_back("answerer: " + std::to_string(state.citations.size()) + " citations");
}

std::string Answerer::no_results_answer(const ConversationState& state) const {
    if (state.sources_exhausted && !state.degraded_sources.empty()) return kSourcesUnavailableMessage;
    if (state.intent.type == IntentType::Clarification) return kClarificationMessage;

    std::string msg = "I couldn't find any matching results for \"" + sanitize(state.query) + "\"";
    if (state.constraints.max_price) msg += " under " + format_price(state.constraints.max_price);
    msg += ". Try different keywords";
    msg += state.constraints.max_price ? " or a higher budget." : ".";
    return msg;
}

std::string Answerer::spoken_summary(const ConversationState& state) const {
    const auto& results = state.reconciled_results;
    std::ostringstream out;

    out << "I found " << results.size() << (results.size() == 1 ? " option" : " options")
        << " for \"" << sanitize(state.query) << "\". ";

    size_t named = std::min(options_.spoken_items, results.size());
    for (size_t i = 0; i < named; ++i) {
        const auto& r = results[i];
        out << (i == 0 ? "The top pick is " : "Another good choice is ")
            << display_title(r) << " [" << r.rank + 1 << "] at " << format_price(r.price) << ". ";
    }

    for (const auto& source : state.degraded_sources) {
        out << (source == "web" ? "Live web results were unavailable, so these come from the catalog only. "
                                : "The product catalog was unavailable, so these come from the web only. ");
    }

    std::string summary = out.str();
    while (!summary.empty() && summary.back() == ' ') summary.pop_back();
    return summary;
}

std::string Answerer::listing_explanation(const ConversationState& state) const {
    std::ostringstream out;
    out << "All results:";
    for (const auto& r : state.reconciled_results) {
        out << "\n[" << r.rank + 1 << "] " << display_title(r) << " - " << format_price(r.price)
            << " (" << origin_of(r) << ")";
    }
    return out.str();
}

std::optional<std::string> Answerer::llm_explanation(ConversationState& state) const {
    std::ostringstream prompt;
    prompt << "You are a shopping assistant. Using ONLY the numbered products below, explain in "
              "2-4 sentences which ones best fit the request. Refer to products only by their "
              "marker, e.g. [1]. Do not invent products or prices.\n\n"
           << "REQUEST: " << state.query << "\n\nPRODUCTS:\n";
    for (const auto& r : state.reconciled_results) {
        prompt << "[" << r.rank + 1 << "] " << sanitize(r.title) << " | " << format_price(r.price);
        if (r.snippet) prompt << " | " << sanitize(*r.snippet);
        prompt << "\n";
    }

    std::string text;
    try {
        text = llm_->generate(prompt.str());
    } catch (const std::exception& e) {
        state.log.push_back(std::string("answerer: explanation model unavailable (") + e.what() + ")");
        spdlog::warn("⚠️ LLM explanation failed: {}", e.what());
        return std::nullopt;
    }

    auto refs = referenced_citation_indices(text);
    int count = static_cast<int>(state.reconciled_results.size());
    bool valid = !refs.empty() && *refs.begin() >= 1 && *refs.rbegin() <= count;
    if (!valid) {
        state.log.push_back("answerer: model explanation cited unknown items, using listing");
        spdlog::warn("⚠️ LLM explanation rejected: citation markers out of range");
        return std::nullopt;
    }
    return text;
}

} // namespace shopping_assistance
