#include "retrieval_engine.hpp"
#include <algorithm>
#include <limits>
#include <string>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "SystemMonitor.hpp"
#include "price_normalizer.hpp"

namespace shopping_assistance {

namespace {

using Clock = CancellationToken::Clock;

struct SourceOutcome {
    bool dispatched = false;
    bool ok = false;
    std::vector<RawResult> results;
    std::string failure;
};

double score_of(const RawResult& r) {
    return r.score ? *r.score : -std::numeric_limits<double>::infinity();
}

double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Returns false when the request was cancelled while waiting.
bool collect(std::future<std::vector<RawResult>>& fut,
             Clock::time_point deadline,
             std::chrono::milliseconds timeout,
             const CancellationToken& token,
             SourceOutcome& out) {
    switch (wait_for_result(fut, deadline, token)) {
        case WaitStatus::Cancelled:
            return false;
        case WaitStatus::TimedOut:
            out.failure = "timed out after " + std::to_string(timeout.count()) + " ms";
            return true;
        case WaitStatus::Ready:
            break;
    }
    try {
        out.results = fut.get();
        out.ok = true;
    } catch (const std::exception& e) {
        out.failure = e.what();
    }
    return true;
}

void note_degradation(ConversationState& state, const std::string& source, const std::string& why) {
    state.degraded_sources.push_back(source);
    state.log.push_back("retriever: " + source + " unavailable (" + why + "), continuing without it");
    SystemMonitor::global_degraded_sources.fetch_add(1);
    spdlog::warn("⚠️ {} source degraded: {}", source, why);
}

void absorb_duplicate(RawResult& kept, const RawResult& dup) {
    if (score_of(dup) > score_of(kept)) kept.score = dup.score;
    if (!kept.price) kept.price = dup.price;
    if (!kept.url) kept.url = dup.url;
    if (!kept.snippet) kept.snippet = dup.snippet;
}

void absorb_web_into_catalog(RawResult& catalog, const RawResult& web, PricePrecedence precedence) {
    if (precedence == PricePrecedence::Catalog) {
        if (!catalog.price) catalog.price = web.price;
    } else if (web.price) {
        catalog.price = web.price;
    }
    if (score_of(web) > score_of(catalog)) catalog.score = web.score;
    if (!catalog.url) catalog.url = web.url;
    if (!catalog.snippet) catalog.snippet = web.snippet;
}

} // namespace

RetrievalEngine::RetrievalEngine(std::shared_ptr<CatalogSearchAdapter> catalog,
                                 std::shared_ptr<WebSearchAdapter> web,
                                 std::shared_ptr<ThreadPool> pool,
                                 RetrievalOptions options)
    : catalog_(std::move(catalog)),
      web_(std::move(web)),
      pool_(std::move(pool)),
      options_(options) {}

void RetrievalEngine::retrieve(ConversationState& state, const CancellationToken& token) noexcept {
    invocations_.fetch_add(1);
    auto start = Clock::now();

    try {
        if (is_blank(state.query)) {
            state.log.push_back("retriever: empty query, no source dispatched");
            return;
        }

        const bool want_catalog = state.strategy != SearchStrategy::WebOnly;
        const bool want_web = state.strategy != SearchStrategy::CatalogOnly;
        const std::string query = state.query;
        const int top_k = options_.top_k;

        // 1. Dispatch both sources concurrently
        SourceOutcome catalog, web;
        std::future<std::vector<RawResult>> catalog_fut, web_fut;

        if (want_catalog && catalog_) {
            catalog.dispatched = true;
            catalog_fut = pool_->enqueue([adapter = catalog_, query, top_k]() {
                auto t0 = Clock::now();
                auto results = adapter->query(query, top_k);
                SystemMonitor::global_catalog_latency_ms.store(elapsed_ms(t0));
                return results;
            });
        } else if (want_catalog) {
            state.log.push_back("retriever: catalog source not configured");
        }

        if (want_web && web_) {
            web.dispatched = true;
            auto web_deadline = start + options_.web_timeout;
            web_fut = pool_->enqueue([adapter = web_, query, top_k, token, web_deadline]() {
                auto t0 = Clock::now();
                auto results = adapter->query(query, top_k, token, web_deadline);
                SystemMonitor::global_web_latency_ms.store(elapsed_ms(t0));
                return results;
            });
        } else if (want_web) {
            state.log.push_back("retriever: web source not configured");
        }

        // 2. Join, each source against its own deadline
        if (catalog.dispatched &&
            !collect(catalog_fut, start + options_.catalog_timeout, options_.catalog_timeout, token, catalog)) {
            state.log.push_back("retriever: cancelled, partial results discarded");
            return;
        }
        if (web.dispatched &&
            !collect(web_fut, start + options_.web_timeout, options_.web_timeout, token, web)) {
            state.log.push_back("retriever: cancelled, partial results discarded");
            return;
        }

        if (catalog.dispatched && !catalog.ok) note_degradation(state, "catalog", catalog.failure);
        if (web.dispatched && !web.ok) note_degradation(state, "web", web.failure);

        // 3. Reconcile
        state.raw_catalog_results = std::move(catalog.results);
        state.raw_web_results = std::move(web.results);
        state.reconciled_results = reconcile(state.raw_catalog_results, state.raw_web_results,
                                             state.constraints.max_price, options_);

        state.sources_exhausted = !catalog.ok && !web.ok;
        if (state.sources_exhausted) {
            state.log.push_back("retriever: no source produced results");
        }

        state.log.push_back("retriever: " + std::to_string(state.raw_catalog_results.size()) +
                            " catalog + " + std::to_string(state.raw_web_results.size()) +
                            " web -> " + std::to_string(state.reconciled_results.size()) + " reconciled");
    } catch (const std::exception& e) {
        state.raw_catalog_results.clear();
        state.raw_web_results.clear();
        state.reconciled_results.clear();
        state.sources_exhausted = true;
        state.log.push_back(std::string("retriever: degraded to empty result set (") + e.what() + ")");
        spdlog::error("❌ Retrieval failed: {}", e.what());
    }

    double duration = elapsed_ms(start);
    SystemMonitor::global_retrieval_latency_ms.store(duration);
    spdlog::info("⏱️ Retrieval Pipeline Time: {:.2f} ms", duration);
}

std::vector<ReconciledResult> RetrievalEngine::reconcile(const std::vector<RawResult>& catalog,
                                                         const std::vector<RawResult>& web,
                                                         const std::optional<double>& max_price,
                                                         const RetrievalOptions& options) {
    std::vector<RawResult> merged;
    std::unordered_map<std::string, size_t> index_of;
    std::unordered_map<std::string, std::string> url_alias; // normalized catalog url -> catalog key

    for (const auto& r : catalog) {
        auto it = index_of.find(r.identity_key);
        if (it != index_of.end()) {
            absorb_duplicate(merged[it->second], r);
        } else {
            index_of.emplace(r.identity_key, merged.size());
            merged.push_back(r);
        }
        if (r.url) {
            if (auto normalized = normalize_url(*r.url)) url_alias.emplace(*normalized, r.identity_key);
        }
    }

    for (const auto& r : web) {
        std::string key = r.identity_key;
        auto alias = url_alias.find(key);
        if (alias != url_alias.end()) key = alias->second;

        auto it = index_of.find(key);
        if (it == index_of.end()) {
            index_of.emplace(key, merged.size());
            merged.push_back(r);
            merged.back().identity_key = key;
            continue;
        }
        auto& kept = merged[it->second];
        if (kept.source == ResultSource::Catalog) {
            absorb_web_into_catalog(kept, r, options.price_precedence);
        } else {
            absorb_duplicate(kept, r);
        }
    }

    for (auto& r : merged) {
        if (r.price && !is_plausible_price(*r.price)) r.price.reset();
    }

    if (options.apply_budget_filter && max_price) {
        merged.erase(std::remove_if(merged.begin(), merged.end(), [&](const RawResult& r) {
            return r.price && *r.price > *max_price;
        }), merged.end());
    }

    std::sort(merged.begin(), merged.end(), ranks_before);

    size_t keep = options.top_n > 0 ? std::min(merged.size(), static_cast<size_t>(options.top_n)) : 0;
    std::vector<ReconciledResult> ranked;
    ranked.reserve(keep);
    for (size_t i = 0; i < keep; ++i) {
        ReconciledResult out;
        static_cast<RawResult&>(out) = std::move(merged[i]);
        out.rank = static_cast<int>(i);
        ranked.push_back(std::move(out));
    }
    return ranked;
}

bool RetrievalEngine::ranks_before(const RawResult& a, const RawResult& b) {
    double sa = score_of(a), sb = score_of(b);
    if (sa != sb) return sa > sb;
    if (a.source != b.source) return a.source == ResultSource::Catalog;
    if (a.price.has_value() != b.price.has_value()) return a.price.has_value();
    if (a.price && *a.price != *b.price) return *a.price < *b.price;
    if (a.title != b.title) return a.title < b.title;
    return a.identity_key < b.identity_key;
}

} // namespace shopping_assistance
