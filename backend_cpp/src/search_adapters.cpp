#include "search_adapters.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "SystemMonitor.hpp"

namespace shopping_assistance {

namespace {

std::string trim(const std::string& s) {
    auto a = s.find_first_not_of(" \t\r\n");
    auto b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    return s.substr(a, b - a + 1);
}

std::optional<std::string> non_empty(const std::string& s) {
    auto t = trim(s);
    if (t.empty()) return std::nullopt;
    return t;
}

std::optional<double> finite_or_absent(const std::optional<double>& v) {
    if (v && std::isfinite(*v)) return v;
    return std::nullopt;
}

} // namespace

// --- CATALOG ---

CatalogSearchAdapter::CatalogSearchAdapter(std::shared_ptr<ICatalogSearch> catalog)
    : catalog_(std::move(catalog)) {}

std::vector<RawResult> CatalogSearchAdapter::query(const std::string& text, int top_k) const {
    auto hits = catalog_->search(text, top_k);
    std::vector<RawResult> results;
    results.reserve(hits.size());
    for (const auto& hit : hits) {
        results.push_back(normalize(hit));
    }
    spdlog::info("📚 Catalog returned {} hits for '{}'", results.size(), text);
    return results;
}

RawResult CatalogSearchAdapter::normalize(const CatalogHit& hit) {
    RawResult r;
    r.source = ResultSource::Catalog;
    r.title = trim(hit.title);
    r.url = hit.url ? non_empty(*hit.url) : std::nullopt;
    r.score = finite_or_absent(hit.score);

    r.identity_key = trim(hit.id);
    if (r.identity_key.empty()) {
        // No product id in the metadata; fall back to something stable.
        auto normalized = r.url ? normalize_url(*r.url) : std::nullopt;
        r.identity_key = normalized ? *normalized : "catalog:" + r.title;
    }

    if (hit.price) {
        if (is_plausible_price(*hit.price)) {
            r.price = hit.price;
        } else {
            spdlog::debug("catalog price {} for '{}' out of range, dropped", *hit.price, r.identity_key);
        }
    }
    return r;
}

// --- WEB ---

WebSearchAdapter::WebSearchAdapter(std::shared_ptr<IWebSearch> web,
                                   std::shared_ptr<IPriceLookup> lookup,
                                   DomainPolicy policy,
                                   std::shared_ptr<ThreadPool> lookup_pool,
                                   WebSearchOptions options)
    : web_(std::move(web)),
      lookup_(std::move(lookup)),
      policy_(std::move(policy)),
      lookup_pool_(std::move(lookup_pool)),
      options_(options) {}

std::vector<RawResult> WebSearchAdapter::query(const std::string& text, int top_k,
                                               const CancellationToken& token,
                                               std::optional<CancellationToken::Clock::time_point> deadline) const {
    auto hits = web_->search(text, policy_.allowed_domains(), top_k);
    auto selected = select_hits(hits, top_k);

    std::vector<RawResult> results;
    results.reserve(selected.size());
    for (const auto& hit : selected) {
        if (auto r = normalize(hit)) results.push_back(std::move(*r));
    }

    fill_prices_from_lookup(results, token, deadline);
    spdlog::info("🛰️ Web search kept {} of {} hits for '{}'", results.size(), hits.size(), text);
    return results;
}

std::vector<WebHit> WebSearchAdapter::select_hits(const std::vector<WebHit>& hits, int top_k) const {
    size_t limit = top_k > 0 ? std::min(hits.size(), static_cast<size_t>(top_k)) : 0;

    std::vector<size_t> selected;
    std::set<std::string> domains_with_product_page;
    std::map<std::string, std::vector<size_t>> listing_pool;

    for (size_t i = 0; i < limit; ++i) {
        auto domain = policy_.matched_domain(hits[i].url);
        if (!domain) {
            spdlog::debug("dropping off-allowlist hit: {}", hits[i].url);
            continue;
        }
        if (policy_.is_product_page(hits[i].url)) {
            selected.push_back(i);
            domains_with_product_page.insert(*domain);
        } else {
            listing_pool[*domain].push_back(i);
        }
    }

    // Listing pages survive only for domains where nothing looked like a product page.
    for (const auto& [domain, indices] : listing_pool) {
        if (domains_with_product_page.count(domain)) continue;
        selected.insert(selected.end(), indices.begin(), indices.end());
    }
    std::sort(selected.begin(), selected.end());

    std::vector<WebHit> out;
    out.reserve(selected.size());
    for (auto i : selected) out.push_back(hits[i]);
    return out;
}

std::optional<RawResult> WebSearchAdapter::normalize(const WebHit& hit) const {
    auto key = normalize_url(hit.url);
    if (!key) {
        spdlog::debug("unparsable web url skipped: {}", hit.url);
        return std::nullopt;
    }

    RawResult r;
    r.source = ResultSource::Web;
    r.identity_key = *key;
    r.title = trim(hit.title);
    r.url = trim(hit.url);
    r.snippet = non_empty(hit.snippet);
    r.score = finite_or_absent(hit.score);

    // Typed price, then title, then snippet. The lookup step comes later.
    if (hit.price && is_plausible_price(*hit.price)) {
        r.price = hit.price;
    } else if (auto p = extract_price(r.title)) {
        r.price = p;
    } else if (r.snippet) {
        r.price = extract_price(*r.snippet);
    }
    return r;
}

void WebSearchAdapter::fill_prices_from_lookup(std::vector<RawResult>& results,
                                               const CancellationToken& token,
                                               std::optional<CancellationToken::Clock::time_point> caller_deadline) const {
    if (!options_.lookup_enabled || !lookup_ || !lookup_pool_) return;

    std::map<std::string, std::vector<size_t>> pending; // item code -> result indices
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].price || !results[i].url) continue;
        if (auto code = policy_.extract_item_code(*results[i].url)) {
            pending[*code].push_back(i);
        }
    }
    if (pending.empty()) return;

    std::vector<std::pair<std::string, std::future<std::optional<LookupResult>>>> inflight;
    inflight.reserve(pending.size());
    for (const auto& entry : pending) {
        auto lookup = lookup_;
        auto code = entry.first;
        inflight.emplace_back(code, lookup_pool_->enqueue([lookup, code]() {
            return lookup->lookup(code);
        }));
    }
    SystemMonitor::global_price_lookups.fetch_add(static_cast<int>(inflight.size()));

    auto deadline = CancellationToken::Clock::now() + options_.lookup_timeout;
    if (caller_deadline) deadline = std::min(deadline, *caller_deadline - options_.deadline_margin);
    for (auto& [code, fut] : inflight) {
        auto status = wait_for_result(fut, deadline, token);
        if (status == WaitStatus::Cancelled) return;
        if (status == WaitStatus::TimedOut) {
            spdlog::warn("⚠️ Price lookup for {} timed out, price left empty", code);
            continue;
        }

        std::optional<LookupResult> found;
        try {
            found = fut.get();
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Price lookup for {} failed: {}", code, e.what());
            continue;
        }
        if (!found) continue;

        for (auto idx : pending[code]) {
            auto& r = results[idx];
            if (found->price && is_plausible_price(*found->price)) r.price = found->price;
            if (found->title && !trim(*found->title).empty()) r.title = trim(*found->title);
        }
    }
}

} // namespace shopping_assistance
