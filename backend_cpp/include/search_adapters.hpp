#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "agent/AgentTypes.hpp"
#include "CancellationToken.hpp"
#include "ThreadPool.hpp"
#include "price_normalizer.hpp"
#include "tools/SearchCollaborators.hpp"

namespace shopping_assistance {

class CatalogSearchAdapter {
public:
    explicit CatalogSearchAdapter(std::shared_ptr<ICatalogSearch> catalog);

    std::vector<RawResult> query(const std::string& text, int top_k) const;

    static RawResult normalize(const CatalogHit& hit);

private:
    std::shared_ptr<ICatalogSearch> catalog_;
};

struct WebSearchOptions {
    bool lookup_enabled = true;
    std::chrono::milliseconds lookup_timeout{5000};
    // Lookups stop this long before the caller's deadline so the priced hits still make it back.
    std::chrono::milliseconds deadline_margin{50};
};

class WebSearchAdapter {
public:
    // lookup and lookup_pool may be null, which disables the authoritative price step.
    WebSearchAdapter(std::shared_ptr<IWebSearch> web,
                     std::shared_ptr<IPriceLookup> lookup,
                     DomainPolicy policy,
                     std::shared_ptr<ThreadPool> lookup_pool,
                     WebSearchOptions options = {});

    // deadline is when the caller stops waiting for this call; pending lookups are
    // abandoned ahead of it and their items keep no price.
    std::vector<RawResult> query(const std::string& text, int top_k,
                                 const CancellationToken& token = CancellationToken(),
                                 std::optional<CancellationToken::Clock::time_point> deadline = std::nullopt) const;

    // Allowlist, then product-page detection with a per-domain fallback pool.
    std::vector<WebHit> select_hits(const std::vector<WebHit>& hits, int top_k) const;

    const DomainPolicy& policy() const { return policy_; }

private:
    std::optional<RawResult> normalize(const WebHit& hit) const;
    void fill_prices_from_lookup(std::vector<RawResult>& results,
                                 const CancellationToken& token,
                                 std::optional<CancellationToken::Clock::time_point> caller_deadline) const;

    std::shared_ptr<IWebSearch> web_;
    std::shared_ptr<IPriceLookup> lookup_;
    DomainPolicy policy_;
    std::shared_ptr<ThreadPool> lookup_pool_;
    WebSearchOptions options_;
};

} // namespace shopping_assistance
