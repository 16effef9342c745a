#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>
#include "agent/AgentTypes.hpp"
#include "CancellationToken.hpp"
#include "ThreadPool.hpp"
#include "search_adapters.hpp"

namespace shopping_assistance {

// Which price wins when catalog and web both resolved one for the same item.
enum class PricePrecedence { Catalog, Web };

struct RetrievalOptions {
    int top_k = 5;   // per-source request size
    int top_n = 10;  // size of the reconciled list
    std::chrono::milliseconds catalog_timeout{8000};
    std::chrono::milliseconds web_timeout{8000};
    PricePrecedence price_precedence = PricePrecedence::Catalog;
    bool apply_budget_filter = true;
};

class RetrievalEngine {
public:
    // Either adapter may be null when that source is disabled.
    RetrievalEngine(std::shared_ptr<CatalogSearchAdapter> catalog,
                    std::shared_ptr<WebSearchAdapter> web,
                    std::shared_ptr<ThreadPool> pool,
                    RetrievalOptions options = {});

    // Fills raw and reconciled results. Never throws: a failing source only leaves a
    // degradation note. On cancellation nothing but the log is written.
    void retrieve(ConversationState& state, const CancellationToken& token = CancellationToken()) noexcept;

    // Merge by identity key, filter, rank and truncate. Deterministic for any input order.
    static std::vector<ReconciledResult> reconcile(const std::vector<RawResult>& catalog,
                                                   const std::vector<RawResult>& web,
                                                   const std::optional<double>& max_price,
                                                   const RetrievalOptions& options);

    // Total order used for ranking.
    static bool ranks_before(const RawResult& a, const RawResult& b);

    size_t invocation_count() const { return invocations_.load(); }

private:
    std::shared_ptr<CatalogSearchAdapter> catalog_;
    std::shared_ptr<WebSearchAdapter> web_;
    std::shared_ptr<ThreadPool> pool_;
    RetrievalOptions options_;
    std::atomic<size_t> invocations_{0};
};

} // namespace shopping_assistance
