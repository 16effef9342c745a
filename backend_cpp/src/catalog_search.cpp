#include "catalog_search.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace shopping_assistance {

FaissCatalogSearch::FaissCatalogSearch(std::shared_ptr<EmbeddingService> embeddings,
                                       std::shared_ptr<FaissVectorStore> store)
    : embeddings_(std::move(embeddings)), store_(std::move(store)) {}

std::vector<CatalogHit> FaissCatalogSearch::search(const std::string& query, int top_k) {
    if (!store_ || !store_->is_loaded()) {
        throw SourceUnavailableError("catalog", "index not loaded");
    }

    auto vector = embeddings_->generate_embedding(query);
    auto matches = store_->search(vector, top_k);

    std::vector<CatalogHit> hits;
    hits.reserve(matches.size());
    for (const auto& m : matches) {
        CatalogHit hit;
        hit.id = m.record->product_id;
        hit.title = m.record->title;
        hit.price = m.record->price;
        hit.url = m.record->url;
        hit.score = std::max(0.0, 1.0 - static_cast<double>(m.distance));
        hits.push_back(std::move(hit));
    }
    spdlog::debug("🔎 Catalog returned {} hits for '{}'", hits.size(), query);
    return hits;
}

} // namespace shopping_assistance
