#pragma once
#include <memory>
#include "embedding_service.hpp"
#include "faiss_vector_store.hpp"
#include "tools/SearchCollaborators.hpp"

namespace shopping_assistance {

// Embeds the query and searches the local FAISS product catalog.
// score = max(0, 1 - distance) over normalized vectors.
class FaissCatalogSearch : public ICatalogSearch {
public:
    FaissCatalogSearch(std::shared_ptr<EmbeddingService> embeddings,
                       std::shared_ptr<FaissVectorStore> store);

    std::vector<CatalogHit> search(const std::string& query, int top_k) override;

private:
    std::shared_ptr<EmbeddingService> embeddings_;
    std::shared_ptr<FaissVectorStore> store_;
};

} // namespace shopping_assistance
