#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Forward declare FAISS Index
namespace faiss { struct Index; }

namespace shopping_assistance {

// One row of metadata.json, aligned with the FAISS row of the same position.
struct ProductRecord {
    std::string product_id;
    std::string title;
    std::optional<double> price;
    std::optional<std::string> url;

    // Fields of the wrong type are left empty. A row that is not an object yields a placeholder.
    static ProductRecord from_json(const nlohmann::json& j);

    bool is_placeholder() const;
};

struct FaissSearchResult {
    const ProductRecord* record;
    float distance;
};

// Read-only view over a prebuilt product index. Index construction happens offline.
class FaissVectorStore {
public:
    explicit FaissVectorStore(int dimension);
    ~FaissVectorStore(); // Destructor must be defined in .cpp

    void load(const std::string& path);
    std::vector<FaissSearchResult> search(const std::vector<float>& query_vector, int k) const;

    bool is_loaded() const { return index_ != nullptr; }
    size_t size() const { return records_.size(); }

private:
    int dimension_;
    std::unique_ptr<faiss::Index> index_;
    std::vector<ProductRecord> records_;
};

} // namespace shopping_assistance
