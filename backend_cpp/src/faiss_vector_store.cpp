#include "faiss_vector_store.hpp"
#include <faiss/Index.h>
#include <faiss/index_io.h>
#include <faiss/impl/FaissException.h>
#include <faiss/utils/distances.h>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace shopping_assistance {

namespace {

// Prices arrive as numbers or as strings like "12.99" or "$12.99".
std::optional<double> read_price(const json& j) {
    if (j.is_number()) return j.get<double>();
    if (!j.is_string()) return std::nullopt;
    std::string s = j.get<std::string>();
    std::string digits;
    for (char c : s) {
        if ((c >= '0' && c <= '9') || c == '.') digits += c;
        else if (c == '$' || c == ',' || c == ' ') continue;
        else return std::nullopt;
    }
    if (digits.empty()) return std::nullopt;
    try {
        return std::stod(digits);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

ProductRecord ProductRecord::from_json(const json& j) {
    ProductRecord r;
    if (!j.is_object()) return r;
    if (j.contains("product_id")) {
        const auto& id = j["product_id"];
        if (id.is_string()) r.product_id = id.get<std::string>();
        else if (id.is_number()) r.product_id = id.dump();
    }
    if (j.contains("title") && j["title"].is_string()) r.title = j["title"].get<std::string>();
    if (j.contains("price")) r.price = read_price(j["price"]);
    if (j.contains("url") && j["url"].is_string() && !j["url"].get<std::string>().empty()) {
        r.url = j["url"].get<std::string>();
    }
    return r;
}

bool ProductRecord::is_placeholder() const {
    return product_id.empty() && title.empty();
}

FaissVectorStore::FaissVectorStore(int dimension) : dimension_(dimension) {}

FaissVectorStore::~FaissVectorStore() {
}

void FaissVectorStore::load(const std::string& path) {
    fs::path dir(path);
    fs::path index_file = dir / "faiss.index";
    fs::path meta_path = dir / "metadata.json";

    if (!fs::exists(index_file) || !fs::exists(meta_path)) {
        throw ConfigurationError("catalog index not found at " + dir.string());
    }

    std::unique_ptr<faiss::Index> index;
    try {
        index.reset(faiss::read_index(index_file.string().c_str()));
    } catch (const faiss::FaissException& e) {
        throw ConfigurationError(std::string("cannot read catalog index: ") + e.what());
    }
    if (index->d != dimension_) {
        throw ConfigurationError("catalog index dimension " + std::to_string(index->d) +
                                 " does not match configured " + std::to_string(dimension_));
    }

    std::ifstream meta_file(meta_path);
    json metadata;
    try {
        metadata = json::parse(meta_file);
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("cannot parse catalog metadata: ") + e.what());
    }
    if (!metadata.is_array()) {
        throw ConfigurationError("catalog metadata must be a JSON array");
    }

    std::vector<ProductRecord> records;
    records.reserve(metadata.size());
    size_t placeholders = 0;
    try {
        for (const auto& j_record : metadata) {
            records.push_back(ProductRecord::from_json(j_record));
            if (records.back().is_placeholder()) placeholders++;
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("bad catalog metadata row: ") + e.what());
    }
    if (placeholders > 0) {
        spdlog::warn("⚠️ {} catalog metadata rows have no id or title and will never be returned", placeholders);
    }

    if (static_cast<size_t>(index->ntotal) != records.size()) {
        spdlog::warn("⚠️ Catalog index has {} vectors but {} metadata rows", index->ntotal, records.size());
    }
    index_ = std::move(index);
    records_ = std::move(records);
    spdlog::info("✅ Loaded FAISS catalog with {} products from {}", index_->ntotal, path);
}

std::vector<FaissSearchResult> FaissVectorStore::search(const std::vector<float>& query_vector, int k) const {
    if (!index_ || index_->ntotal == 0 || k <= 0) return {};
    if (static_cast<int>(query_vector.size()) != dimension_) {
        throw SourceUnavailableError("catalog", "embedding dimension mismatch");
    }

    std::vector<float> query_copy = query_vector;
    faiss::fvec_renorm_L2(dimension_, 1, query_copy.data());

    std::vector<float> distances(k);
    std::vector<faiss::idx_t> indices(k);

    index_->search(1, query_copy.data(), k, distances.data(), indices.data());

    std::vector<FaissSearchResult> results;
    for (int i = 0; i < k; ++i) {
        if (indices[i] < 0 || static_cast<size_t>(indices[i]) >= records_.size()) continue;
        if (records_[indices[i]].is_placeholder()) continue;
        results.push_back({&records_[indices[i]], distances[i]});
    }
    return results;
}

} // namespace shopping_assistance
