#pragma once

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "tools/SearchCollaborators.hpp"

namespace shopping_assistance {

// Thread-safe LRU with a per-entry TTL.
template <typename Key, typename Value>
class LRUCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit LRUCache(size_t capacity, std::chrono::seconds ttl = std::chrono::seconds(300))
        : capacity_(capacity), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;

        if (Clock::now() > it->second->expires_at) {
            order_.erase(it->second);
            index_.erase(it);
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second);
        return it->second->value;
    }

    void set(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ == 0) return;
        auto expires_at = Clock::now() + ttl_;

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->value = std::move(value);
            it->second->expires_at = expires_at;
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        if (index_.size() >= capacity_) {
            index_.erase(order_.back().key);
            order_.pop_back();
        }
        order_.push_front({key, std::move(value), expires_at});
        index_[key] = order_.begin();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        index_.clear();
        order_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

private:
    struct Entry {
        Key key;
        Value value;
        Clock::time_point expires_at;
    };

    size_t capacity_;
    std::chrono::seconds ttl_;
    std::list<Entry> order_; // most recent first
    std::unordered_map<Key, typename std::list<Entry>::iterator> index_;
    mutable std::mutex mutex_;
};

class CacheManager {
public:
    CacheManager()
        : embedding_cache_(1000, std::chrono::seconds(3600)),
          lookup_cache_(500, std::chrono::seconds(900)) {}

    std::optional<std::vector<float>> get_embedding(const std::string& text) {
        return embedding_cache_.get(text);
    }

    void set_embedding(const std::string& text, const std::vector<float>& embedding) {
        embedding_cache_.set(text, embedding);
    }

    // Authoritative lookups, keyed by item code. Prices move, hence the shorter TTL.
    std::optional<LookupResult> get_lookup(const std::string& item_code) {
        return lookup_cache_.get(item_code);
    }

    void set_lookup(const std::string& item_code, const LookupResult& result) {
        lookup_cache_.set(item_code, result);
    }

    void clear_all() {
        embedding_cache_.clear();
        lookup_cache_.clear();
    }

private:
    LRUCache<std::string, std::vector<float>> embedding_cache_;
    LRUCache<std::string, LookupResult> lookup_cache_;
};

} // namespace shopping_assistance
