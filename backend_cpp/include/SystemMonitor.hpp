#pragma once
#include <atomic>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace shopping_assistance {

struct TelemetryData {
    size_t rss_mb = 0;

    // Latency of the most recent call per stage
    double catalog_latency_ms = 0.0;
    double web_latency_ms = 0.0;
    double retrieval_latency_ms = 0.0;
    double embedding_latency_ms = 0.0;
    double llm_latency_ms = 0.0;

    int price_lookups = 0;
    int degraded_sources = 0;
    int queries_served = 0;
};

class SystemMonitor {
public:
    // Global Atomic Metrics
    inline static std::atomic<double> global_catalog_latency_ms{0.0};
    inline static std::atomic<double> global_web_latency_ms{0.0};
    inline static std::atomic<double> global_retrieval_latency_ms{0.0};
    inline static std::atomic<double> global_embedding_latency_ms{0.0};
    inline static std::atomic<double> global_llm_latency_ms{0.0};
    inline static std::atomic<int> global_price_lookups{0};
    inline static std::atomic<int> global_degraded_sources{0};
    inline static std::atomic<int> global_queries_served{0};

    TelemetryData get_latest_snapshot() const {
        TelemetryData snapshot;
        snapshot.rss_mb = read_rss_mb();
        snapshot.catalog_latency_ms = global_catalog_latency_ms.load();
        snapshot.web_latency_ms = global_web_latency_ms.load();
        snapshot.retrieval_latency_ms = global_retrieval_latency_ms.load();
        snapshot.embedding_latency_ms = global_embedding_latency_ms.load();
        snapshot.llm_latency_ms = global_llm_latency_ms.load();
        snapshot.price_lookups = global_price_lookups.load();
        snapshot.degraded_sources = global_degraded_sources.load();
        snapshot.queries_served = global_queries_served.load();
        return snapshot;
    }

    nlohmann::json get_snapshot_json() const {
        auto m = get_latest_snapshot();
        return {
            {"rss_mb", m.rss_mb},
            {"catalog_latency", m.catalog_latency_ms},
            {"web_latency", m.web_latency_ms},
            {"retrieval_latency", m.retrieval_latency_ms},
            {"embedding_latency", m.embedding_latency_ms},
            {"llm_latency", m.llm_latency_ms},
            {"price_lookups", m.price_lookups},
            {"degraded_sources", m.degraded_sources},
            {"queries_served", m.queries_served}
        };
    }

private:
    // Second field of /proc/self/statm is resident pages.
    static size_t read_rss_mb() {
        std::ifstream statm("/proc/self/statm");
        size_t total_pages = 0, resident_pages = 0;
        if (!(statm >> total_pages >> resident_pages)) return 0;
        long page_size = sysconf(_SC_PAGESIZE);
        if (page_size <= 0) return 0;
        return resident_pages * static_cast<size_t>(page_size) / 1024 / 1024;
    }
};

} // namespace shopping_assistance
