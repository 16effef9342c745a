#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

namespace shopping_assistance {

struct InteractionLog {
    long long timestamp;
    std::string query;
    std::string intent;
    std::string strategy;
    size_t result_count;
    std::string answer;
    std::string error;       // empty when the query succeeded
    std::vector<std::string> stage_log;
    double duration_ms;
};

class LogManager {
public:
    static constexpr size_t kMaxEntries = 50;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(InteractionLog log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(std::move(log));
        if (logs_.size() > kMaxEntries) {
            logs_.pop_front();
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    // Newest first
    nlohmann::json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"query", it->query},
                {"intent", it->intent},
                {"strategy", it->strategy},
                {"result_count", it->result_count},
                {"answer", it->answer},
                {"error", it->error.empty() ? nlohmann::json(nullptr) : nlohmann::json(it->error)},
                {"stages", it->stage_log},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

private:
    LogManager() = default;
    std::deque<InteractionLog> logs_;
    mutable std::mutex mtx_;
};

} // namespace shopping_assistance
