#include "embedding_service.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>
#include "errors.hpp"
#include "SystemMonitor.hpp"

namespace shopping_assistance {

using json = nlohmann::json;

namespace {

template <typename Func>
cpr::Response perform_request_with_retry(Func request_factory, const std::shared_ptr<KeyManager>& km) {
    const int max_retries = 3;
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if ((r.status_code == 429 || r.status_code == 503) && km) {
            spdlog::warn("⚠️ API {} ({}). Rotating key and cooling down (Attempt {}/{})...",
                         r.status_code, (r.status_code == 429 ? "Quota" : "Overload"), i + 1, max_retries);
            km->report_rate_limit();
            std::this_thread::sleep_for(std::chrono::milliseconds(500 + (i * 500)));
            continue;
        }
        break;
    }
    return r;
}

std::string describe_failure(const cpr::Response& r) {
    if (r.error) return "transport error: " + r.error.message;
    return "HTTP " + std::to_string(r.status_code);
}

} // namespace

EmbeddingService::EmbeddingService(std::shared_ptr<KeyManager> key_manager,
                                   std::shared_ptr<CacheManager> cache_manager,
                                   std::string model,
                                   int timeout_ms)
    : key_manager_(std::move(key_manager)),
      cache_manager_(std::move(cache_manager)),
      model_(std::move(model)),
      timeout_ms_(timeout_ms) {}

std::vector<float> EmbeddingService::generate_embedding(const std::string& text) {
    if (auto cached = cache_manager_->get_embedding(text)) return *cached;

    auto start = std::chrono::high_resolution_clock::now();

    auto r = perform_request_with_retry([&]() {
        // Fresh header each attempt so a rotated key is picked up.
        return cpr::Post(cpr::Url{endpoint_},
                         cpr::Header{{"Authorization", "Bearer " + key_manager_->get_current_key()},
                                     {"Content-Type", "application/json"}},
                         cpr::Body{json{{"model", model_}, {"input", text}}.dump()},
                         cpr::Timeout{timeout_ms_});
    }, key_manager_);

    auto end = std::chrono::high_resolution_clock::now();
    SystemMonitor::global_embedding_latency_ms.store(
        std::chrono::duration<double, std::milli>(end - start).count());

    if (r.status_code != 200) {
        spdlog::error("❌ Embedding API error [{}]: {}", r.status_code, r.text.substr(0, 300));
        throw SourceUnavailableError("embedding", describe_failure(r));
    }

    std::vector<float> embedding;
    try {
        auto body = json::parse(r.text);
        embedding = body.at("data").at(0).at("embedding").get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw SourceUnavailableError("embedding", std::string("malformed response: ") + e.what());
    }
    cache_manager_->set_embedding(text, embedding);
    return embedding;
}

AnthropicTextGenerator::AnthropicTextGenerator(std::shared_ptr<KeyManager> key_manager, std::string model, int timeout_ms)
    : key_manager_(std::move(key_manager)), model_(std::move(model)), timeout_ms_(timeout_ms) {}

std::string AnthropicTextGenerator::generate(const std::string& prompt) {
    auto start = std::chrono::high_resolution_clock::now();

    json payload = {
        {"model", model_},
        {"max_tokens", 1024},
        {"temperature", 0.1},
        {"messages", json::array({{{"role", "user"}, {"content", prompt}}})}
    };

    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{endpoint_},
                         cpr::Header{{"x-api-key", key_manager_->get_llm_key()},
                                     {"anthropic-version", "2023-06-01"},
                                     {"Content-Type", "application/json"}},
                         cpr::Body{payload.dump()},
                         cpr::Timeout{timeout_ms_});
    }, nullptr);

    SystemMonitor::global_llm_latency_ms.store(std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count());

    if (r.status_code != 200) {
        spdlog::error("❌ LLM API error [{}]: {}", r.status_code, r.text.substr(0, 300));
        throw SourceUnavailableError("llm", describe_failure(r));
    }

    try {
        auto body = json::parse(r.text);
        std::string text;
        for (const auto& block : body.at("content")) {
            if (block.value("type", "") == "text") text += block.value("text", "");
        }
        if (text.empty()) throw SourceUnavailableError("llm", "empty completion");
        return text;
    } catch (const json::exception& e) {
        throw SourceUnavailableError("llm", std::string("malformed response: ") + e.what());
    }
}

} // namespace shopping_assistance
