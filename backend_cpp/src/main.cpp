#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "agent/ShoppingAgent.hpp"
#include "app_config.hpp"
#include "cache_manager.hpp"
#include "catalog_search.hpp"
#include "embedding_service.hpp"
#include "errors.hpp"
#include "faiss_vector_store.hpp"
#include "KeyManager.hpp"
#include "LogManager.hpp"
#include "SystemMonitor.hpp"
#include "ThreadPool.hpp"
#include "tools/WebSearchTool.hpp"

using json = nlohmann::json;

class ShoppingAssistanceServer {
public:
    ShoppingAssistanceServer(shopping_assistance::AppConfig config,
                             std::shared_ptr<shopping_assistance::KeyManager> key_manager)
        : config_(std::move(config)),
          key_manager_(std::move(key_manager)),
          cache_manager_(std::make_shared<shopping_assistance::CacheManager>()),
          io_pool_(std::make_shared<shopping_assistance::ThreadPool>(static_cast<size_t>(config_.worker_threads)))
    {
        build_pipeline();
        setup_routes();
    }

    bool run() {
        spdlog::info("🚀 Starting Shopping Assistance backend on {}:{}", config_.host, config_.port);
        return server_.listen(config_.host, config_.port);
    }

private:
    shopping_assistance::AppConfig config_;
    std::shared_ptr<shopping_assistance::KeyManager> key_manager_;
    std::shared_ptr<shopping_assistance::CacheManager> cache_manager_;
    std::shared_ptr<shopping_assistance::ThreadPool> io_pool_;
    std::shared_ptr<shopping_assistance::ThreadPool> lookup_pool_;
    std::shared_ptr<shopping_assistance::FaissVectorStore> catalog_store_;
    std::unique_ptr<shopping_assistance::ShoppingAgent> agent_;

    httplib::Server server_;
    shopping_assistance::SystemMonitor system_monitor_;

    void build_pipeline() {
        using namespace shopping_assistance;

        std::shared_ptr<ITextGenerator> llm;
        if (config_.router_use_llm || config_.answerer_use_llm) {
            llm = std::make_shared<AnthropicTextGenerator>(key_manager_, config_.llm_model);
        }

        std::shared_ptr<CatalogSearchAdapter> catalog_adapter;
        if (config_.catalog.enabled) {
            catalog_store_ = std::make_shared<FaissVectorStore>(config_.catalog.dimension);
            try {
                catalog_store_->load(config_.catalog.index_path);
            } catch (const std::exception& e) {
                // Served degraded: every catalog call reports the source unavailable.
                spdlog::error("❌ Catalog index unavailable: {}", e.what());
            }
            auto embeddings = std::make_shared<EmbeddingService>(
                key_manager_, cache_manager_, config_.catalog.embedding_model, config_.catalog.timeout_ms);
            catalog_adapter = std::make_shared<CatalogSearchAdapter>(
                std::make_shared<FaissCatalogSearch>(embeddings, catalog_store_));
        }

        std::shared_ptr<WebSearchAdapter> web_adapter;
        if (config_.web.enabled) {
            std::shared_ptr<IPriceLookup> lookup;
            if (config_.lookup.enabled) {
                lookup = std::make_shared<RainforestPriceLookup>(key_manager_, cache_manager_, config_.lookup.timeout_ms);
                lookup_pool_ = std::make_shared<shopping_assistance::ThreadPool>(static_cast<size_t>(config_.lookup.max_in_flight));
            }
            WebSearchOptions web_options;
            web_options.lookup_enabled = config_.lookup.enabled;
            web_options.lookup_timeout = std::chrono::milliseconds(config_.lookup.timeout_ms);
            web_adapter = std::make_shared<WebSearchAdapter>(
                std::make_shared<TavilyWebSearch>(key_manager_, config_.web.timeout_ms),
                lookup, DomainPolicy(config_.allowed_domains), lookup_pool_, web_options);
        }

        std::shared_ptr<IIntentClassifier> classifier;
        if (config_.router_use_llm) {
            classifier = std::make_shared<LlmIntentClassifier>(llm);
        } else {
            classifier = std::make_shared<KeywordIntentClassifier>();
        }

        PlannerOptions planner_options;
        planner_options.catalog_enabled = config_.catalog.enabled;
        planner_options.web_enabled = config_.web.enabled;

        AnswererOptions answerer_options;
        answerer_options.use_llm = config_.answerer_use_llm;

        agent_ = std::make_unique<ShoppingAgent>(
            std::make_shared<Router>(classifier),
            std::make_shared<Planner>(planner_options),
            std::make_shared<RetrievalEngine>(catalog_adapter, web_adapter, io_pool_, config_.retrieval_options()),
            std::make_shared<Answerer>(config_.answerer_use_llm ? llm : nullptr, answerer_options));
    }

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Post("/api/search", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_search(req, res);
        });

        server_.Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
            json response = {
                {"status", "ok"},
                {"catalog", source_status(config_.catalog.enabled, catalog_store_ && catalog_store_->is_loaded())},
                {"web", source_status(config_.web.enabled, true)},
                {"lookup", source_status(config_.web.enabled && config_.lookup.enabled, true)},
                {"embedding_keys_active", key_manager_->get_active_key_count()}
            };
            res.set_content(response.dump(), "application/json");
        });

        server_.Get("/api/admin/telemetry", [this](const httplib::Request&, httplib::Response& res) {
            json response = {
                {"metrics", system_monitor_.get_snapshot_json()},
                {"logs", shopping_assistance::LogManager::instance().get_logs_json()}
            };
            res.set_content(response.dump(), "application/json");
        });

        server_.Get("/api/admin/logs", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(shopping_assistance::LogManager::instance().get_logs_json().dump(), "application/json");
        });
    }

    static const char* source_status(bool enabled, bool ready) {
        if (!enabled) return "disabled";
        return ready ? "enabled" : "unavailable";
    }

    void handle_search(const httplib::Request& req, httplib::Response& res) {
        std::string query;
        try {
            auto body = json::parse(req.body);
            if (!body.is_object() || !body.contains("query") || !body["query"].is_string()) {
                throw std::invalid_argument("body must be an object with a string 'query'");
            }
            query = body["query"].get<std::string>();
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Rejected /api/search request: {}", e.what());
            res.status = 400;
            res.set_content(json{{"query", ""}, {"results", json::array()}, {"error", e.what()}}.dump(),
                            "application/json");
            return;
        }

        auto token = shopping_assistance::CancellationToken::with_deadline(
            std::chrono::milliseconds(config_.request_timeout_ms));
        auto state = agent_->run(query, token);
        res.set_content(shopping_assistance::ShoppingAgent::to_response_json(state).dump(), "application/json");
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    const std::string config_path = argc > 1 ? argv[1] : "config.json";

    try {
        auto config = shopping_assistance::AppConfig::load(config_path);
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        auto key_manager = std::make_shared<shopping_assistance::KeyManager>();
        config.validate(*key_manager);

        ShoppingAssistanceServer server(std::move(config), key_manager);
        if (!server.run()) {
            spdlog::critical("🔥 Could not bind the HTTP listener");
            return 1;
        }
    } catch (const shopping_assistance::ConfigurationError& e) {
        spdlog::critical("🔥 Configuration error: {}", e.what());
        return 1;
    }
    return 0;
}
