#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <signal.h>

#include "Config.hpp"
#include "KeyManager.hpp"
#include "LogManager.hpp"
#include "Logging.hpp"
#include "embedding_service.hpp"
#include "agent/AnswerSynthesizer.hpp"
#include "agent/WorkflowOrchestrator.hpp"
#include "graph/GraphClient.hpp"
#include "memory/SimilarityCache.hpp"
#include "retrieval/GraphRetriever.hpp"
#include "retrieval/WebRetriever.hpp"
#include "search/SearchClient.hpp"
#include "server/AgentServer.hpp"

using namespace hybrid_agent;

std::unique_ptr<AgentServer> global_server_ptr;

void signal_handler(int signum) {
    spdlog::info("🛑 Interrupt signal ({}) received. Shutting down...", signum);
    if (global_server_ptr) {
        global_server_ptr->stop();
    }
}

std::shared_ptr<Embedder> make_embedder(const AppConfig& config, const std::shared_ptr<EmbeddingService>& gemini) {
    const std::string& provider = config.embedding_provider;
    if (provider == "gemini" || (provider == "auto" && gemini->available())) {
        if (gemini->available()) {
            spdlog::info("🧠 Embeddings: Gemini {}", config.embedding_model);
            return gemini;
        }
        spdlog::warn("⚠️ Embedding provider 'gemini' requested but no GEMINI_API_KEY. Using local hashing embedder.");
    } else if (provider != "auto" && provider != "hashing") {
        spdlog::warn("⚠️ Unknown embedding provider '{}'. Using local hashing embedder.", provider);
    }
    spdlog::info("🧠 Embeddings: local hashing (dim={})", config.embedding_dimension);
    return std::make_shared<HashingEmbedder>(config.embedding_dimension);
}

int main() {
    AppConfig config = load_config();
    configure_logging(config.log_file, config.log_level);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    auto missing = missing_configuration(config);
    if (!missing.empty()) {
        std::string names;
        for (const auto& m : missing) names += (names.empty() ? "" : ", ") + m;
        spdlog::warn("⚠️ Missing configuration: {}", names);
    } else {
        spdlog::info("✅ All configurations validated successfully");
    }

    LogManager::instance().set_storage_path(config.query_log_path);

    auto key_manager = std::make_shared<KeyManager>(config.gemini_keys, config.gemini_models);
    auto gemini = std::make_shared<EmbeddingService>(key_manager, config.embedding_model, config.request_timeout_ms);
    if (!gemini->available()) {
        spdlog::warn("⚠️ Gemini API key not configured - using fallback answers");
    }

    std::shared_ptr<Embedder> embedder;
    std::shared_ptr<SimilarityCache> cache;
    try {
        embedder = make_embedder(config, gemini);
        cache = std::make_shared<SimilarityCache>(embedder, config.cache_path,
                                                  (size_t)std::max(0, config.cache_persist_every));
    } catch (const std::exception& e) {
        spdlog::error("❌ Similarity cache disabled: {}", e.what());
        cache.reset();
    }

    auto graph_client = std::make_shared<Neo4jHttpClient>(config.neo4j_uri, config.neo4j_database,
                                                          config.neo4j_username, config.neo4j_password,
                                                          config.graph_connect_timeout_ms, config.request_timeout_ms);
    auto search_client = std::make_shared<TavilyClient>(config.tavily_api_key, config.request_timeout_ms);
    if (!search_client->available()) {
        spdlog::warn("⚠️ TAVILY_API_KEY not configured - internet search returns mock data");
    }

    auto graph = std::make_shared<GraphRetriever>(graph_client);
    auto web = std::make_shared<WebRetriever>(search_client, cache);
    auto synthesizer = std::make_shared<AnswerSynthesizer>(gemini);
    auto orchestrator = std::make_shared<WorkflowOrchestrator>(graph, web, cache, synthesizer);

    ServerComponents components;
    components.orchestrator = orchestrator;
    components.graph_client = graph_client;
    components.web = web;
    components.synthesizer = synthesizer;
    components.cache = cache;
    components.llm_model = gemini->model_name();

    global_server_ptr = std::make_unique<AgentServer>(config, components);
    bool ok = global_server_ptr->run(); // blocks until stop()

    spdlog::info("💾 Flushing similarity cache...");
    if (cache) cache->flush();
    global_server_ptr.reset();

    spdlog::info("👋 Shutdown complete");
    spdlog::shutdown();
    return ok ? 0 : 1;
}
