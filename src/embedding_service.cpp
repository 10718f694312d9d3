#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <thread>
#include <chrono>

#include "embedding_service.hpp"

namespace hybrid_agent {

using json = nlohmann::json;

namespace {

// Fail-fast retry: one extra attempt on 429/5xx, on the next key
template<typename Func>
cpr::Response perform_request_with_retry_fast(Func request_factory, const std::shared_ptr<KeyManager>& km) {
    const int MAX_RETRIES = 2;
    cpr::Response r;
    for (int attempt = 0; attempt < MAX_RETRIES; ++attempt) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if (r.status_code == 404 || r.status_code == 400) return r;

        if (r.status_code == 429 || r.status_code >= 500) {
            km->report_retryable_status(r.status_code);
            if (attempt < MAX_RETRIES - 1) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }
        }
        return r;
    }
    return r;
}

}

EmbeddingService::EmbeddingService(std::shared_ptr<KeyManager> key_manager,
                                   std::string embedding_model,
                                   int timeout_ms)
    : key_manager_(std::move(key_manager)),
      embedding_model_(std::move(embedding_model)),
      timeout_ms_(timeout_ms) {}

std::string EmbeddingService::model_name() const {
    return key_manager_ ? key_manager_->get_current_model() : "";
}

std::string EmbeddingService::get_endpoint_url(const std::string& action) const {
    auto pair = key_manager_->get_current_pair();

    std::string model_path;
    if (action == "embedContent") {
        model_path = "models/" + embedding_model_;
    } else {
        if (pair.model.find("models/") == 0) model_path = pair.model;
        else model_path = "models/" + pair.model;
    }
    return base_url_ + model_path + ":" + action + "?key=" + pair.key;
}

GenerationResult EmbeddingService::generate(const std::string& prompt) {
    GenerationResult result;
    if (!available()) return result;

    auto send = [&]() {
        return perform_request_with_retry_fast([&]() {
            return cpr::Post(cpr::Url{get_endpoint_url("generateContent")},
                             cpr::Body{json{
                                 {"contents", {{{"parts", {{{"text", prompt}}}}}}},
                                 {"generationConfig", {
                                     {"temperature", 0.1},
                                     {"maxOutputTokens", 1024}
                                 }}
                             }.dump()},
                             cpr::Header{{"Content-Type", "application/json"}},
                             cpr::Timeout{timeout_ms_});
        }, key_manager_);
    };

    auto r = send();
    // Each configured model gets at most one try
    for (size_t tried = 1; r.status_code == 404 && tried < key_manager_->get_total_models(); ++tried) {
        std::string missing = key_manager_->get_current_model();
        if (!key_manager_->fall_back_model()) break;
        spdlog::warn("⚠️ Gemini model {} not found, trying {}", missing, key_manager_->get_current_model());
        r = send();
    }

    if (r.error.code != cpr::ErrorCode::OK) {
        spdlog::warn("⚠️ Gemini generation transport error: {}", r.error.message);
        return result;
    }
    if (r.status_code != 200) {
        spdlog::warn("⚠️ Gemini generation returned HTTP {}", r.status_code);
        return result;
    }

    try {
        auto j = json::parse(r.text);
        if (j.contains("candidates") && !j["candidates"].empty()) {
            result.text = j["candidates"][0]["content"]["parts"][0]["text"].get<std::string>();
            if (j.contains("usageMetadata")) {
                const auto& u = j["usageMetadata"];
                result.prompt_tokens = u.value("promptTokenCount", 0);
                result.completion_tokens = u.value("candidatesTokenCount", 0);
                result.total_tokens = u.value("totalTokenCount", 0);
            }
            result.success = true;
        }
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Malformed Gemini generation response: {}", e.what());
    }
    return result;
}

std::vector<float> EmbeddingService::embed(const std::string& text) {
    if (!available()) return {};

    auto r = perform_request_with_retry_fast([&]() {
        return cpr::Post(cpr::Url{get_endpoint_url("embedContent")},
                         cpr::Body{json{
                             {"model", "models/" + embedding_model_},
                             {"content", {{"parts", {{{"text", text}}}}}}
                         }.dump()},
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Timeout{timeout_ms_});
    }, key_manager_);

    if (r.error.code != cpr::ErrorCode::OK || r.status_code != 200) {
        spdlog::warn("⚠️ Gemini embedding failed (HTTP {}): {}", r.status_code, r.error.message);
        return {};
    }

    try {
        auto j = json::parse(r.text);
        if (j.contains("embedding") && j["embedding"].contains("values")) {
            return j["embedding"]["values"].get<std::vector<float>>();
        }
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Malformed Gemini embedding response: {}", e.what());
    }
    return {};
}

}
