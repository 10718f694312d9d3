#pragma once
#include <string>
#include <vector>
#include <memory>

#include "KeyManager.hpp"
#include "ai/Embedder.hpp"
#include "ai/TextGenerator.hpp"

namespace hybrid_agent {

// Gemini REST client: text-embedding-004 embeddings and generateContent prose.
class EmbeddingService : public Embedder, public TextGenerator {
public:
    EmbeddingService(std::shared_ptr<KeyManager> key_manager,
                     std::string embedding_model = "text-embedding-004",
                     int timeout_ms = 30000);

    // Embedder
    std::vector<float> embed(const std::string& text) override;
    int dimension() const override { return 768; }
    std::string name() const override { return "gemini:" + embedding_model_; }

    // TextGenerator
    bool available() const override { return key_manager_ && key_manager_->has_keys(); }
    GenerationResult generate(const std::string& prompt) override;
    std::string model_name() const override;

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::string embedding_model_;
    int timeout_ms_;
    const std::string base_url_ = "https://generativelanguage.googleapis.com/v1beta/";

    std::string get_endpoint_url(const std::string& action) const;
};

}
