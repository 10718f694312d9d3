#pragma once
#include <string>

namespace hybrid_agent {

struct GenerationResult {
    std::string text;
    int prompt_tokens = 0;
    int completion_tokens = 0;
    int total_tokens = 0;
    bool success = false;
};

// Prose generation from already-retrieved facts. Failure is reported through
// GenerationResult::success, never thrown.
class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    virtual bool available() const = 0;
    virtual GenerationResult generate(const std::string& prompt) = 0;
    virtual std::string model_name() const = 0;
};

}
