#pragma once
#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>

#include "ai/TextGenerator.hpp"
#include "agent/ResponseParser.hpp"
#include "core/Document.hpp"

namespace hybrid_agent {

enum class SynthesisMode {
    EMPTY,     // no documents, fixed "insufficient information" answer
    LLM,       // generated and parsed
    RAW_TEXT,  // generated, parse failed
    FALLBACK   // no generator or generation failed
};

inline std::string synthesis_mode_to_string(SynthesisMode m) {
    switch (m) {
        case SynthesisMode::EMPTY: return "empty";
        case SynthesisMode::LLM: return "llm";
        case SynthesisMode::RAW_TEXT: return "raw_text";
        case SynthesisMode::FALLBACK: return "fallback";
    }
    return "fallback";
}

struct SynthesisResult {
    std::string answer;
    std::vector<std::string> key_points;
    std::string summary;
    nlohmann::json sources = nlohmann::json::array();
    SynthesisMode mode = SynthesisMode::FALLBACK;
};

class AnswerSynthesizer {
public:
    static constexpr size_t RAW_SUMMARY_CHARS = 100;

    // generator may be null; parser defaults to FirstJsonObjectParser
    explicit AnswerSynthesizer(std::shared_ptr<TextGenerator> generator,
                               std::unique_ptr<ResponseParser> parser = nullptr);

    SynthesisResult synthesize(const std::string& query, const std::vector<Document>& documents) const;

    static std::string format_contexts(const std::vector<Document>& documents);
    static std::string build_prompt(const std::string& query, const std::string& context_text);
    static nlohmann::json format_sources(const std::vector<Document>& documents);

    static SynthesisResult empty_answer();
    static SynthesisResult fallback_answer(const std::vector<Document>& documents);
    static SynthesisResult raw_text_answer(const std::string& raw);

    bool generator_available() const { return generator_ && generator_->available(); }

private:
    std::shared_ptr<TextGenerator> generator_;
    std::unique_ptr<ResponseParser> parser_;
};

}
