#include <sstream>
#include <spdlog/spdlog.h>

#include "agent/AnswerSynthesizer.hpp"
#include "utils/TextUtils.hpp"

namespace hybrid_agent {

using json = nlohmann::json;

AnswerSynthesizer::AnswerSynthesizer(std::shared_ptr<TextGenerator> generator,
                                     std::unique_ptr<ResponseParser> parser)
    : generator_(std::move(generator)), parser_(std::move(parser)) {
    if (!parser_) parser_ = std::make_unique<FirstJsonObjectParser>();
}

std::string AnswerSynthesizer::format_contexts(const std::vector<Document>& documents) {
    std::stringstream ss;
    int i = 1;
    for (const auto& d : documents) {
        ss << "\n--- Source " << i++ << " (" << kind_to_string(d.kind) << ") ---\n";
        ss << "Title: " << d.title << "\n";
        ss << "Content: " << d.content << "\n";
    }
    return ss.str();
}

std::string AnswerSynthesizer::build_prompt(const std::string& query, const std::string& context_text) {
    std::stringstream ss;
    ss << "Based on the following information, provide a comprehensive answer to the query.\n\n";
    ss << "QUERY: " << query << "\n\n";
    ss << "INFORMATION:\n" << context_text << "\n";
    ss << "Please provide:\n"
       << "1. A clear main answer\n"
       << "2. 3-5 key points\n"
       << "3. A brief summary\n\n";
    ss << "Format as JSON:\n"
       << R"({
    "answer": "your answer",
    "key_points": ["point1", "point2", "point3"],
    "summary": "brief summary"
})" << "\n";
    return ss.str();
}

json AnswerSynthesizer::format_sources(const std::vector<Document>& documents) {
    json sources = json::array();
    for (const auto& d : documents) sources.push_back(d.to_source_json());
    return sources;
}

SynthesisResult AnswerSynthesizer::empty_answer() {
    SynthesisResult r;
    r.mode = SynthesisMode::EMPTY;
    r.answer = "I couldn't find enough relevant information to answer your question.";
    r.key_points = {"No information found"};
    r.summary = "Unable to generate answer due to insufficient information";
    return r;
}

SynthesisResult AnswerSynthesizer::fallback_answer(const std::vector<Document>& documents) {
    size_t graph_count = 0;
    size_t internet_count = 0;
    for (const auto& d : documents) {
        if (d.kind == DocumentKind::GRAPH) graph_count++;
        else if (d.kind == DocumentKind::INTERNET) internet_count++;
    }

    SynthesisResult r;
    r.mode = SynthesisMode::FALLBACK;
    r.answer = "I found information about your query from " + std::to_string(documents.size()) +
               " sources (" + std::to_string(graph_count) + " from knowledge graph, " +
               std::to_string(internet_count) + " from web search). Configure LLM for detailed AI responses.";
    r.key_points = {
        "Graph sources: " + std::to_string(graph_count),
        "Internet sources: " + std::to_string(internet_count),
        "Fallback mode active",
        "LLM not configured"
    };
    r.summary = "Found " + std::to_string(documents.size()) + " information sources";
    r.sources = format_sources(documents);
    return r;
}

SynthesisResult AnswerSynthesizer::raw_text_answer(const std::string& raw) {
    SynthesisResult r;
    r.mode = SynthesisMode::RAW_TEXT;
    r.answer = raw;
    r.key_points = {"See main answer for details"};
    r.summary = utf8_length(raw) > RAW_SUMMARY_CHARS ? utf8_truncate(raw, RAW_SUMMARY_CHARS) + "..." : raw;
    return r;
}

SynthesisResult AnswerSynthesizer::synthesize(const std::string& query, const std::vector<Document>& documents) const {
    if (documents.empty()) {
        spdlog::warn("⚠️ No documents to synthesize from");
        return empty_answer();
    }

    if (!generator_available()) {
        return fallback_answer(documents);
    }

    GenerationResult generation;
    try {
        generation = generator_->generate(build_prompt(query, format_contexts(documents)));
    } catch (const std::exception& e) {
        spdlog::error("❌ LLM generation threw: {}", e.what());
        generation.success = false;
    }
    if (!generation.success) {
        spdlog::error("❌ LLM generation failed, using fallback answer");
        return fallback_answer(documents);
    }

    spdlog::info("🤖 Generated answer with {} ({} tokens)", generator_->model_name(), generation.total_tokens);

    SynthesisResult r;
    auto parsed = parser_->parse(generation.text);
    if (parsed) {
        r.mode = SynthesisMode::LLM;
        r.answer = std::move(parsed->answer);
        r.key_points = std::move(parsed->key_points);
        r.summary = std::move(parsed->summary);
    } else {
        r = raw_text_answer(generation.text);
    }
    r.sources = format_sources(documents);
    return r;
}

}
