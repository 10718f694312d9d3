#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "agent/ResponseParser.hpp"

namespace hybrid_agent {

using json = nlohmann::json;

std::optional<ParsedAnswer> FirstJsonObjectParser::parse(const std::string& raw) const {
    size_t start = raw.find('{');
    size_t end = raw.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        spdlog::warn("⚠️ No JSON object in generated text ({} chars)", raw.size());
        return std::nullopt;
    }

    json j = json::parse(raw.substr(start, end - start + 1), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("⚠️ Generated JSON is malformed");
        return std::nullopt;
    }

    auto answer = j.find("answer");
    auto points = j.find("key_points");
    auto summary = j.find("summary");
    if (answer == j.end() || !answer->is_string() ||
        points == j.end() || !points->is_array() ||
        summary == j.end() || !summary->is_string()) {
        spdlog::warn("⚠️ Generated JSON lacks answer/key_points/summary");
        return std::nullopt;
    }

    ParsedAnswer parsed;
    parsed.answer = answer->get<std::string>();
    parsed.summary = summary->get<std::string>();
    for (const auto& p : *points) {
        parsed.key_points.push_back(p.is_string() ? p.get<std::string>() : p.dump());
    }
    return parsed;
}

}
