#pragma once
#include <string>
#include <vector>
#include <optional>

namespace hybrid_agent {

struct ParsedAnswer {
    std::string answer;
    std::vector<std::string> key_points;
    std::string summary;
};

// Extracts {answer, key_points, summary} from generated text.
// nullopt means the caller should use the raw-text fallback.
class ResponseParser {
public:
    virtual ~ResponseParser() = default;
    virtual std::optional<ParsedAnswer> parse(const std::string& raw) const = 0;
};

// Takes the span from the first '{' to the last '}' and parses it as JSON.
class FirstJsonObjectParser : public ResponseParser {
public:
    std::optional<ParsedAnswer> parse(const std::string& raw) const override;
};

}
