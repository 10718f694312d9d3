#include "ai/Embedder.hpp"
#include <cmath>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace hybrid_agent {

namespace {

uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        // Bytes >= 0x80 are kept so UTF-8 words stay intact
        if (std::isalnum(c) || c >= 0x80) {
            current += (char)std::tolower(c);
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

}

HashingEmbedder::HashingEmbedder(int dimension) : dimension_(dimension) {
    if (dimension_ <= 0) throw std::invalid_argument("embedding dimension must be positive");
}

void HashingEmbedder::accumulate(std::vector<float>& vec, const std::string& feature, float weight) const {
    uint64_t h = fnv1a(feature);
    size_t bucket = (size_t)(h % (uint64_t)dimension_);
    float sign = ((h >> 63) & 1ULL) ? -1.0f : 1.0f;
    vec[bucket] += sign * weight;
}

std::vector<float> HashingEmbedder::embed(const std::string& text) {
    auto tokens = tokenize(text);
    if (tokens.empty()) return {};

    std::vector<float> vec(dimension_, 0.0f);
    for (size_t i = 0; i < tokens.size(); ++i) {
        accumulate(vec, tokens[i], 1.0f);
        if (i + 1 < tokens.size()) {
            accumulate(vec, tokens[i] + " " + tokens[i + 1], 0.5f);
        }
    }

    double norm = 0.0;
    for (float v : vec) norm += (double)v * v;
    if (norm <= 0.0) return {};
    float inv = (float)(1.0 / std::sqrt(norm));
    for (auto& v : vec) v *= inv;
    return vec;
}

}
