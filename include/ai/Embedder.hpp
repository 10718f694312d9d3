#pragma once
#include <string>
#include <vector>

namespace hybrid_agent {

// Text -> fixed-dimension vector. An empty vector means "could not embed".
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::vector<float> embed(const std::string& text) = 0;

    // Dimension this embedder produces (0 if unknown until first call)
    virtual int dimension() const = 0;

    virtual std::string name() const = 0;
};

// Offline embedder: signed feature hashing of lower-cased words and word
// bigrams, L2-normalised. Stable across processes (FNV-1a, not std::hash).
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(int dimension = 384);

    std::vector<float> embed(const std::string& text) override;
    int dimension() const override { return dimension_; }
    std::string name() const override { return "hashing"; }

private:
    int dimension_;

    void accumulate(std::vector<float>& vec, const std::string& feature, float weight) const;
};

}
