#pragma once
#include <string>
#include <vector>
#include <memory>
#include <shared_mutex>
#include <faiss/Index.h>

#include "ai/Embedder.hpp"
#include "core/Document.hpp"

namespace hybrid_agent {

// Append-only document store with a parallel FAISS L2 index.
// Invariant: index_->ntotal == documents_.size() whenever the lock is free.
class SimilarityCache {
public:
    static constexpr size_t EMBED_CONTENT_CHARS = 500;
    static constexpr int FILE_VERSION = 1;

    // persist_every == 0 disables periodic saves; empty path disables persistence
    SimilarityCache(std::shared_ptr<Embedder> embedder, std::string storage_path, size_t persist_every = 5);
    ~SimilarityCache();

    SimilarityCache(const SimilarityCache&) = delete;
    SimilarityCache& operator=(const SimilarityCache&) = delete;

    // Best-effort: embedding or index failures are logged and swallowed
    void insert(const Document& doc);

    // At most k nearest neighbours, ascending distance, kind = SEMANTIC
    std::vector<Document> query(const std::string& text, int k) const;

    bool save();
    void load();
    void flush();
    void clear();

    size_t size() const;
    int dimension() const;
    const std::string& storage_path() const { return storage_path_; }

    static std::string embedding_text(const Document& doc);

private:
    std::shared_ptr<Embedder> embedder_;
    std::string storage_path_;
    size_t persist_every_;

    std::unique_ptr<faiss::Index> index_;
    std::vector<Document> documents_;
    bool dirty_ = false;

    mutable std::shared_mutex data_mutex_;

    bool save_internal();
};

}
