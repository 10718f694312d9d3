#include "memory/SimilarityCache.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <faiss/IndexFlat.h>
#include <faiss/index_io.h>
#include <faiss/impl/io.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/TextUtils.hpp"

namespace hybrid_agent {

namespace fs = std::filesystem;
using json = nlohmann::json;

SimilarityCache::SimilarityCache(std::shared_ptr<Embedder> embedder, std::string storage_path, size_t persist_every)
    : embedder_(std::move(embedder)), storage_path_(std::move(storage_path)), persist_every_(persist_every) {
    if (!embedder_) throw std::invalid_argument("SimilarityCache requires an embedder");
    load();
}

SimilarityCache::~SimilarityCache() {
    try {
        flush();
    } catch (const std::exception& e) {
        spdlog::error("💥 Similarity cache flush on shutdown failed: {}", e.what());
    }
}

std::string SimilarityCache::embedding_text(const Document& doc) {
    return doc.title + " " + utf8_truncate(doc.content, EMBED_CONTENT_CHARS);
}

void SimilarityCache::insert(const Document& doc) {
    std::vector<float> vec;
    try {
        vec = embedder_->embed(embedding_text(doc));
    } catch (const std::exception& e) {
        spdlog::error("❌ Cache insert: embedding failed for '{}': {}", doc.title, e.what());
        return;
    }
    if (vec.empty()) {
        spdlog::warn("⚠️ Cache insert: empty embedding for '{}', skipped", doc.title);
        return;
    }

    std::unique_lock lock(data_mutex_);
    try {
        if (!index_) {
            index_ = std::make_unique<faiss::IndexFlatL2>((faiss::idx_t)vec.size());
            spdlog::info("🧠 Similarity index created (dim={})", vec.size());
        }
        if ((size_t)index_->d != vec.size()) {
            spdlog::error("❌ Cache insert: dimension {} does not match index dimension {}", vec.size(), index_->d);
            return;
        }

        // Copy and reserve first so nothing can throw after the vector lands
        Document stored = doc;
        documents_.reserve(documents_.size() + 1);
        index_->add(1, vec.data());
        documents_.push_back(std::move(stored));
        dirty_ = true;
    } catch (const std::exception& e) {
        spdlog::error("❌ Cache insert failed for '{}': {}", doc.title, e.what());
        return;
    }

    if (persist_every_ > 0 && documents_.size() % persist_every_ == 0) {
        save_internal(); // already holding the lock
    }
}

std::vector<Document> SimilarityCache::query(const std::string& text, int k) const {
    if (k <= 0 || size() == 0) return {};

    std::vector<float> vec;
    try {
        vec = embedder_->embed(text);
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Semantic search: embedding failed: {}", e.what());
        return {};
    }
    if (vec.empty()) return {};

    std::shared_lock lock(data_mutex_);
    if (!index_ || documents_.empty()) return {};
    if ((size_t)index_->d != vec.size()) {
        spdlog::warn("⚠️ Semantic search: query dimension {} != index dimension {}", vec.size(), index_->d);
        return {};
    }

    faiss::idx_t kk = std::min<faiss::idx_t>((faiss::idx_t)k, index_->ntotal);
    std::vector<float> distances(kk);
    std::vector<faiss::idx_t> labels(kk);

    std::vector<Document> results;
    try {
        index_->search(1, vec.data(), kk, distances.data(), labels.data());
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Semantic search failed: {}", e.what());
        return {};
    }

    for (faiss::idx_t i = 0; i < kk; ++i) {
        faiss::idx_t idx = labels[i];
        if (idx < 0 || (size_t)idx >= documents_.size()) continue;
        Document d = documents_[idx];
        d.confidence = std::min(1.0, std::max(0.1, 1.0 - (double)distances[i] / 10.0));
        d.kind = DocumentKind::SEMANTIC;
        results.push_back(std::move(d));
    }

    spdlog::info("🔎 Semantic search: {} cached results for '{}'", results.size(), text);
    return results;
}

bool SimilarityCache::save() {
    std::unique_lock lock(data_mutex_);
    return save_internal();
}

void SimilarityCache::flush() {
    std::unique_lock lock(data_mutex_);
    if (dirty_) save_internal();
}

bool SimilarityCache::save_internal() {
    if (storage_path_.empty()) return false;

    try {
        json docs = json::array();
        for (const auto& d : documents_) docs.push_back(d.to_json());

        std::vector<std::uint8_t> index_bytes;
        if (index_) {
            faiss::VectorIOWriter writer;
            faiss::write_index(index_.get(), &writer);
            index_bytes = std::move(writer.data);
        }

        json j = {
            {"version", FILE_VERSION},
            {"dimension", index_ ? (int)index_->d : 0},
            {"documents", docs},
            {"index", json::binary(std::move(index_bytes))}
        };
        std::vector<std::uint8_t> payload = json::to_cbor(j);

        fs::path path(storage_path_);
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        fs::path tmp = path;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) throw std::runtime_error("cannot open " + tmp.string());
            out.write(reinterpret_cast<const char*>(payload.data()), (std::streamsize)payload.size());
            if (!out) throw std::runtime_error("short write to " + tmp.string());
        }
        fs::rename(tmp, path);

        dirty_ = false;
        spdlog::info("💾 Similarity cache saved: {} documents -> {}", documents_.size(), storage_path_);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("💥 Failed to save similarity cache to {}: {}", storage_path_, e.what());
        return false;
    }
}

void SimilarityCache::load() {
    std::unique_lock lock(data_mutex_);
    index_.reset();
    documents_.clear();
    dirty_ = false;

    if (storage_path_.empty()) return;
    if (!fs::exists(storage_path_)) {
        spdlog::warn("⚠️ No similarity cache at {}. Starting empty.", storage_path_);
        return;
    }

    try {
        std::ifstream in(storage_path_, std::ios::binary);
        if (!in) throw std::runtime_error("cannot open file");
        std::vector<std::uint8_t> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        json j = json::from_cbor(raw);
        if (j.value("version", 0) != FILE_VERSION) {
            throw std::runtime_error("unsupported cache file version");
        }
        int dim = j.at("dimension").get<int>();

        std::vector<Document> docs;
        for (const auto& d : j.at("documents")) docs.push_back(Document::from_json(d));

        std::unique_ptr<faiss::Index> idx;
        const auto& bin = j.at("index").get_binary();
        if (!bin.empty()) {
            faiss::VectorIOReader reader;
            reader.data.assign(bin.begin(), bin.end());
            idx.reset(faiss::read_index(&reader));
        }

        size_t ntotal = idx ? (size_t)idx->ntotal : 0;
        if (ntotal != docs.size()) {
            throw std::runtime_error("index holds " + std::to_string(ntotal) + " vectors but " +
                                     std::to_string(docs.size()) + " documents");
        }
        if (idx && idx->d != dim) {
            throw std::runtime_error("index dimension does not match header");
        }
        if (idx && embedder_->dimension() > 0 && idx->d != embedder_->dimension()) {
            throw std::runtime_error("index dimension " + std::to_string(idx->d) +
                                     " does not match embedder " + embedder_->name());
        }

        index_ = std::move(idx);
        documents_ = std::move(docs);
        spdlog::info("🧠 Similarity cache loaded: {} documents from {}", documents_.size(), storage_path_);
    } catch (const std::exception& e) {
        index_.reset();
        documents_.clear();
        spdlog::warn("⚠️ Similarity cache at {} unreadable ({}). Starting empty.", storage_path_, e.what());
    }
}

void SimilarityCache::clear() {
    std::unique_lock lock(data_mutex_);
    index_.reset();
    documents_.clear();
    dirty_ = true;
}

size_t SimilarityCache::size() const {
    std::shared_lock lock(data_mutex_);
    return documents_.size();
}

int SimilarityCache::dimension() const {
    std::shared_lock lock(data_mutex_);
    return index_ ? (int)index_->d : 0;
}

}
