#pragma once
#include <vector>
#include <string>
#include <shared_mutex>
#include <atomic>
#include <spdlog/spdlog.h>

namespace hybrid_agent {

// Gemini key pool with rotation on rate limits. Keys come from AppConfig.
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    std::vector<std::string> model_pool;
    mutable std::shared_mutex pool_mutex;

    std::atomic<size_t> current_key_index{0};
    std::atomic<size_t> current_model_index{0};

public:
    KeyManager(const std::vector<std::string>& keys, const std::vector<std::string>& models) {
        for (const auto& k : keys) {
            if (!k.empty()) key_pool.push_back({k, true, 0});
        }
        model_pool = models;
        if (model_pool.empty()) model_pool = {"gemini-2.5-flash"};
        spdlog::info("🔑 Key pool ready: {} Gemini keys, {} models.", key_pool.size(), model_pool.size());
    }

    struct KeyModelPair {
        std::string key;
        std::string model;
        size_t key_index;
        size_t model_index;
    };

    KeyModelPair get_current_pair() const {
        std::shared_lock lock(pool_mutex);
        if (key_pool.empty() || model_pool.empty()) return {"", "", 0, 0};

        size_t start_idx = current_key_index.load();
        size_t pool_size = key_pool.size();

        // First active key at or after the cursor
        for (size_t i = 0; i < pool_size; ++i) {
            size_t idx = (start_idx + i) % pool_size;
            if (key_pool[idx].is_active) {
                size_t m_idx = current_model_index.load() % model_pool.size();
                return {key_pool[idx].key, model_pool[m_idx], idx, m_idx};
            }
        }

        size_t k_idx = start_idx % pool_size;
        size_t m_idx = current_model_index.load() % model_pool.size();
        return {key_pool[k_idx].key, model_pool[m_idx], k_idx, m_idx};
    }

    std::string get_current_key() const { return get_current_pair().key; }
    std::string get_current_model() const { return get_current_pair().model; }

    bool has_keys() const {
        std::shared_lock lock(pool_mutex);
        return !key_pool.empty();
    }

    void rotate_key() {
        current_key_index++;
    }

    void rotate_model() {
        current_model_index++;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        size_t idx = current_key_index.load() % key_pool.size();

        if (key_pool[idx].is_active) {
            key_pool[idx].fail_count++;
            if (key_pool[idx].fail_count > 2) {
                key_pool[idx].is_active = false;
                spdlog::warn("⚠️ Gemini key #{} decommissioned after repeated rate limits", idx);
            }
        }

        bool any_active = false;
        for (const auto& k : key_pool) {
            if (k.is_active) { any_active = true; break; }
        }

        if (!any_active) {
            spdlog::error("🔥 All Gemini keys exhausted. Reviving the pool.");
            for (auto& k : key_pool) {
                k.is_active = true;
                k.fail_count = 0;
            }
        }

        current_key_index++;
    }

    // One cursor step per failed attempt: 429 counts against the key, 5xx just moves on
    void report_retryable_status(long status_code) {
        if (status_code == 429) report_rate_limit();
        else rotate_key();
    }

    // Unknown model (404): move to the next configured model, false if there is none
    bool fall_back_model() {
        if (get_total_models() < 2) return false;
        rotate_model();
        return true;
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) if (k.is_active) count++;
        return count;
    }

    size_t get_total_keys() const {
        std::shared_lock lock(pool_mutex);
        return key_pool.size();
    }

    size_t get_total_models() const {
        std::shared_lock lock(pool_mutex);
        return model_pool.size();
    }
};

}
