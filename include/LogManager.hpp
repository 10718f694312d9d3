#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
using json = nlohmann::json;

namespace hybrid_agent {

struct StepTrace {
    std::string query_id;
    std::string step;
    std::string detail;
    double duration_ms = 0.0;
};

struct QueryLog {
    long long timestamp = 0;
    std::string query_id;
    std::string query;
    std::string status;       // "success" | "error"
    std::string error_code;   // empty on success
    size_t source_count = 0;
    std::vector<std::string> steps;
    double duration_ms = 0.0;
};

class LogManager {
public:
    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    // Empty path disables persistence. Reloads from the new path.
    void set_storage_path(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        storage_path_ = path;
        logs_.clear();
        load_logs_from_disk();
    }

    void add_log(const QueryLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        total_queries_++;
        total_duration_ms_ += log.duration_ms;
        if (logs_.size() > 50) logs_.pop_front();
        save_logs_to_disk();
    }

    void add_trace(const StepTrace& trace) {
        std::lock_guard<std::mutex> lock(mtx_);
        traces_.push_back(trace);
        if (traces_.size() > 100) traces_.pop_front();
    }

    json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back(log_to_json(*it));
        }
        return j_list;
    }

    json get_traces_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j = json::array();
        for (const auto& t : traces_) {
            j.push_back({
                {"query_id", t.query_id},
                {"step", t.step},
                {"detail", t.detail},
                {"duration", t.duration_ms}
            });
        }
        return j;
    }

    size_t total_queries() {
        std::lock_guard<std::mutex> lock(mtx_);
        return total_queries_;
    }

    // Over the queries seen by this process (not the reloaded history)
    double average_response_ms() {
        std::lock_guard<std::mutex> lock(mtx_);
        return total_queries_ == 0 ? 0.0 : total_duration_ms_ / (double)total_queries_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
        traces_.clear();
        total_queries_ = 0;
        total_duration_ms_ = 0.0;
    }

private:
    LogManager() {
        load_logs_from_disk();
    }

    std::deque<QueryLog> logs_;
    std::deque<StepTrace> traces_;
    size_t total_queries_ = 0;
    double total_duration_ms_ = 0.0;
    std::mutex mtx_;
    std::string storage_path_ = "data/logs.json";

    static json log_to_json(const QueryLog& log) {
        return {
            {"t", log.timestamp},
            {"id", log.query_id},
            {"q", log.query},
            {"s", log.status},
            {"e", log.error_code},
            {"n", log.source_count},
            {"steps", log.steps},
            {"d", log.duration_ms}
        };
    }

    void save_logs_to_disk() {
        if (storage_path_.empty()) return;
        json j = json::array();
        for (const auto& log : logs_) j.push_back(log_to_json(log));

        try {
            std::filesystem::path p(storage_path_);
            if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
            std::ofstream o(storage_path_);
            o << j.dump(2);
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Could not persist query logs to {}: {}", storage_path_, e.what());
        }
    }

    void load_logs_from_disk() {
        if (storage_path_.empty() || !std::filesystem::exists(storage_path_)) return;
        try {
            std::ifstream i(storage_path_);
            json j;
            i >> j;
            for (const auto& item : j) {
                QueryLog log;
                log.timestamp = item.value("t", 0LL);
                log.query_id = item.value("id", "");
                log.query = item.value("q", "");
                log.status = item.value("s", "");
                log.error_code = item.value("e", "");
                log.source_count = item.value("n", (size_t)0);
                log.steps = item.value("steps", std::vector<std::string>{});
                log.duration_ms = item.value("d", 0.0);
                logs_.push_back(log);
            }
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Failed to load query logs ({}). Starting fresh.", e.what());
            logs_.clear();
        }
    }
};

}
