#include "Logging.hpp"
#include "utils/TextUtils.hpp"
#include <filesystem>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace hybrid_agent {

spdlog::level::level_enum parse_log_level(const std::string& name, bool& recognised) {
    std::string lowered = to_lower(trim(name));
    auto level = spdlog::level::from_str(lowered);
    recognised = level != spdlog::level::off || lowered == "off";
    return recognised ? level : spdlog::level::info;
}

void configure_logging(const std::string& log_file, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    if (!log_file.empty()) {
        try {
            std::filesystem::path p(log_file);
            if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, 5 * 1024 * 1024, 3));
        } catch (const std::exception& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("hybrid_agent", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
    bool level_known = true;
    logger->set_level(parse_log_level(level, level_known));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!level_known) {
        spdlog::warn("⚠️ Unknown log level '{}'. Using info.", level);
    }
    if (!file_error.empty()) {
        spdlog::warn("⚠️ File logging disabled ({}): {}", log_file, file_error);
    }
}

}
