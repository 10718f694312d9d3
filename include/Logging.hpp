#pragma once
#include <string>
#include <spdlog/common.h>

namespace hybrid_agent {

// Installs the default logger: colored stdout + rotating file sink.
// Falls back to console-only if the log file cannot be opened.
void configure_logging(const std::string& log_file, const std::string& level);

// spdlog level for a config name (case-insensitive). Unknown names map to info
// and clear `recognised`; spdlog itself would map them to off.
spdlog::level::level_enum parse_log_level(const std::string& name, bool& recognised);

}
