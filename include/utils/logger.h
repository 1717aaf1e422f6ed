// logger.h - spdlog setup for the acquisition pipeline
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace modelfetch::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// MODELFETCH_LOG_DIR, or ~/.modelfetch/logs.
std::string get_log_dir();

// Today's log file (modelfetch.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// MODELFETCH_LOG_RETENTION_DAYS (1..364), default 7.
int get_retention_days();

// Remove dated log files older than retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Install the default logger. additional_sinks replaces the file sink (used by tests).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// stdout (human readable) + JSON lines file, level from MODELFETCH_LOG_LEVEL.
void init_from_env();

}  // namespace modelfetch::logger
