// logger.h - lightweight logging wrapper around spdlog
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace modelseal::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> warn.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Directory for daily log files (MODELSEAL_LOG_DIR); empty when unset.
std::string get_log_dir();

// Today's log file path in `log_dir` (modelseal.jsonl.YYYY-MM-DD).
std::string get_log_file_path(const std::string& log_dir);

// Retention days from MODELSEAL_LOG_RETENTION_DAYS (default: 7).
int get_retention_days();

// Remove modelseal.jsonl.* files older than retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Initialize the default logger. Without additional sinks, logs go to stderr
// and, when file_path is set, to that file as well.
// additional_sinks is mainly for testing (e.g., ostream sink injection).
void init(const std::string& level = "warn",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Initialize using environment variables:
// MODELSEAL_LOG_LEVEL (trace|debug|info|warn|error|critical|off, default warn)
// MODELSEAL_LOG_DIR (adds a daily JSON-lines file when set)
// MODELSEAL_LOG_RETENTION_DAYS (retention days, default: 7)
void init_from_env();

}  // namespace modelseal::logger
