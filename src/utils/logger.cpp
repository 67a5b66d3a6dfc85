#include "utils/logger.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace modelseal::logger {

namespace {
    constexpr const char* LOG_FILE_BASE = "modelseal.jsonl";
    constexpr int DEFAULT_RETENTION_DAYS = 7;

    constexpr const char* LOG_DIR_ENV = "MODELSEAL_LOG_DIR";
    constexpr const char* LOG_LEVEL_ENV = "MODELSEAL_LOG_LEVEL";
    constexpr const char* LOG_RETENTION_DAYS_ENV = "MODELSEAL_LOG_RETENTION_DAYS";

    std::string format_date(std::chrono::system_clock::time_point tp) {
        auto t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d");
        return oss.str();
    }
}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::warn;
}

std::string get_log_dir() {
    if (const char* env = std::getenv(LOG_DIR_ENV)) {
        return env;
    }
    return "";
}

std::string get_log_file_path(const std::string& log_dir) {
    std::string filename = std::string(LOG_FILE_BASE) + "." + format_date(std::chrono::system_clock::now());
    return (fs::path(log_dir) / filename).string();
}

int get_retention_days() {
    if (const char* env = std::getenv(LOG_RETENTION_DAYS_ENV)) {
        char* end = nullptr;
        long days = std::strtol(env, &end, 10);
        if (end != env && *end == '\0' && days > 0 && days < 365) {
            return static_cast<int>(days);
        }
    }
    return DEFAULT_RETENTION_DAYS;
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    std::error_code ec;
    if (!fs::exists(log_dir, ec)) {
        return;
    }

    const std::string cutoff_str =
        format_date(std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days));
    const std::string prefix = std::string(LOG_FILE_BASE) + ".";

    for (fs::directory_iterator it(log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;

        std::string filename = it->path().filename().string();
        if (filename.rfind(prefix, 0) != 0) continue;

        std::string date_part = filename.substr(prefix.length());
        if (date_part < cutoff_str) {
            std::error_code remove_ec;
            fs::remove(it->path(), remove_ec);
        }
    }
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> additional_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(additional_sinks);

    if (sinks.empty()) {
        // stdout carries command output; logs never go there.
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!file_path.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
        }
    }

    auto logger = std::make_shared<spdlog::logger>("modelseal", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::warn);
}

void init_from_env() {
    std::string level = "warn";
    if (const char* env = std::getenv(LOG_LEVEL_ENV)) {
        level = env;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stderr_sink->set_pattern("[%Y-%m-%d %T.%e] [%l] %v");
    sinks.push_back(stderr_sink);

    std::string log_path;
    std::string file_error;
    const std::string log_dir = get_log_dir();
    if (!log_dir.empty()) {
        std::error_code ec;
        fs::create_directories(log_dir, ec);
        if (!ec) {
            cleanup_old_logs(log_dir, get_retention_days());
            log_path = get_log_file_path(log_dir);
            try {
                // File sink (JSON format for structured logging)
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
                file_sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
                log_path.clear();
            }
        } else {
            file_error = ec.message();
        }
    }

    // Preserve per-sink patterns (stderr human-readable, file JSON).
    init(level, "", "", sinks);

    if (!file_error.empty()) {
        spdlog::warn("File logging disabled ({}): {}", log_dir, file_error);
    } else if (!log_path.empty()) {
        spdlog::debug("File logging enabled: {}", log_path);
    }
}

}  // namespace modelseal::logger
