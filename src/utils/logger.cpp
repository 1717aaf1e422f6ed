#include "utils/logger.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace modelfetch::logger {

namespace {

constexpr const char* kLogStem = "modelfetch.jsonl";
constexpr int kDefaultRetentionDays = 7;
constexpr int kMaxRetentionDays = 364;
constexpr const char* kConsolePattern = "[%Y-%m-%d %T.%e] [%l] %v";
constexpr const char* kJsonLinePattern = R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"msg":"%v"})";

const std::array<std::pair<const char*, spdlog::level::level_enum>, 9> kLevelNames = {{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"fatal", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

std::string dated_suffix(std::chrono::system_clock::time_point tp) {
    const auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d");
    return oss.str();
}

// Parses the YYYY-MM-DD suffix of a rotated log file; false for anything else.
bool parse_suffix(const std::string& suffix, std::chrono::system_clock::time_point& out) {
    std::tm tm{};
    std::istringstream iss(suffix);
    iss >> std::get_time(&tm, "%Y-%m-%d");
    if (iss.fail() || iss.peek() != std::char_traits<char>::eof()) return false;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return false;
    out = std::chrono::system_clock::from_time_t(t);
    return true;
}

void install(std::vector<spdlog::sink_ptr> sinks, const std::string& level, const std::string& pattern) {
    auto logger = std::make_shared<spdlog::logger>("modelfetch", sinks.begin(), sinks.end());
    if (!pattern.empty()) logger->set_pattern(pattern);
    logger->set_level(parse_level(level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower(level_text.size(), '\0');
    std::transform(level_text.begin(), level_text.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& [name, level] : kLevelNames) {
        if (lower == name) return level;
    }
    return spdlog::level::info;
}

std::string get_log_dir() {
    const std::string home = env_or("HOME", "/tmp");
    return env_or("MODELFETCH_LOG_DIR", (fs::path(home) / ".modelfetch" / "logs").string());
}

std::string get_log_file_path() {
    return (fs::path(get_log_dir()) / (std::string(kLogStem) + "." + dated_suffix(std::chrono::system_clock::now())))
        .string();
}

int get_retention_days() {
    const std::string raw = env_or("MODELFETCH_LOG_RETENTION_DAYS", "");
    if (raw.empty()) return kDefaultRetentionDays;
    try {
        size_t consumed = 0;
        const int days = std::stoi(raw, &consumed);
        if (consumed == raw.size() && days >= 1 && days <= kMaxRetentionDays) return days;
    } catch (const std::exception&) {
    }
    spdlog::warn("Logger: ignoring MODELFETCH_LOG_RETENTION_DAYS={}", raw);
    return kDefaultRetentionDays;
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    std::error_code ec;
    if (!fs::is_directory(log_dir, ec)) return;

    const auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days);
    const std::string prefix = std::string(kLogStem) + ".";
    size_t removed = 0;

    for (fs::directory_iterator it(log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string filename = it->path().filename().string();
        if (filename.compare(0, prefix.size(), prefix) != 0) continue;

        std::chrono::system_clock::time_point day;
        if (!parse_suffix(filename.substr(prefix.size()), day)) continue;
        // A dated file covers the whole day; keep it until that day ends before the cutoff.
        if (day + std::chrono::hours(24) <= cutoff && fs::remove(it->path(), ec)) ++removed;
    }
    if (removed > 0) {
        spdlog::debug("Logger: removed {} rotated log files from {}", removed, log_dir);
    }
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> additional_sinks) {
    if (additional_sinks.empty()) {
        const fs::path target = file_path.empty() ? fs::path(get_log_file_path()) : fs::path(file_path);
        if (target.has_parent_path()) fs::create_directories(target.parent_path());
        additional_sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(target.string(), false));
    }
    install(std::move(additional_sinks), level, pattern);
}

void init_from_env() {
    const std::string log_dir = get_log_dir();
    fs::create_directories(log_dir);
    cleanup_old_logs(log_dir, get_retention_days());
    const std::string log_path = get_log_file_path();

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(kConsolePattern);
    auto json_file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
    json_file->set_pattern(kJsonLinePattern);

    install({console, json_file}, env_or("MODELFETCH_LOG_LEVEL", "info"), "");
    spdlog::info("Logger: writing {}", log_path);
}

}  // namespace modelfetch::logger
