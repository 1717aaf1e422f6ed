#include "utils/config.h"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/allowlist.h"
#include "utils/file_lock.h"
#include "utils/json_utils.h"

namespace modelfetch {

namespace {

namespace fs = std::filesystem;

constexpr const char* kDataDir = ".modelfetch";

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) return std::nullopt;
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

fs::path dataRoot() {
    fs::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) home = fs::temp_directory_path();
    return home / kDataDir;
}

std::optional<long long> parseInteger(const std::string& text) {
    try {
        size_t pos = 0;
        long long v = std::stoll(text, &pos);
        if (pos != text.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parseBool(const std::string& text) {
    const auto lower = toLowerAscii(trimAscii(text));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

std::optional<EvictionStrategy> parseEviction(const std::string& text) {
    const auto lower = toLowerAscii(trimAscii(text));
    if (lower == "lru") return EvictionStrategy::kLeastRecentlyUsed;
    if (lower == "age" || lower == "ttl") return EvictionStrategy::kAge;
    return std::nullopt;
}

std::vector<std::string> stringList(const nlohmann::json& value) {
    if (value.is_string()) return splitCsv(value.get<std::string>());
    std::vector<std::string> out;
    if (!value.is_array()) return out;
    for (const auto& item : value) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

void applyJson(const nlohmann::json& j, PipelineConfig& cfg) {
    auto& dl = cfg.download;
    dl.max_concurrency = get_or<size_t>(j, "concurrency", dl.max_concurrency);
    dl.max_bytes_per_sec = get_or<size_t>(j, "max_bps", dl.max_bytes_per_sec);
    dl.buffer_size = get_or<size_t>(j, "buffer_size", dl.buffer_size);
    dl.memory_threshold_bytes = get_or<uint64_t>(j, "memory_threshold_bytes", dl.memory_threshold_bytes);
    dl.adaptive_throttling = get_or<bool>(j, "adaptive_throttling", dl.adaptive_throttling);
    dl.allow_insecure_transport = get_or<bool>(j, "allow_insecure_transport", dl.allow_insecure_transport);
    if (j.contains("origin_allowlist")) dl.origin_allowlist = stringList(j["origin_allowlist"]);

    auto& cache = cfg.cache;
    cache.cache_dir = get_or<std::string>(j, "cache_dir", cache.cache_dir);
    cache.max_bytes = get_or<uint64_t>(j, "cache_max_bytes", cache.max_bytes);
    if (auto e = parseEviction(get_or<std::string>(j, "eviction", ""))) cache.eviction = *e;
    cache.ttl = std::chrono::hours(get_or<long long>(j, "cache_ttl_hours", cache.ttl.count()));

    cfg.quarantine.quarantine_dir = get_or<std::string>(j, "quarantine_dir", cfg.quarantine.quarantine_dir);
    cfg.quarantine.retention_days = get_or<int>(j, "quarantine_retention_days", cfg.quarantine.retention_days);

    auto& rec = cfg.recovery;
    if (j.contains("probe_endpoints")) rec.probe_endpoints = stringList(j["probe_endpoints"]);
    rec.probe_timeout = std::chrono::milliseconds(get_or<long long>(j, "probe_timeout_ms", rec.probe_timeout.count()));
    rec.retry_delay = std::chrono::milliseconds(get_or<long long>(j, "retry_delay_ms", rec.retry_delay.count()));
    rec.max_retry_attempts = get_or<int>(j, "max_retry_attempts", rec.max_retry_attempts);
}

}  // namespace

const char* to_string(EvictionStrategy strategy) {
    switch (strategy) {
        case EvictionStrategy::kLeastRecentlyUsed:
            return "lru";
        case EvictionStrategy::kAge:
            return "age";
    }
    return "lru";
}

PipelineConfig loadPipelineConfig() {
    return loadPipelineConfigWithLog().first;
}

std::pair<PipelineConfig, std::string> loadPipelineConfigWithLog() {
    PipelineConfig cfg;
    cfg.cache.cache_dir = (dataRoot() / "models").string();
    cfg.quarantine.quarantine_dir = (dataRoot() / "quarantine").string();

    std::ostringstream log;
    bool used_file = false;
    bool used_env = false;

    auto load_from_file = [&](const fs::path& path) {
        std::error_code ec;
        if (!fs::exists(path, ec)) return false;
        FileLock lock(path.string() + ".lock", std::chrono::milliseconds(500));
        std::string err;
        auto j = read_json_file(path, &err);
        if (!j || !j->is_object()) {
            spdlog::warn("Config: ignoring {}: {}", path.string(), err.empty() ? "not an object" : err);
            return false;
        }
        applyJson(*j, cfg);
        log << "file=" << path << " ";
        return true;
    };

    if (auto env = getEnvValue("MODELFETCH_CONFIG")) {
        used_file = load_from_file(*env);
    } else {
        used_file = load_from_file(dataRoot() / "config.json");
    }

    auto env_int = [&](const char* name, const char* label, auto&& apply) {
        auto env = getEnvValue(name);
        if (!env) return;
        auto v = parseInteger(*env);
        if (!v) {
            spdlog::warn("Config: {} is not an integer: '{}'", name, *env);
            return;
        }
        if (apply(*v)) {
            log << "env:" << label << "=" << *v << " ";
            used_env = true;
        }
    };

    if (auto env = getEnvValue("MODELFETCH_CACHE_DIR"); env && !env->empty()) {
        cfg.cache.cache_dir = *env;
        log << "env:CACHE_DIR=" << *env << " ";
        used_env = true;
    }
    env_int("MODELFETCH_CACHE_MAX_BYTES", "CACHE_MAX_BYTES", [&](long long v) {
        if (v <= 0) return false;
        cfg.cache.max_bytes = static_cast<uint64_t>(v);
        return true;
    });
    if (auto env = getEnvValue("MODELFETCH_EVICTION")) {
        if (auto e = parseEviction(*env)) {
            cfg.cache.eviction = *e;
            log << "env:EVICTION=" << to_string(*e) << " ";
            used_env = true;
        }
    }
    env_int("MODELFETCH_CACHE_TTL_HOURS", "CACHE_TTL_HOURS", [&](long long v) {
        if (v <= 0) return false;
        cfg.cache.ttl = std::chrono::hours(v);
        return true;
    });
    env_int("MODELFETCH_DL_CONCURRENCY", "CONCURRENCY", [&](long long v) {
        if (v <= 0 || v >= 64) return false;
        cfg.download.max_concurrency = static_cast<size_t>(v);
        return true;
    });
    env_int("MODELFETCH_DL_MAX_BPS", "MAX_BPS", [&](long long v) {
        if (v < 0) return false;
        cfg.download.max_bytes_per_sec = static_cast<size_t>(v);
        return true;
    });
    env_int("MODELFETCH_DL_BUFFER", "BUFFER", [&](long long v) {
        if (v <= 0 || v > (64 << 20)) return false;
        cfg.download.buffer_size = static_cast<size_t>(v);
        return true;
    });
    env_int("MODELFETCH_MEMORY_THRESHOLD", "MEMORY_THRESHOLD", [&](long long v) {
        if (v <= 0) return false;
        cfg.download.memory_threshold_bytes = static_cast<uint64_t>(v);
        return true;
    });
    if (auto env = getEnvValue("MODELFETCH_ALLOW_INSECURE")) {
        if (auto b = parseBool(*env)) {
            cfg.download.allow_insecure_transport = *b;
            log << "env:ALLOW_INSECURE=" << (*b ? "true" : "false") << " ";
            used_env = true;
        }
    }
    if (auto env = getEnvValue("MODELFETCH_ORIGIN_ALLOWLIST")) {
        cfg.download.origin_allowlist = splitCsv(*env);
        log << "env:ORIGIN_ALLOWLIST=" << cfg.download.origin_allowlist.size() << " ";
        used_env = true;
    }
    if (auto env = getEnvValue("MODELFETCH_QUARANTINE_DIR"); env && !env->empty()) {
        cfg.quarantine.quarantine_dir = *env;
        log << "env:QUARANTINE_DIR=" << *env << " ";
        used_env = true;
    }
    env_int("MODELFETCH_QUARANTINE_RETENTION_DAYS", "QUARANTINE_RETENTION_DAYS", [&](long long v) {
        if (v <= 0 || v > 3650) return false;
        cfg.quarantine.retention_days = static_cast<int>(v);
        return true;
    });
    if (auto env = getEnvValue("MODELFETCH_PROBE_ENDPOINTS")) {
        auto endpoints = splitCsv(*env);
        if (!endpoints.empty()) {
            cfg.recovery.probe_endpoints = std::move(endpoints);
            log << "env:PROBE_ENDPOINTS=" << cfg.recovery.probe_endpoints.size() << " ";
            used_env = true;
        }
    }
    env_int("MODELFETCH_PROBE_TIMEOUT_MS", "PROBE_TIMEOUT_MS", [&](long long v) {
        if (v <= 0) return false;
        cfg.recovery.probe_timeout = std::chrono::milliseconds(v);
        return true;
    });
    env_int("MODELFETCH_RETRY_DELAY_MS", "RETRY_DELAY_MS", [&](long long v) {
        if (v < 0) return false;
        cfg.recovery.retry_delay = std::chrono::milliseconds(v);
        return true;
    });
    env_int("MODELFETCH_MAX_RETRIES", "MAX_RETRIES", [&](long long v) {
        if (v < 0 || v > 100) return false;
        cfg.recovery.max_retry_attempts = static_cast<int>(v);
        return true;
    });

    if (cfg.download.max_concurrency == 0) cfg.download.max_concurrency = 1;
    if (cfg.download.buffer_size == 0) cfg.download.buffer_size = 64 * 1024;

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

}  // namespace modelfetch
