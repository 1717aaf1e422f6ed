#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace modelfetch {

enum class EvictionStrategy {
    kLeastRecentlyUsed,
    kAge,
};

struct DownloadConfig {
    size_t max_concurrency{3};
    size_t max_bytes_per_sec{0};          // 0 = unlimited
    size_t buffer_size{64 * 1024};        // sink high-water mark
    uint64_t memory_threshold_bytes{512ull * 1024 * 1024};
    bool adaptive_throttling{true};
    bool allow_insecure_transport{false};
    std::vector<std::string> origin_allowlist;  // empty = any https origin
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds read_timeout{std::chrono::seconds(60)};
};

struct CacheConfig {
    std::string cache_dir;
    uint64_t max_bytes{10ull * 1024 * 1024 * 1024};
    EvictionStrategy eviction{EvictionStrategy::kLeastRecentlyUsed};
    std::chrono::hours ttl{24 * 30};
};

struct QuarantineConfig {
    std::string quarantine_dir;
    int retention_days{30};
};

struct RecoveryConfig {
    std::vector<std::string> probe_endpoints{"https://huggingface.co", "https://github.com", "https://1.1.1.1"};
    std::chrono::milliseconds probe_timeout{5000};
    std::chrono::milliseconds connectivity_ttl{std::chrono::seconds(60)};
    std::chrono::milliseconds disk_info_ttl{std::chrono::seconds(30)};
    std::chrono::milliseconds retry_delay{1000};
    int max_retry_attempts{3};
    size_t history_limit{1000};
};

struct PipelineConfig {
    DownloadConfig download;
    CacheConfig cache;
    QuarantineConfig quarantine;
    RecoveryConfig recovery;
};

const char* to_string(EvictionStrategy strategy);

PipelineConfig loadPipelineConfig();
// Second element describes where values came from, e.g. "file=... env:MAX_BPS=10 |sources=env,file".
std::pair<PipelineConfig, std::string> loadPipelineConfigWithLog();

}  // namespace modelfetch
