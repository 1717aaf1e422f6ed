#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <filesystem>

#include "test_support.h"
#include "utils/config.h"

using namespace modelfetch;
using modelfetch::test::EnvGuard;
using modelfetch::test::TempDir;
namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kConfigEnv = {
    "MODELFETCH_CONFIG",           "MODELFETCH_CACHE_DIR",      "MODELFETCH_CACHE_MAX_BYTES",
    "MODELFETCH_EVICTION",         "MODELFETCH_CACHE_TTL_HOURS", "MODELFETCH_DL_CONCURRENCY",
    "MODELFETCH_DL_MAX_BPS",       "MODELFETCH_DL_BUFFER",      "MODELFETCH_MEMORY_THRESHOLD",
    "MODELFETCH_ALLOW_INSECURE",   "MODELFETCH_ORIGIN_ALLOWLIST", "MODELFETCH_QUARANTINE_DIR",
    "MODELFETCH_QUARANTINE_RETENTION_DAYS", "MODELFETCH_PROBE_ENDPOINTS", "MODELFETCH_PROBE_TIMEOUT_MS",
    "MODELFETCH_RETRY_DELAY_MS",   "MODELFETCH_MAX_RETRIES",    "HOME"};

void clearConfigEnv(const TempDir& home) {
    for (const auto& key : kConfigEnv) unsetenv(key.c_str());
    setenv("HOME", home.path.c_str(), 1);
}

}  // namespace

TEST(UtilsConfigTest, DefaultsLiveUnderHome) {
    EnvGuard guard(kConfigEnv);
    TempDir home("cfg-home");
    clearConfigEnv(home);

    auto info = loadPipelineConfigWithLog();
    const auto& cfg = info.first;

    EXPECT_EQ(cfg.cache.cache_dir, (home.path / ".modelfetch" / "models").string());
    EXPECT_EQ(cfg.quarantine.quarantine_dir, (home.path / ".modelfetch" / "quarantine").string());
    EXPECT_EQ(cfg.download.max_concurrency, 3u);
    EXPECT_EQ(cfg.download.max_bytes_per_sec, 0u);
    EXPECT_FALSE(cfg.download.allow_insecure_transport);
    EXPECT_EQ(cfg.cache.eviction, EvictionStrategy::kLeastRecentlyUsed);
    EXPECT_EQ(cfg.recovery.max_retry_attempts, 3);
    EXPECT_EQ(cfg.recovery.probe_endpoints.size(), 3u);
    EXPECT_NE(info.second.find("sources=default"), std::string::npos);
}

TEST(UtilsConfigTest, LoadsPipelineConfigFromFileWithLock) {
    EnvGuard guard(kConfigEnv);
    TempDir home("cfg-home");
    clearConfigEnv(home);

    fs::path tmp = home.path / "pipeline.json";
    std::ofstream(tmp) << R"({
        "cache_dir": "/tmp/mf-cache",
        "cache_max_bytes": 2048,
        "eviction": "age",
        "cache_ttl_hours": 12,
        "concurrency": 5,
        "max_bps": 1000000,
        "allow_insecure_transport": true,
        "origin_allowlist": ["https://huggingface.co/*", "cdn.example"],
        "probe_endpoints": "https://a.example, https://b.example",
        "retry_delay_ms": 250,
        "max_retry_attempts": 7
    })";
    setenv("MODELFETCH_CONFIG", tmp.string().c_str(), 1);

    auto info = loadPipelineConfigWithLog();
    auto cfg = info.first;

    EXPECT_EQ(cfg.cache.cache_dir, "/tmp/mf-cache");
    EXPECT_EQ(cfg.cache.max_bytes, 2048u);
    EXPECT_EQ(cfg.cache.eviction, EvictionStrategy::kAge);
    EXPECT_EQ(cfg.cache.ttl, std::chrono::hours(12));
    EXPECT_EQ(cfg.download.max_concurrency, 5u);
    EXPECT_EQ(cfg.download.max_bytes_per_sec, 1000000u);
    EXPECT_TRUE(cfg.download.allow_insecure_transport);
    EXPECT_EQ(cfg.download.origin_allowlist.size(), 2u);
    ASSERT_EQ(cfg.recovery.probe_endpoints.size(), 2u);
    EXPECT_EQ(cfg.recovery.probe_endpoints[1], "https://b.example");
    EXPECT_EQ(cfg.recovery.retry_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.recovery.max_retry_attempts, 7);
    EXPECT_NE(info.second.find("file="), std::string::npos);
    EXPECT_NE(info.second.find("sources=file"), std::string::npos);
}

TEST(UtilsConfigTest, EnvOverridesFileValues) {
    EnvGuard guard(kConfigEnv);
    TempDir home("cfg-home");
    clearConfigEnv(home);

    fs::path tmp = home.path / "pipeline.json";
    std::ofstream(tmp) << R"({"cache_dir": "/tmp/from-file", "max_bps": 10})";
    setenv("MODELFETCH_CONFIG", tmp.string().c_str(), 1);
    setenv("MODELFETCH_CACHE_DIR", "/tmp/from-env", 1);
    setenv("MODELFETCH_DL_MAX_BPS", "4096", 1);
    setenv("MODELFETCH_EVICTION", "age", 1);
    setenv("MODELFETCH_ALLOW_INSECURE", "yes", 1);
    setenv("MODELFETCH_PROBE_ENDPOINTS", "https://x.example", 1);

    auto info = loadPipelineConfigWithLog();
    auto cfg = info.first;

    EXPECT_EQ(cfg.cache.cache_dir, "/tmp/from-env");
    EXPECT_EQ(cfg.download.max_bytes_per_sec, 4096u);
    EXPECT_EQ(cfg.cache.eviction, EvictionStrategy::kAge);
    EXPECT_TRUE(cfg.download.allow_insecure_transport);
    ASSERT_EQ(cfg.recovery.probe_endpoints.size(), 1u);
    EXPECT_NE(info.second.find("env:MAX_BPS=4096"), std::string::npos);
    EXPECT_NE(info.second.find("sources=env,file"), std::string::npos);
}

TEST(UtilsConfigTest, InvalidEnvValuesAreIgnored) {
    EnvGuard guard(kConfigEnv);
    TempDir home("cfg-home");
    clearConfigEnv(home);

    setenv("MODELFETCH_DL_CONCURRENCY", "64", 1);
    setenv("MODELFETCH_DL_BUFFER", "lots", 1);
    setenv("MODELFETCH_MAX_RETRIES", "-1", 1);
    setenv("MODELFETCH_EVICTION", "random", 1);

    auto cfg = loadPipelineConfig();
    EXPECT_EQ(cfg.download.max_concurrency, 3u);
    EXPECT_EQ(cfg.download.buffer_size, 64u * 1024);
    EXPECT_EQ(cfg.recovery.max_retry_attempts, 3);
    EXPECT_EQ(cfg.cache.eviction, EvictionStrategy::kLeastRecentlyUsed);
}

TEST(UtilsConfigTest, MalformedFileFallsBackToDefaults) {
    EnvGuard guard(kConfigEnv);
    TempDir home("cfg-home");
    clearConfigEnv(home);

    fs::path tmp = home.path / "broken.json";
    std::ofstream(tmp) << "{ not json";
    setenv("MODELFETCH_CONFIG", tmp.string().c_str(), 1);

    auto info = loadPipelineConfigWithLog();
    EXPECT_EQ(info.first.download.max_concurrency, 3u);
    EXPECT_NE(info.second.find("sources=default"), std::string::npos);
}
