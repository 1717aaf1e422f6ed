#include <gtest/gtest.h>

#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>

#include "models/cache_manager.h"
#include "models/pipeline_error.h"
#include "test_support.h"
#include "utils/sha256.h"

using namespace modelfetch;
using namespace modelfetch::test;

namespace {

ArtifactDescriptor describe(const std::string& name, const std::string& version, const std::string& content) {
    ArtifactDescriptor d;
    d.name = name;
    d.version = version;
    d.url = "https://models.example/" + name + "/" + version;
    d.sha256 = sha256_text(content);
    d.size = content.size();
    d.format = "gguf";
    return d;
}

CacheConfig cacheConfig(const TempDir& dir, uint64_t max_bytes = 1024 * 1024) {
    CacheConfig cfg;
    cfg.cache_dir = dir.str("cache");
    cfg.max_bytes = max_bytes;
    return cfg;
}

std::string stage(const TempDir& dir, const std::string& name, const std::string& content) {
    const auto path = dir.path / "staging" / name;
    writeFile(path, content);
    return path.string();
}

}  // namespace

TEST(CacheManagerTest, MissOnEmptyCache) {
    TempDir dir;
    CacheManager cache(cacheConfig(dir));
    auto result = cache.checkCache(describe("m", "1", "abc"));
    EXPECT_FALSE(result.hit);
    EXPECT_EQ(result.status, CacheStatus::kMissing);
    EXPECT_EQ(cache.getStats().misses, 1u);
}

TEST(CacheManagerTest, StoreMovesFileAndHits) {
    TempDir dir;
    CacheManager cache(cacheConfig(dir));
    const auto content = makeBlob(300);
    const auto d = describe("m", "1", content);
    const auto staged = stage(dir, "m.tmp", content);

    const auto stored = cache.storeModel(d, staged);
    EXPECT_EQ(stored, cache.cachePathFor(d).string());
    EXPECT_FALSE(fs::exists(staged));
    EXPECT_EQ(readFile(stored), content);

    auto hit = cache.checkCache(d);
    EXPECT_TRUE(hit.hit);
    EXPECT_EQ(hit.status, CacheStatus::kValid);
    ASSERT_TRUE(hit.file_path.has_value());
    EXPECT_EQ(*hit.file_path, stored);

    auto entry = cache.entry(d);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->load_count, 1u);
    EXPECT_EQ(entry->size, 300u);

    cache.checkCache(describe("other", "1", "x"));
    auto stats = cache.getStats();
    EXPECT_EQ(stats.total_models, 1u);
    EXPECT_EQ(stats.total_size, 300u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_DOUBLE_EQ(stats.hit_rate, 0.5);
    EXPECT_EQ(stats.eviction_strategy, "lru");
}

TEST(CacheManagerTest, DifferentChecksumIsInvalid) {
    TempDir dir;
    CacheManager cache(cacheConfig(dir));
    const auto d = describe("m", "1", "content");
    cache.storeModel(d, stage(dir, "m", "content"));

    auto changed = d;
    changed.sha256 = sha256_text("other content");
    auto result = cache.checkCache(changed);
    EXPECT_FALSE(result.hit);
    EXPECT_EQ(result.status, CacheStatus::kInvalid);
}

TEST(CacheManagerTest, MissingFileIsCorruptedAndDropped) {
    TempDir dir;
    CacheManager cache(cacheConfig(dir));
    const auto d = describe("m", "1", "content");
    const auto stored = cache.storeModel(d, stage(dir, "m", "content"));
    fs::remove(stored);

    auto result = cache.checkCache(d);
    EXPECT_FALSE(result.hit);
    EXPECT_EQ(result.status, CacheStatus::kCorrupted);
    EXPECT_FALSE(cache.entry(d).has_value());
}

TEST(CacheManagerTest, LruEvictsLeastRecentlyUsed) {
    TempDir dir;
    CacheManager cache(cacheConfig(dir, 250));
    const auto a = describe("a", "1", makeBlob(100, 1));
    const auto b = describe("b", "1", makeBlob(100, 2));
    const auto c = describe("c", "1", makeBlob(100, 3));

    cache.storeModel(a, stage(dir, "a", makeBlob(100, 1)));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    cache.storeModel(b, stage(dir, "b", makeBlob(100, 2)));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_TRUE(cache.checkCache(a).hit);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    cache.storeModel(c, stage(dir, "c", makeBlob(100, 3)));

    EXPECT_TRUE(cache.entry(a).has_value());
    EXPECT_FALSE(cache.entry(b).has_value());
    EXPECT_TRUE(cache.entry(c).has_value());
    EXPECT_FALSE(fs::exists(cache.cachePathFor(b)));
    EXPECT_LE(cache.getStats().total_size, 250u);
}

TEST(CacheManagerTest, NewestEntrySurvivesEvenWhenOverLimit) {
    TempDir dir;
    CacheManager cache(cacheConfig(dir, 50));
    const auto big = describe("big", "1", makeBlob(100));
    const auto stored = cache.storeModel(big, stage(dir, "big", makeBlob(100)));
    EXPECT_TRUE(fs::exists(stored));
    EXPECT_TRUE(cache.checkCache(big).hit);
}

TEST(CacheManagerTest, AgeStrategyReportsOutdatedEntries) {
    TempDir dir;
    auto cfg = cacheConfig(dir);
    cfg.eviction = EvictionStrategy::kAge;
    cfg.ttl = std::chrono::hours(24);

    const auto content = makeBlob(64);
    const auto d = describe("old", "1", content);
    const auto fresh = describe("fresh", "1", "fresh");
    {
        CacheManager cache(cfg);
        cache.storeModel(d, stage(dir, "old", content));
        cache.storeModel(fresh, stage(dir, "fresh", "fresh"));
    }

    // Backdate one entry in the persisted index.
    const auto index_path = fs::path(cfg.cache_dir) / "cache_index.json";
    auto index = nlohmann::json::parse(readFile(index_path));
    const auto two_days_ago = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  (std::chrono::system_clock::now() - std::chrono::hours(48)).time_since_epoch())
                                  .count();
    for (auto& e : index["entries"]) {
        if (e["name"] == "old") e["stored_at_ms"] = two_days_ago;
    }
    writeFile(index_path, index.dump());

    CacheManager cache(cfg);
    auto result = cache.checkCache(d);
    EXPECT_FALSE(result.hit);
    EXPECT_EQ(result.status, CacheStatus::kOutdated);
    EXPECT_FALSE(fs::exists(cache.cachePathFor(d)));
    EXPECT_TRUE(cache.checkCache(fresh).hit);
    EXPECT_EQ(cache.cleanup(), 0u);
}

TEST(CacheManagerTest, IndexPersistsAcrossInstances) {
    TempDir dir;
    const auto content = makeBlob(128);
    const auto d = describe("m", "2", content);
    {
        CacheManager cache(cacheConfig(dir));
        cache.storeModel(d, stage(dir, "m", content));
    }
    CacheManager reopened(cacheConfig(dir));
    EXPECT_EQ(reopened.getStats().total_models, 1u);
    EXPECT_TRUE(reopened.checkCache(d).hit);
}

TEST(CacheManagerTest, RemoveModelWithoutVersionRemovesAll) {
    TempDir dir;
    CacheManager cache(cacheConfig(dir));
    const auto v1 = describe("m", "1", "one");
    const auto v2 = describe("m", "2", "two");
    const auto other = describe("n", "1", "three");
    cache.storeModel(v1, stage(dir, "1", "one"));
    cache.storeModel(v2, stage(dir, "2", "two"));
    cache.storeModel(other, stage(dir, "3", "three"));

    EXPECT_EQ(cache.removeModel("m", std::string("2")), 1u);
    EXPECT_TRUE(cache.entry(v1).has_value());
    EXPECT_EQ(cache.removeModel("m"), 1u);
    EXPECT_FALSE(cache.entry(v1).has_value());
    EXPECT_TRUE(cache.entry(other).has_value());

    cache.clear();
    EXPECT_EQ(cache.getStats().total_models, 0u);
    EXPECT_FALSE(fs::exists(cache.cachePathFor(other)));
}

TEST(CacheManagerTest, ConcurrentClaimsShareOneTransfer) {
    TempDir dir;
    CacheManager cache(cacheConfig(dir));
    const auto d = describe("m", "1", "x");

    auto first = cache.claimTransfer(d);
    auto second = cache.claimTransfer(d);
    EXPECT_TRUE(first.owner);
    EXPECT_FALSE(second.owner);
    EXPECT_TRUE(cache.isInFlight(d));

    std::thread waiter([&]() { EXPECT_EQ(second.result.get(), "/cache/m-1.gguf"); });
    cache.completeTransfer(d, "/cache/m-1.gguf");
    waiter.join();
    EXPECT_FALSE(cache.isInFlight(d));

    // A new claim after completion owns a fresh transfer.
    EXPECT_TRUE(cache.claimTransfer(d).owner);
}

TEST(CacheManagerTest, FailedTransferPropagatesToWaiters) {
    TempDir dir;
    CacheManager cache(cacheConfig(dir));
    const auto d = describe("m", "1", "x");

    auto owner = cache.claimTransfer(d);
    auto waiter = cache.claimTransfer(d);
    ASSERT_TRUE(owner.owner);
    cache.failTransfer(d, std::make_exception_ptr(NetworkError("connection reset")));
    EXPECT_THROW(waiter.result.get(), NetworkError);
    EXPECT_FALSE(cache.isInFlight(d));
}
