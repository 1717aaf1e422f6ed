#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "models/artifact_descriptor.h"
#include "utils/config.h"

namespace modelfetch {

enum class CacheStatus {
    kMissing,
    kValid,
    kInvalid,
    kCorrupted,
    kOutdated,
};

const char* to_string(CacheStatus status);

struct CacheEntry {
    ArtifactDescriptor descriptor;
    std::string file_path;
    uint64_t size{0};
    std::chrono::system_clock::time_point stored_at;
    std::chrono::system_clock::time_point last_access;
    uint64_t load_count{0};
};

struct CacheHitResult {
    bool hit{false};
    CacheStatus status{CacheStatus::kMissing};
    std::optional<std::string> file_path;
    std::string reason;
};

struct CacheStats {
    size_t total_models{0};
    uint64_t total_size{0};
    double hit_rate{0.0};
    uint64_t hits{0};
    uint64_t misses{0};
    std::string eviction_strategy;
};

// Result of claiming a descriptor for download. The owner performs the
// transfer and must call completeTransfer or failTransfer; other callers
// wait on result.
struct InFlightTicket {
    bool owner{false};
    std::shared_future<std::string> result;
};

// Index of verified artifacts in the cache directory, persisted as
// <cache_dir>/cache_index.json. All operations are serialized.
class CacheManager {
public:
    explicit CacheManager(CacheConfig config);

    CacheHitResult checkCache(const ArtifactDescriptor& descriptor);

    // file_path must already have passed verification. The file is moved to
    // <cache_dir>/<name>-<version>.<format> when stored elsewhere. Returns the
    // cached path. Throws FileSystemError when the file cannot be placed.
    std::string storeModel(const ArtifactDescriptor& descriptor, const std::string& file_path);

    // Without a version every version of name is removed. Returns the count removed.
    size_t removeModel(const std::string& name, const std::optional<std::string>& version = std::nullopt);

    CacheStats getStats() const;

    // Runs the configured eviction strategy. Returns the count evicted.
    size_t cleanup();

    // Removes every entry and file.
    void clear();

    std::optional<CacheEntry> entry(const ArtifactDescriptor& descriptor) const;
    std::vector<CacheEntry> entries() const;

    InFlightTicket claimTransfer(const ArtifactDescriptor& descriptor);
    void completeTransfer(const ArtifactDescriptor& descriptor, const std::string& file_path);
    void failTransfer(const ArtifactDescriptor& descriptor, std::exception_ptr error);
    bool isInFlight(const ArtifactDescriptor& descriptor) const;

    const CacheConfig& config() const { return config_; }
    std::filesystem::path cachePathFor(const ArtifactDescriptor& descriptor) const;

private:
    size_t evictLocked(const std::optional<std::string>& keep_key);
    void removeEntryLocked(std::map<std::string, CacheEntry>::iterator it);
    uint64_t totalSizeLocked() const;
    void loadIndex();
    void persistIndexLocked();
    std::filesystem::path indexPath() const;

    CacheConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, CacheEntry> entries_;
    std::unordered_map<std::string, std::promise<std::string>> in_flight_promises_;
    std::unordered_map<std::string, std::shared_future<std::string>> in_flight_;
    uint64_t hits_{0};
    uint64_t misses_{0};
};

}  // namespace modelfetch
