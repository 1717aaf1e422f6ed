#include "models/cache_manager.h"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "models/pipeline_error.h"
#include "utils/allowlist.h"
#include "utils/file_lock.h"
#include "utils/json_utils.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace modelfetch {

namespace {

constexpr const char* kIndexFile = "cache_index.json";

int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

json entryToJson(const CacheEntry& e) {
    const auto& d = e.descriptor;
    return json{{"name", d.name},
                {"version", d.version},
                {"url", d.url},
                {"sha256", d.sha256},
                {"size", d.size},
                {"format", d.format},
                {"dimensions", d.dimensions},
                {"file_path", e.file_path},
                {"stored_size", e.size},
                {"stored_at_ms", toEpochMillis(e.stored_at)},
                {"last_access_ms", toEpochMillis(e.last_access)},
                {"load_count", e.load_count}};
}

std::optional<CacheEntry> entryFromJson(const json& j) {
    CacheEntry e;
    auto& d = e.descriptor;
    d.name = get_or<std::string>(j, "name", "");
    d.version = get_or<std::string>(j, "version", "");
    if (d.name.empty() || d.version.empty()) return std::nullopt;
    d.url = get_or<std::string>(j, "url", "");
    d.sha256 = get_or<std::string>(j, "sha256", "");
    d.size = get_or<uint64_t>(j, "size", 0);
    d.format = get_or<std::string>(j, "format", "");
    d.dimensions = get_or<int>(j, "dimensions", 0);
    e.file_path = get_or<std::string>(j, "file_path", "");
    e.size = get_or<uint64_t>(j, "stored_size", 0);
    e.stored_at = fromEpochMillis(get_or<int64_t>(j, "stored_at_ms", 0));
    e.last_access = fromEpochMillis(get_or<int64_t>(j, "last_access_ms", 0));
    e.load_count = get_or<uint64_t>(j, "load_count", 0);
    return e;
}

bool samePath(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    return fs::weakly_canonical(a, ec) == fs::weakly_canonical(b, ec);
}

}  // namespace

const char* to_string(CacheStatus status) {
    switch (status) {
        case CacheStatus::kMissing:
            return "missing";
        case CacheStatus::kValid:
            return "valid";
        case CacheStatus::kInvalid:
            return "invalid";
        case CacheStatus::kCorrupted:
            return "corrupted";
        case CacheStatus::kOutdated:
            return "outdated";
    }
    return "missing";
}

CacheManager::CacheManager(CacheConfig config) : config_(std::move(config)) {
    std::error_code ec;
    fs::create_directories(config_.cache_dir, ec);
    if (ec) {
        spdlog::warn("CacheManager: cannot create cache dir {}: {}", config_.cache_dir, ec.message());
    }
    loadIndex();
}

fs::path CacheManager::cachePathFor(const ArtifactDescriptor& descriptor) const {
    return fs::path(config_.cache_dir) / descriptor.fileName();
}

fs::path CacheManager::indexPath() const {
    return fs::path(config_.cache_dir) / kIndexFile;
}

CacheHitResult CacheManager::checkCache(const ArtifactDescriptor& descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheHitResult result;

    auto it = entries_.find(descriptor.key());
    if (it == entries_.end()) {
        ++misses_;
        result.reason = "not cached";
        return result;
    }

    auto& entry = it->second;
    if (toLowerAscii(entry.descriptor.sha256) != toLowerAscii(descriptor.sha256)) {
        ++misses_;
        result.status = CacheStatus::kInvalid;
        result.reason = "cached checksum differs from requested descriptor";
        return result;
    }

    std::error_code ec;
    const auto on_disk = fs::file_size(entry.file_path, ec);
    if (ec || on_disk != entry.size) {
        ++misses_;
        result.status = CacheStatus::kCorrupted;
        result.reason = ec ? "cached file missing" : "cached file size changed";
        spdlog::warn("CacheManager: dropping {}: {}", descriptor.key(), result.reason);
        removeEntryLocked(it);
        persistIndexLocked();
        return result;
    }

    const auto now = std::chrono::system_clock::now();
    if (config_.eviction == EvictionStrategy::kAge && now - entry.stored_at > config_.ttl) {
        ++misses_;
        result.status = CacheStatus::kOutdated;
        result.reason = "cached entry older than ttl";
        removeEntryLocked(it);
        persistIndexLocked();
        return result;
    }

    entry.last_access = now;
    ++entry.load_count;
    ++hits_;
    result.hit = true;
    result.status = CacheStatus::kValid;
    result.file_path = entry.file_path;
    persistIndexLocked();
    return result;
}

std::string CacheManager::storeModel(const ArtifactDescriptor& descriptor, const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    const fs::path source(file_path);
    const fs::path target = cachePathFor(descriptor);

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        throw FileSystemError("cannot store missing file: " + file_path);
    }

    if (!samePath(source, target)) {
        fs::create_directories(target.parent_path(), ec);
        fs::rename(source, target, ec);
        if (ec) {
            std::error_code copy_ec;
            fs::copy_file(source, target, fs::copy_options::overwrite_existing, copy_ec);
            if (copy_ec) {
                throw FileSystemError("cannot place " + file_path + " in cache", copy_ec.message());
            }
            fs::remove(source, copy_ec);
        }
    }

    CacheEntry entry;
    entry.descriptor = descriptor;
    entry.file_path = target.string();
    entry.size = fs::file_size(target, ec);
    if (ec) {
        throw FileSystemError("cannot stat cached file " + entry.file_path, ec.message());
    }
    entry.stored_at = std::chrono::system_clock::now();
    entry.last_access = entry.stored_at;
    entries_[descriptor.key()] = entry;

    const size_t evicted = evictLocked(descriptor.key());
    if (evicted > 0) {
        spdlog::info("CacheManager: evicted {} entries after storing {}", evicted, descriptor.key());
    }
    persistIndexLocked();
    spdlog::info("CacheManager: stored {} ({} bytes)", descriptor.key(), entry.size);
    return entry.file_path;
}

size_t CacheManager::removeModel(const std::string& name, const std::optional<std::string>& version) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& d = it->second.descriptor;
        if (d.name == name && (!version || d.version == *version)) {
            auto next = std::next(it);
            removeEntryLocked(it);
            it = next;
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) persistIndexLocked();
    return removed;
}

CacheStats CacheManager::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.total_models = entries_.size();
    stats.total_size = totalSizeLocked();
    stats.hits = hits_;
    stats.misses = misses_;
    const uint64_t lookups = hits_ + misses_;
    stats.hit_rate = lookups == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(lookups);
    stats.eviction_strategy = to_string(config_.eviction);
    return stats;
}

size_t CacheManager::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t evicted = evictLocked(std::nullopt);
    if (evicted > 0) persistIndexLocked();
    return evicted;
}

void CacheManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!entries_.empty()) removeEntryLocked(entries_.begin());
    hits_ = 0;
    misses_ = 0;
    persistIndexLocked();
}

std::optional<CacheEntry> CacheManager::entry(const ArtifactDescriptor& descriptor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = entries_.find(descriptor.key()); it != entries_.end()) return it->second;
    return std::nullopt;
}

std::vector<CacheEntry> CacheManager::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CacheEntry> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.second);
    return out;
}

InFlightTicket CacheManager::claimTransfer(const ArtifactDescriptor& descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = descriptor.key();
    if (auto it = in_flight_.find(key); it != in_flight_.end()) {
        return InFlightTicket{false, it->second};
    }
    std::promise<std::string> promise;
    auto future = promise.get_future().share();
    in_flight_promises_.emplace(key, std::move(promise));
    in_flight_.emplace(key, future);
    return InFlightTicket{true, future};
}

void CacheManager::completeTransfer(const ArtifactDescriptor& descriptor, const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = descriptor.key();
    if (auto it = in_flight_promises_.find(key); it != in_flight_promises_.end()) {
        it->second.set_value(file_path);
        in_flight_promises_.erase(it);
    }
    in_flight_.erase(key);
}

void CacheManager::failTransfer(const ArtifactDescriptor& descriptor, std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = descriptor.key();
    if (auto it = in_flight_promises_.find(key); it != in_flight_promises_.end()) {
        it->second.set_exception(error);
        in_flight_promises_.erase(it);
    }
    in_flight_.erase(key);
}

bool CacheManager::isInFlight(const ArtifactDescriptor& descriptor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(descriptor.key()) > 0;
}

size_t CacheManager::evictLocked(const std::optional<std::string>& keep_key) {
    size_t evicted = 0;
    if (config_.eviction == EvictionStrategy::kAge) {
        const auto cutoff = std::chrono::system_clock::now() - config_.ttl;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.stored_at < cutoff && (!keep_key || it->first != *keep_key)) {
                auto next = std::next(it);
                removeEntryLocked(it);
                it = next;
                ++evicted;
            } else {
                ++it;
            }
        }
        return evicted;
    }

    while (totalSizeLocked() > config_.max_bytes) {
        auto victim = entries_.end();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (keep_key && it->first == *keep_key) continue;
            if (victim == entries_.end() || it->second.last_access < victim->second.last_access) victim = it;
        }
        if (victim == entries_.end()) break;
        spdlog::debug("CacheManager: LRU evict {}", victim->first);
        removeEntryLocked(victim);
        ++evicted;
    }
    return evicted;
}

void CacheManager::removeEntryLocked(std::map<std::string, CacheEntry>::iterator it) {
    std::error_code ec;
    fs::remove(it->second.file_path, ec);
    if (ec) {
        spdlog::warn("CacheManager: failed to remove {}: {}", it->second.file_path, ec.message());
    }
    entries_.erase(it);
}

uint64_t CacheManager::totalSizeLocked() const {
    uint64_t total = 0;
    for (const auto& kv : entries_) total += kv.second.size;
    return total;
}

void CacheManager::loadIndex() {
    std::string err;
    auto j = read_json_file(indexPath(), &err);
    if (!j) return;
    if (!j->is_object() || !j->contains("entries") || !(*j)["entries"].is_array()) {
        spdlog::warn("CacheManager: ignoring malformed {}", indexPath().string());
        return;
    }
    size_t dropped = 0;
    for (const auto& item : (*j)["entries"]) {
        auto entry = entryFromJson(item);
        if (!entry) continue;
        std::error_code ec;
        if (!fs::is_regular_file(entry->file_path, ec)) {
            ++dropped;
            continue;
        }
        entries_[entry->descriptor.key()] = *entry;
    }
    if (dropped > 0) {
        spdlog::info("CacheManager: dropped {} index entries with missing files", dropped);
        persistIndexLocked();
    }
}

void CacheManager::persistIndexLocked() {
    json list = json::array();
    for (const auto& kv : entries_) list.push_back(entryToJson(kv.second));
    FileLock lock(indexPath().string() + ".lock", std::chrono::seconds(1));
    std::string err;
    if (!write_json_atomic(indexPath(), json{{"entries", list}}, &err)) {
        spdlog::warn("CacheManager: failed to write cache index: {}", err);
    }
}

}  // namespace modelfetch
