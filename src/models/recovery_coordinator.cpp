#include "models/recovery_coordinator.h"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <thread>
#include <spdlog/spdlog.h>

#include "utils/allowlist.h"

namespace fs = std::filesystem;

namespace modelfetch {

namespace {

constexpr uint64_t kEstimatedAvailableBytes = 5ull * 1024 * 1024 * 1024;
constexpr std::chrono::milliseconds kMaxRetryWait{std::chrono::seconds(30)};
constexpr size_t kRecentErrors = 10;

bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

std::string toBase36(uint64_t value) {
    static const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.push_back(digits[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string recommendedAction(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::kNetwork:
            return "Check the network connection and retry";
        case ErrorCategory::kDiskSpace:
            return "Free disk space in the cache directory and retry";
        case ErrorCategory::kFileSystem:
            return "Check file permissions and paths, then retry";
        case ErrorCategory::kValidation:
            return "The artifact failed integrity checks; use a registered fallback or report the source";
        case ErrorCategory::kConfiguration:
            return "Fix the configuration and retry";
        case ErrorCategory::kSecurity:
            return "Stop and review the source; security failures are never retried";
        case ErrorCategory::kUnknown:
            return "Retry the operation";
    }
    return "Retry the operation";
}

fs::path nearestExistingPath(const fs::path& path) {
    std::error_code ec;
    fs::path p = fs::absolute(path, ec);
    if (ec) p = path;
    while (!fs::exists(p, ec) && p.has_parent_path() && p != p.parent_path()) {
        p = p.parent_path();
    }
    return p;
}

}  // namespace

const char* to_string(ConnectivityStatus status) {
    switch (status) {
        case ConnectivityStatus::kOnline:
            return "online";
        case ConnectivityStatus::kLimited:
            return "limited";
        case ConnectivityStatus::kOffline:
            return "offline";
    }
    return "offline";
}

RecoveryCoordinator::RecoveryCoordinator(RecoveryConfig config,
                                         std::shared_ptr<Transport> transport,
                                         std::string storage_dir)
    : config_(std::move(config)), transport_(std::move(transport)), storage_dir_(std::move(storage_dir)) {
    if (config_.history_limit == 0) config_.history_limit = 1;
}

RecoveryStrategy RecoveryCoordinator::strategyFor(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::kNetwork:
            return RecoveryStrategy::kRetry;
        case ErrorCategory::kDiskSpace:
            return RecoveryStrategy::kManual;
        case ErrorCategory::kFileSystem:
            return RecoveryStrategy::kRetry;
        case ErrorCategory::kValidation:
            return RecoveryStrategy::kFallback;
        case ErrorCategory::kConfiguration:
            return RecoveryStrategy::kManual;
        case ErrorCategory::kSecurity:
            return RecoveryStrategy::kAbort;
        case ErrorCategory::kUnknown:
            return RecoveryStrategy::kRetry;
    }
    return RecoveryStrategy::kRetry;
}

ErrorCategory RecoveryCoordinator::categoryFromMessage(const std::string& message) {
    const auto m = toLowerAscii(message);
    if (containsAny(m, {"enospc", "no space", "disk full", "quota", "insufficient space", "storage"})) {
        return ErrorCategory::kDiskSpace;
    }
    if (containsAny(m, {"certificate", "ssl", "tls", "unauthorized", "security", "forbidden"})) {
        return ErrorCategory::kSecurity;
    }
    if (containsAny(m, {"network", "fetch", "timeout", "timed out", "connection", "dns", "host", "econnrefused",
                        "enotfound", "etimedout"})) {
        return ErrorCategory::kNetwork;
    }
    if (containsAny(m, {"enoent", "eacces", "eperm", "permission", "file", "directory", "path"})) {
        return ErrorCategory::kFileSystem;
    }
    if (containsAny(m, {"checksum", "validation", "verify", "corrupt", "invalid", "mismatch"})) {
        return ErrorCategory::kValidation;
    }
    if (containsAny(m, {"config", "setting", "parameter"})) {
        return ErrorCategory::kConfiguration;
    }
    if (containsAny(m, {"space", "disk"})) {
        return ErrorCategory::kDiskSpace;
    }
    return ErrorCategory::kUnknown;
}

ErrorSeverity RecoveryCoordinator::severityFromMessage(const std::string& message) {
    const auto m = toLowerAscii(message);
    if (containsAny(m, {"critical", "fatal", "corrupt", "security", "unauthorized"})) {
        return ErrorSeverity::kCritical;
    }
    if (containsAny(m, {"fail", "error", "invalid", "timeout", "space", "enotfound", "network", "connection",
                        "mismatch"})) {
        return ErrorSeverity::kHigh;
    }
    if (containsAny(m, {"warning", "deprecated", "retry"})) {
        return ErrorSeverity::kMedium;
    }
    return ErrorSeverity::kLow;
}

std::string RecoveryCoordinator::humanize(const std::string& message) {
    static const std::vector<std::pair<std::string, std::string>> kReplacements = {
        {"ENOENT", "File or directory not found"},
        {"EACCES", "Permission denied"},
        {"ENOSPC", "Not enough disk space"},
        {"ETIMEDOUT", "Operation timed out"},
        {"ECONNREFUSED", "Connection refused"},
        {"ENOTFOUND", "Host not found"},
    };
    for (const auto& [code, text] : kReplacements) {
        if (message.find(code) != std::string::npos) return text + " (" + message + ")";
    }
    return message;
}

ErrorRecord RecoveryCoordinator::makeRecord(ErrorCategory category,
                                            const std::string& message,
                                            const std::string& detail,
                                            const ErrorContext& context) {
    ErrorRecord record;
    record.category = category;
    record.severity = severityFromMessage(message + " " + detail);
    if (category == ErrorCategory::kSecurity) {
        record.severity = ErrorSeverity::kCritical;
    } else if (category == ErrorCategory::kDiskSpace && record.severity < ErrorSeverity::kHigh) {
        record.severity = ErrorSeverity::kHigh;
    }
    record.message = humanize(message);
    record.technical_detail = detail.empty() ? message : message + " | " + detail;
    record.recommended_action = recommendedAction(category);
    record.strategy = strategyFor(category);
    record.timestamp = std::chrono::system_clock::now();
    record.context = context;

    const auto ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp.time_since_epoch()).count());
    std::ostringstream code;
    code << to_string(category) << "_" << std::hex << std::setw(8) << std::setfill('0')
         << (std::hash<std::string>{}(message) & 0xFFFFFFFFu) << "_" << toBase36(ms);
    record.code = code.str();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(record);
        while (history_.size() > config_.history_limit) history_.pop_front();
    }

    spdlog::warn("RecoveryCoordinator: [{}] {} severity={} strategy={}{}", record.code, record.message,
                 to_string(record.severity), to_string(record.strategy),
                 context.artifact_name.empty() ? "" : " artifact=" + context.artifact_name);
    return record;
}

ErrorRecord RecoveryCoordinator::categorize(const std::exception& error, const ErrorContext& context) {
    if (const auto* typed = dynamic_cast<const PipelineError*>(&error)) {
        return makeRecord(typed->category(), typed->what(), typed->detail(), context);
    }
    return makeRecord(categoryFromMessage(error.what()), error.what(), "", context);
}

ErrorRecord RecoveryCoordinator::categorize(const std::exception_ptr& error, const ErrorContext& context) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return categorize(e, context);
    } catch (...) {
        return makeRecord(ErrorCategory::kUnknown, "non-standard exception", "", context);
    }
}

ErrorRecord RecoveryCoordinator::categorize(const std::string& message, const ErrorContext& context) {
    return makeRecord(categoryFromMessage(message), message, "", context);
}

ConnectivityInfo RecoveryCoordinator::validateConnectivity() {
    return validateConnectivity(config_.probe_endpoints);
}

ConnectivityInfo RecoveryCoordinator::validateConnectivity(const std::vector<std::string>& endpoints) {
    std::string key;
    for (const auto& ep : endpoints) key += ep + "\n";

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connectivity_cache_ && connectivity_cache_->key == key &&
            std::chrono::steady_clock::now() - connectivity_cache_->at < config_.connectivity_ttl) {
            return connectivity_cache_->info;
        }
    }

    std::vector<ProbeResult> probes(endpoints.size());
    std::vector<std::thread> workers;
    workers.reserve(endpoints.size());
    for (size_t i = 0; i < endpoints.size(); ++i) {
        workers.emplace_back([&, i]() { probes[i] = transport_->probe(endpoints[i], config_.probe_timeout); });
    }
    for (auto& th : workers) {
        if (th.joinable()) th.join();
    }

    ConnectivityInfo info;
    info.endpoint_count = endpoints.size();
    info.checked_at = std::chrono::system_clock::now();
    for (size_t i = 0; i < endpoints.size(); ++i) {
        if (probes[i].reachable) {
            ++info.reachable_count;
            info.latency[endpoints[i]] = probes[i].latency;
        } else {
            info.errors.push_back(endpoints[i] + ": " + (probes[i].error.empty() ? "unreachable" : probes[i].error));
        }
    }
    if (info.endpoint_count > 0 && info.reachable_count == info.endpoint_count) {
        info.status = ConnectivityStatus::kOnline;
    } else if (info.reachable_count > 0) {
        info.status = ConnectivityStatus::kLimited;
    } else {
        info.status = ConnectivityStatus::kOffline;
    }

    if (info.status != ConnectivityStatus::kOnline) {
        spdlog::warn("RecoveryCoordinator: connectivity {} ({}/{} endpoints reachable)", to_string(info.status),
                     info.reachable_count, info.endpoint_count);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    connectivity_cache_ = CachedConnectivity{key, info, std::chrono::steady_clock::now()};
    return info;
}

DiskSpaceInfo RecoveryCoordinator::validateDiskSpace(const std::string& path, uint64_t required_bytes) {
    const auto now = std::chrono::steady_clock::now();
    DiskSpaceInfo info;
    bool cached = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = disk_cache_.find(path); it != disk_cache_.end() && now - it->second.at < config_.disk_info_ttl) {
            info = it->second.info;
            cached = true;
        }
    }

    if (!cached) {
        info.path = path;
        std::error_code ec;
        const auto space = fs::space(nearestExistingPath(path), ec);
        if (ec) {
            spdlog::warn("RecoveryCoordinator: disk statistics unavailable for {} ({}), using estimate", path,
                         ec.message());
            info.available_bytes = kEstimatedAvailableBytes;
            info.total_bytes = kEstimatedAvailableBytes;
            info.estimated = true;
        } else {
            info.total_bytes = space.capacity;
            info.available_bytes = space.available;
            info.used_bytes = space.capacity >= space.free ? space.capacity - space.free : 0;
        }
        info.available_percent = info.total_bytes > 0
                                     ? static_cast<double>(info.available_bytes) * 100.0 /
                                           static_cast<double>(info.total_bytes)
                                     : 0.0;
        std::lock_guard<std::mutex> lock(mutex_);
        disk_cache_[path] = CachedDisk{info, now};
    }

    info.required_bytes = required_bytes;
    info.sufficient = info.available_bytes >= required_bytes;
    return info;
}

void RecoveryCoordinator::registerFallback(const std::string& name, FallbackRegistration registration) {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::info("RecoveryCoordinator: registered {} fallback(s) for {}", registration.alternatives.size(), name);
    fallbacks_[name] = std::move(registration);
}

void RecoveryCoordinator::setLocalAvailabilityCheck(LocalAvailability check) {
    std::lock_guard<std::mutex> lock(mutex_);
    local_check_ = std::move(check);
}

bool RecoveryCoordinator::alternativeQualifies(const ArtifactDescriptor& alt,
                                               const FallbackCriteria& criteria,
                                               std::optional<ConnectivityInfo>& connectivity) {
    if (criteria.max_size && alt.size > *criteria.max_size) return false;
    if (criteria.min_dimensions && alt.dimensions < *criteria.min_dimensions) return false;
    if (criteria.preferred_format && toLowerAscii(alt.format) != toLowerAscii(*criteria.preferred_format)) {
        return false;
    }

    LocalAvailability local_check;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local_check = local_check_;
    }
    const bool local = local_check && local_check(alt);
    if (local) return true;
    if (criteria.require_offline_usable) return false;

    if (!connectivity) connectivity = validateConnectivity();
    if (connectivity->status == ConnectivityStatus::kOffline) return false;

    return validateDiskSpace(storage_dir_, alt.size).sufficient;
}

std::optional<ArtifactDescriptor> RecoveryCoordinator::selectFallback(const std::string& name,
                                                                     const ErrorRecord& record) {
    if (record.strategy != RecoveryStrategy::kFallback) {
        return std::nullopt;
    }
    FallbackRegistration registration;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = fallbacks_.find(name);
        if (it == fallbacks_.end()) return std::nullopt;
        registration = it->second;
    }

    std::optional<ConnectivityInfo> connectivity;
    for (const auto& alt : registration.alternatives) {
        if (alternativeQualifies(alt, registration.criteria, connectivity)) {
            spdlog::info("RecoveryCoordinator: selected fallback {} for {}", alt.key(), name);
            return alt;
        }
    }
    return std::nullopt;
}

RecoveryResult RecoveryCoordinator::attemptRecovery(const ErrorRecord& record,
                                                    const ErrorContext& context,
                                                    const RetryOperation& retry_operation) {
    RecoveryResult result;
    result.strategy = record.strategy;

    switch (record.strategy) {
        case RecoveryStrategy::kRetry: {
            std::this_thread::sleep_for(std::min(config_.retry_delay, kMaxRetryWait));
            if (!retry_operation) {
                result.success = true;
                result.message = "Ready to retry " + (context.operation.empty() ? "operation" : context.operation);
                break;
            }
            try {
                result.file_path = retry_operation();
                result.success = true;
                result.message = "Retry succeeded";
            } catch (const TransferCancelledError&) {
                throw;
            } catch (const std::exception& e) {
                result.retry_error = categorize(e, context);
                result.message = "Retry failed: " + result.retry_error->message;
            }
            break;
        }
        case RecoveryStrategy::kFallback: {
            const auto& name = context.artifact_name.empty() ? record.context.artifact_name : context.artifact_name;
            result.fallback = selectFallback(name, record);
            result.success = result.fallback.has_value();
            result.message = result.success ? "Using fallback model: " + result.fallback->key()
                                            : "No suitable fallback model available";
            break;
        }
        case RecoveryStrategy::kManual:
            result.message = record.category == ErrorCategory::kDiskSpace
                                 ? "Manual intervention required - free disk space and retry"
                                 : "Manual intervention required - please check system configuration";
            break;
        case RecoveryStrategy::kAbort:
            result.message = "Operation aborted due to security or critical error";
            break;
    }

    spdlog::info("RecoveryCoordinator: {} for {}: {}", to_string(result.strategy), record.code, result.message);
    return result;
}

ErrorStatistics RecoveryCoordinator::getErrorStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ErrorStatistics stats;
    stats.total = history_.size();
    const auto hour_ago = std::chrono::system_clock::now() - std::chrono::hours(1);
    for (const auto& r : history_) {
        ++stats.by_category[r.category];
        ++stats.by_severity[r.severity];
        if (r.timestamp >= hour_ago) ++stats.last_hour;
    }
    const size_t n = std::min(kRecentErrors, history_.size());
    stats.recent.assign(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
    stats.per_minute_last_hour = static_cast<double>(stats.last_hour) / 60.0;
    return stats;
}

void RecoveryCoordinator::clearHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

}  // namespace modelfetch
