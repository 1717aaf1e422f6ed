#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "models/artifact_descriptor.h"
#include "models/pipeline_error.h"
#include "net/transport.h"
#include "utils/config.h"

namespace modelfetch {

struct ErrorContext {
    std::string operation;
    std::string artifact_name;
    std::string file_path;
};

struct ErrorRecord {
    ErrorCategory category{ErrorCategory::kUnknown};
    ErrorSeverity severity{ErrorSeverity::kLow};
    std::string message;             // human readable
    std::string technical_detail;    // raw error text and detail
    std::string recommended_action;
    RecoveryStrategy strategy{RecoveryStrategy::kRetry};
    std::string code;
    std::chrono::system_clock::time_point timestamp;
    ErrorContext context;
};

enum class ConnectivityStatus {
    kOnline,
    kLimited,
    kOffline,
};

const char* to_string(ConnectivityStatus status);

struct ConnectivityInfo {
    ConnectivityStatus status{ConnectivityStatus::kOffline};
    size_t reachable_count{0};
    size_t endpoint_count{0};
    std::vector<std::string> errors;
    std::map<std::string, std::chrono::milliseconds> latency;
    std::chrono::system_clock::time_point checked_at;
};

struct DiskSpaceInfo {
    std::string path;
    uint64_t total_bytes{0};
    uint64_t used_bytes{0};
    uint64_t available_bytes{0};
    double available_percent{0.0};
    uint64_t required_bytes{0};
    bool sufficient{false};
    bool estimated{false};  // filesystem statistics were unavailable
};

struct FallbackCriteria {
    std::optional<uint64_t> max_size;
    std::optional<int> min_dimensions;
    std::optional<std::string> preferred_format;
    bool require_offline_usable{false};
};

struct FallbackRegistration {
    std::vector<ArtifactDescriptor> alternatives;  // priority order
    FallbackCriteria criteria;
};

struct RecoveryResult {
    bool success{false};
    RecoveryStrategy strategy{RecoveryStrategy::kAbort};
    std::string message;
    std::optional<ArtifactDescriptor> fallback;
    std::optional<std::string> file_path;     // set when a retry operation succeeded
    std::optional<ErrorRecord> retry_error;   // set when a retry operation failed again
};

struct ErrorStatistics {
    size_t total{0};
    std::map<ErrorCategory, size_t> by_category;
    std::map<ErrorSeverity, size_t> by_severity;
    std::vector<ErrorRecord> recent;  // newest last, at most 10
    size_t last_hour{0};
    double per_minute_last_hour{0.0};
};

// Classifies failures, checks the environment and picks a recovery path.
class RecoveryCoordinator {
public:
    using RetryOperation = std::function<std::string()>;
    using LocalAvailability = std::function<bool(const ArtifactDescriptor&)>;

    // storage_dir is where fallback artifacts would be written; its free
    // space is checked before a fallback is offered.
    RecoveryCoordinator(RecoveryConfig config, std::shared_ptr<Transport> transport, std::string storage_dir);

    ErrorRecord categorize(const std::exception& error, const ErrorContext& context = {});
    ErrorRecord categorize(const std::exception_ptr& error, const ErrorContext& context = {});
    // For failures that only exist as text (external tools, logs).
    ErrorRecord categorize(const std::string& message, const ErrorContext& context = {});

    ConnectivityInfo validateConnectivity();
    ConnectivityInfo validateConnectivity(const std::vector<std::string>& endpoints);

    DiskSpaceInfo validateDiskSpace(const std::string& path, uint64_t required_bytes);

    void registerFallback(const std::string& name, FallbackRegistration registration);
    std::optional<ArtifactDescriptor> selectFallback(const std::string& name, const ErrorRecord& record);

    // Retry waits once, then re-invokes retry_operation when given and reports
    // its outcome. Without an operation a retry reports readiness only.
    RecoveryResult attemptRecovery(const ErrorRecord& record,
                                   const ErrorContext& context,
                                   const RetryOperation& retry_operation = nullptr);

    ErrorStatistics getErrorStatistics() const;
    void clearHistory();

    // Used for the "usable without network" fallback criterion.
    void setLocalAvailabilityCheck(LocalAvailability check);

    static RecoveryStrategy strategyFor(ErrorCategory category);
    static ErrorCategory categoryFromMessage(const std::string& message);
    static ErrorSeverity severityFromMessage(const std::string& message);
    static std::string humanize(const std::string& message);

private:
    ErrorRecord makeRecord(ErrorCategory category,
                           const std::string& message,
                           const std::string& detail,
                           const ErrorContext& context);
    bool alternativeQualifies(const ArtifactDescriptor& alt,
                              const FallbackCriteria& criteria,
                              std::optional<ConnectivityInfo>& connectivity);

    RecoveryConfig config_;
    std::shared_ptr<Transport> transport_;
    std::string storage_dir_;

    mutable std::mutex mutex_;
    std::deque<ErrorRecord> history_;
    std::map<std::string, FallbackRegistration> fallbacks_;
    LocalAvailability local_check_;

    struct CachedConnectivity {
        std::string key;
        ConnectivityInfo info;
        std::chrono::steady_clock::time_point at;
    };
    std::optional<CachedConnectivity> connectivity_cache_;

    struct CachedDisk {
        DiskSpaceInfo info;
        std::chrono::steady_clock::time_point at;
    };
    std::map<std::string, CachedDisk> disk_cache_;
};

}  // namespace modelfetch
