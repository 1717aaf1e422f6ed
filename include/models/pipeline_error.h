#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace modelfetch {

enum class ErrorCategory {
    kNetwork,
    kDiskSpace,
    kFileSystem,
    kValidation,
    kConfiguration,
    kSecurity,
    kUnknown,
};

enum class ErrorSeverity {
    kLow,
    kMedium,
    kHigh,
    kCritical,
};

enum class RecoveryStrategy {
    kRetry,
    kFallback,
    kManual,
    kAbort,
};

enum class QuarantineReason {
    kChecksumMismatch,
    kSizeMismatch,
    kCorruptedHeader,
    kUnknownError,
};

inline const char* to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::kNetwork:
            return "NETWORK";
        case ErrorCategory::kDiskSpace:
            return "DISK_SPACE";
        case ErrorCategory::kFileSystem:
            return "FILE_SYSTEM";
        case ErrorCategory::kValidation:
            return "VALIDATION";
        case ErrorCategory::kConfiguration:
            return "CONFIGURATION";
        case ErrorCategory::kSecurity:
            return "SECURITY";
        case ErrorCategory::kUnknown:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

inline const char* to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::kLow:
            return "LOW";
        case ErrorSeverity::kMedium:
            return "MEDIUM";
        case ErrorSeverity::kHigh:
            return "HIGH";
        case ErrorSeverity::kCritical:
            return "CRITICAL";
    }
    return "LOW";
}

inline const char* to_string(RecoveryStrategy strategy) {
    switch (strategy) {
        case RecoveryStrategy::kRetry:
            return "RETRY";
        case RecoveryStrategy::kFallback:
            return "FALLBACK";
        case RecoveryStrategy::kManual:
            return "MANUAL";
        case RecoveryStrategy::kAbort:
            return "ABORT";
    }
    return "ABORT";
}

inline const char* to_string(QuarantineReason reason) {
    switch (reason) {
        case QuarantineReason::kChecksumMismatch:
            return "CHECKSUM_MISMATCH";
        case QuarantineReason::kSizeMismatch:
            return "SIZE_MISMATCH";
        case QuarantineReason::kCorruptedHeader:
            return "CORRUPTED_HEADER";
        case QuarantineReason::kUnknownError:
            return "UNKNOWN_ERROR";
    }
    return "UNKNOWN_ERROR";
}

inline std::optional<QuarantineReason> parseQuarantineReason(const std::string& text) {
    for (auto reason : {QuarantineReason::kChecksumMismatch, QuarantineReason::kSizeMismatch,
                        QuarantineReason::kCorruptedHeader, QuarantineReason::kUnknownError}) {
        if (text == to_string(reason)) return reason;
    }
    return std::nullopt;
}

// Base of every error raised by a pipeline stage. The category is fixed by the
// stage that detects the failure, so no message inspection is needed.
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorCategory category, const std::string& message, std::string detail = {})
        : std::runtime_error(message), category_(category), detail_(std::move(detail)) {}

    ErrorCategory category() const noexcept { return category_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorCategory category_;
    std::string detail_;
};

class NetworkError : public PipelineError {
public:
    explicit NetworkError(const std::string& message, int http_status = 0, std::string detail = {})
        : PipelineError(ErrorCategory::kNetwork, message, std::move(detail)), http_status_(http_status) {}

    // 0 when no HTTP response was received.
    int httpStatus() const noexcept { return http_status_; }

private:
    int http_status_;
};

class DiskSpaceError : public PipelineError {
public:
    explicit DiskSpaceError(const std::string& message, std::string detail = {})
        : PipelineError(ErrorCategory::kDiskSpace, message, std::move(detail)) {}
};

class FileSystemError : public PipelineError {
public:
    explicit FileSystemError(const std::string& message, std::string detail = {})
        : PipelineError(ErrorCategory::kFileSystem, message, std::move(detail)) {}
};

class ValidationError : public PipelineError {
public:
    explicit ValidationError(const std::string& message, std::string detail = {})
        : PipelineError(ErrorCategory::kValidation, message, std::move(detail)) {}
};

class ConfigurationError : public PipelineError {
public:
    explicit ConfigurationError(const std::string& message, std::string detail = {})
        : PipelineError(ErrorCategory::kConfiguration, message, std::move(detail)) {}
};

class SecurityError : public PipelineError {
public:
    explicit SecurityError(const std::string& message, std::string detail = {})
        : PipelineError(ErrorCategory::kSecurity, message, std::move(detail)) {}
};

// Raised when a transfer stops because cancel() was called. Not a failure:
// the partial file stays on disk for a later resume.
class TransferCancelledError : public std::runtime_error {
public:
    explicit TransferCancelledError(const std::string& id)
        : std::runtime_error("transfer cancelled: " + id), id_(id) {}

    const std::string& id() const noexcept { return id_; }

private:
    std::string id_;
};

}  // namespace modelfetch
