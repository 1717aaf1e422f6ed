#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "models/artifact_descriptor.h"
#include "models/pipeline_error.h"

namespace modelfetch {

struct VerificationOptions {
    bool skip_checksum{false};
    bool skip_size{false};
    bool skip_format{false};
    bool quarantine_on_failure{true};
};

struct VerificationResult {
    bool valid{false};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::string actual_checksum;
    uint64_t actual_size{0};
    std::optional<QuarantineReason> failure_reason;
    std::optional<std::string> quarantine_path;
};

struct QuarantineEntry {
    std::string quarantine_path;
    std::string original_path;
    QuarantineReason reason{QuarantineReason::kUnknownError};
    std::chrono::system_clock::time_point timestamp;
    std::string expected_checksum;
    std::string actual_checksum;
    uint64_t expected_size{0};
    uint64_t actual_size{0};
    std::string detail;
};

// Optional expected/actual values recorded alongside a quarantine.
struct QuarantineDetail {
    std::string message;
    std::string expected_checksum;
    std::string actual_checksum;
    uint64_t expected_size{0};
    uint64_t actual_size{0};
};

// Checks downloaded artifacts and isolates the ones that fail.
// The quarantine index lives in <quarantine_dir>/quarantine.json.
class IntegrityVerifier {
public:
    explicit IntegrityVerifier(std::string quarantine_dir);

    VerificationResult verify(const std::string& file_path,
                              const ArtifactDescriptor& descriptor,
                              const VerificationOptions& options = {});

    // Moves file_path into quarantine. Returns the new path.
    // Throws FileSystemError when the file cannot be moved.
    std::string quarantine(const std::string& file_path,
                           QuarantineReason reason,
                           const QuarantineDetail& detail = {});

    std::vector<QuarantineEntry> listQuarantined() const;

    // Copies the quarantined file to target_path and drops its record.
    // Throws FileSystemError for unknown entries or I/O failures.
    void restore(const std::string& quarantine_path, const std::string& target_path);

    // Removes entries (and files) older than max_age_days. Returns the count removed.
    size_t cleanup(int max_age_days);

    const std::string& quarantineDir() const { return quarantine_dir_; }

    // Header check alone. Returns an error message, or std::nullopt when the
    // header is acceptable. Unknown formats are accepted.
    static std::optional<std::string> checkFormatHeader(const std::filesystem::path& path,
                                                        const std::string& format,
                                                        uint64_t file_size);
    static bool isKnownFormat(const std::string& format);

private:
    void loadIndex();
    void persistIndex();
    std::filesystem::path indexPath() const;
    std::filesystem::path uniqueQuarantinePath(const std::filesystem::path& source);

    std::string quarantine_dir_;
    mutable std::mutex mutex_;
    std::map<std::string, QuarantineEntry> entries_;
    uint64_t sequence_{0};
};

}  // namespace modelfetch
