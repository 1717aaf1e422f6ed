#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "models/artifact_descriptor.h"
#include "net/transport.h"
#include "system/resource_monitor.h"
#include "utils/config.h"

namespace modelfetch {

enum class TransferStatus {
    kPending,
    kDownloading,
    kPaused,
    kCompleted,
    kFailed,
    kCancelled,
};

const char* to_string(TransferStatus status);

struct ResumeInfo {
    uint64_t offset{0};
    std::string partial_path;
    std::string last_modified;
};

struct TransferState {
    std::string id;  // name@version
    TransferStatus status{TransferStatus::kPending};
    uint64_t bytes_transferred{0};
    uint64_t total_bytes{0};
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point last_update;
    double speed_bps{0.0};
    double eta_seconds{0.0};
    double percentage{0.0};
    std::optional<ResumeInfo> resume;
};

struct TransferMetrics {
    double download_speed{0.0};   // sum of active EMA speeds, bytes/sec
    uint64_t memory_usage{0};     // process RSS
    size_t active_downloads{0};
    double bandwidth_usage{0.0};  // percent of the cap, 0 when unlimited
    size_t max_concurrency{0};
    size_t max_bytes_per_sec{0};
    size_t buffer_size{0};
};

// Fetches artifacts into <destination>/<name>-<version>.<format>, resuming
// from the ".partial" file left by an interrupted attempt. Progress is
// exposed through getActiveTransfers(); failures are thrown as typed
// PipelineError subclasses and are not retried here.
class DownloadOrchestrator {
public:
    DownloadOrchestrator(DownloadConfig config,
                         std::shared_ptr<Transport> transport,
                         std::shared_ptr<ResourceMonitor> monitor = nullptr);

    std::string acquire(const ArtifactDescriptor& descriptor, const std::string& destination_dir);

    // Results keep the order of descriptors. A cancelled member is not retried
    // and its TransferCancelledError is rethrown once the other members finish.
    std::vector<std::string> acquireMany(const std::vector<ArtifactDescriptor>& descriptors,
                                         const std::string& destination_dir);

    bool pause(const std::string& id);
    bool resume(const std::string& id);
    bool cancel(const std::string& id);

    std::vector<TransferState> getActiveTransfers() const;
    std::optional<TransferState> getTransfer(const std::string& id) const;
    TransferMetrics getMetrics() const;

    // Re-tunes concurrency, buffer size and the throttle cap from available
    // memory and recent speed samples.
    void optimizeConfiguration();

    DownloadConfig currentConfig() const;

    // Throws ConfigurationError or SecurityError.
    void validateDescriptor(const ArtifactDescriptor& descriptor) const;

private:
    struct ActiveTransfer {
        TransferState state;
        std::condition_variable cv;
    };

    std::shared_ptr<ActiveTransfer> registerTransfer(const ArtifactDescriptor& descriptor);
    void finishTransfer(const std::shared_ptr<ActiveTransfer>& transfer, TransferStatus status);
    void runTransfer(const std::shared_ptr<ActiveTransfer>& transfer,
                     const ArtifactDescriptor& descriptor,
                     const std::filesystem::path& partial_path);
    bool waitWhilePaused(ActiveTransfer& transfer);
    bool sleepUnlessCancelled(ActiveTransfer& transfer, std::chrono::milliseconds duration);
    bool isCancelled(ActiveTransfer& transfer);
    void updateProgress(ActiveTransfer& transfer, uint64_t transferred, uint64_t total, double speed);

    mutable std::mutex config_mutex_;
    DownloadConfig config_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<ResourceMonitor> monitor_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ActiveTransfer>> transfers_;
    std::deque<double> speed_history_;
};

}  // namespace modelfetch
