#include "models/download_orchestrator.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <ctime>
#include <exception>
#include <iomanip>
#include <map>
#include <numeric>
#include <sstream>
#include <thread>
#include <spdlog/spdlog.h>

#include "models/bandwidth_throttle.h"
#include "models/byte_sink.h"
#include "models/pipeline_error.h"
#include "utils/allowlist.h"
#include "utils/file_lock.h"

namespace fs = std::filesystem;

namespace modelfetch {

namespace {

constexpr size_t kSpeedHistoryLimit = 1000;
constexpr size_t kSustainedSpeedSamples = 10;
constexpr std::chrono::milliseconds kMemoryPressurePause{100};
constexpr uint64_t kLowMemoryBytes = 512ull * 1024 * 1024;
constexpr uint64_t kMediumMemoryBytes = 1024ull * 1024 * 1024;

std::string formatMtime(const fs::path& path) {
    std::error_code ec;
    const auto ftime = fs::last_write_time(path, ec);
    if (ec) return "";
    const auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    const auto t = std::chrono::system_clock::to_time_t(sys);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

bool isCancellation(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const TransferCancelledError&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::kPending:
            return "pending";
        case TransferStatus::kDownloading:
            return "downloading";
        case TransferStatus::kPaused:
            return "paused";
        case TransferStatus::kCompleted:
            return "completed";
        case TransferStatus::kFailed:
            return "failed";
        case TransferStatus::kCancelled:
            return "cancelled";
    }
    return "pending";
}

DownloadOrchestrator::DownloadOrchestrator(DownloadConfig config,
                                           std::shared_ptr<Transport> transport,
                                           std::shared_ptr<ResourceMonitor> monitor)
    : config_(std::move(config)), transport_(std::move(transport)), monitor_(std::move(monitor)) {
    if (!transport_) {
        throw ConfigurationError("DownloadOrchestrator requires a transport");
    }
    if (!monitor_) {
        monitor_ = std::make_shared<ResourceMonitor>(config_.memory_threshold_bytes);
    }
    if (config_.max_concurrency == 0) config_.max_concurrency = 1;
}

DownloadConfig DownloadOrchestrator::currentConfig() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void DownloadOrchestrator::validateDescriptor(const ArtifactDescriptor& descriptor) const {
    if (descriptor.name.empty() || descriptor.version.empty()) {
        throw ConfigurationError("artifact descriptor requires name and version");
    }
    if (descriptor.name.find('/') != std::string::npos || descriptor.name.find("..") != std::string::npos ||
        descriptor.version.find('/') != std::string::npos || descriptor.version.find("..") != std::string::npos) {
        throw SecurityError("artifact name or version escapes the destination directory: " + descriptor.key());
    }
    if (descriptor.url.empty()) {
        throw ConfigurationError("artifact " + descriptor.key() + " has no source url");
    }
    const auto url = parseUrl(descriptor.url);
    if (!url.valid()) {
        throw ConfigurationError("invalid source url for " + descriptor.key() + ": " + descriptor.url);
    }

    const auto cfg = currentConfig();
    if (url.scheme != "https" && !(cfg.allow_insecure_transport && url.scheme == "http")) {
        throw SecurityError("refusing unencrypted transport for " + descriptor.key() + ": " + descriptor.url);
    }
    if (!cfg.origin_allowlist.empty() && !isUrlAllowedByAllowlist(descriptor.url, cfg.origin_allowlist)) {
        throw SecurityError("source origin not in allowlist: " + url.origin());
    }
}

std::shared_ptr<DownloadOrchestrator::ActiveTransfer> DownloadOrchestrator::registerTransfer(
    const ArtifactDescriptor& descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = descriptor.key();
    if (transfers_.count(id) > 0) {
        throw ConfigurationError("transfer already in progress: " + id);
    }
    auto transfer = std::make_shared<ActiveTransfer>();
    transfer->state.id = id;
    transfer->state.total_bytes = descriptor.size;
    transfer->state.start_time = std::chrono::system_clock::now();
    transfer->state.last_update = transfer->state.start_time;
    transfers_[id] = transfer;
    return transfer;
}

void DownloadOrchestrator::finishTransfer(const std::shared_ptr<ActiveTransfer>& transfer, TransferStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    transfer->state.status = status;
    transfer->cv.notify_all();
    transfers_.erase(transfer->state.id);
}

std::string DownloadOrchestrator::acquire(const ArtifactDescriptor& descriptor, const std::string& destination_dir) {
    validateDescriptor(descriptor);

    const fs::path dir(destination_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw FileSystemError("cannot create destination directory " + destination_dir, ec.message());
    }
    const fs::path final_path = dir / descriptor.fileName();
    const fs::path partial_path = dir / descriptor.partialFileName();
    const fs::path lock_path = partial_path.string() + ".lock";

    {
        // Exclusive owner of the partial file, also across processes.
        FileLock partial_lock(lock_path);
        if (!partial_lock.locked()) {
            throw FileSystemError("partial file is locked by another process: " + partial_path.string());
        }

        auto transfer = registerTransfer(descriptor);
        try {
            runTransfer(transfer, descriptor, partial_path);
        } catch (const TransferCancelledError&) {
            spdlog::info("DownloadOrchestrator: {} cancelled, partial kept at {}", descriptor.key(),
                         partial_path.string());
            finishTransfer(transfer, TransferStatus::kCancelled);
            throw;
        } catch (const std::exception& e) {
            spdlog::warn("DownloadOrchestrator: {} failed: {}", descriptor.key(), e.what());
            finishTransfer(transfer, TransferStatus::kFailed);
            throw;
        }

        fs::rename(partial_path, final_path, ec);
        if (ec) {
            finishTransfer(transfer, TransferStatus::kFailed);
            throw FileSystemError("cannot finalize " + final_path.string(), ec.message());
        }
        finishTransfer(transfer, TransferStatus::kCompleted);
    }
    fs::remove(lock_path, ec);

    spdlog::info("DownloadOrchestrator: {} -> {}", descriptor.key(), final_path.string());
    return final_path.string();
}

void DownloadOrchestrator::runTransfer(const std::shared_ptr<ActiveTransfer>& transfer,
                                       const ArtifactDescriptor& descriptor,
                                       const fs::path& partial_path) {
    std::error_code ec;
    uint64_t offset = 0;
    if (fs::is_regular_file(partial_path, ec)) {
        offset = fs::file_size(partial_path, ec);
        if (ec) offset = 0;
    }
    if (descriptor.size > 0 && offset > descriptor.size) {
        spdlog::warn("DownloadOrchestrator: partial {} larger than expected ({} > {}), restarting",
                     partial_path.string(), offset, descriptor.size);
        fs::remove(partial_path, ec);
        offset = 0;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        transfer->state.status = TransferStatus::kDownloading;
        transfer->state.bytes_transferred = offset;
        if (offset > 0) {
            transfer->state.resume = ResumeInfo{offset, partial_path.string(), formatMtime(partial_path)};
        }
    }

    if (descriptor.size > 0 && offset == descriptor.size) {
        spdlog::info("DownloadOrchestrator: {} partial already complete", descriptor.key());
        return;
    }
    if (offset > 0) {
        spdlog::info("DownloadOrchestrator: resuming {} at offset {}", descriptor.key(), offset);
    }

    const auto request = TransferRequest::get(descriptor.url, offset > 0 ? std::optional<uint64_t>(offset)
                                                                         : std::nullopt);
    const size_t buffer_size = currentConfig().buffer_size;

    std::unique_ptr<FileSink> sink;
    BandwidthThrottle throttle;
    uint64_t written = offset;
    uint64_t total = descriptor.size;
    int unexpected_status = 0;
    bool cancelled = false;

    auto on_response = [&](const TransferResponse& res) {
        bool append = false;
        if (res.status == 206 && offset > 0) {
            append = true;
        } else if (res.status == 200 || res.status == 206) {
            if (offset > 0) {
                spdlog::warn("DownloadOrchestrator: {} server ignored range, restarting from 0", descriptor.key());
            }
            written = 0;
        } else {
            unexpected_status = res.status;
            return false;
        }
        sink = std::make_unique<FileSink>(partial_path, append, buffer_size);
        if (res.content_length) total = (append ? offset : 0) + *res.content_length;
        throttle.reset(BandwidthThrottle::Clock::now());
        updateProgress(*transfer, written, total, 0.0);
        return true;
    };

    auto on_chunk = [&](const char* data, size_t length) {
        if (!waitWhilePaused(*transfer)) {
            cancelled = true;
            return false;
        }
        const size_t cap = currentConfig().max_bytes_per_sec;
        for (auto delay = throttle.delayFor(BandwidthThrottle::Clock::now(), cap); delay.count() > 0;
             delay = throttle.delayFor(BandwidthThrottle::Clock::now(), cap)) {
            if (!sleepUnlessCancelled(*transfer, delay)) {
                cancelled = true;
                return false;
            }
        }

        if (!sink->write(data, length)) {
            sink->drain();
        }
        written += length;
        throttle.onChunk(length, BandwidthThrottle::Clock::now());
        updateProgress(*transfer, written, total, throttle.speed());

        if (monitor_->pollOnce()) {
            sink->drain();
            if (!sleepUnlessCancelled(*transfer, kMemoryPressurePause)) {
                cancelled = true;
                return false;
            }
        }
        if (isCancelled(*transfer)) {
            cancelled = true;
            return false;
        }
        return true;
    };

    TransferResponse response;
    try {
        response = transport_->fetch(request, on_response, on_chunk);
    } catch (const std::exception&) {
        // Keep what arrived so the next attempt resumes from it.
        if (sink) {
            try {
                sink->close();
            } catch (const std::exception& flush_error) {
                spdlog::warn("DownloadOrchestrator: flush after failure: {}", flush_error.what());
            }
        }
        throw;
    }

    if (sink) sink->close();

    if (cancelled || isCancelled(*transfer)) {
        throw TransferCancelledError(descriptor.key());
    }
    if (unexpected_status != 0) {
        throw NetworkError("unexpected HTTP status " + std::to_string(unexpected_status) + " for " +
                               descriptor.key(),
                           unexpected_status);
    }
    if (!sink || response.aborted) {
        throw NetworkError("transfer aborted for " + descriptor.key(), response.status);
    }
    if (total > 0 && written < total) {
        throw NetworkError("connection closed after " + std::to_string(written) + " of " + std::to_string(total) +
                               " bytes for " + descriptor.key(),
                           response.status);
    }
}

bool DownloadOrchestrator::waitWhilePaused(ActiveTransfer& transfer) {
    std::unique_lock<std::mutex> lock(mutex_);
    transfer.cv.wait(lock, [&]() { return transfer.state.status != TransferStatus::kPaused; });
    return transfer.state.status != TransferStatus::kCancelled;
}

bool DownloadOrchestrator::sleepUnlessCancelled(ActiveTransfer& transfer, std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    transfer.cv.wait_for(lock, duration, [&]() { return transfer.state.status == TransferStatus::kCancelled; });
    return transfer.state.status != TransferStatus::kCancelled;
}

bool DownloadOrchestrator::isCancelled(ActiveTransfer& transfer) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfer.state.status == TransferStatus::kCancelled;
}

void DownloadOrchestrator::updateProgress(ActiveTransfer& transfer, uint64_t transferred, uint64_t total,
                                          double speed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = transfer.state;
    s.bytes_transferred = transferred;
    s.total_bytes = total;
    s.speed_bps = speed;
    s.percentage = total > 0 ? std::min(100.0, static_cast<double>(transferred) * 100.0 / static_cast<double>(total))
                             : 0.0;
    s.eta_seconds = (speed > 0.0 && total > transferred) ? static_cast<double>(total - transferred) / speed : 0.0;
    s.last_update = std::chrono::system_clock::now();
    if (speed > 0.0) {
        speed_history_.push_back(speed);
        if (speed_history_.size() > kSpeedHistoryLimit) speed_history_.pop_front();
    }
}

std::vector<std::string> DownloadOrchestrator::acquireMany(const std::vector<ArtifactDescriptor>& descriptors,
                                                           const std::string& destination_dir) {
    std::vector<std::string> results(descriptors.size());

    // Members sharing a key transfer once; later duplicates take the first result.
    std::vector<size_t> unique;
    std::vector<size_t> first_of(descriptors.size());
    std::map<std::string, size_t> seen;
    for (size_t i = 0; i < descriptors.size(); ++i) {
        const auto inserted = seen.emplace(descriptors[i].key(), i);
        first_of[i] = inserted.first->second;
        if (inserted.second) unique.push_back(i);
    }

    const size_t batch_size = std::max<size_t>(1, currentConfig().max_concurrency);
    std::exception_ptr cancellation;

    for (size_t begin = 0; begin < unique.size(); begin += batch_size) {
        const size_t end = std::min(unique.size(), begin + batch_size);
        std::vector<std::exception_ptr> errors(end - begin);

        std::vector<std::thread> workers;
        workers.reserve(end - begin);
        for (size_t slot = begin; slot < end; ++slot) {
            workers.emplace_back([&, slot]() {
                const size_t i = unique[slot];
                try {
                    results[i] = acquire(descriptors[i], destination_dir);
                } catch (const std::exception&) {
                    errors[slot - begin] = std::current_exception();
                }
            });
        }
        for (auto& th : workers) {
            if (th.joinable()) th.join();
        }

        for (size_t slot = begin; slot < end; ++slot) {
            const auto& error = errors[slot - begin];
            if (!error) continue;
            const auto& descriptor = descriptors[unique[slot]];
            if (isCancellation(error)) {
                spdlog::info("DownloadOrchestrator: {} was cancelled, not retrying", descriptor.key());
                if (!cancellation) cancellation = error;
                continue;
            }
            spdlog::warn("DownloadOrchestrator: retrying {} after batch failure", descriptor.key());
            results[unique[slot]] = acquire(descriptor, destination_dir);
        }
    }
    if (cancellation) std::rethrow_exception(cancellation);

    for (size_t i = 0; i < descriptors.size(); ++i) {
        if (first_of[i] != i) results[i] = results[first_of[i]];
    }
    return results;
}

bool DownloadOrchestrator::pause(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    if (it == transfers_.end()) return false;
    auto& status = it->second->state.status;
    if (status != TransferStatus::kDownloading && status != TransferStatus::kPending) return false;
    status = TransferStatus::kPaused;
    spdlog::info("DownloadOrchestrator: paused {}", id);
    return true;
}

bool DownloadOrchestrator::resume(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    if (it == transfers_.end() || it->second->state.status != TransferStatus::kPaused) return false;
    it->second->state.status = TransferStatus::kDownloading;
    it->second->cv.notify_all();
    spdlog::info("DownloadOrchestrator: resumed {}", id);
    return true;
}

bool DownloadOrchestrator::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    if (it == transfers_.end()) return false;
    it->second->state.status = TransferStatus::kCancelled;
    it->second->cv.notify_all();
    return true;
}

std::vector<TransferState> DownloadOrchestrator::getActiveTransfers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferState> out;
    out.reserve(transfers_.size());
    for (const auto& kv : transfers_) out.push_back(kv.second->state);
    return out;
}

std::optional<TransferState> DownloadOrchestrator::getTransfer(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = transfers_.find(id); it != transfers_.end()) return it->second->state;
    return std::nullopt;
}

TransferMetrics DownloadOrchestrator::getMetrics() const {
    TransferMetrics metrics;
    const auto cfg = currentConfig();
    metrics.max_concurrency = cfg.max_concurrency;
    metrics.max_bytes_per_sec = cfg.max_bytes_per_sec;
    metrics.buffer_size = cfg.buffer_size;
    metrics.memory_usage = monitor_->latestUsage().process_rss_bytes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics.active_downloads = transfers_.size();
        for (const auto& kv : transfers_) metrics.download_speed += kv.second->state.speed_bps;
    }
    if (cfg.max_bytes_per_sec > 0) {
        metrics.bandwidth_usage = metrics.download_speed * 100.0 / static_cast<double>(cfg.max_bytes_per_sec);
    }
    return metrics;
}

void DownloadOrchestrator::optimizeConfiguration() {
    auto usage = monitor_->latestUsage();
    if (usage.mem_total_bytes == 0) {
        monitor_->pollOnce();
        usage = monitor_->latestUsage();
    }
    const uint64_t available = usage.memAvailableBytes();

    double sustained = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const size_t n = std::min(kSustainedSpeedSamples, speed_history_.size());
        if (n > 0) {
            sustained = std::accumulate(speed_history_.end() - static_cast<std::ptrdiff_t>(n), speed_history_.end(),
                                        0.0) /
                        static_cast<double>(n);
        }
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    if (usage.mem_total_bytes > 0) {
        if (available < kLowMemoryBytes) {
            config_.max_concurrency = 1;
            config_.buffer_size = 32 * 1024;
        } else if (available < kMediumMemoryBytes) {
            config_.max_concurrency = 2;
            config_.buffer_size = 64 * 1024;
        } else {
            config_.max_concurrency = 3;
            config_.buffer_size = 128 * 1024;
        }
    }

    if (config_.adaptive_throttling && config_.max_bytes_per_sec > 0 && sustained > 0.0) {
        const auto target = static_cast<size_t>(sustained * 0.9);
        if (target > 0 && config_.max_bytes_per_sec > target) {
            config_.max_bytes_per_sec = target;
        }
    }

    spdlog::info("DownloadOrchestrator: tuned concurrency={} buffer={} max_bps={} (available_mem={})",
                 config_.max_concurrency, config_.buffer_size, config_.max_bytes_per_sec, available);
}

}  // namespace modelfetch
