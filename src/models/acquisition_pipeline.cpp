#include "models/acquisition_pipeline.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>

namespace modelfetch {

namespace {

constexpr int kMaxFallbackDepth = 1;
constexpr std::chrono::milliseconds kMaxBackoff{std::chrono::seconds(30)};

std::string joinErrors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e;
    }
    return out;
}

}  // namespace

AcquisitionPipeline::AcquisitionPipeline(std::shared_ptr<DownloadOrchestrator> orchestrator,
                                         std::shared_ptr<IntegrityVerifier> verifier,
                                         std::shared_ptr<CacheManager> cache,
                                         std::shared_ptr<RecoveryCoordinator> coordinator,
                                         RecoveryConfig recovery)
    : orchestrator_(std::move(orchestrator)),
      verifier_(std::move(verifier)),
      cache_(std::move(cache)),
      coordinator_(std::move(coordinator)),
      recovery_(std::move(recovery)) {
    if (!orchestrator_ || !verifier_ || !cache_ || !coordinator_) {
        throw ConfigurationError("AcquisitionPipeline requires all components");
    }
}

std::unique_ptr<AcquisitionPipeline> AcquisitionPipeline::create(const PipelineConfig& config,
                                                                 std::shared_ptr<Transport> transport) {
    auto orchestrator = std::make_shared<DownloadOrchestrator>(config.download, transport);
    auto verifier = std::make_shared<IntegrityVerifier>(config.quarantine.quarantine_dir);
    auto cache = std::make_shared<CacheManager>(config.cache);
    auto coordinator = std::make_shared<RecoveryCoordinator>(config.recovery, transport, config.cache.cache_dir);
    coordinator->setLocalAvailabilityCheck(
        [cache](const ArtifactDescriptor& alt) { return cache->entry(alt).has_value(); });

    const size_t expired = verifier->cleanup(config.quarantine.retention_days);
    if (expired > 0) {
        spdlog::info("AcquisitionPipeline: removed {} expired quarantine entries", expired);
    }
    return std::make_unique<AcquisitionPipeline>(orchestrator, verifier, cache, coordinator, config.recovery);
}

AcquisitionResult AcquisitionPipeline::acquire(const ArtifactDescriptor& descriptor) {
    return acquireWithRecovery(descriptor, 0);
}

AcquisitionResult AcquisitionPipeline::acquireOnce(const ArtifactDescriptor& descriptor) {
    AcquisitionResult result;
    result.artifact = descriptor;

    auto hit = cache_->checkCache(descriptor);
    if (hit.hit) {
        result.file_path = *hit.file_path;
        result.from_cache = true;
        return result;
    }

    auto ticket = cache_->claimTransfer(descriptor);
    if (!ticket.owner) {
        spdlog::info("AcquisitionPipeline: waiting for in-flight transfer of {}", descriptor.key());
        result.file_path = ticket.result.get();
        result.coalesced = true;
        return result;
    }

    // Another caller may have stored it between the lookup and the claim.
    if (cache_->entry(descriptor)) {
        auto stored = cache_->checkCache(descriptor);
        if (stored.hit) {
            cache_->completeTransfer(descriptor, *stored.file_path);
            result.file_path = *stored.file_path;
            result.from_cache = true;
            return result;
        }
    }

    try {
        const auto& cache_dir = cache_->config().cache_dir;
        const auto disk = coordinator_->validateDiskSpace(cache_dir, descriptor.size);
        if (!disk.sufficient) {
            throw DiskSpaceError("insufficient disk space for " + descriptor.key(),
                                 "required=" + std::to_string(disk.required_bytes) +
                                     " available=" + std::to_string(disk.available_bytes));
        }

        const auto downloaded = orchestrator_->acquire(descriptor, cache_dir);
        const auto verification = verifier_->verify(downloaded, descriptor);
        if (!verification.valid) {
            throw ValidationError("integrity verification failed for " + descriptor.key(),
                                  joinErrors(verification.errors));
        }
        result.file_path = cache_->storeModel(descriptor, downloaded);
    } catch (const std::exception&) {
        cache_->failTransfer(descriptor, std::current_exception());
        throw;
    }
    cache_->completeTransfer(descriptor, result.file_path);
    return result;
}

AcquisitionResult AcquisitionPipeline::acquireWithRecovery(const ArtifactDescriptor& descriptor, int depth) {
    const ErrorContext context{"acquire", descriptor.name, ""};
    ErrorRecord record;
    try {
        return acquireOnce(descriptor);
    } catch (const TransferCancelledError&) {
        throw;
    } catch (const std::exception& e) {
        record = coordinator_->categorize(e, context);
    }

    int retries = 0;
    for (;;) {
        if (record.strategy == RecoveryStrategy::kRetry) {
            if (retries >= recovery_.max_retry_attempts) {
                throw AcquisitionError(record, "giving up after " + std::to_string(retries) + " retries");
            }
            // The coordinator waits retry_delay; the rest of the exponential backoff is applied here.
            const auto backoff = std::min(recovery_.retry_delay * ((1 << std::min(retries, 10)) - 1), kMaxBackoff);
            std::this_thread::sleep_for(backoff);
            ++retries;

            AcquisitionResult retried;
            const auto outcome = coordinator_->attemptRecovery(record, context, [&]() {
                retried = acquireOnce(descriptor);
                return retried.file_path;
            });
            if (outcome.success) {
                retried.attempts = retries + 1;
                return retried;
            }
            if (!outcome.retry_error) {
                throw AcquisitionError(record, outcome.message);
            }
            record = *outcome.retry_error;
            continue;
        }

        const auto outcome = coordinator_->attemptRecovery(record, context);
        if (record.strategy == RecoveryStrategy::kFallback && outcome.fallback && depth < kMaxFallbackDepth) {
            auto result = acquireWithRecovery(*outcome.fallback, depth + 1);
            result.used_fallback = true;
            result.attempts += retries + 1;
            return result;
        }
        throw AcquisitionError(record, outcome.message);
    }
}

}  // namespace modelfetch
