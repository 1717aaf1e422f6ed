#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "models/artifact_descriptor.h"
#include "models/cache_manager.h"
#include "models/download_orchestrator.h"
#include "models/integrity_verifier.h"
#include "models/recovery_coordinator.h"
#include "utils/config.h"

namespace modelfetch {

// Thrown by AcquisitionPipeline::acquire once recovery has been exhausted.
class AcquisitionError : public std::runtime_error {
public:
    AcquisitionError(ErrorRecord record, const std::string& outcome)
        : std::runtime_error(record.message + " (" + outcome + ")"),
          record_(std::move(record)),
          outcome_(outcome) {}

    const ErrorRecord& record() const noexcept { return record_; }
    const std::string& outcome() const noexcept { return outcome_; }

private:
    ErrorRecord record_;
    std::string outcome_;
};

struct AcquisitionResult {
    std::string file_path;
    ArtifactDescriptor artifact;  // differs from the request when a fallback was used
    bool from_cache{false};
    bool coalesced{false};        // another caller performed the transfer
    bool used_fallback{false};
    int attempts{1};
};

// cache check -> download -> verify -> store, with classification and
// recovery around every stage.
class AcquisitionPipeline {
public:
    AcquisitionPipeline(std::shared_ptr<DownloadOrchestrator> orchestrator,
                        std::shared_ptr<IntegrityVerifier> verifier,
                        std::shared_ptr<CacheManager> cache,
                        std::shared_ptr<RecoveryCoordinator> coordinator,
                        RecoveryConfig recovery);

    // Wires one instance of each component from config.
    static std::unique_ptr<AcquisitionPipeline> create(const PipelineConfig& config,
                                                       std::shared_ptr<Transport> transport);

    AcquisitionResult acquire(const ArtifactDescriptor& descriptor);

    CacheHitResult checkCache(const ArtifactDescriptor& descriptor) { return cache_->checkCache(descriptor); }
    CacheStats getStats() const { return cache_->getStats(); }
    ErrorStatistics getErrorStatistics() const { return coordinator_->getErrorStatistics(); }
    void registerFallback(const std::string& name, FallbackRegistration registration) {
        coordinator_->registerFallback(name, std::move(registration));
    }

    DownloadOrchestrator& orchestrator() { return *orchestrator_; }
    IntegrityVerifier& verifier() { return *verifier_; }
    CacheManager& cache() { return *cache_; }
    RecoveryCoordinator& coordinator() { return *coordinator_; }

private:
    AcquisitionResult acquireWithRecovery(const ArtifactDescriptor& descriptor, int depth);
    AcquisitionResult acquireOnce(const ArtifactDescriptor& descriptor);

    std::shared_ptr<DownloadOrchestrator> orchestrator_;
    std::shared_ptr<IntegrityVerifier> verifier_;
    std::shared_ptr<CacheManager> cache_;
    std::shared_ptr<RecoveryCoordinator> coordinator_;
    RecoveryConfig recovery_;
};

}  // namespace modelfetch
