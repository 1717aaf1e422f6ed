#include <gtest/gtest.h>

#include <memory>
#include <thread>

#include "models/acquisition_pipeline.h"
#include "test_support.h"
#include "utils/sha256.h"

using namespace modelfetch;
using namespace modelfetch::test;

namespace {

ArtifactDescriptor describe(const std::string& name, const std::string& body) {
    ArtifactDescriptor d;
    d.name = name;
    d.version = "1.0";
    d.url = "https://models.example/" + name + ".gguf";
    d.sha256 = sha256_text(body);
    d.size = body.size();
    d.format = "gguf";
    return d;
}

std::string ggufBody(size_t size, uint32_t seed) {
    return "GGUF" + makeBlob(size - 4, seed);
}

}  // namespace

class AcquisitionPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<FakeTransport>();
        transport->setReachable("https://probe.example", true);

        config.cache.cache_dir = dir.str("cache");
        config.quarantine.quarantine_dir = dir.str("quarantine");
        config.recovery.probe_endpoints = {"https://probe.example"};
        config.recovery.retry_delay = std::chrono::milliseconds(1);
        config.recovery.max_retry_attempts = 3;
    }

    std::unique_ptr<AcquisitionPipeline> make() { return AcquisitionPipeline::create(config, transport); }

    TempDir dir;
    PipelineConfig config;
    std::shared_ptr<FakeTransport> transport;
};

TEST_F(AcquisitionPipelineTest, AcquiredArtifactIsCachedAndVerifies) {
    const auto body = ggufBody(64 * 1024, 1);
    const auto d = describe("encoder", body);
    transport->serve(d.url, body);
    auto pipeline = make();

    auto result = pipeline->acquire(d);
    EXPECT_FALSE(result.from_cache);
    EXPECT_FALSE(result.used_fallback);
    EXPECT_EQ(result.file_path, pipeline->cache().cachePathFor(d).string());

    auto hit = pipeline->checkCache(d);
    ASSERT_TRUE(hit.hit);
    VerificationOptions no_quarantine;
    no_quarantine.quarantine_on_failure = false;
    auto verified = pipeline->verifier().verify(*hit.file_path, d, no_quarantine);
    EXPECT_TRUE(verified.valid);
    EXPECT_TRUE(verified.errors.empty());

    auto again = pipeline->acquire(d);
    EXPECT_TRUE(again.from_cache);
    EXPECT_EQ(transport->requests().size(), 1u);
    EXPECT_EQ(pipeline->getStats().total_models, 1u);
}

TEST_F(AcquisitionPipelineTest, TransientNetworkFailuresAreRetried) {
    const auto body = ggufBody(4096, 2);
    const auto d = describe("encoder", body);
    FakeTransport::Route route;
    route.body = body;
    route.failures_before_success = 2;
    transport->serve(d.url, route);
    auto pipeline = make();

    auto result = pipeline->acquire(d);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(readFile(result.file_path), body);
    EXPECT_EQ(pipeline->getErrorStatistics().by_category[ErrorCategory::kNetwork], 2u);
}

TEST_F(AcquisitionPipelineTest, GivesUpAfterMaxRetries) {
    const auto d = describe("encoder", ggufBody(4096, 3));
    FakeTransport::Route route;
    route.status = 503;
    transport->serve(d.url, route);
    config.recovery.max_retry_attempts = 2;
    auto pipeline = make();

    try {
        pipeline->acquire(d);
        FAIL() << "expected AcquisitionError";
    } catch (const AcquisitionError& e) {
        EXPECT_EQ(e.record().category, ErrorCategory::kNetwork);
    }
    EXPECT_EQ(transport->requests().size(), 3u);
}

TEST_F(AcquisitionPipelineTest, ValidationFailureUsesRegisteredFallback) {
    const auto large_body = ggufBody(8192, 4);
    auto large = describe("large-model", large_body);
    large.sha256 = sha256_text("something else");
    transport->serve(large.url, large_body);

    const auto small_body = ggufBody(2048, 5);
    const auto small = describe("small-model", small_body);
    transport->serve(small.url, small_body);

    auto pipeline = make();
    FallbackRegistration reg;
    reg.alternatives = {small};
    reg.criteria.max_size = 500ull * 1024 * 1024;
    pipeline->registerFallback("large-model", reg);

    auto result = pipeline->acquire(large);
    EXPECT_TRUE(result.used_fallback);
    EXPECT_EQ(result.artifact, small);
    EXPECT_EQ(readFile(result.file_path), small_body);

    auto quarantined = pipeline->verifier().listQuarantined();
    ASSERT_EQ(quarantined.size(), 1u);
    EXPECT_EQ(quarantined[0].reason, QuarantineReason::kChecksumMismatch);
    EXPECT_FALSE(pipeline->cache().entry(large).has_value());
}

TEST_F(AcquisitionPipelineTest, ValidationFailureWithoutFallbackThrows) {
    const auto body = ggufBody(2048, 6);
    auto d = describe("encoder", body);
    d.size = 4096;
    transport->serve(d.url, body);
    auto pipeline = make();

    try {
        pipeline->acquire(d);
        FAIL() << "expected AcquisitionError";
    } catch (const AcquisitionError& e) {
        EXPECT_EQ(e.record().category, ErrorCategory::kValidation);
        EXPECT_EQ(e.outcome(), "No suitable fallback model available");
    }
}

TEST_F(AcquisitionPipelineTest, SecurityErrorsAbortWithoutTransfer) {
    auto d = describe("encoder", "GGUF....");
    d.url = "http://models.example/encoder.gguf";
    auto pipeline = make();

    try {
        pipeline->acquire(d);
        FAIL() << "expected AcquisitionError";
    } catch (const AcquisitionError& e) {
        EXPECT_EQ(e.record().category, ErrorCategory::kSecurity);
        EXPECT_EQ(e.record().strategy, RecoveryStrategy::kAbort);
    }
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(AcquisitionPipelineTest, MalformedSourceUrlIsNotRetried) {
    auto d = describe("encoder", "GGUF....");
    d.url = "https://models.example:99999999999/encoder.gguf";
    auto pipeline = make();

    try {
        pipeline->acquire(d);
        FAIL() << "expected AcquisitionError";
    } catch (const AcquisitionError& e) {
        EXPECT_EQ(e.record().category, ErrorCategory::kConfiguration);
        EXPECT_EQ(e.record().strategy, RecoveryStrategy::kManual);
    }
    EXPECT_TRUE(transport->requests().empty());
    EXPECT_EQ(pipeline->getErrorStatistics().total, 1u);
}

TEST_F(AcquisitionPipelineTest, InsufficientDiskSpaceNeedsManualAction) {
    auto d = describe("encoder", "GGUF....");
    d.size = 1ull << 62;
    auto pipeline = make();

    try {
        pipeline->acquire(d);
        FAIL() << "expected AcquisitionError";
    } catch (const AcquisitionError& e) {
        EXPECT_EQ(e.record().category, ErrorCategory::kDiskSpace);
        EXPECT_EQ(e.record().strategy, RecoveryStrategy::kManual);
    }
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(AcquisitionPipelineTest, ConcurrentAcquiresShareOneTransfer) {
    const auto body = ggufBody(256 * 1024, 7);
    const auto d = describe("encoder", body);
    FakeTransport::Route route;
    route.body = body;
    route.chunk_delay = std::chrono::milliseconds(2);
    transport->serve(d.url, route);
    auto pipeline = make();

    AcquisitionResult a;
    AcquisitionResult b;
    std::thread first([&]() { a = pipeline->acquire(d); });
    std::thread second([&]() { b = pipeline->acquire(d); });
    first.join();
    second.join();

    EXPECT_EQ(a.file_path, b.file_path);
    EXPECT_EQ(readFile(a.file_path), body);
    EXPECT_EQ(transport->requests().size(), 1u);
}
