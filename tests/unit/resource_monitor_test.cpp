#include <gtest/gtest.h>

#include <cstdint>
#include <fstream>
#include <string>

#include "system/resource_monitor.h"

using namespace modelfetch;

TEST(ResourceMonitorTest, NoReliefBelowThreshold) {
    ResourceUsage usage{50, 100, 10};
    int relief_calls = 0;

    ResourceMonitor monitor(
        [&usage]() { return usage; },
        [&relief_calls]() { relief_calls++; },
        64);

    EXPECT_FALSE(monitor.pollOnce());

    EXPECT_EQ(relief_calls, 0);
    auto latest = monitor.latestUsage();
    EXPECT_EQ(latest.mem_used_bytes, 50u);
    EXPECT_EQ(latest.mem_total_bytes, 100u);
    EXPECT_EQ(latest.memAvailableBytes(), 50u);
}

TEST(ResourceMonitorTest, ReliefWhenRssAboveThreshold) {
    ResourceUsage usage{10, 100, 95};
    int relief_calls = 0;

    ResourceMonitor monitor(
        [&usage]() { return usage; },
        [&usage, &relief_calls]() {
            relief_calls++;
            usage.process_rss_bytes = 40;
        },
        64);

    EXPECT_TRUE(monitor.pollOnce());
    EXPECT_EQ(relief_calls, 1);
    EXPECT_FALSE(monitor.pollOnce());
    EXPECT_EQ(relief_calls, 1);
}

TEST(ResourceMonitorTest, ZeroThresholdDisablesRelief) {
    ResourceUsage usage{10, 100, 1ull << 40};
    int relief_calls = 0;
    ResourceMonitor monitor([&usage]() { return usage; }, [&relief_calls]() { relief_calls++; }, 0);

    EXPECT_FALSE(monitor.pollOnce());
    EXPECT_EQ(relief_calls, 0);

    monitor.setThreshold(1024);
    EXPECT_EQ(monitor.threshold(), 1024u);
    EXPECT_TRUE(monitor.pollOnce());
}

TEST(ResourceMonitorTest, SamplesSystemMemory) {
    auto usage = ResourceMonitor::sampleSystemUsage();
#if defined(__linux__)
    EXPECT_GT(usage.mem_total_bytes, 0u);
    EXPECT_GT(usage.process_rss_bytes, 0u);
    EXPECT_LE(usage.memUsageRatio(), 1.0);
    EXPECT_GT(usage.memAvailableBytes(), 0u);
#else
    (void)usage;
#endif
}

#if defined(__linux__)
TEST(ResourceMonitorTest, AvailableMemoryIncludesReclaimableCache) {
    std::ifstream meminfo("/proc/meminfo");
    std::string key;
    uint64_t value_kb = 0;
    std::string rest;
    uint64_t free_kb = 0;
    uint64_t available_kb = 0;
    while (meminfo >> key >> value_kb) {
        std::getline(meminfo, rest);
        if (key == "MemFree:") free_kb = value_kb;
        if (key == "MemAvailable:") available_kb = value_kb;
    }
    if (available_kb == 0) GTEST_SKIP() << "kernel does not report MemAvailable";

    const auto usage = ResourceMonitor::sampleSystemUsage();
    // Both reads race with the rest of the system; allow 256 MiB of drift.
    const uint64_t slack = 256ull << 20;
    EXPECT_GE(usage.memAvailableBytes() + slack, available_kb * 1024);
    EXPECT_GE(usage.memAvailableBytes() + slack, free_kb * 1024);
}
#endif
