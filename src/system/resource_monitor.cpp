#include "system/resource_monitor.h"

#include <spdlog/spdlog.h>
#include <exception>
#include <fstream>
#include <string>
#include <utility>

#if defined(__linux__)
#include <sys/sysinfo.h>
#include <unistd.h>
#endif
#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace modelfetch {
namespace {

struct UsagePair {
    uint64_t used{0};
    uint64_t total{0};
};

// MemAvailable from /proc/meminfo counts reclaimable page cache; 0 when absent.
uint64_t read_meminfo_available() {
    std::ifstream meminfo("/proc/meminfo");
    std::string key;
    uint64_t value_kb = 0;
    std::string unit;
    while (meminfo >> key >> value_kb) {
        std::getline(meminfo, unit);
        if (key == "MemAvailable:") return value_kb * 1024;
    }
    return 0;
}

UsagePair sample_memory_usage() {
#if defined(__linux__)
    struct sysinfo info;
    if (sysinfo(&info) != 0) {
        return {};
    }
    const uint64_t unit = static_cast<uint64_t>(info.mem_unit);
    const uint64_t total = static_cast<uint64_t>(info.totalram) * unit;
    uint64_t available = read_meminfo_available();
    if (available == 0) {
        available = (static_cast<uint64_t>(info.freeram) + static_cast<uint64_t>(info.bufferram)) * unit;
    }
    UsagePair result;
    result.total = total;
    result.used = total >= available ? total - available : 0;
    return result;
#else
    return {};
#endif
}

uint64_t sample_process_rss() {
#if defined(__linux__)
    std::ifstream statm("/proc/self/statm");
    uint64_t size_pages = 0;
    uint64_t resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) return 0;
    const long page = ::sysconf(_SC_PAGESIZE);
    return resident_pages * static_cast<uint64_t>(page > 0 ? page : 4096);
#else
    return 0;
#endif
}

}  // namespace

ResourceMonitor::ResourceMonitor(MetricsProvider provider,
                                 ReliefCallback relief_cb,
                                 uint64_t threshold_bytes)
    : provider_(std::move(provider)),
      relief_cb_(std::move(relief_cb)),
      threshold_bytes_(threshold_bytes) {}

ResourceMonitor::ResourceMonitor(uint64_t threshold_bytes)
    : ResourceMonitor(sampleSystemUsage, releaseMemory, threshold_bytes) {}

bool ResourceMonitor::pollOnce() {
    ResourceUsage usage;
    try {
        usage = provider_ ? provider_() : ResourceUsage{};
    } catch (const std::exception& e) {
        spdlog::warn("Resource monitor poll failed: {}", e.what());
        return false;
    }

    uint64_t threshold = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_usage_ = usage;
        threshold = threshold_bytes_;
    }

    if (threshold == 0 || usage.process_rss_bytes <= threshold) return false;

    spdlog::debug("Resource monitor: RSS {} bytes above threshold {}", usage.process_rss_bytes, threshold);
    if (relief_cb_) relief_cb_();
    return true;
}

ResourceUsage ResourceMonitor::latestUsage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_usage_;
}

void ResourceMonitor::setThreshold(uint64_t threshold_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_bytes_ = threshold_bytes;
}

uint64_t ResourceMonitor::threshold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_bytes_;
}

ResourceUsage ResourceMonitor::sampleSystemUsage() {
    const auto mem = sample_memory_usage();
    return ResourceUsage{mem.used, mem.total, sample_process_rss()};
}

void ResourceMonitor::releaseMemory() {
#if defined(__GLIBC__)
    ::malloc_trim(0);
#endif
}

}  // namespace modelfetch
