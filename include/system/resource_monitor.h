#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace modelfetch {

inline double usage_ratio(uint64_t used, uint64_t total) {
    if (total == 0) return 0.0;
    return static_cast<double>(used) / static_cast<double>(total);
}

struct ResourceUsage {
    uint64_t mem_used_bytes{0};
    uint64_t mem_total_bytes{0};
    uint64_t process_rss_bytes{0};

    uint64_t memAvailableBytes() const {
        return mem_total_bytes > mem_used_bytes ? mem_total_bytes - mem_used_bytes : 0;
    }
    double memUsageRatio() const { return usage_ratio(mem_used_bytes, mem_total_bytes); }
};

// Samples memory on demand for the transfer loop. When the process resident
// size is above the threshold the relief hook runs before the caller pauses.
class ResourceMonitor {
public:
    using MetricsProvider = std::function<ResourceUsage()>;
    using ReliefCallback = std::function<void()>;

    ResourceMonitor(MetricsProvider provider,
                    ReliefCallback relief_cb,
                    uint64_t threshold_bytes);

    explicit ResourceMonitor(uint64_t threshold_bytes);

    // Sample once. Returns true when over threshold (relief already requested).
    bool pollOnce();
    ResourceUsage latestUsage() const;

    void setThreshold(uint64_t threshold_bytes);
    uint64_t threshold() const;

    static ResourceUsage sampleSystemUsage();
    // Asks the allocator to return free pages to the OS.
    static void releaseMemory();

private:
    MetricsProvider provider_;
    ReliefCallback relief_cb_;
    mutable std::mutex mutex_;
    uint64_t threshold_bytes_;
    ResourceUsage last_usage_{};
};

}  // namespace modelfetch
