#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace modelfetch {

// Per-transfer speed tracking and rate limiting. Bytes received ahead of the
// cap schedule are converted into a delay, at most one second per decision.
class BandwidthThrottle {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kMaxDelay{1000};

    explicit BandwidthThrottle(double ema_alpha = 0.3);

    void reset(Clock::time_point now);
    void onChunk(size_t bytes, Clock::time_point now);
    std::chrono::milliseconds delayFor(Clock::time_point now, size_t cap_bytes_per_sec) const;

    // Exponential moving average, bytes/sec.
    double speed() const { return ema_speed_; }
    uint64_t bytes() const { return bytes_; }

private:
    double alpha_;
    Clock::time_point start_{};
    Clock::time_point last_{};
    uint64_t bytes_{0};
    double ema_speed_{0.0};
};

}  // namespace modelfetch
