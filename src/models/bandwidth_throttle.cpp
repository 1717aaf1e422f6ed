#include "models/bandwidth_throttle.h"

#include <algorithm>

namespace modelfetch {

BandwidthThrottle::BandwidthThrottle(double ema_alpha) : alpha_(ema_alpha) {
    reset(Clock::now());
}

void BandwidthThrottle::reset(Clock::time_point now) {
    start_ = now;
    last_ = now;
    bytes_ = 0;
    ema_speed_ = 0.0;
}

void BandwidthThrottle::onChunk(size_t bytes, Clock::time_point now) {
    bytes_ += bytes;
    const double dt = std::chrono::duration<double>(now - last_).count();
    last_ = now;
    if (dt <= 0.0) return;
    const double instant = static_cast<double>(bytes) / dt;
    ema_speed_ = ema_speed_ <= 0.0 ? instant : alpha_ * instant + (1.0 - alpha_) * ema_speed_;
}

std::chrono::milliseconds BandwidthThrottle::delayFor(Clock::time_point now, size_t cap_bytes_per_sec) const {
    if (cap_bytes_per_sec == 0) return std::chrono::milliseconds(0);
    const double elapsed = std::chrono::duration<double>(now - start_).count();
    const double allowed = static_cast<double>(cap_bytes_per_sec) * std::max(0.0, elapsed);
    const double excess = static_cast<double>(bytes_) - allowed;
    if (excess <= 0.0) return std::chrono::milliseconds(0);
    const auto delay = std::chrono::milliseconds(
        static_cast<int64_t>(excess * 1000.0 / static_cast<double>(cap_bytes_per_sec)));
    return std::min(delay, kMaxDelay);
}

}  // namespace modelfetch
