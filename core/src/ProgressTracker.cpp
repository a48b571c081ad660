// Rate smoothing and ETA derivation.
#include "furman/ProgressTracker.hpp"

namespace furman {

double ProgressTracker::update(std::uint64_t bytesDone, Clock::time_point now) {
    if (!hasSample_) {
        hasSample_ = true;
        lastBytes_ = bytesDone;
        lastAt_ = now;
        return rate_;
    }
    if (bytesDone < lastBytes_) {
        lastBytes_ = bytesDone;
        lastAt_ = now;
        return rate_;
    }
    const double dt = std::chrono::duration<double>(now - lastAt_).count();
    if (dt <= 0.0) return rate_; // the delta is carried into the next reading
    blend(double(bytesDone - lastBytes_) / dt);
    lastBytes_ = bytesDone;
    lastAt_ = now;
    return rate_;
}

bool ProgressTracker::decayIfIdle(Clock::time_point now) {
    if (!hasSample_ || rate_ <= 0.0) return false;
    if (now - lastAt_ < kIdleAfter) return false;
    blend(0.0);
    return true;
}

void ProgressTracker::reset() {
    hasSample_ = false;
    lastBytes_ = 0;
    lastAt_ = {};
    rate_ = 0.0;
}

void ProgressTracker::blend(double instant) {
    if (rate_ > 0.0) rate_ = kSmoothing * instant + (1.0 - kSmoothing) * rate_;
    else rate_ = instant;
    if (rate_ < kFloor) rate_ = 0.0;
}

std::optional<double> etaSeconds(std::uint64_t bytesDone, std::uint64_t bytesTotal, double bytesPerSec) {
    if (bytesPerSec <= 0.0) return std::nullopt;
    const std::uint64_t left = bytesTotal > bytesDone ? bytesTotal - bytesDone : 0;
    return double(left) / bytesPerSec;
}

} // namespace furman
