// Per-transfer transfer-rate estimation.
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>

namespace furman {

// Smoothed bytes/s from successive bytesDone readings.
// The first measured interval sets the rate; later intervals are blended with
// an exponential moving average (kSmoothing weight on the new interval).
// Same readings at the same instants always give the same rate.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr double kSmoothing = 0.3;
    // No reading for this long counts as an interval with zero bytes.
    static constexpr std::chrono::milliseconds kIdleAfter{2000};
    // Rates below this are reported as 0.
    static constexpr double kFloor = 1.0;

    // Feed a reading. A decrease in bytesDone resets the baseline without
    // touching the rate.
    double update(std::uint64_t bytesDone, Clock::time_point now);

    // Decays the rate when no reading arrived for kIdleAfter.
    // Returns true if the rate changed.
    bool decayIfIdle(Clock::time_point now);

    double bytesPerSec() const { return rate_; }
    void reset();

private:
    bool hasSample_ = false;
    std::uint64_t lastBytes_ = 0;
    Clock::time_point lastAt_{};
    double rate_ = 0.0;

    void blend(double instant);
};

// Seconds left at the given rate; nullopt when the rate is 0 (unknown).
std::optional<double> etaSeconds(std::uint64_t bytesDone, std::uint64_t bytesTotal, double bytesPerSec);

} // namespace furman
