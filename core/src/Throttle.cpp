// Simple bucket-based throttling: sleep whenever a chunk arrived faster than
// the limit allows.
#include "furman/Throttle.hpp"
#include <algorithm>
#include <thread>

namespace furman {

namespace {
constexpr std::chrono::milliseconds kSlice{50};
constexpr double kMinSleepSec = 0.0005; // avoid ultra-short sleeps
}

Throttle::Throttle(std::uint64_t bytesPerSec) : limit_(bytesPerSec) {}

std::chrono::duration<double> Throttle::delayFor(std::uint64_t bytes,
                                                 double elapsedSec,
                                                 std::uint64_t limit) {
    if (limit == 0 || bytes == 0) return std::chrono::duration<double>(0.0);
    const double expectedSec = double(bytes) / double(limit);
    if (elapsedSec >= expectedSec) return std::chrono::duration<double>(0.0);
    return std::chrono::duration<double>(expectedSec - elapsedSec);
}

void Throttle::pace(std::uint64_t done, const std::function<bool()>& interrupted) {
    const std::uint64_t limit = limit_.load();
    if (limit == 0 || done <= lastDone_) {
        restart(done);
        return;
    }
    const double elapsedSec = std::chrono::duration<double>(clock::now() - lastTick_).count();
    auto remaining = delayFor(done - lastDone_, elapsedSec, limit);
    if (remaining.count() > kMinSleepSec) {
        const auto until = clock::now() + std::chrono::duration_cast<clock::duration>(remaining);
        while (clock::now() < until) {
            if (interrupted && interrupted()) break;
            if (limit_.load() != limit) break; // re-evaluated on the next chunk
            const auto left = until - clock::now();
            std::this_thread::sleep_for(std::min<clock::duration>(left, kSlice));
        }
    }
    restart(done);
}

void Throttle::restart(std::uint64_t done) {
    lastTick_ = clock::now();
    lastDone_ = done;
}

} // namespace furman
