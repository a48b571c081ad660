// Bandwidth throttling for chunked copies.
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace furman {

// Keeps the observed rate of one transfer under a limit by sleeping after
// each chunk. The limit may change from another thread at any time.
class Throttle {
public:
    using clock = std::chrono::steady_clock;

    explicit Throttle(std::uint64_t bytesPerSec = 0);

    void setLimit(std::uint64_t bytesPerSec) { limit_.store(bytesPerSec); }
    std::uint64_t limit() const { return limit_.load(); }

    // Time still owed for `bytes` transferred in `elapsedSec` at `limit`
    // bytes/s. Zero when unlimited or already slow enough.
    static std::chrono::duration<double> delayFor(std::uint64_t bytes,
                                                  double elapsedSec,
                                                  std::uint64_t limit);

    // Account for `done` total bytes and sleep if needed. The sleep is cut
    // short as soon as `interrupted` returns true or the limit changes.
    void pace(std::uint64_t done, const std::function<bool()>& interrupted = {});

    // Forget the previous tick (after a pause or at a new file).
    void restart(std::uint64_t done);

private:
    std::atomic<std::uint64_t> limit_;
    std::uint64_t lastDone_ = 0;
    clock::time_point lastTick_ = clock::now();
};

} // namespace furman
