// Human-readable sizes, speeds and durations for status lines.
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace furman {

// 512, 1.5K, 3.2M, 1.0G
std::string formatSize(std::uint64_t bytes);
// "" for 0, otherwise 512 B/s, 12.3 KB/s, 4.0 MB/s, 1.1 GB/s
std::string formatSpeed(double bytesPerSec);
// 42s, 3m 5s, 1h 2m; "" when unknown
std::string formatEta(std::optional<double> seconds);

} // namespace furman
