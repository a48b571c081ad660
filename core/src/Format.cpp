#include "furman/Format.hpp"
#include <cmath>
#include <cstdio>

namespace furman {

namespace {
constexpr double KIB = 1024.0;
constexpr double MIB = KIB * 1024.0;
constexpr double GIB = MIB * 1024.0;

std::string printf1(const char* fmt, double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), fmt, v);
    return buf;
}
} // namespace

std::string formatSize(std::uint64_t bytes) {
    const double b = double(bytes);
    if (b < KIB) return std::to_string(bytes);
    if (b < MIB) return printf1("%.1fK", b / KIB);
    if (b < GIB) return printf1("%.1fM", b / MIB);
    return printf1("%.1fG", b / GIB);
}

std::string formatSpeed(double bytesPerSec) {
    if (bytesPerSec <= 0.0) return {};
    if (bytesPerSec < KIB) return printf1("%.0f B/s", bytesPerSec);
    if (bytesPerSec < MIB) return printf1("%.1f KB/s", bytesPerSec / KIB);
    if (bytesPerSec < GIB) return printf1("%.1f MB/s", bytesPerSec / MIB);
    return printf1("%.1f GB/s", bytesPerSec / GIB);
}

std::string formatEta(std::optional<double> seconds) {
    if (!seconds || *seconds <= 0.0) return {};
    const long long secs = std::llround(*seconds);
    char buf[64];
    if (secs < 60) {
        std::snprintf(buf, sizeof(buf), "%llds", secs);
    } else if (secs < 3600) {
        std::snprintf(buf, sizeof(buf), "%lldm %llds", secs / 60, secs % 60);
    } else {
        std::snprintf(buf, sizeof(buf), "%lldh %lldm", secs / 3600, (secs % 3600) / 60);
    }
    return buf;
}

} // namespace furman
