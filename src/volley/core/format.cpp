// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/format.hpp>
#include <iomanip>
#include <limits>
#include <sstream>

namespace volley::core {

std::string format_size(double bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    constexpr double GB = 1024.0 * MB;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (bytes < KB) {
        ss << bytes << " B";
    } else if (bytes < MB) {
        ss << (bytes / KB) << " KB";
    } else if (bytes < GB) {
        ss << (bytes / MB) << " MB";
    } else {
        ss << (bytes / GB) << " GB";
    }
    return ss.str();
}

std::string format_rate(double bytes_per_second) {
    return format_size(bytes_per_second) + "/s";
}

std::string format_transferred(std::uint64_t transferred, std::uint64_t total) {
    return format_size(static_cast<double>(transferred)) + " / "
         + format_size(static_cast<double>(total));
}

int percent_of(std::uint64_t transferred, std::uint64_t total) noexcept {
    if (total == 0) return 0;
    if (transferred >= total) return 100;
    if (transferred <= std::numeric_limits<std::uint64_t>::max() / 100) {
        return static_cast<int>(transferred * 100 / total);
    }

    // transferred * 100 would overflow: add it up a hundred times modulo total
    int pct = 0;
    std::uint64_t rem = 0;
    const std::uint64_t gap = total - transferred;
    for (int i = 0; i < 100; ++i) {
        if (rem >= gap) {
            rem -= gap;
            ++pct;
        } else {
            rem += transferred;
        }
    }
    return pct;
}

} // namespace volley::core
