// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>

namespace volley::core {

// Human readable size with two decimals: "512.00 B", "1.50 MB"
[[nodiscard]] std::string format_size(double bytes);

// format_size(bytes_per_second) + "/s"
[[nodiscard]] std::string format_rate(double bytes_per_second);

// "<transferred> / <total>"
[[nodiscard]] std::string format_transferred(std::uint64_t transferred, std::uint64_t total);

// floor(transferred * 100 / total), clamped to [0, 100]
[[nodiscard]] int percent_of(std::uint64_t transferred, std::uint64_t total) noexcept;

} // namespace volley::core
