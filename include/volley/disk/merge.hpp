// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/disk/error.hpp>
#include <cstdint>
#include <string_view>

namespace volley::disk {

// Concatenate "<destination>.part0" .. "<destination>.part<count-1>" into
// destination in ascending index order. Each part is deleted as soon as it has
// been copied. The destination is truncated first.
[[nodiscard]] std::error_code merge_parts(std::string_view destination,
                                          std::uint32_t part_count) noexcept;

// Best-effort removal of every part file of a transfer. Never fails.
void cleanup_parts(std::string_view destination, std::uint32_t part_count) noexcept;

// Best-effort removal of a single file. Never fails.
void remove_file(std::string_view path) noexcept;

} // namespace volley::disk
