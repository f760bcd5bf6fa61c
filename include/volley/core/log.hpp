// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace volley::log {

// Name of the process-wide logger
inline constexpr const char* LOGGER_NAME = "volley";

// Create (or reconfigure) the stderr logger at `level`
void init(spdlog::level::level_enum level = spdlog::level::info);

// The volley logger; created at info level on first use if init() was not called
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

} // namespace volley::log
