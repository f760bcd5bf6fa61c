// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace volley::log {

namespace {

std::mutex init_mutex;

std::shared_ptr<spdlog::logger> create_locked() {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    return logger;
}

} // namespace

void init(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(init_mutex);
    create_locked()->set_level(level);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(init_mutex);
    return create_locked();
}

} // namespace volley::log
