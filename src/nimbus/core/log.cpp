// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace nimbus::core {

namespace {

std::shared_ptr<spdlog::logger> make_logger() {
    if (auto existing = spdlog::get("nimbus")) {
        return existing;
    }
    auto log = spdlog::stderr_color_mt("nimbus");
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
    log->set_level(spdlog::level::info);
    return log;
}

} // namespace

const std::shared_ptr<spdlog::logger>& logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace nimbus::core
