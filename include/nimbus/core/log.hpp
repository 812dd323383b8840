// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace nimbus::core {

// Process-wide logger ("nimbus", stderr)
[[nodiscard]] const std::shared_ptr<spdlog::logger>& logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace nimbus::core
