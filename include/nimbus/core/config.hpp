// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nimbus/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace nimbus::core {

constexpr int MAX_ATTEMPTS = 100;
constexpr std::chrono::seconds MAX_RETRY_DELAY{60};                 // Ceiling for 2^n backoff

constexpr std::size_t DEFAULT_BUFFER_SIZE = 4096;
constexpr std::size_t MAX_BUFFER_SIZE = 64 * 1024 * 1024;           // 64 MB
constexpr std::size_t UPLOAD_BUFFER_SIZE = 64 * 1024;               // 64 KB
constexpr std::size_t RECEIVE_BUFFER_LIMIT = 256 * 1024;            // Pause curl above this

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr int CAUSE_SEARCH_DEPTH = 3;

// Runtime settings of a transport client
struct ClientConfig {
    std::string user_agent;                          // Empty means "nimbus/<version>"
    int max_attempts{MAX_ATTEMPTS};
    std::chrono::seconds max_retry_delay{MAX_RETRY_DELAY};
    std::size_t buffer_size{DEFAULT_BUFFER_SIZE};
    bool prefer_http2{true};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    bool verbose{false};                             // curl wire tracing

    // User agent actually sent
    [[nodiscard]] std::string effective_user_agent() const;

    // Read settings from a JSON object, unknown keys are ignored
    [[nodiscard]] static Result<ClientConfig> from_json(const nlohmann::json& j) noexcept;

    // Read settings from a JSON file
    [[nodiscard]] static Result<ClientConfig> load(std::string_view path) noexcept;
};

} // namespace nimbus::core
