// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/core/config.hpp>
#include <nimbus/io/error.hpp>
#include <nimbus/version.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>

namespace nimbus::core {

std::string ClientConfig::effective_user_agent() const {
    if (!user_agent.empty()) {
        return user_agent;
    }
    return std::string(PRODUCT_NAME) + "/" + version.to_string();
}

Result<ClientConfig> ClientConfig::from_json(const nlohmann::json& j) noexcept {
    if (!j.is_object()) {
        return std::unexpected(Error(Errc::parse_error, "client configuration must be a JSON object"));
    }

    try {
        ClientConfig config;

        if (j.contains("userAgent")) {
            config.user_agent = j["userAgent"].get<std::string>();
        }

        if (j.contains("maxAttempts")) {
            config.max_attempts = j["maxAttempts"].get<int>();
            if (config.max_attempts < 1) {
                return std::unexpected(Error(Errc::invalid_argument, "maxAttempts must be at least 1"));
            }
        }

        if (j.contains("maxRetryDelaySec")) {
            auto seconds = j["maxRetryDelaySec"].get<std::int64_t>();
            if (seconds < 0) {
                return std::unexpected(Error(Errc::invalid_argument, "maxRetryDelaySec must not be negative"));
            }
            config.max_retry_delay = std::chrono::seconds(seconds);
        }

        if (j.contains("bufferSize")) {
            // Signed read so that negative values are not wrapped
            auto size = j["bufferSize"].get<std::int64_t>();
            if (size < 1 || static_cast<std::uint64_t>(size) > MAX_BUFFER_SIZE) {
                return std::unexpected(Error(Errc::invalid_argument, "bufferSize out of range"));
            }
            config.buffer_size = static_cast<std::size_t>(size);
        }

        if (j.contains("http2")) {
            config.prefer_http2 = j["http2"].get<bool>();
        }

        if (j.contains("connectTimeoutSec")) {
            auto seconds = j["connectTimeoutSec"].get<std::int64_t>();
            if (seconds < 0 || seconds > UINT32_MAX) {
                return std::unexpected(Error(Errc::invalid_argument, "connectTimeoutSec out of range"));
            }
            config.connect_timeout_sec = static_cast<std::uint32_t>(seconds);
        }

        if (j.contains("stallTimeoutSec")) {
            auto seconds = j["stallTimeoutSec"].get<std::int64_t>();
            if (seconds < 0 || seconds > UINT32_MAX) {
                return std::unexpected(Error(Errc::invalid_argument, "stallTimeoutSec out of range"));
            }
            config.stall_timeout_sec = static_cast<std::uint32_t>(seconds);
        }

        if (j.contains("verbose")) {
            config.verbose = j["verbose"].get<bool>();
        }

        return config;
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(Error(Errc::parse_error, e.what()));
    }
}

Result<ClientConfig> ClientConfig::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(Error(io::IoErrc::file_not_found, "cannot open " + std::string(path)));
        }

        auto j = nlohmann::json::parse(file);
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(Error(Errc::parse_error, e.what()));
    }
}

} // namespace nimbus::core
