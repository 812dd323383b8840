// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nimbus/core/error.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace nimbus::http {

using core::Result;

// Produces the bearer token for the next request. Called for every attempt;
// caching, if any, is up to the implementation.
using TokenGetter = std::function<Result<std::string>()>;

// Notified when the token source rotates credentials
class TokenUpdateListener {
public:
    virtual ~TokenUpdateListener() = default;

    virtual void on_token_updated(const std::string& access_token,
                                  const std::string& refresh_token,
                                  std::chrono::system_clock::time_point expires_at) = 0;
};

struct TokenSettings {
    TokenGetter token_getter;
    std::shared_ptr<TokenUpdateListener> listener;
};

// Thread-safe holder of the current credentials. Receives rotations as a
// listener and serves the access token through getter().
class TokenStore final : public TokenUpdateListener,
                         public std::enable_shared_from_this<TokenStore> {
public:
    TokenStore() = default;
    explicit TokenStore(std::string access_token,
                        std::string refresh_token = {},
                        std::chrono::system_clock::time_point expires_at = {});

    void on_token_updated(const std::string& access_token,
                          const std::string& refresh_token,
                          std::chrono::system_clock::time_point expires_at) override;

    [[nodiscard]] Result<std::string> access_token() const;
    [[nodiscard]] std::string refresh_token() const;
    [[nodiscard]] std::chrono::system_clock::time_point expires_at() const;

    // Getter bound to this store, keeping it alive
    [[nodiscard]] TokenGetter getter();

    // Settings using this store as both getter and listener
    [[nodiscard]] TokenSettings settings();

private:
    mutable std::mutex mutex_;
    std::string access_token_;
    std::string refresh_token_;
    std::chrono::system_clock::time_point expires_at_{};
};

} // namespace nimbus::http
