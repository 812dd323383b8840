// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/http/token.hpp>
#include <nimbus/core/log.hpp>

namespace nimbus::http {

TokenStore::TokenStore(std::string access_token,
                       std::string refresh_token,
                       std::chrono::system_clock::time_point expires_at)
    : access_token_(std::move(access_token))
    , refresh_token_(std::move(refresh_token))
    , expires_at_(expires_at) {}

void TokenStore::on_token_updated(const std::string& access_token,
                                  const std::string& refresh_token,
                                  std::chrono::system_clock::time_point expires_at) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        access_token_ = access_token;
        refresh_token_ = refresh_token;
        expires_at_ = expires_at;
    }
    core::logger()->debug("Access token rotated");
}

Result<std::string> TokenStore::access_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (access_token_.empty()) {
        return std::unexpected(core::Error(core::Errc::token_unavailable));
    }
    return access_token_;
}

std::string TokenStore::refresh_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refresh_token_;
}

std::chrono::system_clock::time_point TokenStore::expires_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return expires_at_;
}

TokenGetter TokenStore::getter() {
    return [self = shared_from_this()] { return self->access_token(); };
}

TokenSettings TokenStore::settings() {
    return TokenSettings{getter(), shared_from_this()};
}

} // namespace nimbus::http
