// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nimbus/core/config.hpp>
#include <nimbus/http/http_request.hpp>
#include <memory>
#include <stop_token>
#include <string>

namespace nimbus::http {

// HttpTransport backed by libcurl.
//
// Each request drives its own easy handle through a multi handle on the
// calling thread. The request body is pushed by the caller and pulled by
// curl; the response body is buffered up to RECEIVE_BUFFER_LIMIT bytes, past
// which the transfer is paused until the caller reads.
class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(core::ClientConfig config = {});

    [[nodiscard]] Result<std::unique_ptr<HttpRequest>>
    create_request(const std::string& url, std::stop_token stop) override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    core::ClientConfig config_;
};

} // namespace nimbus::http
