// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nimbus/core/error.hpp>
#include <nimbus/io/stream.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace nimbus::http {

using core::Result;

enum class HttpMethod : std::uint8_t {
    get,
    post,
    put,
    patch,
    del,
};

[[nodiscard]] std::string_view to_string(HttpMethod method) noexcept;

enum class HttpVersion : std::uint8_t {
    http1_1,
    http2,
};

// Response status and headers; the body is owned by the request
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // Lower-cased names
    std::optional<std::uint64_t> content_length;
    io::InputStream* body{nullptr};

    [[nodiscard]] const std::string* header(std::string_view name) const;
};

// Parsed "Content-Range: bytes first-last/total"
struct ContentRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> total;  // Unset for "*"
};

[[nodiscard]] Result<ContentRange> parse_content_range(std::string_view value) noexcept;

// One request/response exchange. A request serves a single attempt.
class HttpRequest {
public:
    virtual ~HttpRequest() = default;

    virtual void method(HttpMethod method) = 0;
    virtual void protocol(HttpVersion version) = 0;

    // Replaces any previous value of the header
    virtual void header(std::string_view name, std::string_view value) = 0;

    // Body of the request. content_length unset sends it chunked. Writes fail
    // with Errc::answered_early once the server has answered; response() then
    // returns that answer.
    [[nodiscard]] virtual Result<io::OutputStream*> request_stream(std::optional<std::uint64_t> content_length) = 0;

    // Finishes the request and waits for the response headers
    [[nodiscard]] virtual Result<HttpResponse*> response() = 0;

    // Drop the exchange and its connection
    virtual void abort() noexcept = 0;

    // Range: bytes=offset- or bytes=offset-last
    void range(std::uint64_t offset, std::optional<std::uint64_t> last = std::nullopt);
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual Result<std::unique_ptr<HttpRequest>>
    create_request(const std::string& url, std::stop_token stop) = 0;
};

} // namespace nimbus::http
