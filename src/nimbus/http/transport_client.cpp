// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/http/transport_client.hpp>
#include <nimbus/core/log.hpp>
#include <nimbus/core/url.hpp>
#include <nimbus/io/error.hpp>
#include <algorithm>

namespace nimbus::http {

namespace {

// Non-success response of a failed attempt. Owning the request keeps the body
// readable until the failure is classified; destroying it aborts the exchange.
class PendingResponse final : public core::FailedResponse {
public:
    PendingResponse(std::unique_ptr<HttpRequest> request, HttpResponse* response) noexcept
        : request_(std::move(request))
        , response_(response) {}

    ~PendingResponse() override {
        if (request_) {
            request_->abort();
        }
    }

    PendingResponse(const PendingResponse&) = delete;
    PendingResponse& operator=(const PendingResponse&) = delete;

    [[nodiscard]] std::int32_t status_code() const noexcept override {
        return response_->status_code;
    }

    [[nodiscard]] std::expected<std::string, core::Error> read_body() noexcept override {
        if (!response_->body) {
            return std::string{};
        }
        return io::read_to_string(*response_->body);
    }

private:
    std::unique_ptr<HttpRequest> request_;
    HttpResponse* response_;
};

bool is_unreserved(unsigned char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
        || c == '-' || c == '.' || c == '_' || c == '~';
}

void append_form_encoded(std::string& out, std::string_view text) {
    constexpr char HEX[] = "0123456789ABCDEF";
    for (unsigned char c : text) {
        if (is_unreserved(c)) {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
}

} // namespace

std::string form_urlencode(const FormParams& params) {
    std::string body;
    for (const auto& [key, value] : params) {
        if (!body.empty()) {
            body += '&';
        }
        append_form_encoded(body, key);
        body += '=';
        append_form_encoded(body, value);
    }
    return body;
}

Result<std::string> read_string(HttpResponse& response) {
    if (!response.body) {
        return std::string{};
    }
    return io::read_to_string(*response.body);
}

//=============================================================================
// TransportClient
//=============================================================================

TransportClient::TransportClient(std::shared_ptr<HttpTransport> transport,
                                 TokenSettings tokens,
                                 core::ClientConfig config,
                                 core::RetryPolicies policies)
    : transport_(std::move(transport))
    , tokens_(std::move(tokens))
    , config_(std::move(config))
    , policies_(std::move(policies))
    , user_agent_(config_.effective_user_agent()) {}

Result<std::unique_ptr<HttpRequest>> TransportClient::open_request(const std::string& url,
                                                                   std::stop_token stop) {
    auto parsed = core::Url::parse(url);
    if (!parsed) {
        return std::unexpected(std::move(parsed).error());
    }

    if (!tokens_.token_getter) {
        return std::unexpected(core::Error(core::Errc::token_unavailable, "no token getter configured"));
    }
    auto token = tokens_.token_getter();
    if (!token) {
        return std::unexpected(std::move(token).error());
    }

    auto request = transport_->create_request(url, std::move(stop));
    if (!request) {
        return std::unexpected(std::move(request).error());
    }

    auto& req = **request;
    req.protocol(config_.prefer_http2 ? HttpVersion::http2 : HttpVersion::http1_1);
    req.header("User-Agent", user_agent_);
    req.header("Authorization", "Bearer " + *token);
    req.header("Cache-Control", "no-cache");

    core::logger()->debug("Request created: {} ({})",
                          requests_created_.fetch_add(1, std::memory_order_relaxed), parsed->base());
    return request;
}

core::RetryVerdict TransportClient::classify_general(const core::Error& error) const {
    return core::ErrorClassifier(policies_.general).classify(error);
}

core::RetryVerdict TransportClient::classify_file_upload(const core::Error& error) const {
    return core::ErrorClassifier(policies_.general, &policies_.file_upload).classify(error);
}

void TransportClient::on_token_updated(const std::string& access_token,
                                       const std::string& refresh_token,
                                       std::chrono::system_clock::time_point expires_at) {
    if (tokens_.listener) {
        tokens_.listener->on_token_updated(access_token, refresh_token, expires_at);
    }
}

core::RetryOptions TransportClient::retry_options(std::stop_token stop) const {
    core::RetryOptions options;
    options.max_attempts = config_.max_attempts;
    options.delay = [cap = std::chrono::milliseconds(config_.max_retry_delay)](int attempt) {
        return core::retry_delay(attempt, cap);
    };
    options.stop = std::move(stop);
    return options;
}

//-----------------------------------------------------------------------------
// Attempt plumbing
//-----------------------------------------------------------------------------

Result<void> TransportClient::execute(HttpMethod method,
                                      const std::string& url,
                                      const RequestWriter& write,
                                      const ResponseStreamer& handle,
                                      std::stop_token stop) {
    return core::retry(
        retry_options(stop),
        [&]() -> Result<void> {
            auto request = open_request(url, stop);
            if (!request) {
                return std::unexpected(std::move(request).error());
            }

            (*request)->method(method);
            if (write) {
                auto written = write(**request);
                if (!written && !written.error().is(core::Errc::answered_early)) {
                    return std::unexpected(std::move(written).error());
                }
            }

            return receive(std::move(*request), handle);
        },
        [this](const core::Error& error) { return classify_general(error); });
}

Result<void> TransportClient::execute_upload(HttpMethod method,
                                             const std::string& url,
                                             const SendFileInfo& info,
                                             const ResponseStreamer& handle) {
    return core::retry(
        retry_options(info.cancellation),
        [&]() -> Result<void> {
            auto request = open_request(url, info.cancellation);
            if (!request) {
                return std::unexpected(std::move(request).error());
            }

            auto sent = write_multipart(**request, method, info);
            if (!sent && !sent.error().is(core::Errc::answered_early)) {
                (*request)->abort();
                return std::unexpected(std::move(sent).error());
            }

            return receive(std::move(*request), handle);
        },
        [this](const core::Error& error) { return classify_file_upload(error); });
}

Result<void> TransportClient::receive(std::unique_ptr<HttpRequest> request,
                                      const ResponseStreamer& handle) {
    auto response = request->response();
    if (!response) {
        request->abort();
        return std::unexpected(std::move(response).error());
    }

    auto* resp = *response;
    if (!core::is_success_status(resp->status_code)) {
        auto status = resp->status_code;
        return std::unexpected(core::Error::http_status(
            status, std::make_shared<PendingResponse>(std::move(request), resp)));
    }

    if (!handle) {
        return {};
    }
    return handle(*resp);
}

Result<void> TransportClient::write_body(HttpRequest& request,
                                         std::string_view content_type,
                                         std::string body) {
    request.header("Content-Type", content_type);

    auto output = request.request_stream(std::nullopt);
    if (!output) {
        return std::unexpected(std::move(output).error());
    }

    auto written = (*output)->write(io::as_bytes(body));
    if (!written) {
        return written;
    }
    return (*output)->flush();
}

Result<void> TransportClient::write_multipart(HttpRequest& request,
                                              HttpMethod method,
                                              const SendFileInfo& info) {
    request.method(method);

    auto boundary = MultipartBoundary::create(info);
    if (!boundary) {
        return std::unexpected(std::move(boundary).error());
    }
    request.header("Content-Type", boundary->content_type());

    if (!info.stream_opener) {
        return std::unexpected(core::Error(core::Errc::invalid_argument, "no stream opener"));
    }
    auto opened = info.stream_opener();
    if (!opened) {
        return std::unexpected(std::move(opened).error());
    }
    auto& input = **opened;

    auto file_length = input.length();
    if (!file_length) {
        return std::unexpected(core::Error(io::IoErrc::unknown_length, "upload source must report its length"));
    }

    io::MemoryInputStream prefix(boundary->prefix(*file_length));
    io::MemoryInputStream postfix(boundary->postfix());
    auto content_length = *prefix.length() + *file_length + *postfix.length();

    if (info.cancellation.stop_requested()) {
        return std::unexpected(core::Error(core::Errc::cancelled));
    }

    auto output = request.request_stream(content_length);
    if (!output) {
        return std::unexpected(std::move(output).error());
    }

    io::ProgressState state;
    const io::CopyOptions framing{info.buffer_size, info.cancellation, {}, nullptr};
    const io::CopyOptions body{info.buffer_size, info.cancellation, info.progress, &state};

    if (auto copied = io::copy_stream(prefix, **output, framing); !copied) {
        return std::unexpected(std::move(copied).error());
    }

    auto copied = io::copy_stream(input, **output, body);
    if (!copied) {
        return std::unexpected(std::move(copied).error());
    }
    if (*copied != *file_length) {
        return std::unexpected(core::Error(io::IoErrc::read_error,
            "upload source produced " + std::to_string(*copied) + " of " + std::to_string(*file_length) + " bytes"));
    }

    if (auto done = io::copy_stream(postfix, **output, framing); !done) {
        return std::unexpected(std::move(done).error());
    }
    return (*output)->flush();
}

//-----------------------------------------------------------------------------
// GET
//-----------------------------------------------------------------------------

Result<std::string> TransportClient::get_string(const std::string& url, std::stop_token stop) {
    return send<std::string>(HttpMethod::get, url, ResponseParser<std::string>(read_string), std::move(stop));
}

Result<void> TransportClient::get_to_stream(const std::string& url,
                                            const ResponseStreamer& streamer,
                                            std::optional<std::uint64_t> offset,
                                            std::optional<std::uint64_t> length,
                                            std::stop_token stop) {
    if (offset && length && *length == 0) {
        return std::unexpected(core::Error(core::Errc::invalid_argument, "empty range"));
    }

    return execute(
        HttpMethod::get, url,
        [offset, length](HttpRequest& request) -> Result<void> {
            if (offset && length) {
                request.range(*offset, *offset + *length - 1);
            } else if (offset) {
                request.range(*offset);
            }
            return {};
        },
        streamer, std::move(stop));
}

Result<void> TransportClient::get_to_stream(const std::string& url,
                                            io::OutputStream& sink,
                                            std::optional<std::uint64_t> offset,
                                            std::optional<std::uint64_t> length,
                                            std::size_t buffer_size,
                                            io::ProgressFn progress,
                                            std::stop_token stop) {
    auto streamer = [&sink, buffer_size, &progress, stop](HttpResponse& response) -> Result<void> {
        if (!response.body) {
            return {};
        }

        // No point in a buffer larger than the announced body
        std::size_t chunk = buffer_size;
        if (response.content_length) {
            chunk = static_cast<std::size_t>(
                std::max<std::uint64_t>(1, std::min<std::uint64_t>(buffer_size, *response.content_length)));
        }

        io::ProgressState state;
        auto copied = io::copy_stream(*response.body, sink, io::CopyOptions{chunk, stop, progress, &state});
        if (!copied) {
            return std::unexpected(std::move(copied).error());
        }
        return {};
    };

    return get_to_stream(url, streamer, offset, length, std::move(stop));
}

Result<std::size_t> TransportClient::get_to_buffer(const std::string& url,
                                                   std::span<std::byte> buffer,
                                                   std::size_t buffer_index,
                                                   std::uint64_t file_offset,
                                                   std::size_t length,
                                                   std::stop_token stop) {
    if (buffer_index > buffer.size() || length > buffer.size() - buffer_index) {
        return std::unexpected(core::Error(core::Errc::invalid_argument, "range outside of buffer"));
    }

    io::SpanOutputStream region(buffer.subspan(buffer_index, length));
    auto done = get_to_stream(url, region, file_offset, length, config_.buffer_size, {}, std::move(stop));
    if (!done) {
        return std::unexpected(std::move(done).error());
    }
    return region.position();
}

} // namespace nimbus::http
