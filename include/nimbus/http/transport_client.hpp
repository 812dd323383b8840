// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nimbus/core/config.hpp>
#include <nimbus/core/error.hpp>
#include <nimbus/core/error_classifier.hpp>
#include <nimbus/core/retry.hpp>
#include <nimbus/http/http_request.hpp>
#include <nimbus/http/multipart.hpp>
#include <nimbus/http/token.hpp>
#include <nimbus/io/stream.hpp>
#include <nimbus/io/stream_copier.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace nimbus::http {

template<typename T>
using ResponseParser = std::function<Result<T>(HttpResponse&)>;

// Consumes a successful response body
using ResponseStreamer = std::function<Result<void>(HttpResponse&)>;

// Form fields in send order
using FormParams = std::vector<std::pair<std::string, std::string>>;

// application/x-www-form-urlencoded body
[[nodiscard]] std::string form_urlencode(const FormParams& params);

// Whole response body as text
[[nodiscard]] Result<std::string> read_string(HttpResponse& response);

template<typename T>
[[nodiscard]] Result<T> parse_json(HttpResponse& response) {
    auto text = read_string(response);
    if (!text) {
        return std::unexpected(std::move(text).error());
    }
    try {
        return nlohmann::json::parse(*text).get<T>();
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(core::Error(core::Errc::parse_error, e.what()));
    }
}

// REST client for the storage service.
//
// Every operation is one logical operation: each attempt creates a fresh
// request, applies the common headers and a freshly fetched bearer token,
// writes a freshly built body and checks the status. Failed attempts go
// through the error classifier, which decides between another attempt and
// giving up with a transfer error.
class TransportClient {
public:
    TransportClient(std::shared_ptr<HttpTransport> transport,
                    TokenSettings tokens,
                    core::ClientConfig config = {},
                    core::RetryPolicies policies = {});

    // Non-copyable, non-movable (classifiers refer to the policies)
    TransportClient(const TransportClient&) = delete;
    TransportClient& operator=(const TransportClient&) = delete;
    TransportClient(TransportClient&&) = delete;
    TransportClient& operator=(TransportClient&&) = delete;

    [[nodiscard]] const core::ClientConfig& config() const noexcept { return config_; }
    [[nodiscard]] const core::RetryPolicies& policies() const noexcept { return policies_; }

    // Request with the common settings and the current token applied
    [[nodiscard]] Result<std::unique_ptr<HttpRequest>> open_request(const std::string& url,
                                                                    std::stop_token stop = {});

    // Classification used by every operation except uploads
    [[nodiscard]] core::RetryVerdict classify_general(const core::Error& error) const;

    // Classification used by uploads
    [[nodiscard]] core::RetryVerdict classify_file_upload(const core::Error& error) const;

    // Forward a credential rotation to the configured listener
    void on_token_updated(const std::string& access_token,
                          const std::string& refresh_token,
                          std::chrono::system_clock::time_point expires_at);

    //-------------------------------------------------------------------------
    // GET
    //-------------------------------------------------------------------------

    template<typename TResult>
    [[nodiscard]] Result<TResult> get_json(const std::string& url, std::stop_token stop = {}) {
        return send<TResult>(HttpMethod::get, url, stop);
    }

    [[nodiscard]] Result<std::string> get_string(const std::string& url, std::stop_token stop = {});

    // Range GET handed to streamer. offset+length ask for
    // [offset, offset+length-1], offset alone for everything from offset.
    [[nodiscard]] Result<void> get_to_stream(const std::string& url,
                                             const ResponseStreamer& streamer,
                                             std::optional<std::uint64_t> offset = std::nullopt,
                                             std::optional<std::uint64_t> length = std::nullopt,
                                             std::stop_token stop = {});

    // Range GET copied into sink, progress as in io::copy_stream
    [[nodiscard]] Result<void> get_to_stream(const std::string& url,
                                             io::OutputStream& sink,
                                             std::optional<std::uint64_t> offset = std::nullopt,
                                             std::optional<std::uint64_t> length = std::nullopt,
                                             std::size_t buffer_size = core::DEFAULT_BUFFER_SIZE,
                                             io::ProgressFn progress = {},
                                             std::stop_token stop = {});

    // Range GET into buffer[buffer_index, buffer_index + length). Returns bytes written.
    [[nodiscard]] Result<std::size_t> get_to_buffer(const std::string& url,
                                                    std::span<std::byte> buffer,
                                                    std::size_t buffer_index,
                                                    std::uint64_t file_offset,
                                                    std::size_t length,
                                                    std::stop_token stop = {});

    //-------------------------------------------------------------------------
    // POST / PATCH
    //-------------------------------------------------------------------------

    template<typename TParam, typename TResult>
    [[nodiscard]] Result<TResult> post(const std::string& url, const TParam& obj, std::stop_token stop = {}) {
        return send_json<TParam, TResult>(HttpMethod::post, url, obj, stop);
    }

    template<typename TParam, typename TResult>
    [[nodiscard]] Result<TResult> patch(const std::string& url, const TParam& obj, std::stop_token stop = {}) {
        return send_json<TParam, TResult>(HttpMethod::patch, url, obj, stop);
    }

    template<typename TResult>
    [[nodiscard]] Result<TResult> post_form(const std::string& url, const FormParams& params,
                                            std::stop_token stop = {}) {
        return send_form<TResult>(HttpMethod::post, url, params, stop);
    }

    template<typename TResult>
    [[nodiscard]] Result<TResult> send_form(HttpMethod method, const std::string& url,
                                            const FormParams& params, std::stop_token stop = {}) {
        std::optional<TResult> result;
        auto done = execute(
            method, url,
            [&params](HttpRequest& request) {
                return write_body(request, "application/x-www-form-urlencoded", form_urlencode(params));
            },
            collect<TResult>(result, parse_json<TResult>),
            stop);
        return finish(std::move(done), std::move(result));
    }

    //-------------------------------------------------------------------------
    // Generic send
    //-------------------------------------------------------------------------

    template<typename TResult>
    [[nodiscard]] Result<TResult> send(HttpMethod method, const std::string& url, std::stop_token stop = {}) {
        return send<TResult>(method, url, ResponseParser<TResult>(parse_json<TResult>), stop);
    }

    template<typename TResult>
    [[nodiscard]] Result<TResult> send(HttpMethod method, const std::string& url,
                                       const ResponseParser<TResult>& parser, std::stop_token stop = {}) {
        std::optional<TResult> result;
        auto done = execute(method, url, {}, collect<TResult>(result, parser), stop);
        return finish(std::move(done), std::move(result));
    }

    template<typename TParam, typename TResult>
    [[nodiscard]] Result<TResult> send_json(HttpMethod method, const std::string& url,
                                            const TParam& obj, std::stop_token stop = {}) {
        return send_json<TParam, TResult>(method, url, obj, ResponseParser<TResult>(parse_json<TResult>), stop);
    }

    template<typename TParam, typename TResult>
    [[nodiscard]] Result<TResult> send_json(HttpMethod method, const std::string& url, const TParam& obj,
                                            const ResponseParser<TResult>& parser, std::stop_token stop = {}) {
        std::optional<TResult> result;
        auto done = execute(
            method, url,
            [&obj](HttpRequest& request) -> Result<void> {
                std::string data;
                try {
                    data = nlohmann::json(obj).dump();
                } catch (const nlohmann::json::exception& e) {
                    return std::unexpected(core::Error(core::Errc::invalid_argument, e.what()));
                }
                return write_body(request, "application/json; charset=utf-8", std::move(data));
            },
            collect<TResult>(result, parser),
            stop);
        return finish(std::move(done), std::move(result));
    }

    //-------------------------------------------------------------------------
    // Upload
    //-------------------------------------------------------------------------

    // multipart/form-data upload; the source is reopened for every attempt
    template<typename TResult>
    [[nodiscard]] Result<TResult> send_file(HttpMethod method, const std::string& url, const SendFileInfo& info) {
        std::optional<TResult> result;
        auto done = execute_upload(method, url, info, collect<TResult>(result, parse_json<TResult>));
        return finish(std::move(done), std::move(result));
    }

private:
    using RequestWriter = std::function<Result<void>(HttpRequest&)>;

    [[nodiscard]] Result<void> execute(HttpMethod method,
                                       const std::string& url,
                                       const RequestWriter& write,
                                       const ResponseStreamer& handle,
                                       std::stop_token stop);

    [[nodiscard]] Result<void> execute_upload(HttpMethod method,
                                              const std::string& url,
                                              const SendFileInfo& info,
                                              const ResponseStreamer& handle);

    // Status check, then handle or a failure holding the response
    [[nodiscard]] static Result<void> receive(std::unique_ptr<HttpRequest> request,
                                              const ResponseStreamer& handle);

    [[nodiscard]] static Result<void> write_body(HttpRequest& request,
                                                 std::string_view content_type,
                                                 std::string body);

    [[nodiscard]] static Result<void> write_multipart(HttpRequest& request,
                                                      HttpMethod method,
                                                      const SendFileInfo& info);

    [[nodiscard]] core::RetryOptions retry_options(std::stop_token stop) const;

    template<typename TResult>
    static ResponseStreamer collect(std::optional<TResult>& result, ResponseParser<TResult> parser) {
        return [&result, parser = std::move(parser)](HttpResponse& response) -> Result<void> {
            auto parsed = parser(response);
            if (!parsed) {
                return std::unexpected(std::move(parsed).error());
            }
            result = std::move(*parsed);
            return {};
        };
    }

    template<typename TResult>
    static Result<TResult> finish(Result<void> done, std::optional<TResult> result) {
        if (!done) {
            return std::unexpected(std::move(done).error());
        }
        return std::move(*result);
    }

    std::shared_ptr<HttpTransport> transport_;
    TokenSettings tokens_;
    core::ClientConfig config_;
    core::RetryPolicies policies_;
    std::string user_agent_;
    std::atomic<std::uint64_t> requests_created_{0};
};

} // namespace nimbus::http
