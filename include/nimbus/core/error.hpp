// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace nimbus::core {

enum class Errc {
    success = 0,
    network_error,
    http_status,
    transfer_failed,
    cancelled,
    invalid_url,
    invalid_argument,
    parse_error,
    token_unavailable,
    answered_early,
};

namespace detail {

struct ErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "nimbus::core";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<Errc>(ev)) {
            case Errc::success:            return "Success";
            case Errc::network_error:      return "Network error";
            case Errc::http_status:        return "Unexpected HTTP status";
            case Errc::transfer_failed:    return "Transfer failed";
            case Errc::cancelled:          return "Operation cancelled";
            case Errc::invalid_url:        return "Invalid URL";
            case Errc::invalid_argument:   return "Invalid argument";
            case Errc::parse_error:        return "Malformed response";
            case Errc::token_unavailable:  return "Access token unavailable";
            case Errc::answered_early:     return "Server answered before the request body was sent";
            default:                       return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ErrcCategory& errc_category() noexcept {
    static detail::ErrcCategory category;
    return category;
}

inline std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), errc_category()};
}

class Error;

// Response of a failed attempt, kept open until the failure is classified
class FailedResponse {
public:
    virtual ~FailedResponse() = default;

    [[nodiscard]] virtual std::int32_t status_code() const noexcept = 0;

    // Read whatever is left of the body
    [[nodiscard]] virtual std::expected<std::string, Error> read_body() noexcept = 0;
};

// Error value returned by every fallible operation.
//
// Besides the error code it carries what a transfer failure needs to be
// reported: the HTTP status, the response body, and the failure it was
// raised from. Errors of kind Errc::http_status also hold the response of
// the failed attempt until it is released.
class Error {
public:
    Error() = default;
    Error(std::error_code code, std::string message = {});  // NOLINT(google-explicit-constructor)
    Error(Errc code, std::string message = {});             // NOLINT(google-explicit-constructor)

    // Non-success HTTP status with the response still attached
    [[nodiscard]] static Error http_status(std::int32_t status,
                                           std::shared_ptr<FailedResponse> response,
                                           std::string message = {});

    // Terminal transfer failure surfaced to callers
    [[nodiscard]] static Error transfer(std::int32_t status,
                                        std::string body,
                                        std::string message,
                                        std::shared_ptr<const Error> cause = nullptr);

    [[nodiscard]] const std::error_code& code() const noexcept { return code_; }
    [[nodiscard]] std::int32_t status_code() const noexcept { return status_code_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }
    [[nodiscard]] const Error* cause() const noexcept { return cause_.get(); }
    [[nodiscard]] const std::shared_ptr<FailedResponse>& response() const noexcept { return response_; }

    // Explicit message, or the category message when none was given
    [[nodiscard]] std::string message() const;

    [[nodiscard]] bool is(Errc e) const noexcept { return code_ == make_error_code(e); }
    [[nodiscard]] bool cancelled() const noexcept { return is(Errc::cancelled); }

    // Attach the failure this one was raised from
    Error& caused_by(Error cause);

    // Drop the attached response, closing its connection
    void release_response() noexcept { response_.reset(); }

    explicit operator bool() const noexcept { return static_cast<bool>(code_); }

private:
    std::error_code code_;
    std::string message_;
    std::int32_t status_code_{0};
    std::string body_;
    std::shared_ptr<const Error> cause_;
    std::shared_ptr<FailedResponse> response_;
};

template<typename T>
using Result = std::expected<T, Error>;

// Walk the cause chain, at most max_depth errors deep, for the first error
// of the given kind
[[nodiscard]] const Error* find_cause(const Error& error, Errc kind, int max_depth = 3) noexcept;

} // namespace nimbus::core

namespace std {

template<>
struct is_error_code_enum<nimbus::core::Errc> : true_type {};

} // namespace std
