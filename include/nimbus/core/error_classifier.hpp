// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nimbus/core/config.hpp>
#include <nimbus/core/error.hpp>
#include <nimbus/core/retry.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <map>

namespace nimbus::core {

constexpr std::array<std::int32_t, 3> SUCCESS_STATUS_CODES = {200, 201, 206};
constexpr std::array<std::int32_t, 1> ALWAYS_RETRY_STATUS_CODES = {407};  // Proxy Authentication Required

[[nodiscard]] bool is_success_status(std::int32_t status) noexcept;
[[nodiscard]] bool is_always_retry_status(std::int32_t status) noexcept;

// Decides for one status code. Returns true when the failure was handled and
// the request should be retried.
using StatusProcessor = std::function<bool(std::int32_t status)>;

// Status code -> processor table
class RetryPolicy {
public:
    RetryPolicy() = default;

    RetryPolicy& on(std::int32_t status, StatusProcessor processor);

    [[nodiscard]] const StatusProcessor* find(std::int32_t status) const noexcept;
    [[nodiscard]] bool empty() const noexcept { return processors_.empty(); }

private:
    std::map<std::int32_t, StatusProcessor> processors_;
};

// The two tables a client owns
struct RetryPolicies {
    RetryPolicy general;
    RetryPolicy file_upload;  // Consulted before general for uploads
};

// Retry/abort decision for failed attempts.
//
// Cancellation aborts as is. Otherwise the cause chain is searched for an
// HTTP status failure; without one the error is not retryable. Statuses in
// the always-retry set are retried, then the specialized table and the
// general table are asked in turn. Anything not handled becomes a transfer
// error carrying the status and the response body.
class ErrorClassifier {
public:
    explicit ErrorClassifier(const RetryPolicy& general,
                             const RetryPolicy* specialized = nullptr) noexcept
        : general_(general)
        , specialized_(specialized) {}

    [[nodiscard]] RetryVerdict classify(const Error& error) const;

    [[nodiscard]] RetryVerdict operator()(const Error& error) const { return classify(error); }

private:
    [[nodiscard]] const StatusProcessor* lookup(std::int32_t status) const noexcept;

    const RetryPolicy& general_;
    const RetryPolicy* specialized_;
};

} // namespace nimbus::core
