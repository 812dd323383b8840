// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nimbus/core/config.hpp>
#include <nimbus/core/error.hpp>
#include <nimbus/core/log.hpp>
#include <chrono>
#include <functional>
#include <stop_token>
#include <type_traits>
#include <utility>

namespace nimbus::core {

// 2^attempt seconds, capped at max_delay
[[nodiscard]] std::chrono::milliseconds retry_delay(int attempt,
                                                    std::chrono::milliseconds max_delay = MAX_RETRY_DELAY) noexcept;

// Sleep that wakes early on a stop request. Returns false if interrupted.
using SleepFunction = std::function<bool(std::chrono::milliseconds, std::stop_token)>;

[[nodiscard]] bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop);

// Decision of a classifier: a value means "retry", an error means "abort with it"
using RetryVerdict = std::expected<void, Error>;
using ErrorClassifierFn = std::function<RetryVerdict(const Error&)>;

struct RetryOptions {
    int max_attempts{MAX_ATTEMPTS};
    std::function<std::chrono::milliseconds(int)> delay{[](int attempt) { return retry_delay(attempt); }};
    std::stop_token stop;
    SleepFunction sleep{interruptible_sleep};
};

// Run action until it succeeds, the classifier aborts, the attempt budget is
// spent, or a stop is requested. Action returns Result<T>.
//
// Cancellation never reaches the classifier and does not use up an attempt.
// The response held by a failed attempt is released once the failure has been
// classified, before the next attempt starts.
template<typename Action>
auto retry(const RetryOptions& options, Action&& action, const ErrorClassifierFn& classify)
    -> std::invoke_result_t<Action&> {
    using ResultType = std::invoke_result_t<Action&>;

    for (int attempt = 0;; ++attempt) {
        if (options.stop.stop_requested()) {
            return ResultType(std::unexpect, Errc::cancelled);
        }

        ResultType result = action();
        if (result) {
            return result;
        }

        Error error = std::move(result).error();
        if (error.cancelled()) {
            return ResultType(std::unexpect, std::move(error));
        }

        RetryVerdict verdict = classify(error);
        error.release_response();
        if (!verdict) {
            return ResultType(std::unexpect, std::move(verdict).error());
        }

        if (attempt + 1 >= options.max_attempts) {
            logger()->error("Giving up after {} attempts: {}", attempt + 1, error.message());
            return ResultType(std::unexpect, std::move(error));
        }

        auto delay = options.delay(attempt);
        logger()->warn("Attempt {}/{} failed: {}; retrying in {} ms",
                       attempt + 1, options.max_attempts, error.message(), delay.count());

        if (!options.sleep(delay, options.stop)) {
            return ResultType(std::unexpect, Errc::cancelled);
        }
    }
}

} // namespace nimbus::core
