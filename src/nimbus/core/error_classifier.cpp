// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/core/error_classifier.hpp>
#include <nimbus/core/log.hpp>
#include <algorithm>

namespace nimbus::core {

bool is_success_status(std::int32_t status) noexcept {
    return std::find(SUCCESS_STATUS_CODES.begin(), SUCCESS_STATUS_CODES.end(), status)
        != SUCCESS_STATUS_CODES.end();
}

bool is_always_retry_status(std::int32_t status) noexcept {
    return std::find(ALWAYS_RETRY_STATUS_CODES.begin(), ALWAYS_RETRY_STATUS_CODES.end(), status)
        != ALWAYS_RETRY_STATUS_CODES.end();
}

//=============================================================================
// RetryPolicy
//=============================================================================

RetryPolicy& RetryPolicy::on(std::int32_t status, StatusProcessor processor) {
    processors_[status] = std::move(processor);
    return *this;
}

const StatusProcessor* RetryPolicy::find(std::int32_t status) const noexcept {
    auto it = processors_.find(status);
    if (it == processors_.end() || !it->second) {
        return nullptr;
    }
    return &it->second;
}

//=============================================================================
// ErrorClassifier
//=============================================================================

const StatusProcessor* ErrorClassifier::lookup(std::int32_t status) const noexcept {
    if (specialized_) {
        if (const auto* processor = specialized_->find(status)) {
            return processor;
        }
    }
    return general_.find(status);
}

RetryVerdict ErrorClassifier::classify(const Error& error) const {
    if (error.cancelled()) {
        return std::unexpected(error);
    }

    const Error* failure = find_cause(error, Errc::http_status, CAUSE_SEARCH_DEPTH);
    if (!failure) {
        return std::unexpected(error);
    }

    const auto status = failure->status_code();
    if (is_always_retry_status(status)) {
        return {};
    }

    if (const auto* processor = lookup(status)) {
        if ((*processor)(status)) {
            return {};
        }
    }

    if (!failure->response()) {
        return std::unexpected(Error::transfer(status, {}, failure->message()));
    }

    auto body = failure->response()->read_body();
    if (!body) {
        logger()->error("HTTP {}: response body unreadable: {}", status, body.error().message());
        return std::unexpected(Error::transfer(status, {}, body.error().message(),
                                               std::make_shared<const Error>(body.error())));
    }

    logger()->error("HTTP {}: {}", status, *body);
    return std::unexpected(Error::transfer(status, std::move(*body), failure->message()));
}

} // namespace nimbus::core
