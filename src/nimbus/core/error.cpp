// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/core/error.hpp>
#include <utility>

namespace nimbus::core {

Error::Error(std::error_code code, std::string message)
    : code_(code)
    , message_(std::move(message)) {}

Error::Error(Errc code, std::string message)
    : code_(make_error_code(code))
    , message_(std::move(message)) {}

Error Error::http_status(std::int32_t status,
                         std::shared_ptr<FailedResponse> response,
                         std::string message) {
    if (message.empty()) {
        message = "HTTP status " + std::to_string(status);
    }
    Error error(Errc::http_status, std::move(message));
    error.status_code_ = status;
    error.response_ = std::move(response);
    return error;
}

Error Error::transfer(std::int32_t status,
                      std::string body,
                      std::string message,
                      std::shared_ptr<const Error> cause) {
    Error error(Errc::transfer_failed, std::move(message));
    error.status_code_ = status;
    error.body_ = std::move(body);
    error.cause_ = std::move(cause);
    return error;
}

std::string Error::message() const {
    if (!message_.empty()) {
        return message_;
    }
    return code_.message();
}

Error& Error::caused_by(Error cause) {
    cause_ = std::make_shared<const Error>(std::move(cause));
    return *this;
}

const Error* find_cause(const Error& error, Errc kind, int max_depth) noexcept {
    const Error* current = &error;
    for (int depth = 0; depth < max_depth && current != nullptr; ++depth) {
        if (current->is(kind)) {
            return current;
        }
        current = current->cause();
    }
    return nullptr;
}

} // namespace nimbus::core
