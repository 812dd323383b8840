// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace nimbus::io {

enum class IoErrc {
    success = 0,
    file_not_found,
    access_denied,
    read_error,
    write_error,
    buffer_overflow,
    unknown_length,
    stream_closed,
};

namespace detail {

struct IoErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "nimbus::io";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<IoErrc>(ev)) {
            case IoErrc::success:          return "Success";
            case IoErrc::file_not_found:   return "File not found";
            case IoErrc::access_denied:    return "Access denied";
            case IoErrc::read_error:       return "Read error";
            case IoErrc::write_error:      return "Write error";
            case IoErrc::buffer_overflow:  return "Destination buffer too small";
            case IoErrc::unknown_length:   return "Stream length unknown";
            case IoErrc::stream_closed:    return "Stream closed";
            default:                       return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::IoErrcCategory& io_errc_category() noexcept {
    static detail::IoErrcCategory category;
    return category;
}

inline std::error_code make_error_code(IoErrc e) noexcept {
    return {static_cast<int>(e), io_errc_category()};
}

} // namespace nimbus::io

namespace std {

template<>
struct is_error_code_enum<nimbus::io::IoErrc> : true_type {};

} // namespace std
