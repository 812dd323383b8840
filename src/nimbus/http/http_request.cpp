// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/http/http_request.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace nimbus::http {

namespace {

std::optional<std::uint64_t> parse_number(std::string_view text) noexcept {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::get:    return "GET";
        case HttpMethod::post:   return "POST";
        case HttpMethod::put:    return "PUT";
        case HttpMethod::patch:  return "PATCH";
        case HttpMethod::del:    return "DELETE";
    }
    return "GET";
}

const std::string* HttpResponse::header(std::string_view name) const {
    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto it = headers.find(lower_name);
    return it == headers.end() ? nullptr : &it->second;
}

Result<ContentRange> parse_content_range(std::string_view value) noexcept {
    auto invalid = [value] {
        return std::unexpected(core::Error(core::Errc::parse_error,
                                           "invalid Content-Range: " + std::string(value)));
    };

    constexpr std::string_view UNIT = "bytes ";
    if (!value.starts_with(UNIT)) {
        return invalid();
    }
    value.remove_prefix(UNIT.size());

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return invalid();
    }

    auto first = parse_number(value.substr(0, dash));
    auto last = parse_number(value.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) {
        return invalid();
    }

    ContentRange range{*first, *last, std::nullopt};
    auto total = value.substr(slash + 1);
    if (total != "*") {
        range.total = parse_number(total);
        if (!range.total || *range.total <= *last) {
            return invalid();
        }
    }
    return range;
}

void HttpRequest::range(std::uint64_t offset, std::optional<std::uint64_t> last) {
    std::string value = "bytes=" + std::to_string(offset) + "-";
    if (last) {
        value += std::to_string(*last);
    }
    header("Range", value);
}

} // namespace nimbus::http
