// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/http/multipart.hpp>
#include <nimbus/io/file_stream.hpp>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <array>
#include <filesystem>
#include <string_view>

namespace nimbus::http {

namespace {

// Quoted Content-Disposition values escape '"', CR and LF the way browsers do
std::string disposition_value(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  escaped += "%22"; break;
            case '\r': escaped += "%0D"; break;
            case '\n': escaped += "%0A"; break;
            default:   escaped += c; break;
        }
    }
    return escaped;
}

} // namespace

SendFileInfo SendFileInfo::from_path(std::string path, std::string file_name) {
    SendFileInfo info;
    if (file_name.empty()) {
        file_name = std::filesystem::path(path).filename().string();
    }
    info.file_name = std::move(file_name);
    info.stream_opener = [path = std::move(path)]() -> Result<std::unique_ptr<io::InputStream>> {
        auto file = io::FileInputStream::open(path);
        if (!file) {
            return std::unexpected(std::move(file).error());
        }
        return std::unique_ptr<io::InputStream>(std::move(*file));
    };
    return info;
}

Result<std::string> generate_boundary() noexcept {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return std::unexpected(core::Error(core::Errc::invalid_argument,
            "random generator failed: " + std::to_string(ERR_get_error())));
    }

    // RFC 4122 version 4, variant 1
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    constexpr char HEX[] = "0123456789abcdef";
    std::string text;
    text.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text += '-';
        }
        text += HEX[bytes[i] >> 4];
        text += HEX[bytes[i] & 0x0F];
    }
    return text;
}

//=============================================================================
// MultipartBoundary
//=============================================================================

Result<MultipartBoundary> MultipartBoundary::create(const SendFileInfo& info) noexcept {
    auto boundary = generate_boundary();
    if (!boundary) {
        return std::unexpected(std::move(boundary).error());
    }
    return MultipartBoundary(info, std::move(*boundary));
}

MultipartBoundary::MultipartBoundary(const SendFileInfo& info, std::string boundary)
    : info_(info)
    , boundary_(std::move(boundary))
    , postfix_("\r\n--" + boundary_ + "--\r\n") {}

std::string MultipartBoundary::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartBoundary::prefix(std::uint64_t file_length) const {
    std::string result;
    result.reserve(500);

    for (const auto& [key, value] : info_.parameters) {
        result += "--" + boundary_ + "\r\n";
        result += "Content-Disposition: form-data; name=\"" + disposition_value(key) + "\"\r\n\r\n";
        result += value;
        result += "\r\n";
    }

    result += "--" + boundary_ + "\r\n";
    result += "Content-Disposition: form-data; name=\"" + disposition_value(info_.form_name)
            + "\"; filename=\"" + disposition_value(info_.file_name) + "\"\r\n";
    result += "Content-Type: application/octet-stream\r\n";
    result += "Content-Length: " + std::to_string(file_length) + "\r\n\r\n";
    return result;
}

std::uint64_t MultipartBoundary::content_length(std::uint64_t file_length) const {
    return prefix(file_length).size() + file_length + postfix_.size();
}

} // namespace nimbus::http
