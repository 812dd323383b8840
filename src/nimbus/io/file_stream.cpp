// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/io/file_stream.hpp>
#include <filesystem>

namespace nimbus::io {

//=============================================================================
// FileInputStream
//=============================================================================

Result<std::unique_ptr<FileInputStream>> FileInputStream::open(std::string_view path) noexcept {
    try {
        std::error_code ec;
        auto size = std::filesystem::file_size(std::filesystem::path(path), ec);
        if (ec) {
            return std::unexpected(core::Error(IoErrc::file_not_found, std::string(path) + ": " + ec.message()));
        }

        std::ifstream file(std::string(path), std::ios::binary);
        if (!file) {
            return std::unexpected(core::Error(IoErrc::access_denied, "cannot open " + std::string(path)));
        }

        return std::make_unique<FileInputStream>(Opened{}, std::move(file), std::string(path),
                                                 static_cast<std::uint64_t>(size));
    } catch (const std::exception& e) {
        return std::unexpected(core::Error(IoErrc::read_error, e.what()));
    }
}

Result<std::size_t> FileInputStream::read(std::span<std::byte> buffer) noexcept {
    if (buffer.empty() || file_.eof()) {
        return std::size_t{0};
    }

    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (file_.bad()) {
        return std::unexpected(core::Error(IoErrc::read_error, "read failed: " + path_));
    }
    return static_cast<std::size_t>(file_.gcount());
}

//=============================================================================
// FileOutputStream
//=============================================================================

Result<std::unique_ptr<FileOutputStream>>
FileOutputStream::open(std::string_view path, std::uint64_t offset) noexcept {
    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }

        std::ofstream file;
        if (offset == 0) {
            file.open(p, std::ios::binary | std::ios::trunc);
        } else {
            // in|out keeps existing content
            file.open(p, std::ios::binary | std::ios::in | std::ios::out);
            if (file) {
                file.seekp(static_cast<std::streamoff>(offset));
            }
        }

        if (!file) {
            return std::unexpected(core::Error(IoErrc::access_denied, "cannot open " + std::string(path)));
        }

        return std::make_unique<FileOutputStream>(Opened{}, std::move(file), std::string(path));
    } catch (const std::exception& e) {
        return std::unexpected(core::Error(IoErrc::write_error, e.what()));
    }
}

Result<void> FileOutputStream::write(std::span<const std::byte> data) noexcept {
    file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file_) {
        return std::unexpected(core::Error(IoErrc::write_error, "write failed: " + path_));
    }
    written_ += data.size();
    return {};
}

Result<void> FileOutputStream::flush() noexcept {
    file_.flush();
    if (!file_) {
        return std::unexpected(core::Error(IoErrc::write_error, "flush failed: " + path_));
    }
    return {};
}

} // namespace nimbus::io
