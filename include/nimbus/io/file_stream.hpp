// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nimbus/io/stream.hpp>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>

namespace nimbus::io {

// Sequential reader of a file on disk, length known from the filesystem
class FileInputStream final : public InputStream {
public:
    [[nodiscard]] static Result<std::unique_ptr<FileInputStream>> open(std::string_view path) noexcept;

    [[nodiscard]] Result<std::size_t> read(std::span<std::byte> buffer) noexcept override;
    [[nodiscard]] std::optional<std::uint64_t> length() const noexcept override { return length_; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    struct Opened {};

public:
    // Only reachable through open()
    FileInputStream(Opened, std::ifstream file, std::string path, std::uint64_t length) noexcept
        : file_(std::move(file))
        , path_(std::move(path))
        , length_(length) {}

private:
    std::ifstream file_;
    std::string path_;
    std::uint64_t length_;
};

// Sequential writer to a file on disk, optionally starting at an offset
class FileOutputStream final : public OutputStream {
public:
    // offset 0 truncates, otherwise the file is kept and written from offset
    [[nodiscard]] static Result<std::unique_ptr<FileOutputStream>>
    open(std::string_view path, std::uint64_t offset = 0) noexcept;

    [[nodiscard]] Result<void> write(std::span<const std::byte> data) noexcept override;
    [[nodiscard]] Result<void> flush() noexcept override;

    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }

private:
    struct Opened {};

public:
    // Only reachable through open()
    FileOutputStream(Opened, std::ofstream file, std::string path) noexcept
        : file_(std::move(file))
        , path_(std::move(path)) {}

private:

    std::ofstream file_;
    std::string path_;
    std::uint64_t written_{0};
};

} // namespace nimbus::io
