// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nimbus/core/error.hpp>
#include <nimbus/io/error.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace nimbus::io {

using core::Result;

class InputStream {
public:
    virtual ~InputStream() = default;

    // Read up to buffer.size() bytes. 0 means end of stream.
    [[nodiscard]] virtual Result<std::size_t> read(std::span<std::byte> buffer) noexcept = 0;

    // Total length if known up front
    [[nodiscard]] virtual std::optional<std::uint64_t> length() const noexcept { return std::nullopt; }
};

class OutputStream {
public:
    virtual ~OutputStream() = default;

    [[nodiscard]] virtual Result<void> write(std::span<const std::byte> data) noexcept = 0;

    [[nodiscard]] virtual Result<void> flush() noexcept { return {}; }
};

// Input over an owned byte string
class MemoryInputStream final : public InputStream {
public:
    explicit MemoryInputStream(std::string data) noexcept : data_(std::move(data)) {}

    [[nodiscard]] Result<std::size_t> read(std::span<std::byte> buffer) noexcept override;
    [[nodiscard]] std::optional<std::uint64_t> length() const noexcept override { return data_.size(); }

    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::string data_;
    std::size_t position_{0};
};

// Output appended to a string
class StringOutputStream final : public OutputStream {
public:
    [[nodiscard]] Result<void> write(std::span<const std::byte> data) noexcept override;

    [[nodiscard]] const std::string& str() const noexcept { return data_; }
    [[nodiscard]] std::string take() noexcept { return std::move(data_); }

private:
    std::string data_;
};

// Output into a fixed caller-owned region; overflowing it is an error
class SpanOutputStream final : public OutputStream {
public:
    explicit SpanOutputStream(std::span<std::byte> region) noexcept : region_(region) {}

    [[nodiscard]] Result<void> write(std::span<const std::byte> data) noexcept override;

    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::span<std::byte> region_;
    std::size_t position_{0};
};

// Drain a stream into a string
[[nodiscard]] Result<std::string> read_to_string(InputStream& stream,
                                                 std::size_t buffer_size = 4096) noexcept;

[[nodiscard]] inline std::span<const std::byte> as_bytes(std::string_view text) noexcept {
    return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

} // namespace nimbus::io
