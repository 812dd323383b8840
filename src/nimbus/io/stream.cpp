// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/io/stream.hpp>
#include <algorithm>
#include <cstring>
#include <exception>
#include <vector>

namespace nimbus::io {

//=============================================================================
// MemoryInputStream
//=============================================================================

Result<std::size_t> MemoryInputStream::read(std::span<std::byte> buffer) noexcept {
    std::size_t count = std::min(buffer.size(), data_.size() - position_);
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + position_, count);
        position_ += count;
    }
    return count;
}

//=============================================================================
// StringOutputStream
//=============================================================================

Result<void> StringOutputStream::write(std::span<const std::byte> data) noexcept {
    try {
        data_.append(reinterpret_cast<const char*>(data.data()), data.size());
    } catch (const std::bad_alloc&) {
        return std::unexpected(core::Error(IoErrc::write_error, "out of memory"));
    }
    return {};
}

//=============================================================================
// SpanOutputStream
//=============================================================================

Result<void> SpanOutputStream::write(std::span<const std::byte> data) noexcept {
    if (data.size() > region_.size() - position_) {
        return std::unexpected(core::Error(IoErrc::buffer_overflow));
    }
    std::memcpy(region_.data() + position_, data.data(), data.size());
    position_ += data.size();
    return {};
}

Result<std::string> read_to_string(InputStream& stream, std::size_t buffer_size) noexcept {
    try {
        std::string text;
        std::vector<std::byte> buffer(buffer_size == 0 ? 4096 : buffer_size);
        while (true) {
            auto count = stream.read(buffer);
            if (!count) {
                return std::unexpected(std::move(count).error());
            }
            if (*count == 0) {
                break;
            }
            text.append(reinterpret_cast<const char*>(buffer.data()), *count);
        }
        return text;
    } catch (const std::exception& e) {
        return std::unexpected(core::Error(IoErrc::read_error, e.what()));
    }
}

} // namespace nimbus::io
