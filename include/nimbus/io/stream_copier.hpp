// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nimbus/io/stream.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>

namespace nimbus::io {

// Called with the bytes transferred so far. Returns the position at which it
// wants to be called next.
using ProgressFn = std::function<std::uint64_t(std::uint64_t position)>;

// Progress bookkeeping of one logical transfer
struct ProgressState {
    std::uint64_t position{0};
    std::optional<std::uint64_t> next_watermark;  // Unset: the first chunk reports
};

struct CopyOptions {
    std::size_t buffer_size{4096};
    std::stop_token stop;
    ProgressFn progress;              // Only used together with state
    ProgressState* state{nullptr};
};

// Copy source to destination in buffer_size chunks until end of stream.
//
// The stop token is checked before every read and every write. With a
// progress callback and state, the callback fires whenever the position
// reaches the watermark; if the last chunk did not fire it, one trailing call
// reports the final position. A callback that throws fails the copy with
// Errc::invalid_argument. Returns the number of bytes copied.
[[nodiscard]] Result<std::uint64_t> copy_stream(InputStream& source,
                                                OutputStream& destination,
                                                const CopyOptions& options) noexcept;

} // namespace nimbus::io
