// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nimbus/io/stream_copier.hpp>
#include <exception>
#include <string>
#include <vector>

namespace nimbus::io {

namespace {

// A throwing callback fails the copy instead of escaping noexcept
Result<std::uint64_t> report(const ProgressFn& progress, std::uint64_t position) noexcept {
    try {
        return progress(position);
    } catch (const std::exception& e) {
        return std::unexpected(core::Error(core::Errc::invalid_argument,
                                           std::string("progress callback failed: ") + e.what()));
    }
}

} // namespace

Result<std::uint64_t> copy_stream(InputStream& source,
                                  OutputStream& destination,
                                  const CopyOptions& options) noexcept {
    std::vector<std::byte> buffer;
    try {
        buffer.resize(options.buffer_size == 0 ? 4096 : options.buffer_size);
    } catch (const std::exception& e) {
        return std::unexpected(core::Error(IoErrc::read_error, std::string("cannot allocate copy buffer: ") + e.what()));
    }

    auto* state = options.progress ? options.state : nullptr;
    std::uint64_t copied = 0;
    bool reported_last = false;

    while (true) {
        if (options.stop.stop_requested()) {
            return std::unexpected(core::Error(core::Errc::cancelled));
        }

        auto count = source.read(buffer);
        if (!count) {
            return std::unexpected(std::move(count).error());
        }
        if (*count == 0) {
            break;
        }

        if (options.stop.stop_requested()) {
            return std::unexpected(core::Error(core::Errc::cancelled));
        }

        auto written = destination.write(std::span<const std::byte>(buffer.data(), *count));
        if (!written) {
            return std::unexpected(std::move(written).error());
        }

        copied += *count;
        reported_last = false;

        if (state) {
            state->position += *count;
            if (!state->next_watermark || state->position >= *state->next_watermark) {
                auto next = report(options.progress, state->position);
                if (!next) {
                    return std::unexpected(std::move(next).error());
                }
                state->next_watermark = *next;
                reported_last = true;
            }
        }
    }

    if (state && !reported_last) {
        if (auto next = report(options.progress, state->position); !next) {
            return std::unexpected(std::move(next).error());
        }
    }

    return copied;
}

} // namespace nimbus::io
