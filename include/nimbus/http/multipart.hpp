// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nimbus/core/config.hpp>
#include <nimbus/io/stream.hpp>
#include <nimbus/io/stream_copier.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nimbus::http {

using core::Result;

// Opens the upload source. Called once per attempt.
using StreamOpener = std::function<Result<std::unique_ptr<io::InputStream>>()>;

// Parameters of a multipart file upload
struct SendFileInfo {
    StreamOpener stream_opener;
    std::string form_name{"content"};
    std::string file_name;
    std::vector<std::pair<std::string, std::string>> parameters;  // Sent before the file, in order
    std::size_t buffer_size{core::UPLOAD_BUFFER_SIZE};
    io::ProgressFn progress;
    std::stop_token cancellation;

    // Upload of a file on disk, file_name defaults to the path's filename
    [[nodiscard]] static SendFileInfo from_path(std::string path, std::string file_name = {});
};

// Random boundary token (UUID v4 text from a CSPRNG)
[[nodiscard]] Result<std::string> generate_boundary() noexcept;

// multipart/form-data framing of one upload attempt.
//
// The prefix holds the extra parameters and the file part header, the postfix
// closes the body. Both are built before the upload starts so the total
// content length is known and the body can be sent without chunking.
class MultipartBoundary {
public:
    // Fresh random boundary
    [[nodiscard]] static Result<MultipartBoundary> create(const SendFileInfo& info) noexcept;

    MultipartBoundary(const SendFileInfo& info, std::string boundary);

    [[nodiscard]] const std::string& boundary() const noexcept { return boundary_; }
    [[nodiscard]] std::string content_type() const;

    [[nodiscard]] std::string prefix(std::uint64_t file_length) const;
    [[nodiscard]] const std::string& postfix() const noexcept { return postfix_; }

    [[nodiscard]] std::uint64_t content_length(std::uint64_t file_length) const;

private:
    const SendFileInfo& info_;
    std::string boundary_;
    std::string postfix_;
};

} // namespace nimbus::http
