// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nimbus/http/multipart.hpp>
#include <set>
#include <string>
#include <vector>

using namespace nimbus;
using namespace nimbus::http;

namespace {

// Split a multipart body into its parts (headers + value), dropping the closing delimiter
std::vector<std::string> split_parts(const std::string& body, const std::string& boundary) {
    std::vector<std::string> parts;
    const std::string delimiter = "--" + boundary;
    auto pos = body.find(delimiter);
    while (pos != std::string::npos) {
        auto start = pos + delimiter.size();
        if (body.compare(start, 2, "--") == 0) {
            break;
        }
        start += 2;  // CRLF after the delimiter
        auto next = body.find("\r\n" + delimiter, start);
        if (next == std::string::npos) {
            break;
        }
        parts.push_back(body.substr(start, next - start));
        pos = next + 2;
    }
    return parts;
}

std::string part_value(const std::string& part) {
    auto split = part.find("\r\n\r\n");
    return split == std::string::npos ? std::string{} : part.substr(split + 4);
}

} // namespace

TEST_CASE("generate_boundary", "[multipart]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto boundary = generate_boundary();
        REQUIRE(boundary.has_value());
        REQUIRE(boundary->size() == 36);
        CHECK((*boundary)[8] == '-');
        CHECK((*boundary)[14] == '4');
        seen.insert(*boundary);
    }
    CHECK(seen.size() == 100);
}

TEST_CASE("MultipartBoundary framing", "[multipart]") {
    SendFileInfo info;
    info.file_name = "report.pdf";
    info.parameters = {{"parentId", "folder-1"}, {"conflict", "rename"}};

    MultipartBoundary framing(info, "BOUNDARY");

    SECTION("Content type") {
        CHECK(framing.content_type() == "multipart/form-data; boundary=BOUNDARY");
    }

    SECTION("Prefix and postfix") {
        CHECK(framing.prefix(10) ==
              "--BOUNDARY\r\n"
              "Content-Disposition: form-data; name=\"parentId\"\r\n\r\n"
              "folder-1\r\n"
              "--BOUNDARY\r\n"
              "Content-Disposition: form-data; name=\"conflict\"\r\n\r\n"
              "rename\r\n"
              "--BOUNDARY\r\n"
              "Content-Disposition: form-data; name=\"content\"; filename=\"report.pdf\"\r\n"
              "Content-Type: application/octet-stream\r\n"
              "Content-Length: 10\r\n\r\n");
        CHECK(framing.postfix() == "\r\n--BOUNDARY--\r\n");
    }

    SECTION("Content length") {
        const std::uint64_t file_length = 1234;
        CHECK(framing.content_length(file_length)
              == framing.prefix(file_length).size() + file_length + framing.postfix().size());
    }

    SECTION("Body parses back") {
        const std::string file = "0123456789";
        const std::string body = framing.prefix(file.size()) + file + framing.postfix();
        REQUIRE(body.size() == framing.content_length(file.size()));

        auto parts = split_parts(body, framing.boundary());
        REQUIRE(parts.size() == 3);
        CHECK(part_value(parts[0]) == "folder-1");
        CHECK(part_value(parts[1]) == "rename");
        CHECK(parts[2].find("filename=\"report.pdf\"") != std::string::npos);
        CHECK(part_value(parts[2]) == file);
    }
}

TEST_CASE("MultipartBoundary without parameters", "[multipart]") {
    SendFileInfo info;
    info.form_name = "file";
    info.file_name = "a b.txt";

    MultipartBoundary framing(info, "X");
    CHECK(framing.prefix(0) ==
          "--X\r\n"
          "Content-Disposition: form-data; name=\"file\"; filename=\"a b.txt\"\r\n"
          "Content-Type: application/octet-stream\r\n"
          "Content-Length: 0\r\n\r\n");
}

TEST_CASE("MultipartBoundary escapes quoted values", "[multipart]") {
    SendFileInfo info;
    info.file_name = "evil\"name\r\nX-Injected: 1.txt";
    info.parameters = {{"odd\"key", "v"}};

    MultipartBoundary framing(info, "B");
    const auto prefix = framing.prefix(3);
    CHECK(prefix.find("name=\"odd%22key\"") != std::string::npos);
    CHECK(prefix.find("filename=\"evil%22name%0D%0AX-Injected: 1.txt\"") != std::string::npos);
    CHECK(prefix.find("\r\nX-Injected") == std::string::npos);

    const std::string body = prefix + "abc" + framing.postfix();
    REQUIRE(body.size() == framing.content_length(3));
    auto parts = split_parts(body, "B");
    REQUIRE(parts.size() == 2);
    CHECK(part_value(parts[0]) == "v");
    CHECK(part_value(parts[1]) == "abc");
}

TEST_CASE("SendFileInfo::from_path", "[multipart]") {
    auto info = SendFileInfo::from_path("/tmp/uploads/photo.jpg");
    CHECK(info.file_name == "photo.jpg");
    CHECK(info.form_name == "content");
    CHECK(static_cast<bool>(info.stream_opener));

    auto renamed = SendFileInfo::from_path("/tmp/uploads/photo.jpg", "holiday.jpg");
    CHECK(renamed.file_name == "holiday.jpg");
}
