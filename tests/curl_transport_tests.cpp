// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nimbus/http/curl_transport.hpp>
#include <nimbus/http/transport_client.hpp>
#include "loopback_server.hpp"
#include <cstdlib>
#include <optional>
#include <string>
#include <thread>

using namespace nimbus;
using namespace nimbus::http;
using nimbus::test::Connection;
using nimbus::test::LoopbackServer;
using nimbus::test::RequestHead;

// None of these reach beyond the loopback interface

namespace {

struct CurlGlobal {
    CurlGlobal() { CurlTransport::global_init(); }
    ~CurlGlobal() { CurlTransport::global_cleanup(); }
};

core::ClientConfig short_timeouts() {
    core::ClientConfig config;
    config.connect_timeout_sec = 5;
    config.stall_timeout_sec = 5;
    config.max_retry_delay = std::chrono::seconds(0);
    config.prefer_http2 = false;
    return config;
}

std::string pattern(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>('a' + i % 26);
    }
    return data;
}

std::string reply(std::string_view status, std::string_view body, std::string_view extra = {}) {
    return "HTTP/1.1 " + std::string(status) + "\r\n" + std::string(extra)
         + "Content-Length: " + std::to_string(body.size()) + "\r\n"
         + "Connection: close\r\n\r\n" + std::string(body);
}

// Overrides an environment variable for the lifetime of the object
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (old_) {
            ::setenv(name_, old_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
    std::optional<std::string> old_;
};

TokenSettings fixed_token() {
    return TokenSettings{[]() -> core::Result<std::string> { return std::string("t"); }, nullptr};
}

} // namespace

TEST_CASE("CurlTransport request lifecycle", "[curl]") {
    CurlGlobal curl;
    CurlTransport transport(short_timeouts());

    SECTION("Empty URL") {
        auto request = transport.create_request("", {});
        REQUIRE_FALSE(request.has_value());
        CHECK(request.error().is(core::Errc::invalid_url));
    }

    SECTION("Aborted before sending") {
        auto request = transport.create_request("http://127.0.0.1:1/", {});
        REQUIRE(request.has_value());
        (*request)->header("X-Test", "1");
        (*request)->abort();

        auto response = (*request)->response();
        REQUIRE_FALSE(response.has_value());
        CHECK(response.error().cancelled());
    }

    SECTION("Stop requested") {
        std::stop_source source;
        source.request_stop();
        auto request = transport.create_request("http://127.0.0.1:1/", source.get_token());
        REQUIRE(request.has_value());

        auto response = (*request)->response();
        REQUIRE_FALSE(response.has_value());
        CHECK(response.error().cancelled());
    }

    SECTION("Refused connection") {
        auto request = transport.create_request("http://127.0.0.1:1/", {});
        REQUIRE(request.has_value());
        (*request)->method(HttpMethod::get);

        auto response = (*request)->response();
        REQUIRE_FALSE(response.has_value());
        CHECK(response.error().is(core::Errc::network_error));
        CHECK(response.error().status_code() == 0);
    }

    SECTION("Body stream only once") {
        auto request = transport.create_request("http://127.0.0.1:1/", {});
        REQUIRE(request.has_value());
        (*request)->method(HttpMethod::post);

        REQUIRE((*request)->request_stream(4).has_value());
        auto again = (*request)->request_stream(4);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().is(core::Errc::invalid_argument));
        (*request)->abort();
    }
}

TEST_CASE("CurlTransport GET on the wire", "[curl]") {
    CurlGlobal curl;
    CurlTransport transport(short_timeouts());
    RequestHead seen;

    SECTION("Headers, range and body") {
        LoopbackServer server({[&seen](Connection& c) {
            seen = c.read_head();
            c.send(reply("206 Partial Content", "klmnopqrst",
                         "Content-Range: bytes 10-19/26\r\nX-Request-Id: abc\r\n"));
        }});

        auto request = transport.create_request(server.url("/v1/items?x=1"), {});
        REQUIRE(request.has_value());
        (*request)->method(HttpMethod::get);
        (*request)->header("Authorization", "Bearer t");
        (*request)->header("authorization", "Bearer rotated");
        (*request)->range(10, 19);

        auto response = (*request)->response();
        REQUIRE(response.has_value());
        CHECK((*response)->status_code == 206);
        REQUIRE((*response)->header("X-Request-Id"));
        CHECK(*(*response)->header("x-request-id") == "abc");
        CHECK((*response)->content_length == 10u);

        auto body = io::read_to_string(*(*response)->body);
        REQUIRE(body.has_value());
        CHECK(*body == "klmnopqrst");

        server.join();
        CHECK(seen.method == "GET");
        CHECK(seen.target == "/v1/items?x=1");
        CHECK(seen.header("range") == "bytes=10-19");
        CHECK(seen.header("authorization") == "Bearer rotated");
        CHECK(seen.header("expect").empty());
        CHECK(seen.header("accept-encoding").find("gzip") != std::string::npos);
    }

    SECTION("Error status keeps its body") {
        LoopbackServer server({[&seen](Connection& c) {
            seen = c.read_head();
            c.send(reply("404 Not Found", R"({"code":"NOT_FOUND"})", "Content-Type: application/json\r\n"));
        }});

        auto request = transport.create_request(server.url("/v1/nodes/missing"), {});
        REQUIRE(request.has_value());

        auto response = (*request)->response();
        REQUIRE(response.has_value());
        CHECK((*response)->status_code == 404);
        CHECK(*(*response)->header("content-type") == "application/json");

        auto body = io::read_to_string(*(*response)->body);
        REQUIRE(body.has_value());
        CHECK(*body == R"({"code":"NOT_FOUND"})");
    }

    SECTION("Interim response is skipped") {
        LoopbackServer server({[&seen](Connection& c) {
            seen = c.read_head();
            c.send("HTTP/1.1 100 Continue\r\nX-Interim: 1\r\n\r\n");
            c.send(reply("200 OK", "ok", "X-Final: yes\r\n"));
        }});

        auto request = transport.create_request(server.url("/"), {});
        REQUIRE(request.has_value());

        auto response = (*request)->response();
        REQUIRE(response.has_value());
        CHECK((*response)->status_code == 200);
        CHECK((*response)->header("x-final"));
        CHECK_FALSE((*response)->header("x-interim"));
    }

    SECTION("Redirect is followed") {
        RequestHead second;
        LoopbackServer server({
            [&seen](Connection& c) {
                seen = c.read_head();
                c.send(reply("302 Found", "", "Location: /moved\r\n"));
            },
            [&second](Connection& c) {
                second = c.read_head();
                c.send(reply("200 OK", "here"));
            },
        });

        auto request = transport.create_request(server.url("/original"), {});
        REQUIRE(request.has_value());

        auto response = (*request)->response();
        REQUIRE(response.has_value());
        CHECK((*response)->status_code == 200);
        CHECK_FALSE((*response)->header("location"));
        CHECK(*io::read_to_string(*(*response)->body) == "here");

        server.join();
        CHECK(seen.target == "/original");
        CHECK(second.target == "/moved");
    }

    SECTION("Download larger than the receive buffer") {
        const auto data = pattern(core::RECEIVE_BUFFER_LIMIT * 4 + 123);
        LoopbackServer server({[&data](Connection& c) {
            c.read_head();
            c.send(reply("200 OK", data));
        }});

        auto request = transport.create_request(server.url("/big"), {});
        REQUIRE(request.has_value());

        auto response = (*request)->response();
        REQUIRE(response.has_value());
        CHECK((*response)->content_length == data.size());

        // Let curl fill and pause the receive buffer before draining it
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        auto body = io::read_to_string(*(*response)->body, 1000);
        REQUIRE(body.has_value());
        CHECK(body->size() == data.size());
        CHECK(*body == data);
    }

    SECTION("Stop while the body stalls") {
        LoopbackServer server({[](Connection& c) {
            c.read_head();
            c.send("HTTP/1.1 200 OK\r\nContent-Length: 1000\r\n\r\npartial");
            c.read_exact(1);  // Until the client goes away
        }});

        std::stop_source source;
        auto request = transport.create_request(server.url("/slow"), source.get_token());
        REQUIRE(request.has_value());

        auto response = (*request)->response();
        REQUIRE(response.has_value());

        std::jthread stopper([&source] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            source.request_stop();
        });
        auto body = io::read_to_string(*(*response)->body);
        REQUIRE_FALSE(body.has_value());
        CHECK(body.error().cancelled());
        (*request)->abort();
    }
}

TEST_CASE("CurlTransport request bodies", "[curl]") {
    CurlGlobal curl;
    CurlTransport transport(short_timeouts());
    RequestHead seen;
    std::string received;

    SECTION("Declared length") {
        const auto data = pattern(core::UPLOAD_BUFFER_SIZE * 5 + 7);
        LoopbackServer server({[&seen, &received](Connection& c) {
            seen = c.read_head();
            received = c.read_exact(std::stoull(seen.header("content-length")));
            c.send(reply("201 Created", std::to_string(received.size())));
        }});

        auto request = transport.create_request(server.url("/upload"), {});
        REQUIRE(request.has_value());
        (*request)->method(HttpMethod::put);
        (*request)->header("Content-Type", "application/octet-stream");

        auto output = (*request)->request_stream(data.size());
        REQUIRE(output.has_value());
        for (std::size_t offset = 0; offset < data.size(); offset += 8192) {
            auto chunk = std::string_view(data).substr(offset, 8192);
            REQUIRE((*output)->write(io::as_bytes(chunk)).has_value());
        }
        REQUIRE((*output)->flush().has_value());

        auto response = (*request)->response();
        REQUIRE(response.has_value());
        CHECK((*response)->status_code == 201);
        CHECK(*io::read_to_string(*(*response)->body) == std::to_string(data.size()));

        server.join();
        CHECK(seen.method == "PUT");
        CHECK(seen.header("content-length") == std::to_string(data.size()));
        CHECK(seen.header("transfer-encoding").empty());
        CHECK(seen.header("expect").empty());
        CHECK(received == data);
    }

    SECTION("Chunked") {
        LoopbackServer server({[&seen, &received](Connection& c) {
            seen = c.read_head();
            received = c.read_chunked();
            c.send(reply("200 OK", "{}"));
        }});

        auto request = transport.create_request(server.url("/v1/nodes"), {});
        REQUIRE(request.has_value());
        (*request)->method(HttpMethod::post);
        (*request)->header("Content-Type", "application/json; charset=utf-8");

        auto output = (*request)->request_stream(std::nullopt);
        REQUIRE(output.has_value());
        REQUIRE((*output)->write(io::as_bytes(R"({"name":)")).has_value());
        REQUIRE((*output)->write(io::as_bytes(R"("folder"})")).has_value());

        auto response = (*request)->response();
        REQUIRE(response.has_value());
        CHECK((*response)->status_code == 200);

        server.join();
        CHECK(seen.method == "POST");
        CHECK(seen.header("transfer-encoding") == "chunked");
        CHECK(seen.header("content-length").empty());
        CHECK(received == R"({"name":"folder"})");
    }
}

TEST_CASE("CurlTransport statuses reach the classifier", "[curl]") {
    CurlGlobal curl;
    auto config = short_timeouts();

    SECTION("Proxy refusing the tunnel is retried") {
        auto refuse = [](Connection& c) {
            auto head = c.read_head();
            if (head.method == "CONNECT") {
                c.send("HTTP/1.1 407 Proxy Authentication Required\r\n"
                       "Proxy-Authenticate: Basic realm=\"nimbus\"\r\n"
                       "Content-Length: 0\r\nConnection: close\r\n\r\n");
            }
            c.read_exact(1);
        };
        LoopbackServer proxy({refuse, refuse, refuse});

        const auto proxy_url = "http://127.0.0.1:" + std::to_string(proxy.port());
        ScopedEnv https_proxy("https_proxy", proxy_url.c_str());
        ScopedEnv upper_proxy("HTTPS_PROXY", proxy_url.c_str());
        ScopedEnv no_proxy("no_proxy", nullptr);
        ScopedEnv upper_no_proxy("NO_PROXY", nullptr);

        config.max_attempts = 3;
        TransportClient client(std::make_shared<CurlTransport>(config), fixed_token(), config);
        auto result = client.get_string("https://api.example.com/v1/account");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(core::Errc::http_status));
        CHECK(result.error().status_code() == 407);

        proxy.join();
        CHECK(proxy.accepted() == 3);
    }

    SECTION("Answer before the upload finished goes through the upload table") {
        const auto data = pattern(16 * 1024 * 1024);
        std::string received;
        LoopbackServer server({
            [](Connection& c) {
                c.read_head();
                c.send(reply("401 Unauthorized", "expired"));
                std::this_thread::sleep_for(std::chrono::milliseconds(300));
            },
            [&received](Connection& c) {
                auto head = c.read_head();
                received = c.read_exact(std::stoull(head.header("content-length")));
                c.send(reply("201 Created", R"({"id":"file-1"})", "Content-Type: application/json\r\n"));
            },
        });

        core::RetryPolicies policies;
        int unauthorized = 0;
        policies.file_upload.on(401, [&unauthorized](std::int32_t) { ++unauthorized; return true; });
        TransportClient client(std::make_shared<CurlTransport>(config), fixed_token(), config, policies);

        int opens = 0;
        SendFileInfo info;
        info.file_name = "big.bin";
        info.stream_opener = [&opens, &data]() -> core::Result<std::unique_ptr<io::InputStream>> {
            ++opens;
            return std::make_unique<io::MemoryInputStream>(data);
        };

        auto result = client.send_file<nlohmann::json>(HttpMethod::post, server.url("/upload"), info);
        REQUIRE(result.has_value());
        CHECK((*result)["id"].get<std::string>() == "file-1");
        CHECK(unauthorized == 1);
        CHECK(opens == 2);

        server.join();
        CHECK(received.find(data) != std::string::npos);
    }

    SECTION("Early answer without a processor is a transfer error") {
        const auto data = pattern(16 * 1024 * 1024);
        LoopbackServer server({[](Connection& c) {
            c.read_head();
            c.send(reply("413 Payload Too Large", "too large"));
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
        }});

        TransportClient client(std::make_shared<CurlTransport>(config), fixed_token(), config);
        SendFileInfo info;
        info.file_name = "big.bin";
        info.stream_opener = [&data]() -> core::Result<std::unique_ptr<io::InputStream>> {
            return std::make_unique<io::MemoryInputStream>(data);
        };

        auto result = client.send_file<nlohmann::json>(HttpMethod::post, server.url("/upload"), info);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(core::Errc::transfer_failed));
        CHECK(result.error().status_code() == 413);
        CHECK(result.error().body() == "too large");
    }
}
