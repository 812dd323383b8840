// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nimbus/core/url.hpp>
#include <nimbus/http/http_request.hpp>

using namespace nimbus::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://api.example.com/v1/files");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "api.example.com");
        CHECK(url.path() == "/v1/files");
        CHECK(url.is_secure());
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://localhost:8080/upload");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "http");
        CHECK(result->port() == "8080");
        CHECK(result->base() == "http://localhost:8080");
        CHECK_FALSE(result->is_secure());
    }

    SECTION("Query kept, fragment dropped") {
        auto result = Url::parse("https://example.com/items?select=id,name#top");
        REQUIRE(result.has_value());
        CHECK(result->query() == "select=id,name");
        CHECK(result->full() == "https://example.com/items?select=id,name");
    }

    SECTION("Scheme is case-insensitive") {
        auto result = Url::parse("HTTPS://example.com");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "https");
        CHECK(result->path() == "/");
    }

    SECTION("Userinfo and IPv6 host") {
        auto result = Url::parse("https://user:pw@[::1]:8443/x");
        REQUIRE(result.has_value());
        CHECK(result->host() == "[::1]");
        CHECK(result->port() == "8443");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    CHECK_FALSE(Url::parse("example.com/file.zip").has_value());
    CHECK_FALSE(Url::parse("").has_value());
    CHECK_FALSE(Url::parse("ftp://example.com/file").has_value());
    CHECK_FALSE(Url::parse("https:///path").has_value());
    CHECK_FALSE(Url::parse("https://example.com:80a/").has_value());
    CHECK_FALSE(Url::parse("https://[::1/").has_value());

    auto result = Url::parse("gopher://example.com");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().is(Errc::invalid_url));
}

TEST_CASE("Url::default_port", "[url]") {
    CHECK(Url::parse("https://example.com")->default_port() == 443);
    CHECK(Url::parse("http://example.com")->default_port() == 80);
}

TEST_CASE("parse_content_range", "[url]") {
    using nimbus::http::parse_content_range;

    SECTION("Full form") {
        auto range = parse_content_range("bytes 0-499/1234");
        REQUIRE(range.has_value());
        CHECK(range->first == 0);
        CHECK(range->last == 499);
        CHECK(range->total == 1234u);
    }

    SECTION("Unknown total") {
        auto range = parse_content_range("bytes 500-999/*");
        REQUIRE(range.has_value());
        CHECK(range->first == 500);
        CHECK_FALSE(range->total.has_value());
    }

    SECTION("Malformed") {
        CHECK_FALSE(parse_content_range("items 0-1/2").has_value());
        CHECK_FALSE(parse_content_range("bytes 5-1/10").has_value());
        CHECK_FALSE(parse_content_range("bytes 0-10/10").has_value());
        CHECK_FALSE(parse_content_range("bytes a-b/c").has_value());
        CHECK_FALSE(parse_content_range("bytes 0-1").has_value());
    }
}
