// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nimbus/core/config.hpp>
#include <nimbus/http/token.hpp>
#include <nimbus/io/error.hpp>
#include <nimbus/version.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace nimbus::core;
using nlohmann::json;

TEST_CASE("ClientConfig defaults", "[config]") {
    ClientConfig config;
    CHECK(config.max_attempts == MAX_ATTEMPTS);
    CHECK(config.max_retry_delay == MAX_RETRY_DELAY);
    CHECK(config.buffer_size == DEFAULT_BUFFER_SIZE);
    CHECK(config.prefer_http2);
    CHECK(config.effective_user_agent() == "nimbus/" + nimbus::version.to_string());
    CHECK(nimbus::version.to_string() == "0.3.0");

    config.user_agent = "MyApp/2.1";
    CHECK(config.effective_user_agent() == "MyApp/2.1");
}

TEST_CASE("ClientConfig::from_json", "[config]") {
    SECTION("All keys") {
        auto config = ClientConfig::from_json(json{
            {"userAgent", "sync-agent/3"},
            {"maxAttempts", 5},
            {"maxRetryDelaySec", 8},
            {"bufferSize", 65536},
            {"http2", false},
            {"connectTimeoutSec", 10},
            {"stallTimeoutSec", 20},
            {"verbose", true},
        });
        REQUIRE(config.has_value());
        CHECK(config->user_agent == "sync-agent/3");
        CHECK(config->max_attempts == 5);
        CHECK(config->max_retry_delay == std::chrono::seconds(8));
        CHECK(config->buffer_size == 65536);
        CHECK_FALSE(config->prefer_http2);
        CHECK(config->connect_timeout_sec == 10);
        CHECK(config->stall_timeout_sec == 20);
        CHECK(config->verbose);
    }

    SECTION("Unknown keys ignored") {
        auto config = ClientConfig::from_json(json{{"colour", "blue"}});
        REQUIRE(config.has_value());
        CHECK(config->max_attempts == MAX_ATTEMPTS);
    }

    SECTION("Wrong type") {
        auto config = ClientConfig::from_json(json{{"maxAttempts", "many"}});
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().is(Errc::parse_error));
    }

    SECTION("Out of range") {
        auto attempts = ClientConfig::from_json(json{{"maxAttempts", 0}});
        REQUIRE_FALSE(attempts.has_value());
        CHECK(attempts.error().is(Errc::invalid_argument));

        auto buffer = ClientConfig::from_json(json{{"bufferSize", 0}});
        REQUIRE_FALSE(buffer.has_value());
        CHECK(buffer.error().is(Errc::invalid_argument));
    }

    SECTION("Negative values are not wrapped") {
        auto buffer = ClientConfig::from_json(json{{"bufferSize", -1}});
        REQUIRE_FALSE(buffer.has_value());
        CHECK(buffer.error().is(Errc::invalid_argument));

        auto delay = ClientConfig::from_json(json{{"maxRetryDelaySec", -5}});
        REQUIRE_FALSE(delay.has_value());
        CHECK(delay.error().is(Errc::invalid_argument));

        auto timeout = ClientConfig::from_json(json{{"stallTimeoutSec", -1}});
        REQUIRE_FALSE(timeout.has_value());
        CHECK(timeout.error().is(Errc::invalid_argument));
    }

    SECTION("Buffer size ceiling") {
        auto huge = ClientConfig::from_json(json{{"bufferSize", MAX_BUFFER_SIZE + 1}});
        REQUIRE_FALSE(huge.has_value());
        CHECK(huge.error().is(Errc::invalid_argument));

        auto largest = ClientConfig::from_json(json{{"bufferSize", MAX_BUFFER_SIZE}});
        REQUIRE(largest.has_value());
        CHECK(largest->buffer_size == MAX_BUFFER_SIZE);

        auto no_delay = ClientConfig::from_json(json{{"maxRetryDelaySec", 0}});
        REQUIRE(no_delay.has_value());
        CHECK(no_delay->max_retry_delay == std::chrono::seconds(0));
    }

    SECTION("Not an object") {
        CHECK_FALSE(ClientConfig::from_json(json::array({1, 2})).has_value());
    }
}

TEST_CASE("ClientConfig::load", "[config]") {
    auto dir = std::filesystem::temp_directory_path() / "nimbus_config_tests";
    std::filesystem::create_directories(dir);

    SECTION("Valid file") {
        auto path = dir / "client.json";
        std::ofstream(path) << R"({"maxAttempts": 7, "http2": false})";

        auto config = ClientConfig::load(path.string());
        REQUIRE(config.has_value());
        CHECK(config->max_attempts == 7);
        CHECK_FALSE(config->prefer_http2);
    }

    SECTION("Malformed file") {
        auto path = dir / "broken.json";
        std::ofstream(path) << "{ maxAttempts: ";

        auto config = ClientConfig::load(path.string());
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().is(Errc::parse_error));
    }

    SECTION("Missing file") {
        auto config = ClientConfig::load((dir / "absent.json").string());
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code() == nimbus::io::make_error_code(nimbus::io::IoErrc::file_not_found));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("TokenStore", "[config]") {
    using nimbus::http::TokenStore;

    SECTION("Empty store has no token") {
        auto store = std::make_shared<TokenStore>();
        auto token = store->access_token();
        REQUIRE_FALSE(token.has_value());
        CHECK(token.error().is(Errc::token_unavailable));
    }

    SECTION("Getter follows rotation") {
        auto store = std::make_shared<TokenStore>("old");
        auto getter = store->getter();
        REQUIRE(getter().has_value());
        CHECK(*getter() == "old");

        store->on_token_updated("new", "refresh", {});
        CHECK(*getter() == "new");
        CHECK(store->refresh_token() == "refresh");
    }

    SECTION("Getter keeps the store alive") {
        nimbus::http::TokenGetter getter;
        {
            auto store = std::make_shared<TokenStore>("kept");
            getter = store->getter();
        }
        CHECK(*getter() == "kept");
    }
}
