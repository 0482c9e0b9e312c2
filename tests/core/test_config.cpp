// coherence_core configuration tests

#include <catch2/catch_test_macros.hpp>
#include <coherence/core/config.hpp>
#include <coherence/core/log.hpp>

using namespace coherence_core;

TEST_CASE("Config defaults", "[core][config]") {
    BridgeConfig config;
    REQUIRE(config.connection_name == "Coherence");
    REQUIRE(config.message_node_count == 100);
    REQUIRE(config.message_node_size == 1024 * 1024);
    REQUIRE(config.pixel_node_count == 2);
    REQUIRE(config.connection_timeout_ms == 5000);
    REQUIRE(validate_config(config).is_ok());
}

TEST_CASE("Config parsing", "[core][config]") {
    SECTION("all sections") {
        auto result = parse_config(R"(
            [connection]
            name = "Studio"
            timeout_ms = 250

            [buffers]
            message_node_count = 8
            message_node_size = 4096
            pixel_node_count = 3
            pixel_node_size = 65536

            [timing]
            read_wait_ms = 5
            write_wait_ms = 7
            disconnect_wait_ms = 20
            outbound_warn_threshold = 50

            [logging]
            level = "debug"
        )");

        REQUIRE(result.is_ok());
        const auto& config = result.value();
        REQUIRE(config.connection_name == "Studio");
        REQUIRE(config.connection_timeout_ms == 250);
        REQUIRE(config.message_node_count == 8);
        REQUIRE(config.message_node_size == 4096);
        REQUIRE(config.pixel_node_count == 3);
        REQUIRE(config.pixel_node_size == 65536);
        REQUIRE(config.read_wait_ms == 5);
        REQUIRE(config.write_wait_ms == 7);
        REQUIRE(config.disconnect_wait_ms == 20);
        REQUIRE(config.outbound_warn_threshold == 50);
        REQUIRE(config.log_level == "debug");
    }

    SECTION("missing sections keep defaults") {
        auto result = parse_config("[connection]\nname = \"Only\"\n");
        REQUIRE(result.is_ok());
        REQUIRE(result.value().connection_name == "Only");
        REQUIRE(result.value().message_node_count == 100);
    }

    SECTION("syntax error") {
        auto result = parse_config("[connection\nname = ");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("wrong type") {
        auto result = parse_config("[buffers]\nmessage_node_count = \"many\"\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("negative value") {
        auto result = parse_config("[buffers]\npixel_node_count = -1\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Config validation", "[core][config]") {
    BridgeConfig config;

    SECTION("empty name") {
        config.connection_name.clear();
        REQUIRE(validate_config(config).is_err());
    }

    SECTION("zero nodes") {
        config.message_node_count = 0;
        REQUIRE(validate_config(config).is_err());
    }

    SECTION("node too small for a frame header") {
        config.message_node_size = 8;
        REQUIRE(validate_config(config).is_err());
    }

    SECTION("unknown log level") {
        config.log_level = "chatty";
        REQUIRE(validate_config(config).is_err());
    }
}

TEST_CASE("Config file loading", "[core][config]") {
    auto result = load_config("/nonexistent/coherence.toml");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::IOError);
}

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    auto logger = scene_logger();
    REQUIRE(logger != nullptr);
    REQUIRE(get_logger(logger->name()) == logger);
}
