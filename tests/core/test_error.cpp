// coherence_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <coherence/core/error.hpp>
#include <string>

using namespace coherence_core;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

Result<std::size_t> checked_length(const std::string& target, std::size_t capacity) {
    if (target.empty()) {
        return Err<std::size_t>(SceneError::invalid_value("target", "empty name"));
    }
    if (target.size() > capacity) {
        return Err<std::size_t>(IpcError::payload_too_large(target, target.size(), capacity));
    }
    return Ok(target.size());
}

} // anonymous namespace

// =============================================================================
// Error
// =============================================================================

TEST_CASE("Error codes follow the error kind", "[core][error]") {
    SECTION("shared memory failures") {
        REQUIRE(Error(IpcError::channel_not_found("Coherence_SourceMessages")).code() == ErrorCode::NotFound);
        REQUIRE(Error(IpcError::channel_exists("Coherence_SourcePixels")).code() == ErrorCode::AlreadyExists);
        REQUIRE(Error(IpcError::map_failed("Coherence", "EACCES")).code() == ErrorCode::IOError);
        REQUIRE(Error(IpcError::dimension_mismatch("messages", "node size 64 != 128")).code() == ErrorCode::IncompatibleVersion);
        REQUIRE(Error(IpcError::channel_closed("pixels")).code() == ErrorCode::NotConnected);
        REQUIRE(Error(IpcError::frame_desync("messages", "bad target length")).code() == ErrorCode::ProtocolError);
        REQUIRE(Error(IpcError::payload_too_large("Cube", 2048, 1024)).code() == ErrorCode::CapacityExceeded);
    }

    SECTION("directory failures") {
        REQUIRE(Error(SceneError::not_found("Object", "Cube")).code() == ErrorCode::NotFound);
        REQUIRE(Error(SceneError::already_exists("Viewport", "3")).code() == ErrorCode::AlreadyExists);
        REQUIRE(Error(SceneError::not_connected()).code() == ErrorCode::NotConnected);
        REQUIRE(Error(SceneError::inbound_not_supported("Cube")).code() == ErrorCode::NotSupported);
        REQUIRE(Error(SceneError::invalid_value("name", "too long")).code() == ErrorCode::InvalidArgument);
    }

    SECTION("plain messages") {
        Error err(ErrorCode::InvalidState, "Already connected");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.message() == "Already connected");
        REQUIRE(err.subject().empty());
    }
}

TEST_CASE("Error subject names the region or entity", "[core][error]") {
    Error ipc = IpcError::frame_desync("Coherence_DestinationMessages", "node overrun");
    REQUIRE(ipc.subject() == "Coherence_DestinationMessages");
    REQUIRE(contains(ipc.message(), "node overrun"));

    Error scene = SceneError::not_found("Object", "Cube");
    REQUIRE(scene.subject() == "Cube");
    REQUIRE(scene.message() == "Object not found: Cube");
    REQUIRE(scene.as<SceneError>()->kind == SceneError::Kind::NotFound);
    REQUIRE(scene.as<IpcError>() == nullptr);
}

TEST_CASE("Only a closed channel counts as a disconnect", "[core][error]") {
    REQUIRE(Error(IpcError::channel_closed("pixels")).is_disconnect());
    REQUIRE_FALSE(Error(SceneError::not_connected()).is_disconnect());
    REQUIRE_FALSE(Error(IpcError::frame_desync("pixels", "short node")).is_disconnect());
}

TEST_CASE("format_error", "[core][error]") {
    SECTION("ipc error with channel") {
        auto text = format_error(IpcError::channel_not_found("Coherence_SourcePixels"));
        REQUIRE(contains(text, "[NotFound]"));
        REQUIRE(contains(text, "[IpcError:ChannelNotFound]"));
        REQUIRE(contains(text, "(channel: Coherence_SourcePixels)"));
    }

    SECTION("scene error with entity") {
        auto text = format_error(SceneError::inbound_not_supported("Cube"));
        REQUIRE(contains(text, "[NotSupported]"));
        REQUIRE(contains(text, "[SceneError:InboundNotSupported]"));
        REQUIRE(contains(text, "(entity: Cube)"));
    }

    SECTION("not connected has no entity") {
        auto text = format_error(SceneError::not_connected());
        REQUIRE_FALSE(contains(text, "(entity:"));
    }

    SECTION("plain message") {
        REQUIRE(format_error(Error(ErrorCode::Timeout, "Peer silent")) == "[Timeout] Peer silent");
    }
}

TEST_CASE("ErrorException carries the error", "[core][error]") {
    try {
        throw ErrorException(IpcError::channel_closed("messages"));
    } catch (const ErrorException& e) {
        REQUIRE(e.code() == ErrorCode::NotConnected);
        REQUIRE(e.error().is_disconnect());
        REQUIRE(contains(e.what(), "messages"));
    }
}

// =============================================================================
// Result
// =============================================================================

TEST_CASE("Result carries a value or an error", "[core][result]") {
    SECTION("value") {
        auto r = checked_length("Cube", 64);
        REQUIRE(r.is_ok());
        REQUIRE(*r == 4);
        REQUIRE(r.value_or(0) == 4);
    }

    SECTION("scene error") {
        auto r = checked_length("", 64);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("ipc error") {
        auto r = checked_length("Suzanne", 4);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().subject() == "Suzanne");
    }

    SECTION("void") {
        Result<void> ok = Ok();
        REQUIRE(ok.is_ok());

        Result<void> err = Err(Error(ErrorCode::NotConnected, "no peer"));
        REQUIRE(err.is_err());
        REQUIRE(err.error().message() == "no peer");
    }
}

TEST_CASE("Result unwrap throws ErrorException", "[core][result]") {
    Result<int> r = Err<int>(SceneError::not_found("Image", "albedo"));
    REQUIRE_THROWS_AS(r.unwrap(), ErrorException);

    Result<void> v = Err(IpcError::channel_closed("pixels"));
    REQUIRE_THROWS_AS(v.unwrap(), ErrorException);

    Result<int> ok = Ok(7);
    REQUIRE(ok.unwrap() == 7);
}

// =============================================================================
// Counters
// =============================================================================

TEST_CASE("Error counters", "[core][error]") {
    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);

    debug::record_error(SceneError::not_connected());
    debug::record_error(IpcError::channel_closed("messages"));
    debug::record_error(SceneError::not_found("Object", "Cube"));

    REQUIRE(debug::error_count(ErrorCode::NotConnected) == 2);
    REQUIRE(debug::error_count(ErrorCode::NotFound) == 1);
    REQUIRE(debug::error_count(ErrorCode::Timeout) == 0);
    REQUIRE(debug::total_error_count() == 3);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}
