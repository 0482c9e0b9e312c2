// coherence_scene Bridge tests
//
// Both ends run in this process over real shared memory, each driven by
// update() the way the host loop and the monitor drive them.

#include <catch2/catch_test_macros.hpp>
#include <coherence/scene/bridge.hpp>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace coherence_scene;
using coherence_core::BridgeConfig;
using coherence_core::ErrorCode;
using coherence_mesh::MLoop;
using coherence_mesh::MLoopCol;
using coherence_mesh::MLoopTri;
using coherence_mesh::MLoopUV;
using coherence_mesh::MVert;

namespace {

std::string unique_name(const std::string& prefix) {
    static int counter = 0;
    return "coherence_test_" + prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++);
}

BridgeConfig test_config(const std::string& name) {
    BridgeConfig config;
    config.connection_name = name;
    config.message_node_count = 32;
    config.message_node_size = 64 * 1024;
    config.pixel_node_count = 2;
    config.pixel_node_size = 64 * 1024;
    config.write_wait_ms = 10;
    config.disconnect_wait_ms = 50;
    return config;
}

/// One end of a connection with its event log
struct Side {
    Bridge bridge;
    std::vector<std::pair<BridgeEvent, std::string>> events;

    Side(const BridgeConfig& config, BridgeRole role)
        : bridge(config, role)
    {
        bridge.set_event_handler([this](BridgeEvent event, const std::string& target) {
            events.emplace_back(event, target);
        });
    }

    [[nodiscard]] bool saw(BridgeEvent event) const {
        return std::any_of(events.begin(), events.end(), [event](const auto& entry) { return entry.first == event; });
    }
};

void pump(Side& source, Side& destination, int rounds = 200) {
    for (int i = 0; i < rounds; ++i) {
        source.bridge.update();
        destination.bridge.update();
    }
}

/// Update one side alone until the peer's Disconnect has been read
void drain(Side& side, int rounds = 200) {
    for (int i = 0; i < rounds && side.bridge.is_connected_to_shared_memory(); ++i) {
        side.bridge.update();
    }
}

/// Connected pair with the handshake completed
struct Connection {
    BridgeConfig config = test_config(unique_name("bridge"));
    Side destination{config, BridgeRole::Destination};
    Side source{config, BridgeRole::Source};

    Connection() {
        REQUIRE(destination.bridge.connect("monitor 1.0").value());
        REQUIRE(source.bridge.connect("4.2.0").value());
    }

    void handshake() {
        pump(source, destination);
        REQUIRE(source.bridge.is_connected());
        REQUIRE(destination.bridge.is_connected());
    }

    void sync() { pump(source, destination); }

    [[nodiscard]] SceneContext& remote() { return *destination.bridge.context(); }
};

/// A quad of two triangles, one color per corner
struct Quad {
    std::vector<MVert> verts;
    std::vector<MLoop> loops{{0, 0}, {1, 0}, {2, 0}, {0, 0}, {2, 0}, {3, 0}};
    std::vector<MLoopTri> tris{{{0, 1, 2}, 0}, {{3, 4, 5}, 1}};
    std::vector<MLoopCol> cols{
        {255, 255, 255, 255}, {255, 255, 255, 255}, {255, 255, 255, 255},
        {255, 255, 255, 255}, {255, 255, 255, 255}, {255, 255, 255, 255}};

    Quad() {
        const float corners[4][2] = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
        for (const auto& corner : corners) {
            MVert v{};
            v.co[0] = corner[0];
            v.co[1] = corner[1];
            v.no[2] = 32767;
            verts.push_back(v);
        }
    }

    coherence_core::Result<void> copy_into(Bridge& bridge, const std::string& mesh_name) const {
        return bridge.copy_mesh_data(mesh_name, verts, loops, tris, cols, {});
    }
};

InteropProperty make_property(const std::string& name, std::int32_t value) {
    InteropProperty prop{};
    prop.name = InteropString64(name);
    prop.type = PropertyType::Integer;
    prop.int_value = value;
    return prop;
}

} // anonymous namespace

// =============================================================================
// Connection
// =============================================================================

TEST_CASE("Bridge source waits for the destination", "[scene][bridge]") {
    const auto config = test_config(unique_name("absent"));
    Bridge source(config, BridgeRole::Source);

    auto connected = source.connect("4.2.0");
    REQUIRE(connected.is_ok());
    REQUIRE_FALSE(*connected);
    REQUIRE_FALSE(source.is_connected_to_shared_memory());
    REQUIRE(source.context() == nullptr);

    SECTION("entity operations report not connected") {
        auto added = source.add_viewport(1);
        REQUIRE(added.is_err());
        REQUIRE(added.error().code() == ErrorCode::NotConnected);

        auto object = source.add_mesh_object("Cube", "CubeMesh", identity_transform());
        REQUIRE(object.error().code() == ErrorCode::NotConnected);
    }

    SECTION("update and consume are no-ops") {
        source.update();
        REQUIRE(source.consume_pixels() == 0);
    }
}

TEST_CASE("Bridge handshake", "[scene][bridge]") {
    Connection conn;

    REQUIRE(conn.source.bridge.is_connected_to_shared_memory());
    REQUIRE(conn.destination.bridge.is_connected_to_shared_memory());
    REQUIRE_FALSE(conn.source.bridge.is_connected());
    REQUIRE_FALSE(conn.destination.bridge.is_connected());

    conn.handshake();

    REQUIRE(conn.source.saw(BridgeEvent::PeerConnected));
    REQUIRE(conn.destination.saw(BridgeEvent::PeerConnected));
    REQUIRE(conn.source.bridge.peer_state().name.str() == "Destination");
    REQUIRE(conn.destination.bridge.peer_state().name.str() == "Source");
    REQUIRE(conn.destination.bridge.peer_state().version.str() == "4.2.0");
    REQUIRE(conn.destination.bridge.peer_state().protocol == PROTOCOL_VERSION);
}

TEST_CASE("Bridge connect misuse", "[scene][bridge]") {
    Connection conn;

    SECTION("connecting twice") {
        auto again = conn.destination.bridge.connect("monitor 1.0");
        REQUIRE(again.is_err());
        REQUIRE(again.error().code() == ErrorCode::InvalidState);
    }

    SECTION("version that does not fit") {
        Bridge other(test_config(unique_name("long")), BridgeRole::Destination);
        REQUIRE(other.connect(std::string(70, 'v')).is_err());
        REQUIRE_FALSE(other.is_connected_to_shared_memory());
    }
}

TEST_CASE("Bridge update reads one inbound message per tick", "[scene][bridge]") {
    Connection conn;
    conn.handshake();

    REQUIRE(conn.source.bridge.add_viewport(1).is_ok());
    REQUIRE(conn.source.bridge.add_viewport(2).is_ok());
    REQUIRE(conn.source.bridge.add_viewport(3).is_ok());
    conn.source.bridge.update();

    auto& inbound = conn.destination.bridge.messenger();
    const auto before = inbound.messages_read();
    conn.destination.bridge.update();
    REQUIRE(inbound.messages_read() == before + 1);
    REQUIRE(conn.remote().viewports().size() <= 1);

    conn.destination.bridge.update();
    REQUIRE(inbound.messages_read() == before + 2);

    conn.sync();
    REQUIRE(conn.remote().viewports().size() == 3);
}

// =============================================================================
// Scene Transfer
// =============================================================================

TEST_CASE("Bridge sends the existing scene on connect", "[scene][bridge]") {
    Connection conn;
    Bridge& host = conn.source.bridge;
    Quad quad;

    // Everything below happens before the peer has answered
    REQUIRE(host.add_viewport(1).is_ok());
    InteropCamera camera{};
    camera.width = 64;
    camera.height = 32;
    camera.is_perspective = 1;
    camera.lens = 50.0f;
    REQUIRE(host.set_viewport_camera(1, camera).is_ok());

    REQUIRE(host.add_mesh_object("Cube", "CubeMesh", identity_transform()).is_ok());
    REQUIRE(quad.copy_into(host, "CubeMesh").is_ok());
    REQUIRE(host.set_object_material("Cube", "Metal").is_ok());

    const std::int32_t cube_id = (*host.get_object("Cube"))->id();
    const std::vector<std::int32_t> visible{cube_id};
    REQUIRE(host.set_visible_objects(1, visible).is_ok());

    REQUIRE(host.add_component("Cube", "Rotator").is_ok());
    const std::vector<InteropProperty> props{make_property("speed", 3)};
    REQUIRE(host.set_component_properties("Cube", "Rotator", props).is_ok());

    REQUIRE(host.add_image("albedo").is_ok());
    const std::vector<float> pixels(2 * 2 * 4, 0.25f);
    REQUIRE(host.copy_image("albedo", 2, 2, pixels).is_ok());

    REQUIRE(host.messenger().queued_count() == 1);  // Connect only

    conn.handshake();
    conn.sync();

    auto& remote = conn.remote();

    auto* cube = remote.objects().find("Cube");
    REQUIRE(cube != nullptr);
    REQUIRE(cube->id() == cube_id);
    REQUIRE(cube->mesh_name() == "CubeMesh");
    REQUIRE(cube->material() == "Metal");
    REQUIRE(cube->vertex_count() == 4);
    REQUIRE(cube->triangle_count() == 2);

    auto* buffers = remote.mesh_buffers().find("CubeMesh");
    REQUIRE(buffers != nullptr);
    REQUIRE(buffers->version() == 1);
    REQUIRE(buffers->vertices().size() == 4);
    REQUIRE(buffers->colors().size() == 4);
    REQUIRE(buffers->triangles().size() == 6);
    REQUIRE(conn.destination.saw(BridgeEvent::MeshUpdated));

    auto* viewport = remote.viewports().find(1);
    REQUIRE(viewport != nullptr);
    REQUIRE(viewport->camera().width == 64);
    REQUIRE(viewport->visible_objects() == visible);

    auto* rotator = remote.components().find("Cube:Rotator");
    REQUIRE(rotator != nullptr);
    REQUIRE(rotator->property("speed") != nullptr);
    REQUIRE(rotator->property("speed")->int_value == 3);

    auto* albedo = remote.images().find("albedo");
    REQUIRE(albedo != nullptr);
    REQUIRE(albedo->width() == 2);
    REQUIRE(albedo->pixels() == pixels);
}

TEST_CASE("Bridge forwards live changes", "[scene][bridge]") {
    Connection conn;
    Bridge& host = conn.source.bridge;
    Quad quad;

    conn.handshake();
    REQUIRE(host.add_mesh_object("Cube", "CubeMesh", identity_transform()).is_ok());
    REQUIRE(quad.copy_into(host, "CubeMesh").is_ok());
    conn.sync();

    auto& remote = conn.remote();
    REQUIRE(remote.objects().contains("Cube"));
    REQUIRE(remote.mesh_buffers().find("CubeMesh")->version() == 1);

    SECTION("transform") {
        auto transform = identity_transform();
        transform.position = coherence_math::Vec3(1.0f, 2.0f, 3.0f);
        REQUIRE(host.set_object_transform("Cube", transform).is_ok());
        conn.sync();

        REQUIRE(remote.objects().find("Cube")->transform().position.y == 2.0f);
    }

    SECTION("moving a vertex resends the mesh") {
        quad.verts[2].co[2] = 0.5f;
        REQUIRE(quad.copy_into(host, "CubeMesh").is_ok());
        conn.sync();

        auto* buffers = remote.mesh_buffers().find("CubeMesh");
        REQUIRE(buffers->version() == 2);
        REQUIRE(buffers->vertices().size() == 4);
    }

    SECTION("identical mesh data sends nothing") {
        const auto written = host.messenger().messages_written();
        REQUIRE(quad.copy_into(host, "CubeMesh").is_ok());
        REQUIRE(host.messenger().queued_count() == 0);
        conn.sync();
        REQUIRE(host.messenger().messages_written() == written);
        REQUIRE(remote.mesh_buffers().find("CubeMesh")->version() == 1);
    }

    SECTION("removing an object") {
        REQUIRE(host.add_component("Cube", "Rotator").is_ok());
        conn.sync();
        REQUIRE(remote.components().contains("Cube:Rotator"));

        REQUIRE(host.remove_object("Cube").is_ok());
        REQUIRE(host.context()->meshes().empty());
        conn.sync();

        REQUIRE_FALSE(remote.objects().contains("Cube"));
        REQUIRE_FALSE(remote.components().contains("Cube:Rotator"));
    }

    SECTION("empty visibility list still reaches the peer") {
        REQUIRE(host.add_viewport(2).is_ok());
        const std::vector<std::int32_t> ids{1};
        REQUIRE(host.set_visible_objects(2, ids).is_ok());
        conn.sync();
        REQUIRE(remote.viewports().find(2)->visible_objects().size() == 1);

        REQUIRE(host.set_visible_objects(2, {}).is_ok());
        conn.sync();
        REQUIRE(remote.viewports().find(2)->visible_objects().empty());
    }

    SECTION("clear removes everything on both sides") {
        host.clear();
        REQUIRE(host.context()->entity_count() == 0);
        conn.sync();
        REQUIRE(remote.objects().empty());
    }
}

TEST_CASE("Bridge operation errors", "[scene][bridge]") {
    Connection conn;
    Bridge& host = conn.source.bridge;
    conn.handshake();

    REQUIRE(host.set_viewport_camera(9, InteropCamera{}).error().code() == ErrorCode::NotFound);
    REQUIRE(host.remove_object("Missing").error().code() == ErrorCode::NotFound);
    REQUIRE(host.add_component("Missing", "Rotator").error().code() == ErrorCode::NotFound);
    REQUIRE(host.copy_image("Missing", 1, 1, std::vector<float>(4)).error().code() == ErrorCode::NotFound);

    REQUIRE(host.add_viewport(1).is_ok());
    REQUIRE(host.add_viewport(1).error().code() == ErrorCode::AlreadyExists);

    REQUIRE(host.add_mesh_object("Cube", "CubeMesh", identity_transform()).is_ok());
    REQUIRE(host.add_mesh_object("Cube", "Other", identity_transform()).error().code() == ErrorCode::AlreadyExists);
    REQUIRE_FALSE(host.context()->meshes().contains("Other"));

    // Rejected on its dimensions; the four floats are never read as 30000x30000
    REQUIRE(host.add_image("albedo").is_ok());
    REQUIRE(host.copy_image("albedo", 30000, 30000, std::vector<float>(4)).error().code() == ErrorCode::CapacityExceeded);
}

// =============================================================================
// Render Frames
// =============================================================================

TEST_CASE("Bridge render frames", "[scene][bridge][pixels]") {
    Connection conn;
    Bridge& host = conn.source.bridge;
    Bridge& renderer = conn.destination.bridge;

    REQUIRE(host.add_viewport(1).is_ok());
    conn.handshake();

    const std::vector<std::uint8_t> rgb(4 * 2 * 3, 200);

    SECTION("frame reaches the viewport") {
        auto sent = renderer.send_render_frame(1, 4, 2, rgb);
        REQUIRE(sent.is_ok());
        REQUIRE(*sent);

        REQUIRE(host.consume_pixels() == 1);
        REQUIRE(host.consume_pixels() == 0);

        auto viewport = host.get_viewport(1);
        REQUIRE(viewport.is_ok());
        auto lock = (*viewport)->lock_render_texture();
        REQUIRE(lock->width == 4);
        REQUIRE(lock->height == 2);
        REQUIRE(lock->pixels[0] == 200);
    }

    SECTION("frames for unknown viewports are skipped") {
        REQUIRE(*renderer.send_render_frame(5, 4, 2, rgb));
        REQUIRE(host.consume_pixels() == 1);
        REQUIRE((*host.get_viewport(1))->frame() == 0);
        REQUIRE(host.is_connected_to_shared_memory());
    }

    SECTION("a full ring reports false") {
        REQUIRE(*renderer.send_render_frame(1, 4, 2, rgb));
        REQUIRE(*renderer.send_render_frame(1, 4, 2, rgb));
        auto third = renderer.send_render_frame(1, 4, 2, rgb);
        REQUIRE(third.is_ok());
        REQUIRE_FALSE(*third);
        REQUIRE(host.consume_pixels() == 2);
    }

    SECTION("bad frames") {
        REQUIRE(renderer.send_render_frame(1, 5, 2, rgb).error().code() == ErrorCode::InvalidArgument);

        const std::vector<std::uint8_t> huge(200 * 200 * 3);
        REQUIRE(renderer.send_render_frame(1, 200, 200, huge).error().code() == ErrorCode::CapacityExceeded);

        REQUIRE(host.send_render_frame(1, 4, 2, rgb).error().code() == ErrorCode::InvalidState);
    }

    SECTION("a held buffer does not block teardown") {
        REQUIRE(*renderer.send_render_frame(1, 4, 2, rgb));
        REQUIRE(host.consume_pixels() == 1);

        auto buffer = host.find_pixel_buffer(1);
        REQUIRE(buffer != nullptr);
        auto data = buffer->acquire();

        renderer.disconnect();

        std::atomic<bool> finished{false};
        std::thread poll([&]() {
            drain(conn.source);
            finished = true;
        });
        poll.join();

        REQUIRE(finished);
        REQUIRE_FALSE(host.is_connected_to_shared_memory());
        REQUIRE(host.find_pixel_buffer(1) == nullptr);
        REQUIRE(data.pixels[0] == 200);
        REQUIRE(buffer->release().is_ok());
    }

    SECTION("removing a held viewport does not block") {
        auto buffer = host.find_pixel_buffer(1);
        REQUIRE(buffer != nullptr);
        auto data = buffer->acquire();
        REQUIRE(data.viewport_id == 1);

        bool removed = false;
        std::thread remover([&]() { removed = host.remove_viewport(1).is_ok(); });
        remover.join();

        REQUIRE(removed);
        REQUIRE(host.find_pixel_buffer(1) == nullptr);
        REQUIRE(buffer->release().is_ok());
    }
}

// =============================================================================
// Disconnect
// =============================================================================

TEST_CASE("Bridge disconnect", "[scene][bridge]") {
    Connection conn;
    conn.handshake();

    SECTION("source leaving tears down the destination") {
        conn.source.bridge.disconnect();
        REQUIRE_FALSE(conn.source.bridge.is_connected_to_shared_memory());
        REQUIRE(conn.source.bridge.context() == nullptr);

        drain(conn.destination);
        REQUIRE(conn.destination.saw(BridgeEvent::PeerDisconnected));
        REQUIRE_FALSE(conn.destination.bridge.is_connected());
        REQUIRE_FALSE(conn.destination.bridge.is_connected_to_shared_memory());

        // The destination can offer a fresh connection straight away
        REQUIRE(*conn.destination.bridge.connect("monitor 1.0"));
        REQUIRE(*conn.source.bridge.connect("4.2.0"));
        conn.handshake();
    }

    SECTION("destination leaving tears down the source") {
        conn.destination.bridge.disconnect();
        drain(conn.source);

        REQUIRE(conn.source.saw(BridgeEvent::PeerDisconnected));
        REQUIRE_FALSE(conn.source.bridge.is_connected_to_shared_memory());
        REQUIRE(conn.source.bridge.context() == nullptr);
    }

    SECTION("disconnect is idempotent") {
        conn.source.bridge.disconnect();
        conn.source.bridge.disconnect();
        REQUIRE_FALSE(conn.source.bridge.is_connected_to_shared_memory());
    }
}

TEST_CASE("Bridge peer timeout", "[scene][bridge]") {
    auto config = test_config(unique_name("timeout"));
    config.connection_timeout_ms = 200;
    Side destination(config, BridgeRole::Destination);
    Side source(config, BridgeRole::Source);

    REQUIRE(*destination.bridge.connect("monitor 1.0"));
    REQUIRE(*source.bridge.connect("4.2.0"));
    pump(source, destination);
    REQUIRE(destination.bridge.is_connected());

    // Source stops polling; whatever it already wrote is read first
    for (int i = 0; i < 20; ++i) {
        destination.bridge.update();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    destination.bridge.update();

    REQUIRE(destination.saw(BridgeEvent::ConnectionLost));
    REQUIRE_FALSE(destination.bridge.is_connected_to_shared_memory());
}
