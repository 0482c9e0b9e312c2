#pragma once

/// @file bridge.hpp
/// @brief Connection lifecycle, message routing and scene operations
///
/// A Bridge drives one connection from a single poll thread. The source
/// side (the authoring application) attaches to shared memory created by
/// the destination side (the renderer). Scene operations update the
/// SceneContext immediately and queue the matching messages once the peer
/// has completed the handshake; everything that exists at handshake time is
/// sent in one batch.
///
/// Typical source-side loop:
/// @code
/// Bridge bridge(config, BridgeRole::Source);
/// if (bridge.connect("4.2.0").value()) {
///     bridge.add_viewport(1);
///     while (running) {
///         bridge.update();
///         bridge.consume_pixels();
///     }
///     bridge.disconnect();
/// }
/// @endcode

#include "fwd.hpp"
#include "context.hpp"
#include "interop.hpp"

#include <coherence/core/config.hpp>
#include <coherence/core/error.hpp>
#include <coherence/ipc/messenger.hpp>
#include <coherence/ipc/ring_buffer.hpp>
#include <coherence/mesh/types.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>

namespace coherence_scene {

enum class BridgeRole : std::uint8_t {
    /// Authoring side; attaches to existing shared memory
    Source,
    /// Rendering side; creates the shared memory and sends frames back
    Destination,
};

[[nodiscard]] inline const char* bridge_role_name(BridgeRole role) {
    switch (role) {
        case BridgeRole::Source: return "Source";
        case BridgeRole::Destination: return "Destination";
        default: return "Unknown";
    }
}

/// Notifications raised from update()
enum class BridgeEvent : std::uint8_t {
    PeerConnected,
    PeerDisconnected,
    ConnectionLost,
    MeshUpdated,
    ObjectUpdated,
    ViewportUpdated,
    ImageUpdated,
};

[[nodiscard]] inline const char* bridge_event_name(BridgeEvent event) {
    switch (event) {
        case BridgeEvent::PeerConnected: return "PeerConnected";
        case BridgeEvent::PeerDisconnected: return "PeerDisconnected";
        case BridgeEvent::ConnectionLost: return "ConnectionLost";
        case BridgeEvent::MeshUpdated: return "MeshUpdated";
        case BridgeEvent::ObjectUpdated: return "ObjectUpdated";
        case BridgeEvent::ViewportUpdated: return "ViewportUpdated";
        case BridgeEvent::ImageUpdated: return "ImageUpdated";
        default: return "Unknown";
    }
}

class Bridge {
public:
    using EventHandler = std::function<void(BridgeEvent event, const std::string& target)>;

    explicit Bridge(coherence_core::BridgeConfig config, BridgeRole role = BridgeRole::Source);
    ~Bridge();

    // Non-copyable
    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    // =========================================================================
    // Connection
    // =========================================================================

    /// Open the shared memory channels and create a fresh context.
    /// @param version host application version sent with Connect
    /// @return false on the source side if the destination has not created
    ///         the shared memory yet
    [[nodiscard]] coherence_core::Result<bool> connect(const std::string& version);

    /// Notify the peer (best effort) and release rings, pixel buffers and the context
    void disconnect();

    /// Drop all entities and queued messages, keeping the connection
    void clear();

    /// One poll tick: flush the outbound queue, read at most one inbound message,
    /// check the peer timeout, then run any deferred teardown.
    void update();

    /// Read every pending render frame into its viewport (source side)
    /// @return frames consumed
    std::size_t consume_pixels();

    /// Write one RGB24 frame for a viewport (destination side)
    /// @return false if no pixel node was free within the write wait
    [[nodiscard]] coherence_core::Result<bool> send_render_frame(
        std::int32_t viewport_id, std::int32_t width, std::int32_t height, std::span<const std::uint8_t> rgb);

    /// Peer completed the handshake
    [[nodiscard]] bool is_connected() const noexcept { return m_peer_connected; }

    /// Shared memory channels are open
    [[nodiscard]] bool is_connected_to_shared_memory() const noexcept { return m_messenger.is_connected(); }

    [[nodiscard]] BridgeRole role() const noexcept { return m_role; }
    [[nodiscard]] const coherence_core::BridgeConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const InteropClientState& local_state() const noexcept { return m_local_state; }
    [[nodiscard]] const InteropClientState& peer_state() const noexcept { return m_peer_state; }

    /// Current context, nullptr while disconnected
    [[nodiscard]] SceneContext* context() noexcept { return m_context.get(); }
    [[nodiscard]] const SceneContext* context() const noexcept { return m_context.get(); }

    [[nodiscard]] coherence_ipc::Messenger& messenger() noexcept { return m_messenger; }

    void set_event_handler(EventHandler handler) { m_event_handler = std::move(handler); }

    // =========================================================================
    // Viewports
    // =========================================================================

    [[nodiscard]] coherence_core::Result<void> add_viewport(std::int32_t id);
    [[nodiscard]] coherence_core::Result<void> remove_viewport(std::int32_t id);
    [[nodiscard]] coherence_core::Result<void> set_viewport_camera(std::int32_t id, const InteropCamera& camera);
    [[nodiscard]] coherence_core::Result<void> set_visible_objects(std::int32_t id, std::span<const std::int32_t> object_ids);

    [[nodiscard]] coherence_core::Result<Viewport*> get_viewport(std::int32_t id) const;

    /// Pixel buffer of a viewport, nullptr if there is none. Safe to call
    /// from a render thread while update() runs on the poll thread.
    [[nodiscard]] std::shared_ptr<PixelBuffer> find_pixel_buffer(std::int32_t viewport_id) const;

    // =========================================================================
    // Objects and Meshes
    // =========================================================================

    /// Add an object that renders the named mesh
    [[nodiscard]] coherence_core::Result<void> add_mesh_object(
        const std::string& name, const std::string& mesh_name, const InteropTransform& transform);

    [[nodiscard]] coherence_core::Result<void> set_object_transform(const std::string& name, const InteropTransform& transform);
    [[nodiscard]] coherence_core::Result<void> set_object_material(const std::string& name, const std::string& material);

    /// Remove an object, its components and its mesh once no object uses it
    [[nodiscard]] coherence_core::Result<void> remove_object(const std::string& name);

    /// Diff new source arrays for a mesh and queue the changed channels
    [[nodiscard]] coherence_core::Result<void> copy_mesh_data(
        const std::string& mesh_name,
        std::span<const coherence_mesh::MVert> verts,
        std::span<const coherence_mesh::MLoop> loops,
        std::span<const coherence_mesh::MLoopTri> loop_tris,
        std::span<const coherence_mesh::MLoopCol> loop_cols,
        std::span<const std::span<const coherence_mesh::MLoopUV>> uv_layers);

    [[nodiscard]] coherence_core::Result<SceneObject*> get_object(const std::string& name) const;

    // =========================================================================
    // Images
    // =========================================================================

    [[nodiscard]] coherence_core::Result<void> add_image(const std::string& name);
    [[nodiscard]] coherence_core::Result<void> copy_image(
        const std::string& name, std::int32_t width, std::int32_t height, std::span<const float> pixels);
    [[nodiscard]] coherence_core::Result<void> remove_image(const std::string& name);

    // =========================================================================
    // Components
    // =========================================================================

    [[nodiscard]] coherence_core::Result<void> add_component(
        const std::string& target, const std::string& name, bool enabled = true);
    [[nodiscard]] coherence_core::Result<void> set_component_properties(
        const std::string& target, const std::string& name, std::span<const InteropProperty> properties);
    [[nodiscard]] coherence_core::Result<void> remove_component(const std::string& target, const std::string& name);

private:
    using Handler = std::size_t (Bridge::*)(
        const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);

    void register_handlers();
    void teardown(bool notify_peer);
    void check_for_timeout();
    void send_heartbeat();
    void send_all_scene_data();
    void emit(BridgeEvent event, const std::string& target);

    /// Mirror the context's viewport buffers into the render-thread lookup
    void publish_pixel_buffers();

    [[nodiscard]] bool can_send() const noexcept { return m_peer_connected && m_messenger.is_connected(); }
    [[nodiscard]] coherence_core::Result<SceneContext*> require_context() const;

    std::size_t dispatch(const std::string& target, const coherence_ipc::MessageHeader& header,
                         std::span<const std::byte> payload);

    // Inbound handlers
    std::size_t on_connect(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_disconnect(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_update_state(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_add_viewport(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_remove_viewport(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_update_viewport(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_update_visible_objects(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_add_object(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_remove_object(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_update_object(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_add_component(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_destroy_component(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_update_component(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_update_properties(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_mesh_channel(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_update_mesh(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_add_image(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_remove_image(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_update_image(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);
    std::size_t on_update_image_data(const std::string& target, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);

    coherence_core::BridgeConfig m_config;
    BridgeRole m_role;

    coherence_ipc::Messenger m_messenger;
    std::unique_ptr<coherence_ipc::RingBuffer> m_pixels;
    std::unique_ptr<SceneContext> m_context;
    std::unordered_map<coherence_ipc::RpcRequest, Handler> m_handlers;

    mutable std::mutex m_pixel_buffers_mutex;
    std::map<std::int32_t, std::shared_ptr<PixelBuffer>> m_pixel_buffers;

    InteropClientState m_local_state{};
    InteropClientState m_peer_state{};

    bool m_peer_connected = false;
    bool m_pending_teardown = false;

    std::chrono::steady_clock::time_point m_last_inbound;
    std::chrono::steady_clock::time_point m_last_heartbeat;

    EventHandler m_event_handler;
};

} // namespace coherence_scene
