/// @file bridge.cpp
/// @brief Bridge connection lifecycle and scene operations

#include <coherence/scene/bridge.hpp>
#include <coherence/ipc/entity.hpp>
#include <coherence/core/log.hpp>

#include <algorithm>
#include <cstring>
#include <vector>

namespace coherence_scene {

using coherence_core::Err;
using coherence_core::Error;
using coherence_core::ErrorCode;
using coherence_core::ErrorException;
using coherence_core::IpcError;
using coherence_core::Ok;
using coherence_core::SceneError;
using coherence_ipc::MessageHeader;
using coherence_ipc::RpcRequest;

namespace {

using Clock = std::chrono::steady_clock;

bool is_channel_missing(const Error& error) {
    const auto* ipc = error.as<IpcError>();
    return ipc != nullptr && ipc->kind == IpcError::Kind::ChannelNotFound;
}

/// Copy a flat value out of a payload, logging short payloads
template<typename T>
bool decode(std::span<const std::byte> payload, T& out, RpcRequest type, const std::string& target) {
    if (coherence_ipc::read_value(payload, out)) {
        return true;
    }
    coherence_core::scene_logger()->warn("{} for '{}' carries {} bytes, expected {}",
        coherence_ipc::rpc_request_name(type), target, payload.size(), sizeof(T));
    return false;
}

/// Copy an int32 array out of a payload that may not be aligned
bool decode_ids(std::span<const std::byte> payload, const MessageHeader& header, std::vector<std::int32_t>& out) {
    if (header.count < 0) {
        return false;
    }
    const std::size_t bytes = static_cast<std::size_t>(header.count) * sizeof(std::int32_t);
    if (bytes > payload.size()) {
        return false;
    }
    out.resize(static_cast<std::size_t>(header.count));
    if (bytes > 0) {
        std::memcpy(out.data(), payload.data(), bytes);
    }
    return true;
}

} // anonymous namespace

Bridge::Bridge(coherence_core::BridgeConfig config, BridgeRole role)
    : m_config(std::move(config))
    , m_role(role)
    , m_messenger(m_config.outbound_warn_threshold)
{
    register_handlers();
}

Bridge::~Bridge() {
    disconnect();
}

void Bridge::register_handlers() {
    m_handlers = {
        {RpcRequest::Connect, &Bridge::on_connect},
        {RpcRequest::Disconnect, &Bridge::on_disconnect},
        {RpcRequest::UpdateState, &Bridge::on_update_state},

        {RpcRequest::AddViewport, &Bridge::on_add_viewport},
        {RpcRequest::RemoveViewport, &Bridge::on_remove_viewport},
        {RpcRequest::UpdateViewport, &Bridge::on_update_viewport},
        {RpcRequest::UpdateVisibleObjects, &Bridge::on_update_visible_objects},

        {RpcRequest::AddObject, &Bridge::on_add_object},
        {RpcRequest::RemoveObject, &Bridge::on_remove_object},
        {RpcRequest::UpdateObject, &Bridge::on_update_object},

        {RpcRequest::AddComponent, &Bridge::on_add_component},
        {RpcRequest::DestroyComponent, &Bridge::on_destroy_component},
        {RpcRequest::UpdateComponent, &Bridge::on_update_component},
        {RpcRequest::UpdateProperties, &Bridge::on_update_properties},

        {RpcRequest::UpdateVertices, &Bridge::on_mesh_channel},
        {RpcRequest::UpdateNormals, &Bridge::on_mesh_channel},
        {RpcRequest::UpdateVertexColors, &Bridge::on_mesh_channel},
        {RpcRequest::UpdateUV, &Bridge::on_mesh_channel},
        {RpcRequest::UpdateUV2, &Bridge::on_mesh_channel},
        {RpcRequest::UpdateUV3, &Bridge::on_mesh_channel},
        {RpcRequest::UpdateUV4, &Bridge::on_mesh_channel},
        {RpcRequest::UpdateTriangles, &Bridge::on_mesh_channel},
        {RpcRequest::UpdateMesh, &Bridge::on_update_mesh},

        {RpcRequest::AddImage, &Bridge::on_add_image},
        {RpcRequest::RemoveImage, &Bridge::on_remove_image},
        {RpcRequest::UpdateImage, &Bridge::on_update_image},
        {RpcRequest::UpdateImageData, &Bridge::on_update_image_data},
    };
}

// =============================================================================
// Connection
// =============================================================================

coherence_core::Result<bool> Bridge::connect(const std::string& version) {
    if (m_messenger.is_connected()) {
        return Err<bool>(Error(ErrorCode::InvalidState, "Already connected to '" + m_config.connection_name + "'"));
    }
    if (!InteropString64::fits(version)) {
        return Err<bool>(SceneError::invalid_value("version", "longer than " +
            std::to_string(InteropString64::MAX_LENGTH) + " bytes"));
    }

    m_local_state = InteropClientState{};
    m_local_state.version = InteropString64(version);
    m_local_state.name = InteropString64(bridge_role_name(m_role));
    m_local_state.protocol = PROTOCOL_VERSION;
    m_peer_state = InteropClientState{};

    const std::string& name = m_config.connection_name;
    const bool source = m_role == BridgeRole::Source;
    const std::string inbound = source ? coherence_ipc::source_messages_name(name)
                                       : coherence_ipc::destination_messages_name(name);
    const std::string outbound = source ? coherence_ipc::destination_messages_name(name)
                                        : coherence_ipc::source_messages_name(name);
    const std::string pixels = coherence_ipc::viewport_pixels_name(name);

    m_messenger.clear_queue();

    if (source) {
        auto result = m_messenger.connect_as_slave(
            inbound, outbound, m_config.message_node_count, m_config.message_node_size);
        if (!result) {
            if (is_channel_missing(result.error())) {
                coherence_core::scene_logger()->debug("Shared memory '{}' is not available yet", name);
                return Ok(false);
            }
            return Err<bool>(result.error());
        }

        auto ring = coherence_ipc::RingBuffer::open(pixels, m_config.pixel_node_count, m_config.pixel_node_size);
        if (!ring) {
            m_messenger.close();
            if (is_channel_missing(ring.error())) {
                coherence_core::scene_logger()->debug("Pixel buffer '{}' is not available yet", pixels);
                return Ok(false);
            }
            return Err<bool>(ring.error());
        }
        m_pixels = std::move(ring).value();
    } else {
        auto result = m_messenger.connect_as_master(
            inbound, outbound, m_config.message_node_count, m_config.message_node_size);
        if (!result) {
            return Err<bool>(result.error());
        }

        auto ring = coherence_ipc::RingBuffer::create(pixels, m_config.pixel_node_count, m_config.pixel_node_size);
        if (!ring) {
            m_messenger.close();
            return Err<bool>(ring.error());
        }
        m_pixels = std::move(ring).value();
    }

    m_context = std::make_unique<SceneContext>();
    m_peer_connected = false;
    m_pending_teardown = false;
    m_last_inbound = Clock::now();
    m_last_heartbeat = m_last_inbound;

    if (source) {
        m_messenger.queue(RpcRequest::Connect, name, m_local_state);
    }

    coherence_core::scene_logger()->info("Connected to shared memory '{}' as {} ({})",
        name, bridge_role_name(m_role), version);
    return Ok(true);
}

void Bridge::disconnect() {
    teardown(true);
}

void Bridge::teardown(bool notify_peer) {
    if (!m_messenger.is_connected() && !m_context) {
        return;
    }

    if (notify_peer && m_messenger.is_connected()) {
        try {
            m_messenger.write_disconnect(std::chrono::milliseconds(m_config.disconnect_wait_ms));
        } catch (const ErrorException& e) {
            coherence_core::scene_logger()->debug("Disconnect notice not delivered: {}", e.what());
        }
    }

    m_peer_connected = false;
    m_pending_teardown = false;

    // Queued arrays point into the context
    m_messenger.clear_queue();
    m_messenger.close();
    m_pixels.reset();
    m_context.reset();
    publish_pixel_buffers();

    coherence_core::scene_logger()->info("Disconnected from '{}'", m_config.connection_name);
}

void Bridge::clear() {
    if (!m_context) {
        return;
    }

    const bool notify = can_send();
    for (const auto& [name, object] : m_context->objects()) {
        if (notify) {
            coherence_ipc::remove_entity(m_messenger, RpcRequest::RemoveObject, *object);
        }
    }
    for (const auto& [id, viewport] : m_context->viewports()) {
        if (notify) {
            coherence_ipc::remove_entity(m_messenger, RpcRequest::RemoveViewport, *viewport);
        } else {
            m_messenger.discard_queued(viewport->name());
        }
    }
    for (const auto& [name, image] : m_context->images()) {
        if (notify) {
            coherence_ipc::remove_entity(m_messenger, RpcRequest::RemoveImage, *image);
        } else {
            m_messenger.discard_queued(name);
        }
    }
    for (const auto& [key, component] : m_context->components()) {
        m_messenger.discard_queued(key);
    }
    for (const auto& [name, mesh] : m_context->meshes()) {
        m_messenger.discard_queued(name);
    }

    m_context->clear();
    publish_pixel_buffers();
    coherence_core::scene_logger()->debug("Cleared scene context");
}

void Bridge::update() {
    if (!m_messenger.is_connected()) {
        return;
    }

    const auto read_wait = std::chrono::milliseconds(m_config.read_wait_ms);
    const auto write_wait = std::chrono::milliseconds(m_config.write_wait_ms);

    try {
        m_messenger.process_outbound_queue(write_wait);

        auto dispatcher = [this](const std::string& target, const MessageHeader& header,
                                 std::span<const std::byte> payload) {
            return dispatch(target, header, payload);
        };

        // One inbound message per tick
        m_messenger.read(dispatcher, read_wait);

        if (!m_pending_teardown) {
            check_for_timeout();
        }
        if (!m_pending_teardown) {
            send_heartbeat();
        }
    } catch (const ErrorException& e) {
        if (e.error().is_disconnect()) {
            coherence_core::scene_logger()->warn("Shared memory '{}' closed by peer", e.error().subject());
        } else {
            coherence_core::scene_logger()->error("Connection to '{}' failed: {}", m_config.connection_name, e.what());
        }
        m_pending_teardown = true;
        emit(BridgeEvent::ConnectionLost, m_config.connection_name);
    }

    // Deferred until the ring read has returned
    if (m_pending_teardown) {
        teardown(false);
    }
}

void Bridge::check_for_timeout() {
    if (!m_peer_connected) {
        return;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - m_last_inbound);
    if (elapsed.count() < static_cast<std::int64_t>(m_config.connection_timeout_ms)) {
        return;
    }

    coherence_core::scene_logger()->warn("No message from peer for {}ms, disconnecting", elapsed.count());
    m_pending_teardown = true;
    emit(BridgeEvent::ConnectionLost, m_config.connection_name);
}

void Bridge::send_heartbeat() {
    if (!m_peer_connected) {
        return;
    }

    const auto interval = std::chrono::milliseconds(m_config.connection_timeout_ms / 4);
    const auto now = Clock::now();
    if (now - m_last_heartbeat < interval) {
        return;
    }

    m_messenger.replace_or_queue(RpcRequest::UpdateState, m_config.connection_name, m_local_state);
    m_last_heartbeat = now;
}

void Bridge::emit(BridgeEvent event, const std::string& target) {
    if (m_event_handler) {
        m_event_handler(event, target);
    }
}

coherence_core::Result<SceneContext*> Bridge::require_context() const {
    if (!m_context) {
        return Err<SceneContext*>(SceneError::not_connected());
    }
    return Ok(m_context.get());
}

void Bridge::send_all_scene_data() {
    auto log = coherence_core::scene_logger();

    for (const auto& [name, object] : m_context->objects()) {
        coherence_ipc::add_entity(m_messenger, RpcRequest::AddObject, *object);
    }

    for (const auto& [key, component] : m_context->components()) {
        coherence_ipc::add_entity(m_messenger, RpcRequest::AddComponent, *component);
        try {
            coherence_ipc::send_array(m_messenger, RpcRequest::UpdateProperties, key, component->properties());
        } catch (const ErrorException& e) {
            log->error("Skipping properties of '{}': {}", key, e.what());
        }
    }

    for (const auto& [id, viewport] : m_context->viewports()) {
        coherence_ipc::add_entity(m_messenger, RpcRequest::AddViewport, *viewport);
        try {
            coherence_ipc::send_array(m_messenger, RpcRequest::UpdateVisibleObjects,
                                      viewport->name(), viewport->visible_objects());
        } catch (const ErrorException& e) {
            log->error("Skipping visibility of '{}': {}", viewport->name(), e.what());
        }
    }

    for (const auto& [name, image] : m_context->images()) {
        coherence_ipc::add_entity(m_messenger, RpcRequest::AddImage, *image);
        try {
            image->send_all(m_messenger);
        } catch (const ErrorException& e) {
            log->error("Skipping pixels of image '{}': {}", name, e.what());
        }
    }

    // Geometry last so the peer has every object before the large arrays
    for (const auto& [name, mesh] : m_context->meshes()) {
        try {
            mesh->send_all(m_messenger);
        } catch (const ErrorException& e) {
            log->error("Skipping mesh '{}': {}", name, e.what());
        }
    }

    log->info("Sent scene: {} objects, {} viewports, {} meshes, {} images ({} messages queued)",
        m_context->objects().size(), m_context->viewports().size(),
        m_context->meshes().size(), m_context->images().size(), m_messenger.queued_count());
}

// =============================================================================
// Pixels
// =============================================================================

void Bridge::publish_pixel_buffers() {
    std::map<std::int32_t, std::shared_ptr<PixelBuffer>> buffers;
    if (m_context) {
        for (const auto& [id, viewport] : m_context->viewports()) {
            buffers.emplace(id, viewport->pixel_buffer());
        }
    }

    std::lock_guard<std::mutex> lock(m_pixel_buffers_mutex);
    m_pixel_buffers.swap(buffers);
}

std::shared_ptr<PixelBuffer> Bridge::find_pixel_buffer(std::int32_t viewport_id) const {
    std::lock_guard<std::mutex> lock(m_pixel_buffers_mutex);
    auto it = m_pixel_buffers.find(viewport_id);
    return it != m_pixel_buffers.end() ? it->second : nullptr;
}

std::size_t Bridge::consume_pixels() {
    if (!m_pixels || !m_context || m_role != BridgeRole::Source) {
        return 0;
    }

    std::size_t frames = 0;
    try {
        while (frames < m_pixels->node_count()) {
            const std::size_t read = m_pixels->read([this](std::span<const std::byte> node) -> std::size_t {
                coherence_ipc::RenderFrameHeader header{};
                if (node.size() < sizeof(header)) {
                    throw ErrorException(IpcError::frame_desync(m_pixels->name(),
                        "frame node of " + std::to_string(node.size()) + " bytes"));
                }
                std::memcpy(&header, node.data(), sizeof(header));

                auto* viewport = m_context->viewports().find(header.viewport_id);
                if (!viewport) {
                    coherence_core::scene_logger()->warn("Render frame for unknown viewport {}", header.viewport_id);
                    return sizeof(header);
                }
                return sizeof(header) + viewport->read_pixels(header, node.subspan(sizeof(header)));
            }, std::chrono::milliseconds(0));

            if (read == 0) {
                break;
            }
            ++frames;
        }
    } catch (const ErrorException& e) {
        coherence_core::scene_logger()->error("Pixel channel failed: {}", e.what());
        emit(BridgeEvent::ConnectionLost, m_config.connection_name);
        teardown(false);
    }
    return frames;
}

coherence_core::Result<bool> Bridge::send_render_frame(
    std::int32_t viewport_id, std::int32_t width, std::int32_t height, std::span<const std::uint8_t> rgb)
{
    if (m_role != BridgeRole::Destination) {
        return Err<bool>(Error(ErrorCode::InvalidState, "Render frames are sent by the destination"));
    }
    if (!m_pixels) {
        return Err<bool>(SceneError::not_connected());
    }
    if (width < 0 || height < 0) {
        return Err<bool>(SceneError::invalid_value(Viewport::make_name(viewport_id), "negative frame size"));
    }

    const std::size_t size = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 3;
    if (rgb.size() != size) {
        return Err<bool>(SceneError::invalid_value(Viewport::make_name(viewport_id),
            std::to_string(rgb.size()) + " bytes for a " + std::to_string(width) + "x" +
            std::to_string(height) + " RGB24 frame"));
    }

    const coherence_ipc::RenderFrameHeader header{viewport_id, width, height};
    const std::size_t total = sizeof(header) + size;
    if (total > m_pixels->node_size()) {
        return Err<bool>(IpcError::payload_too_large(Viewport::make_name(viewport_id), total, m_pixels->node_size()));
    }

    try {
        const std::size_t written = m_pixels->write([&](std::span<std::byte> node) -> std::size_t {
            std::memcpy(node.data(), &header, sizeof(header));
            if (size > 0) {
                std::memcpy(node.data() + sizeof(header), rgb.data(), size);
            }
            return total;
        }, std::chrono::milliseconds(m_config.write_wait_ms));
        return Ok(written > 0);
    } catch (const ErrorException& e) {
        return Err<bool>(e.error());
    }
}

// =============================================================================
// Viewports
// =============================================================================

coherence_core::Result<Viewport*> Bridge::get_viewport(std::int32_t id) const {
    auto ctx = require_context();
    if (!ctx) {
        return Err<Viewport*>(ctx.error());
    }
    return (*ctx)->viewports().get(id);
}

coherence_core::Result<void> Bridge::add_viewport(std::int32_t id) {
    auto ctx = require_context();
    if (!ctx) {
        return Err(ctx.error());
    }

    auto viewport = (*ctx)->add_viewport(id);
    if (!viewport) {
        return Err(viewport.error());
    }
    publish_pixel_buffers();

    if (can_send()) {
        coherence_ipc::add_entity(m_messenger, RpcRequest::AddViewport, **viewport);
    }
    return Ok();
}

coherence_core::Result<void> Bridge::remove_viewport(std::int32_t id) {
    auto viewport = get_viewport(id);
    if (!viewport) {
        return Err(viewport.error());
    }

    if (can_send()) {
        coherence_ipc::remove_entity(m_messenger, RpcRequest::RemoveViewport, **viewport);
    } else {
        m_messenger.discard_queued((*viewport)->name());
    }

    m_context->viewports().take(id).reset();
    publish_pixel_buffers();
    return Ok();
}

coherence_core::Result<void> Bridge::set_viewport_camera(std::int32_t id, const InteropCamera& camera) {
    auto viewport = get_viewport(id);
    if (!viewport) {
        return Err(viewport.error());
    }

    if ((*viewport)->set_camera(camera) && can_send()) {
        coherence_ipc::send_entity(m_messenger, RpcRequest::UpdateViewport, **viewport);
    }
    return Ok();
}

coherence_core::Result<void> Bridge::set_visible_objects(std::int32_t id, std::span<const std::int32_t> object_ids) {
    auto viewport = get_viewport(id);
    if (!viewport) {
        return Err(viewport.error());
    }

    if ((*viewport)->set_visible_objects(object_ids) && can_send()) {
        // An empty list is meaningful here, so bypass send_array()
        try {
            m_messenger.queue_array(RpcRequest::UpdateVisibleObjects, (*viewport)->name(),
                                    (*viewport)->visible_objects());
        } catch (const ErrorException& e) {
            return Err(e.error());
        }
    }
    return Ok();
}

// =============================================================================
// Objects and Meshes
// =============================================================================

coherence_core::Result<SceneObject*> Bridge::get_object(const std::string& name) const {
    auto ctx = require_context();
    if (!ctx) {
        return Err<SceneObject*>(ctx.error());
    }
    return (*ctx)->objects().get(name);
}

coherence_core::Result<void> Bridge::add_mesh_object(
    const std::string& name, const std::string& mesh_name, const InteropTransform& transform)
{
    auto ctx = require_context();
    if (!ctx) {
        return Err(ctx.error());
    }
    if ((*ctx)->objects().contains(name)) {
        return Err(SceneError::already_exists("Object", name));
    }

    auto mesh = (*ctx)->get_or_create_mesh(mesh_name);
    if (!mesh) {
        return Err(mesh.error());
    }

    auto object = (*ctx)->add_object(name, SceneObjectType::Mesh);
    if (!object) {
        return Err(object.error());
    }

    SceneObject* obj = *object;
    obj->set_transform(transform);
    if (auto linked = obj->set_mesh(mesh_name); !linked) {
        return linked;
    }
    obj->set_mesh_counts(static_cast<std::int32_t>((*mesh)->vertices().size()),
                         static_cast<std::int32_t>((*mesh)->triangle_count()));

    if (can_send()) {
        coherence_ipc::add_entity(m_messenger, RpcRequest::AddObject, *obj);
    }
    return Ok();
}

coherence_core::Result<void> Bridge::set_object_transform(const std::string& name, const InteropTransform& transform) {
    auto object = get_object(name);
    if (!object) {
        return Err(object.error());
    }

    if ((*object)->set_transform(transform) && can_send()) {
        coherence_ipc::send_entity(m_messenger, RpcRequest::UpdateObject, **object);
    }
    return Ok();
}

coherence_core::Result<void> Bridge::set_object_material(const std::string& name, const std::string& material) {
    auto object = get_object(name);
    if (!object) {
        return Err(object.error());
    }

    auto changed = (*object)->set_material(material);
    if (!changed) {
        return Err(changed.error());
    }
    if (*changed && can_send()) {
        coherence_ipc::send_entity(m_messenger, RpcRequest::UpdateObject, **object);
    }
    return Ok();
}

coherence_core::Result<void> Bridge::remove_object(const std::string& name) {
    auto object = get_object(name);
    if (!object) {
        return Err(object.error());
    }

    const bool notify = can_send();

    for (auto* component : m_context->components_of(name)) {
        const std::string key = component->name();
        if (notify) {
            coherence_ipc::remove_entity(m_messenger, RpcRequest::DestroyComponent, *component);
        } else {
            m_messenger.discard_queued(key);
        }
        auto removed = m_context->components().take(key);
    }

    if (notify) {
        coherence_ipc::remove_entity(m_messenger, RpcRequest::RemoveObject, **object);
    }

    const std::string mesh_name = (*object)->mesh_name();
    auto owned = m_context->objects().take(name);

    // Meshes are shared; drop one only when its last user goes
    if (!mesh_name.empty() && m_context->objects_using_mesh(mesh_name).empty()) {
        m_messenger.discard_queued(mesh_name);
        auto mesh = m_context->meshes().take(mesh_name);
        if (mesh) {
            coherence_core::scene_logger()->debug("Released mesh '{}'", mesh_name);
        }
    }
    return Ok();
}

coherence_core::Result<void> Bridge::copy_mesh_data(
    const std::string& mesh_name,
    std::span<const coherence_mesh::MVert> verts,
    std::span<const coherence_mesh::MLoop> loops,
    std::span<const coherence_mesh::MLoopTri> loop_tris,
    std::span<const coherence_mesh::MLoopCol> loop_cols,
    std::span<const std::span<const coherence_mesh::MLoopUV>> uv_layers)
{
    auto ctx = require_context();
    if (!ctx) {
        return Err(ctx.error());
    }

    auto found = (*ctx)->get_or_create_mesh(mesh_name);
    if (!found) {
        return Err(found.error());
    }
    coherence_mesh::Mesh* mesh = *found;

    if (auto copied = mesh->copy_mesh_data(verts, loops, loop_tris, loop_cols, uv_layers); !copied) {
        return copied;
    }

    const bool notify = can_send();

    if (notify) {
        try {
            mesh->send_dirty(m_messenger);
        } catch (const ErrorException& e) {
            return Err(e.error());
        }
    }

    const auto vertex_count = static_cast<std::int32_t>(mesh->vertices().size());
    const auto triangle_count = static_cast<std::int32_t>(mesh->triangle_count());
    for (auto* object : (*ctx)->objects_using_mesh(mesh_name)) {
        if (object->set_mesh_counts(vertex_count, triangle_count) && notify) {
            coherence_ipc::send_entity(m_messenger, RpcRequest::UpdateObject, *object);
        }
    }
    return Ok();
}

// =============================================================================
// Images
// =============================================================================

coherence_core::Result<void> Bridge::add_image(const std::string& name) {
    auto ctx = require_context();
    if (!ctx) {
        return Err(ctx.error());
    }

    auto image = (*ctx)->add_image(name);
    if (!image) {
        return Err(image.error());
    }

    if (can_send()) {
        coherence_ipc::add_entity(m_messenger, RpcRequest::AddImage, **image);
    }
    return Ok();
}

coherence_core::Result<void> Bridge::copy_image(
    const std::string& name, std::int32_t width, std::int32_t height, std::span<const float> pixels)
{
    auto ctx = require_context();
    if (!ctx) {
        return Err(ctx.error());
    }

    auto image = (*ctx)->images().get(name);
    if (!image) {
        return Err(image.error());
    }

    // Checked on the dimensions alone, before any pixel is read
    if (width > 0 && height > 0) {
        const std::size_t bytes = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) *
            Image::CHANNELS * sizeof(float);
        if (bytes > m_config.message_node_size) {
            return Err(IpcError::payload_too_large(name, bytes, m_config.message_node_size));
        }
    }

    auto changed = (*image)->copy_pixels(width, height, pixels);
    if (!changed) {
        return Err(changed.error());
    }

    if (*changed && can_send()) {
        try {
            (*image)->send_dirty(m_messenger);
        } catch (const ErrorException& e) {
            return Err(e.error());
        }
    }
    return Ok();
}

coherence_core::Result<void> Bridge::remove_image(const std::string& name) {
    auto ctx = require_context();
    if (!ctx) {
        return Err(ctx.error());
    }

    auto image = (*ctx)->images().get(name);
    if (!image) {
        return Err(image.error());
    }

    if (can_send()) {
        coherence_ipc::remove_entity(m_messenger, RpcRequest::RemoveImage, **image);
    } else {
        m_messenger.discard_queued(name);
    }

    auto owned = (*ctx)->images().take(name);
    owned->release();
    return Ok();
}

// =============================================================================
// Components
// =============================================================================

coherence_core::Result<void> Bridge::add_component(const std::string& target, const std::string& name, bool enabled) {
    auto ctx = require_context();
    if (!ctx) {
        return Err(ctx.error());
    }

    auto component = (*ctx)->add_component(target, name);
    if (!component) {
        return Err(component.error());
    }
    (*component)->set_enabled(enabled);

    if (can_send()) {
        coherence_ipc::add_entity(m_messenger, RpcRequest::AddComponent, **component);
    }
    return Ok();
}

coherence_core::Result<void> Bridge::set_component_properties(
    const std::string& target, const std::string& name, std::span<const InteropProperty> properties)
{
    auto ctx = require_context();
    if (!ctx) {
        return Err(ctx.error());
    }

    auto component = (*ctx)->components().get(Component::make_key(target, name));
    if (!component) {
        return Err(component.error());
    }

    if ((*component)->set_properties(properties) && can_send()) {
        // An empty property list still replaces the peer's copy
        try {
            m_messenger.queue_array(RpcRequest::UpdateProperties, (*component)->name(), (*component)->properties());
        } catch (const ErrorException& e) {
            return Err(e.error());
        }
    }
    return Ok();
}

coherence_core::Result<void> Bridge::remove_component(const std::string& target, const std::string& name) {
    auto ctx = require_context();
    if (!ctx) {
        return Err(ctx.error());
    }

    const std::string key = Component::make_key(target, name);
    auto component = (*ctx)->components().get(key);
    if (!component) {
        return Err(component.error());
    }

    if (can_send()) {
        coherence_ipc::remove_entity(m_messenger, RpcRequest::DestroyComponent, **component);
    } else {
        m_messenger.discard_queued(key);
    }

    auto owned = (*ctx)->components().take(key);
    return Ok();
}

// =============================================================================
// Inbound Messages
// =============================================================================

std::size_t Bridge::dispatch(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    m_last_inbound = Clock::now();

    if (!m_context) {
        return 0;
    }

    auto it = m_handlers.find(header.type);
    if (it == m_handlers.end()) {
        coherence_core::scene_logger()->warn("Unhandled {} for '{}'", coherence_ipc::rpc_request_name(header.type), target);
        return 0;
    }

    return (this->*(it->second))(target, header, payload);
}

std::size_t Bridge::on_connect(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    if (!decode(payload, m_peer_state, header.type, target)) {
        return 0;
    }

    if (m_peer_state.protocol != PROTOCOL_VERSION) {
        coherence_core::scene_logger()->warn("Peer speaks protocol {}, this build speaks {}",
            m_peer_state.protocol, PROTOCOL_VERSION);
    }

    m_peer_connected = true;
    coherence_core::scene_logger()->info("{} peer connected on '{}' (version {})",
        m_peer_state.name.str(), target, m_peer_state.version.str());

    if (m_role == BridgeRole::Destination) {
        m_messenger.queue(RpcRequest::Connect, m_config.connection_name, m_local_state);
    } else {
        send_all_scene_data();
    }

    emit(BridgeEvent::PeerConnected, target);
    return sizeof(InteropClientState);
}

std::size_t Bridge::on_disconnect(const std::string& target, const MessageHeader&, std::span<const std::byte>) {
    coherence_core::scene_logger()->info("Peer disconnected from '{}'", m_config.connection_name);
    m_pending_teardown = true;
    emit(BridgeEvent::PeerDisconnected, target);
    return 0;
}

std::size_t Bridge::on_update_state(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    if (!decode(payload, m_peer_state, header.type, target)) {
        return 0;
    }
    return sizeof(InteropClientState);
}

std::size_t Bridge::on_add_viewport(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    InteropViewport data{};
    if (!decode(payload, data, header.type, target)) {
        return 0;
    }

    Viewport* viewport = m_context->viewports().find(data.id);
    if (!viewport) {
        auto added = m_context->add_viewport(data.id);
        if (!added) {
            coherence_core::scene_logger()->warn("{}", added.error().message());
            return sizeof(data);
        }
        viewport = *added;
        publish_pixel_buffers();
    }

    if (auto applied = viewport->apply_inbound(data); !applied) {
        coherence_core::scene_logger()->warn("{}", applied.error().message());
    }
    emit(BridgeEvent::ViewportUpdated, viewport->name());
    return sizeof(data);
}

std::size_t Bridge::on_remove_viewport(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    InteropViewport data{};
    if (!decode(payload, data, header.type, target)) {
        return 0;
    }

    auto owned = m_context->viewports().take(data.id);
    if (!owned) {
        coherence_core::scene_logger()->warn("Remove for unknown viewport {}", data.id);
        return sizeof(data);
    }
    owned.reset();
    publish_pixel_buffers();
    emit(BridgeEvent::ViewportUpdated, target);
    return sizeof(data);
}

std::size_t Bridge::on_update_viewport(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    InteropViewport data{};
    if (!decode(payload, data, header.type, target)) {
        return 0;
    }

    Viewport* viewport = m_context->viewports().find(data.id);
    if (!viewport) {
        coherence_core::scene_logger()->warn("Update for unknown viewport {}", data.id);
        return sizeof(data);
    }

    if (auto applied = viewport->apply_inbound(data); !applied) {
        coherence_core::scene_logger()->warn("{}", applied.error().message());
    }
    emit(BridgeEvent::ViewportUpdated, viewport->name());
    return sizeof(data);
}

std::size_t Bridge::on_update_visible_objects(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    std::vector<std::int32_t> ids;
    if (!decode_ids(payload, header, ids)) {
        coherence_core::scene_logger()->warn("Malformed visibility list for '{}'", target);
        return 0;
    }

    for (const auto& [id, viewport] : m_context->viewports()) {
        if (viewport->name() == target) {
            viewport->set_visible_objects(ids);
            emit(BridgeEvent::ViewportUpdated, target);
            return ids.size() * sizeof(std::int32_t);
        }
    }

    coherence_core::scene_logger()->warn("Visibility list for unknown viewport '{}'", target);
    return ids.size() * sizeof(std::int32_t);
}

std::size_t Bridge::on_add_object(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    return on_update_object(target, header, payload);
}

std::size_t Bridge::on_remove_object(const std::string& target, const MessageHeader&, std::span<const std::byte> payload) {
    for (auto* component : m_context->components_of(target)) {
        auto removed = m_context->components().take(component->name());
    }

    auto owned = m_context->objects().take(target);
    if (!owned) {
        coherence_core::scene_logger()->warn("Remove for unknown object '{}'", target);
    }
    emit(BridgeEvent::ObjectUpdated, target);
    return std::min(payload.size(), sizeof(InteropSceneObject));
}

std::size_t Bridge::on_update_object(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    InteropSceneObject data{};
    if (!decode(payload, data, header.type, target)) {
        return 0;
    }

    SceneObject* object = m_context->objects().find(target);
    if (!object) {
        if (m_role != BridgeRole::Destination) {
            coherence_core::scene_logger()->warn("{} for unknown object '{}'",
                coherence_ipc::rpc_request_name(header.type), target);
            return sizeof(data);
        }

        auto added = m_context->add_object(target, data.type, data.id);
        if (!added) {
            coherence_core::scene_logger()->warn("{}", added.error().message());
            return sizeof(data);
        }
        object = *added;
    }

    if (auto applied = object->apply_inbound(data); !applied) {
        coherence_core::scene_logger()->warn("{}", applied.error().message());
        return sizeof(data);
    }

    // The destination mirrors what the source says the object renders
    if (m_role == BridgeRole::Destination) {
        if (auto linked = object->set_mesh(data.mesh.str()); !linked) {
            coherence_core::scene_logger()->warn("{}", linked.error().message());
        }
        object->set_mesh_counts(data.vertex_count, data.triangle_count);
    }

    emit(BridgeEvent::ObjectUpdated, target);
    return sizeof(data);
}

std::size_t Bridge::on_add_component(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    InteropComponent data{};
    if (!decode(payload, data, header.type, target)) {
        return 0;
    }

    Component* component = m_context->components().find(target);
    if (!component) {
        auto added = m_context->add_component(data.target.str(), data.name.str());
        if (!added) {
            coherence_core::scene_logger()->warn("{}", added.error().message());
            return sizeof(data);
        }
        component = *added;
    }

    if (auto applied = component->apply_inbound(data); !applied) {
        coherence_core::scene_logger()->warn("{}", applied.error().message());
    }
    return sizeof(data);
}

std::size_t Bridge::on_destroy_component(const std::string& target, const MessageHeader&, std::span<const std::byte> payload) {
    auto owned = m_context->components().take(target);
    if (!owned) {
        coherence_core::scene_logger()->warn("Destroy for unknown component '{}'", target);
    }
    return std::min(payload.size(), sizeof(InteropComponent));
}

std::size_t Bridge::on_update_component(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    InteropComponent data{};
    if (!decode(payload, data, header.type, target)) {
        return 0;
    }

    Component* component = m_context->components().find(target);
    if (!component) {
        coherence_core::scene_logger()->warn("Update for unknown component '{}'", target);
        return sizeof(data);
    }

    if (auto applied = component->apply_inbound(data); !applied) {
        coherence_core::scene_logger()->warn("{}", applied.error().message());
    }
    return sizeof(data);
}

std::size_t Bridge::on_update_properties(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    Component* component = m_context->components().find(target);
    if (!component) {
        coherence_core::scene_logger()->warn("Properties for unknown component '{}'", target);
        return 0;
    }

    auto applied = component->apply_properties(header, payload);
    if (!applied) {
        coherence_core::scene_logger()->warn("{}", applied.error().message());
        return 0;
    }
    return *applied;
}

std::size_t Bridge::on_mesh_channel(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    auto buffers = m_context->get_or_create_mesh_buffers(target);
    if (!buffers) {
        coherence_core::scene_logger()->warn("{}", buffers.error().message());
        return 0;
    }

    auto applied = (*buffers)->apply_array(header.type, header, payload);
    if (!applied) {
        coherence_core::scene_logger()->warn("{} for '{}': {}",
            coherence_ipc::rpc_request_name(header.type), target, applied.error().message());
        return 0;
    }
    return *applied;
}

std::size_t Bridge::on_update_mesh(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    coherence_mesh::InteropMesh data{};
    if (!decode(payload, data, header.type, target)) {
        return 0;
    }

    auto buffers = m_context->get_or_create_mesh_buffers(target);
    if (!buffers) {
        coherence_core::scene_logger()->warn("{}", buffers.error().message());
        return sizeof(data);
    }

    (*buffers)->apply_changes(data);
    emit(BridgeEvent::MeshUpdated, target);
    return sizeof(data);
}

std::size_t Bridge::on_add_image(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    return on_update_image(target, header, payload);
}

std::size_t Bridge::on_remove_image(const std::string& target, const MessageHeader&, std::span<const std::byte> payload) {
    auto owned = m_context->images().take(target);
    if (!owned) {
        coherence_core::scene_logger()->warn("Remove for unknown image '{}'", target);
    } else {
        owned->release();
    }
    emit(BridgeEvent::ImageUpdated, target);
    return std::min(payload.size(), sizeof(InteropImage));
}

std::size_t Bridge::on_update_image(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    InteropImage data{};
    if (!decode(payload, data, header.type, target)) {
        return 0;
    }

    Image* image = m_context->images().find(target);
    if (!image) {
        auto added = m_context->add_image(target);
        if (!added) {
            coherence_core::scene_logger()->warn("{}", added.error().message());
            return sizeof(data);
        }
        image = *added;
    }

    if (auto applied = image->apply_inbound(data); !applied) {
        coherence_core::scene_logger()->warn("{}", applied.error().message());
    }
    return sizeof(data);
}

std::size_t Bridge::on_update_image_data(const std::string& target, const MessageHeader& header, std::span<const std::byte> payload) {
    Image* image = m_context->images().find(target);
    if (!image) {
        coherence_core::scene_logger()->warn("Pixels for unknown image '{}'", target);
        return 0;
    }

    auto applied = image->apply_pixels(header, payload);
    if (!applied) {
        coherence_core::scene_logger()->warn("{}", applied.error().message());
        return 0;
    }
    emit(BridgeEvent::ImageUpdated, target);
    return *applied;
}

} // namespace coherence_scene
