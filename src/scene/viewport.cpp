/// @file viewport.cpp
/// @brief Viewport implementation

#include <coherence/scene/viewport.hpp>
#include <coherence/core/log.hpp>

#include <algorithm>
#include <cstring>

namespace coherence_scene {

using coherence_core::Err;
using coherence_core::Error;
using coherence_core::ErrorCode;
using coherence_core::ErrorException;
using coherence_core::IpcError;
using coherence_core::Ok;
using coherence_core::SceneError;

Viewport::Viewport(std::int32_t id)
    : m_name(make_name(id))
    , m_pixels(std::make_shared<PixelBuffer>(id))
{
    m_data.id = id;
    m_data.camera.width = DEFAULT_SIZE;
    m_data.camera.height = DEFAULT_SIZE;
}

coherence_core::Result<void> Viewport::apply_inbound(const InteropViewport& data) {
    if (data.id != m_data.id) {
        return Err(SceneError::invalid_value(m_name, "inbound data is for viewport " + std::to_string(data.id)));
    }
    m_data.camera = data.camera;
    return Ok();
}

bool Viewport::set_camera(const InteropCamera& camera) {
    if (m_data.camera.approx_equal(camera)) {
        return false;
    }
    m_data.camera = camera;
    return true;
}

bool Viewport::set_visible_objects(std::span<const std::int32_t> ids) {
    if (std::equal(ids.begin(), ids.end(), m_visible.begin(), m_visible.end())) {
        return false;
    }
    m_visible.assign(ids.begin(), ids.end());
    return true;
}

// =============================================================================
// Pixels
// =============================================================================

std::size_t Viewport::read_pixels(const coherence_ipc::RenderFrameHeader& header, std::span<const std::byte> pixels) {
    if (header.width < 0 || header.height < 0) {
        throw ErrorException(IpcError::frame_desync(m_name,
            "negative frame size " + std::to_string(header.width) + "x" + std::to_string(header.height)));
    }

    const std::size_t size = static_cast<std::size_t>(header.width) * static_cast<std::size_t>(header.height) * 3;
    if (size > pixels.size()) {
        throw ErrorException(IpcError::frame_desync(m_name,
            "frame claims " + std::to_string(size) + " bytes, node holds " + std::to_string(pixels.size())));
    }

    m_pixels->write(header, pixels.first(size));
    return size;
}

PixelLock Viewport::lock_render_texture() {
    return m_pixels->lock();
}

RenderTextureData Viewport::acquire_render_texture() {
    return m_pixels->acquire();
}

coherence_core::Result<void> Viewport::release_render_texture() {
    return m_pixels->release();
}

// =============================================================================
// PixelBuffer
// =============================================================================

PixelBuffer::PixelBuffer(std::int32_t viewport_id)
    : m_viewport_id(viewport_id) {}

void PixelBuffer::write(const coherence_ipc::RenderFrameHeader& header, std::span<const std::byte> pixels) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (header.width != m_header.width || header.height != m_header.height) {
        coherence_core::scene_logger()->debug("Viewport #{} resized to {}x{}", m_viewport_id, header.width, header.height);
    }

    m_pixels.resize(pixels.size());
    if (!pixels.empty()) {
        std::memcpy(m_pixels.data(), pixels.data(), pixels.size());
    }
    m_header = header;
    ++m_frame;
}

RenderTextureData PixelBuffer::snapshot() const noexcept {
    RenderTextureData data;
    data.viewport_id = m_viewport_id;
    data.width = m_header.width;
    data.height = m_header.height;
    data.frame = m_frame.load();
    data.pixels = m_pixels.empty() ? nullptr : m_pixels.data();
    return data;
}

PixelLock PixelBuffer::lock() {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto data = snapshot();
    return PixelLock(std::move(lock), data);
}

RenderTextureData PixelBuffer::acquire() {
    m_mutex.lock();
    m_holder.store(std::this_thread::get_id());
    return snapshot();
}

coherence_core::Result<void> PixelBuffer::release() {
    // Unlocking a std::mutex from a thread that does not own it is undefined
    if (m_holder.load() != std::this_thread::get_id()) {
        return Err(Error(ErrorCode::InvalidState,
            "Viewport #" + std::to_string(m_viewport_id) + " render texture is not locked by this thread"));
    }
    m_holder.store(std::thread::id{});
    m_mutex.unlock();
    return Ok();
}

} // namespace coherence_scene
