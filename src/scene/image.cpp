/// @file image.cpp
/// @brief Image implementation

#include <coherence/scene/image.hpp>
#include <coherence/ipc/entity.hpp>
#include <coherence/core/log.hpp>

#include <algorithm>
#include <cstring>

namespace coherence_scene {

using coherence_core::Err;
using coherence_core::Error;
using coherence_core::ErrorCode;
using coherence_core::Ok;
using coherence_core::SceneError;
using coherence_ipc::RpcRequest;

Image::Image(std::string name)
    : m_name(std::move(name))
{
    m_data.name = InteropString64(m_name);
}

coherence_core::Result<void> Image::apply_inbound(const InteropImage& data) {
    if (data.width < 0 || data.height < 0) {
        return Err(SceneError::invalid_value(m_name, "negative image size"));
    }
    m_data.width = data.width;
    m_data.height = data.height;
    return Ok();
}

coherence_core::Result<bool> Image::copy_pixels(
    std::int32_t width, std::int32_t height, std::span<const float> pixels)
{
    if (width < 0 || height < 0) {
        return Err<bool>(SceneError::invalid_value(m_name, "negative image size"));
    }

    const std::size_t expected = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * CHANNELS;
    if (pixels.size() != expected) {
        return Err<bool>(SceneError::invalid_value(m_name,
            std::to_string(pixels.size()) + " floats for a " + std::to_string(width) + "x" +
            std::to_string(height) + " image, expected " + std::to_string(expected)));
    }

    if (m_data.width == width && m_data.height == height &&
        std::equal(pixels.begin(), pixels.end(), m_pixels.begin(), m_pixels.end())) {
        return Ok(false);
    }

    m_data.width = width;
    m_data.height = height;
    m_pixels.assign(pixels.begin(), pixels.end());
    m_dirty = true;
    return Ok(true);
}

coherence_core::Result<std::size_t> Image::apply_pixels(
    const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload)
{
    if (header.count < 0) {
        return Err<std::size_t>(Error(ErrorCode::ProtocolError, "negative pixel count for '" + m_name + "'"));
    }

    const std::size_t bytes = static_cast<std::size_t>(header.count) * sizeof(float);
    if (bytes > payload.size()) {
        return Err<std::size_t>(Error(ErrorCode::ProtocolError,
            std::to_string(header.count) + " floats do not fit a " +
            std::to_string(payload.size()) + " byte payload"));
    }

    m_pixels.resize(static_cast<std::size_t>(header.count));
    if (bytes > 0) {
        std::memcpy(m_pixels.data(), payload.data(), bytes);
    }
    return Ok(bytes);
}

bool Image::send_dirty(coherence_ipc::Messenger& messenger) {
    if (!m_dirty) {
        return false;
    }
    send_all(messenger);
    return true;
}

void Image::send_all(coherence_ipc::Messenger& messenger) {
    coherence_core::scene_logger()->debug("Sending image '{}' {}x{} ({} floats)",
        m_name, m_data.width, m_data.height, m_pixels.size());

    coherence_ipc::send_entity(messenger, RpcRequest::UpdateImage, *this);
    coherence_ipc::send_array(messenger, RpcRequest::UpdateImageData, m_name, m_pixels);
    m_dirty = false;
}

void Image::release() {
    m_pixels.clear();
    m_pixels.shrink_to_fit();
}

} // namespace coherence_scene
