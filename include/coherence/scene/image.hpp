#pragma once

/// @file image.hpp
/// @brief Float RGBA image shared with the peer

#include "fwd.hpp"
#include "interop.hpp"

#include <coherence/core/error.hpp>
#include <coherence/ipc/fwd.hpp>
#include <coherence/ipc/wire.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace coherence_scene {

class Image {
public:
    using interop_type = InteropImage;

    /// Floats per pixel
    static constexpr std::size_t CHANNELS = 4;

    /// @throws coherence_core::ErrorException if `name` does not fit an InteropString64
    explicit Image(std::string name);

    // Non-copyable: queued array messages reference the pixel buffer
    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] std::int32_t width() const noexcept { return m_data.width; }
    [[nodiscard]] std::int32_t height() const noexcept { return m_data.height; }

    [[nodiscard]] InteropImage serialize() const { return m_data; }

    /// Accept the peer's dimensions
    [[nodiscard]] coherence_core::Result<void> apply_inbound(const InteropImage& data);

    /// Copy new pixels. Identical dimensions and contents leave the image clean.
    /// @return true if the image changed
    [[nodiscard]] coherence_core::Result<bool> copy_pixels(
        std::int32_t width, std::int32_t height, std::span<const float> pixels);

    /// Replace pixels from an inbound array
    /// @return payload bytes consumed
    [[nodiscard]] coherence_core::Result<std::size_t> apply_pixels(
        const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);

    /// Queue metadata and pixels if changed since the last send
    /// @return true if anything was queued
    bool send_dirty(coherence_ipc::Messenger& messenger);

    /// Queue metadata and pixels unconditionally
    void send_all(coherence_ipc::Messenger& messenger);

    [[nodiscard]] const std::vector<float>& pixels() const noexcept { return m_pixels; }
    [[nodiscard]] bool is_dirty() const noexcept { return m_dirty; }

    /// Free the pixel buffer
    void release();

private:
    std::string m_name;
    InteropImage m_data{};
    std::vector<float> m_pixels;
    bool m_dirty = false;
};

} // namespace coherence_scene
