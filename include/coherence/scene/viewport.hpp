#pragma once

/// @file viewport.hpp
/// @brief Viewport camera, visibility list and rendered pixels
///
/// The pixel buffer is the one piece of state touched from two threads: the
/// poll loop copies frames in while a render thread reads them out. Readers
/// hold the pixel lock for as long as they use the pointer, either through a
/// scoped PixelLock or the explicit acquire/release pair for callers on the
/// far side of the C API.

#include "fwd.hpp"
#include "interop.hpp"

#include <coherence/core/error.hpp>
#include <coherence/ipc/wire.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace coherence_scene {

/// Snapshot handed to pixel readers. `pixels` stays valid while the lock is held.
struct RenderTextureData {
    std::int32_t viewport_id = -1;
    std::int32_t width = 0;
    std::int32_t height = 0;
    std::int32_t frame = 0;
    const std::uint8_t* pixels = nullptr;
};

/// Scoped hold on a viewport's pixel buffer
class PixelLock {
public:
    PixelLock(std::unique_lock<std::mutex> lock, RenderTextureData data)
        : m_lock(std::move(lock)), m_data(data) {}

    PixelLock(PixelLock&&) noexcept = default;
    PixelLock& operator=(PixelLock&&) noexcept = default;

    // Non-copyable
    PixelLock(const PixelLock&) = delete;
    PixelLock& operator=(const PixelLock&) = delete;

    [[nodiscard]] const RenderTextureData& data() const noexcept { return m_data; }
    [[nodiscard]] const RenderTextureData* operator->() const noexcept { return &m_data; }
    [[nodiscard]] bool owns_lock() const noexcept { return m_lock.owns_lock(); }

    /// Release before the guard goes out of scope
    void unlock() {
        if (m_lock.owns_lock()) {
            m_lock.unlock();
        }
        m_data.pixels = nullptr;
    }

private:
    std::unique_lock<std::mutex> m_lock;
    RenderTextureData m_data;
};

// =============================================================================
// PixelBuffer
// =============================================================================

/// Latest RGB24 frame of one viewport.
///
/// Shared between the viewport and any reader holding it, so a frame locked
/// by a render thread outlives the viewport's removal or a teardown of the
/// whole scene. The poll thread never blocks on a buffer it is destroying.
class PixelBuffer {
public:
    explicit PixelBuffer(std::int32_t viewport_id);

    // Non-copyable: the mutex may be held across calls
    PixelBuffer(const PixelBuffer&) = delete;
    PixelBuffer& operator=(const PixelBuffer&) = delete;

    [[nodiscard]] std::int32_t viewport_id() const noexcept { return m_viewport_id; }

    /// Copy one validated frame in under the lock
    void write(const coherence_ipc::RenderFrameHeader& header, std::span<const std::byte> pixels);

    [[nodiscard]] PixelLock lock();

    /// Lock and record the calling thread as holder
    [[nodiscard]] RenderTextureData acquire();

    /// Unlock a hold taken by acquire() on this thread
    [[nodiscard]] coherence_core::Result<void> release();

    /// True while some thread holds the buffer through acquire()
    [[nodiscard]] bool is_held() const noexcept { return m_holder.load() != std::thread::id{}; }

    [[nodiscard]] std::int32_t frame() const noexcept { return m_frame.load(); }

private:
    [[nodiscard]] RenderTextureData snapshot() const noexcept;

    std::int32_t m_viewport_id;
    std::mutex m_mutex;
    std::vector<std::uint8_t> m_pixels;
    coherence_ipc::RenderFrameHeader m_header{};
    std::atomic<std::int32_t> m_frame{0};
    std::atomic<std::thread::id> m_holder{};
};

class Viewport {
public:
    using interop_type = InteropViewport;

    /// Width and height used until the host sets a camera
    static constexpr std::int32_t DEFAULT_SIZE = 100;

    explicit Viewport(std::int32_t id);

    // Non-copyable: readers may hold pointers into the pixel buffer
    Viewport(const Viewport&) = delete;
    Viewport& operator=(const Viewport&) = delete;

    [[nodiscard]] static std::string make_name(std::int32_t id) {
        return "Viewport #" + std::to_string(id);
    }

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] std::int32_t id() const noexcept { return m_data.id; }

    [[nodiscard]] InteropViewport serialize() const { return m_data; }

    /// Replace the camera with the peer's copy
    [[nodiscard]] coherence_core::Result<void> apply_inbound(const InteropViewport& data);

    // =========================================================================
    // Camera and Visibility
    // =========================================================================

    /// @return true if the camera differs beyond EPSILON
    bool set_camera(const InteropCamera& camera);
    [[nodiscard]] const InteropCamera& camera() const noexcept { return m_data.camera; }

    /// @return true if the list changed
    bool set_visible_objects(std::span<const std::int32_t> ids);
    [[nodiscard]] const std::vector<std::int32_t>& visible_objects() const noexcept { return m_visible; }

    // =========================================================================
    // Pixels
    // =========================================================================

    /// Copy one RGB24 frame under the pixel lock
    /// @return pixel bytes consumed
    /// @throws coherence_core::ErrorException if `pixels` is shorter than the header claims
    std::size_t read_pixels(const coherence_ipc::RenderFrameHeader& header, std::span<const std::byte> pixels);

    /// Scoped access to the latest frame
    [[nodiscard]] PixelLock lock_render_texture();

    /// Lock and return the latest frame; pair with release_render_texture()
    /// on the same thread, also on error paths.
    [[nodiscard]] RenderTextureData acquire_render_texture();

    /// @return InvalidState unless this thread holds the lock through
    ///         acquire_render_texture()
    [[nodiscard]] coherence_core::Result<void> release_render_texture();

    /// Buffer handle for readers that must not depend on the viewport's lifetime
    [[nodiscard]] const std::shared_ptr<PixelBuffer>& pixel_buffer() const noexcept { return m_pixels; }

    /// Frames received since creation
    [[nodiscard]] std::int32_t frame() const noexcept { return m_pixels->frame(); }

private:
    std::string m_name;
    InteropViewport m_data{};
    std::vector<std::int32_t> m_visible;
    std::shared_ptr<PixelBuffer> m_pixels;
};

} // namespace coherence_scene
