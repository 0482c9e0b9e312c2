#pragma once

/// @file ring_buffer.hpp
/// @brief Fixed-size node ring in shared memory
///
/// One process creates the ring (master) and the other attaches (slave).
/// Each ring carries traffic in one direction: exactly one producer and one
/// consumer. Node hand-off is tracked by two monotonically increasing
/// positions in the shared header; a node is free for writing while
/// `write_pos - read_pos < node_count`.

#include "fwd.hpp"
#include "shared_memory.hpp"

#include <coherence/core/error.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace coherence_ipc {

// =============================================================================
// Shared Layout
// =============================================================================

inline constexpr std::uint32_t RING_MAGIC = 0x48524f43;  // "CORH"
inline constexpr std::uint32_t RING_VERSION = 1;

/// Header at the start of the mapping
struct RingBufferHeader {
    std::uint32_t magic;
    std::uint32_t version;
    std::uint32_t node_count;
    std::uint32_t node_size;
    alignas(64) std::atomic<std::uint64_t> write_pos;
    alignas(64) std::atomic<std::uint64_t> read_pos;
    alignas(64) std::atomic<std::uint32_t> closed;
};

static_assert(std::atomic<std::uint64_t>::is_always_lock_free,
              "ring positions must be lock free to live in shared memory");

/// Per-node prefix holding the number of bytes the producer used
struct NodeHeader {
    std::uint32_t used;
    std::uint32_t reserved;
};

// =============================================================================
// RingBuffer
// =============================================================================

class RingBuffer {
public:
    /// Fills a node; returns bytes used (0 leaves the node unpublished)
    using Producer = std::function<std::size_t(std::span<std::byte>)>;
    /// Reads a node; returns bytes consumed
    using Consumer = std::function<std::size_t(std::span<const std::byte>)>;

    /// Create and own a ring (master side)
    [[nodiscard]] static coherence_core::Result<std::unique_ptr<RingBuffer>>
        create(const std::string& name, std::uint32_t node_count, std::uint32_t node_size);

    /// Attach to an existing ring (slave side). Zero expectations accept
    /// whatever the master created.
    [[nodiscard]] static coherence_core::Result<std::unique_ptr<RingBuffer>>
        open(const std::string& name, std::uint32_t expected_count = 0, std::uint32_t expected_size = 0);

    /// Total mapping size for a layout
    [[nodiscard]] static std::size_t required_size(std::uint32_t node_count, std::uint32_t node_size);

    ~RingBuffer();

    // Non-copyable
    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    /// Acquire a free node within `timeout` and hand it to `producer`.
    /// @return bytes written, 0 on timeout
    /// @throws coherence_core::ErrorException if the peer closed the channel
    ///         or the producer overran the node
    std::size_t write(const Producer& producer, std::chrono::milliseconds timeout);

    /// Acquire a published node within `timeout` and hand it to `consumer`.
    /// @return bytes consumed, 0 on timeout
    /// @throws coherence_core::ErrorException if the peer closed the channel
    std::size_t read(const Consumer& consumer, std::chrono::milliseconds timeout);

    /// Mark the channel closed for the peer
    void close() noexcept;

    [[nodiscard]] bool is_closed() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept { return m_region->name(); }
    [[nodiscard]] bool is_master() const noexcept { return m_region->is_owner(); }
    [[nodiscard]] std::uint32_t node_count() const noexcept { return m_node_count; }
    [[nodiscard]] std::uint32_t node_size() const noexcept { return m_node_size; }

    /// Nodes currently published and not yet read
    [[nodiscard]] std::size_t pending() const noexcept;

private:
    RingBuffer(std::unique_ptr<SharedMemoryRegion> region);

    [[nodiscard]] RingBufferHeader& header() noexcept;
    [[nodiscard]] const RingBufferHeader& header() const noexcept;
    [[nodiscard]] std::byte* node(std::uint64_t position) noexcept;
    void throw_if_closed() const;

    std::unique_ptr<SharedMemoryRegion> m_region;
    std::uint32_t m_node_count = 0;
    std::uint32_t m_node_size = 0;
    std::size_t m_node_stride = 0;
};

} // namespace coherence_ipc
