/// @file ring_buffer.cpp
/// @brief Shared memory node ring implementation

#include <coherence/ipc/ring_buffer.hpp>
#include <coherence/core/log.hpp>

#include <algorithm>
#include <new>
#include <thread>

namespace coherence_ipc {

using coherence_core::Err;
using coherence_core::ErrorException;
using coherence_core::IpcError;

namespace {

constexpr std::chrono::microseconds k_poll_interval{50};

std::size_t align_up(std::size_t value, std::size_t alignment) {
    return (value + alignment - 1) & ~(alignment - 1);
}

std::size_t node_stride(std::uint32_t node_size) {
    return align_up(sizeof(NodeHeader) + node_size, alignof(std::uint64_t));
}

/// Publishes the read position when the consumer is done, even if it throws
struct NodeRelease {
    std::atomic<std::uint64_t>& read_pos;
    std::uint64_t next;

    ~NodeRelease() { read_pos.store(next, std::memory_order_release); }
};

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

std::size_t RingBuffer::required_size(std::uint32_t node_count, std::uint32_t node_size) {
    return sizeof(RingBufferHeader) + static_cast<std::size_t>(node_count) * node_stride(node_size);
}

RingBuffer::RingBuffer(std::unique_ptr<SharedMemoryRegion> region)
    : m_region(std::move(region)) {
    const auto& hdr = header();
    m_node_count = hdr.node_count;
    m_node_size = hdr.node_size;
    m_node_stride = node_stride(m_node_size);
}

RingBuffer::~RingBuffer() {
    if (m_region && m_region->is_owner()) {
        close();
    }
}

coherence_core::Result<std::unique_ptr<RingBuffer>>
RingBuffer::create(const std::string& name, std::uint32_t node_count, std::uint32_t node_size) {
    if (node_count == 0 || node_size == 0) {
        return Err<std::unique_ptr<RingBuffer>>(
            IpcError::dimension_mismatch(name, "node count and size must be positive"));
    }

    auto region = SharedMemoryRegion::create(name, required_size(node_count, node_size));
    if (!region) {
        return Err<std::unique_ptr<RingBuffer>>(region.error());
    }

    auto* hdr = new (region.value()->data()) RingBufferHeader{};
    hdr->magic = RING_MAGIC;
    hdr->version = RING_VERSION;
    hdr->node_count = node_count;
    hdr->node_size = node_size;
    hdr->write_pos.store(0, std::memory_order_relaxed);
    hdr->read_pos.store(0, std::memory_order_relaxed);
    hdr->closed.store(0, std::memory_order_release);

    coherence_core::ipc_logger()->info("Created ring '{}' ({} nodes x {} bytes)",
        name, node_count, node_size);

    return std::unique_ptr<RingBuffer>(new RingBuffer(std::move(region).value()));
}

coherence_core::Result<std::unique_ptr<RingBuffer>>
RingBuffer::open(const std::string& name, std::uint32_t expected_count, std::uint32_t expected_size) {
    auto region = SharedMemoryRegion::open(name);
    if (!region) {
        return Err<std::unique_ptr<RingBuffer>>(region.error());
    }

    auto& shm = *region.value();
    if (shm.size() < sizeof(RingBufferHeader)) {
        return Err<std::unique_ptr<RingBuffer>>(
            IpcError::dimension_mismatch(name, "mapping smaller than ring header"));
    }

    const auto* hdr = reinterpret_cast<const RingBufferHeader*>(shm.data());
    if (hdr->magic != RING_MAGIC || hdr->version != RING_VERSION) {
        return Err<std::unique_ptr<RingBuffer>>(
            IpcError::dimension_mismatch(name, "bad magic or version"));
    }
    if ((expected_count != 0 && hdr->node_count != expected_count) ||
        (expected_size != 0 && hdr->node_size != expected_size)) {
        return Err<std::unique_ptr<RingBuffer>>(IpcError::dimension_mismatch(name,
            "expected " + std::to_string(expected_count) + "x" + std::to_string(expected_size) +
            ", found " + std::to_string(hdr->node_count) + "x" + std::to_string(hdr->node_size)));
    }
    if (shm.size() < required_size(hdr->node_count, hdr->node_size)) {
        return Err<std::unique_ptr<RingBuffer>>(
            IpcError::dimension_mismatch(name, "mapping smaller than declared nodes"));
    }
    if (hdr->closed.load(std::memory_order_acquire) != 0) {
        return Err<std::unique_ptr<RingBuffer>>(IpcError::channel_closed(name));
    }

    coherence_core::ipc_logger()->info("Attached to ring '{}' ({} nodes x {} bytes)",
        name, hdr->node_count, hdr->node_size);

    return std::unique_ptr<RingBuffer>(new RingBuffer(std::move(region).value()));
}

// =============================================================================
// Layout Access
// =============================================================================

RingBufferHeader& RingBuffer::header() noexcept {
    return *reinterpret_cast<RingBufferHeader*>(m_region->data());
}

const RingBufferHeader& RingBuffer::header() const noexcept {
    return *reinterpret_cast<const RingBufferHeader*>(m_region->data());
}

std::byte* RingBuffer::node(std::uint64_t position) noexcept {
    const auto slot = static_cast<std::size_t>(position % m_node_count);
    return m_region->data() + sizeof(RingBufferHeader) + slot * m_node_stride;
}

void RingBuffer::throw_if_closed() const {
    if (is_closed()) {
        throw ErrorException(IpcError::channel_closed(name()));
    }
}

bool RingBuffer::is_closed() const noexcept {
    return header().closed.load(std::memory_order_acquire) != 0;
}

void RingBuffer::close() noexcept {
    header().closed.store(1, std::memory_order_release);
}

std::size_t RingBuffer::pending() const noexcept {
    const auto& hdr = header();
    return static_cast<std::size_t>(
        hdr.write_pos.load(std::memory_order_acquire) - hdr.read_pos.load(std::memory_order_acquire));
}

// =============================================================================
// Producer / Consumer
// =============================================================================

std::size_t RingBuffer::write(const Producer& producer, std::chrono::milliseconds timeout) {
    auto& hdr = header();
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::uint64_t write_pos = 0;
    for (;;) {
        throw_if_closed();

        write_pos = hdr.write_pos.load(std::memory_order_relaxed);
        const std::uint64_t read_pos = hdr.read_pos.load(std::memory_order_acquire);
        if (write_pos - read_pos < m_node_count) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return 0;
        }
        std::this_thread::sleep_for(k_poll_interval);
    }

    std::byte* slot = node(write_pos);
    auto* node_header = reinterpret_cast<NodeHeader*>(slot);
    std::span<std::byte> payload(slot + sizeof(NodeHeader), m_node_size);

    const std::size_t used = producer(payload);
    if (used > m_node_size) {
        throw ErrorException(IpcError::payload_too_large(name(), used, m_node_size));
    }
    if (used == 0) {
        return 0;
    }

    node_header->used = static_cast<std::uint32_t>(used);
    hdr.write_pos.store(write_pos + 1, std::memory_order_release);
    return used;
}

std::size_t RingBuffer::read(const Consumer& consumer, std::chrono::milliseconds timeout) {
    auto& hdr = header();
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::uint64_t read_pos = 0;
    for (;;) {
        read_pos = hdr.read_pos.load(std::memory_order_relaxed);
        const std::uint64_t write_pos = hdr.write_pos.load(std::memory_order_acquire);
        if (write_pos != read_pos) {
            break;
        }

        // Drain what the peer published before it closed
        throw_if_closed();

        if (std::chrono::steady_clock::now() >= deadline) {
            return 0;
        }
        std::this_thread::sleep_for(k_poll_interval);
    }

    const std::byte* slot = node(read_pos);
    const auto* node_header = reinterpret_cast<const NodeHeader*>(slot);
    const std::size_t used = std::min<std::size_t>(node_header->used, m_node_size);

    NodeRelease release{hdr.read_pos, read_pos + 1};
    return consumer(std::span<const std::byte>(slot + sizeof(NodeHeader), used));
}

} // namespace coherence_ipc
