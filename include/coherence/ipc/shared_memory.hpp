#pragma once

/// @file shared_memory.hpp
/// @brief RAII wrapper around a named POSIX shared memory mapping

#include "fwd.hpp"

#include <coherence/core/error.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace coherence_ipc {

/// A mapped shared memory object.
///
/// The creating side owns the name and unlinks it on destruction. The
/// attaching side only unmaps, so the creator's teardown never invalidates
/// the name for a later reconnect.
class SharedMemoryRegion {
public:
    /// Create a new region of `size` bytes, replacing any stale object of the same name
    [[nodiscard]] static coherence_core::Result<std::unique_ptr<SharedMemoryRegion>>
        create(const std::string& name, std::size_t size);

    /// Attach to a region created by another process
    [[nodiscard]] static coherence_core::Result<std::unique_ptr<SharedMemoryRegion>>
        open(const std::string& name);

    /// Check whether a region with this name currently exists
    [[nodiscard]] static bool exists(const std::string& name);

    ~SharedMemoryRegion();

    // Non-copyable
    SharedMemoryRegion(const SharedMemoryRegion&) = delete;
    SharedMemoryRegion& operator=(const SharedMemoryRegion&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] std::size_t size() const noexcept { return m_size; }
    [[nodiscard]] bool is_owner() const noexcept { return m_owner; }

    [[nodiscard]] std::byte* data() noexcept { return static_cast<std::byte*>(m_addr); }
    [[nodiscard]] const std::byte* data() const noexcept { return static_cast<const std::byte*>(m_addr); }

private:
    SharedMemoryRegion(std::string name, std::size_t size, int fd, void* addr, bool owner);

    std::string m_name;
    std::size_t m_size = 0;
    int m_fd = -1;
    void* m_addr = nullptr;
    bool m_owner = false;
};

/// POSIX object name for a channel name
[[nodiscard]] std::string shm_object_name(const std::string& name);

} // namespace coherence_ipc
