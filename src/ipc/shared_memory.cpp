/// @file shared_memory.cpp
/// @brief POSIX shm_open / mmap implementation

#include <coherence/ipc/shared_memory.hpp>
#include <coherence/core/log.hpp>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace coherence_ipc {

using coherence_core::Err;
using coherence_core::IpcError;

std::string shm_object_name(const std::string& name) {
    if (!name.empty() && name.front() == '/') {
        return name;
    }
    return "/" + name;
}

SharedMemoryRegion::SharedMemoryRegion(std::string name, std::size_t size, int fd, void* addr, bool owner)
    : m_name(std::move(name))
    , m_size(size)
    , m_fd(fd)
    , m_addr(addr)
    , m_owner(owner) {}

SharedMemoryRegion::~SharedMemoryRegion() {
    if (m_addr != nullptr) {
        munmap(m_addr, m_size);
    }
    if (m_fd != -1) {
        ::close(m_fd);
    }
    if (m_owner) {
        shm_unlink(shm_object_name(m_name).c_str());
        coherence_core::ipc_logger()->debug("Unlinked shared memory '{}'", m_name);
    }
}

coherence_core::Result<std::unique_ptr<SharedMemoryRegion>>
SharedMemoryRegion::create(const std::string& name, std::size_t size) {
    const std::string object_name = shm_object_name(name);

    // A crashed master leaves its object behind
    if (shm_unlink(object_name.c_str()) == 0) {
        coherence_core::ipc_logger()->warn("Removed stale shared memory '{}'", name);
    }

    int fd = shm_open(object_name.c_str(), O_CREAT | O_EXCL | O_RDWR, 0666);
    if (fd == -1) {
        if (errno == EEXIST) {
            return Err<std::unique_ptr<SharedMemoryRegion>>(IpcError::channel_exists(name));
        }
        return Err<std::unique_ptr<SharedMemoryRegion>>(
            IpcError::map_failed(name, std::strerror(errno)));
    }

    if (ftruncate(fd, static_cast<off_t>(size)) == -1) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        shm_unlink(object_name.c_str());
        return Err<std::unique_ptr<SharedMemoryRegion>>(IpcError::map_failed(name, reason));
    }

    void* addr = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (addr == MAP_FAILED) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        shm_unlink(object_name.c_str());
        return Err<std::unique_ptr<SharedMemoryRegion>>(IpcError::map_failed(name, reason));
    }

    std::memset(addr, 0, size);

    coherence_core::ipc_logger()->debug("Created shared memory '{}' ({} bytes)", name, size);
    return std::unique_ptr<SharedMemoryRegion>(new SharedMemoryRegion(name, size, fd, addr, true));
}

coherence_core::Result<std::unique_ptr<SharedMemoryRegion>>
SharedMemoryRegion::open(const std::string& name) {
    const std::string object_name = shm_object_name(name);

    int fd = shm_open(object_name.c_str(), O_RDWR, 0666);
    if (fd == -1) {
        if (errno == ENOENT) {
            return Err<std::unique_ptr<SharedMemoryRegion>>(IpcError::channel_not_found(name));
        }
        return Err<std::unique_ptr<SharedMemoryRegion>>(
            IpcError::map_failed(name, std::strerror(errno)));
    }

    struct stat st {};
    if (fstat(fd, &st) == -1) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        return Err<std::unique_ptr<SharedMemoryRegion>>(IpcError::map_failed(name, reason));
    }

    const auto size = static_cast<std::size_t>(st.st_size);
    if (size == 0) {
        // Master has created the object but not sized it yet
        ::close(fd);
        return Err<std::unique_ptr<SharedMemoryRegion>>(IpcError::channel_not_found(name));
    }

    void* addr = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (addr == MAP_FAILED) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        return Err<std::unique_ptr<SharedMemoryRegion>>(IpcError::map_failed(name, reason));
    }

    coherence_core::ipc_logger()->debug("Attached to shared memory '{}' ({} bytes)", name, size);
    return std::unique_ptr<SharedMemoryRegion>(new SharedMemoryRegion(name, size, fd, addr, false));
}

bool SharedMemoryRegion::exists(const std::string& name) {
    int fd = shm_open(shm_object_name(name).c_str(), O_RDONLY, 0666);
    if (fd == -1) {
        return false;
    }
    ::close(fd);
    return true;
}

} // namespace coherence_ipc
