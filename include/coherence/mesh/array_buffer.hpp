#pragma once

/// @file array_buffer.hpp
/// @brief Dirty-tracked channel storage and cached source arrays

#include <cstddef>
#include <cstring>
#include <span>
#include <type_traits>
#include <vector>

namespace coherence_mesh {

// =============================================================================
// ArrayBuffer
// =============================================================================

/// One derived channel. Any mutation marks the buffer dirty until clean().
template<typename T>
class ArrayBuffer {
public:
    using value_type = T;

    ArrayBuffer() = default;

    [[nodiscard]] std::size_t size() const noexcept { return m_data.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_data.empty(); }
    [[nodiscard]] const T* data() const noexcept { return m_data.data(); }
    [[nodiscard]] std::span<const T> span() const noexcept { return m_data; }
    [[nodiscard]] const T& operator[](std::size_t index) const { return m_data[index]; }

    [[nodiscard]] bool is_dirty() const noexcept { return m_dirty; }
    void mark_dirty() noexcept { m_dirty = true; }
    void clean() noexcept { m_dirty = false; }

    /// Resize, keeping existing elements
    void resize(std::size_t count) {
        m_data.resize(count);
        m_dirty = true;
    }

    void set(std::size_t index, const T& value) {
        m_data[index] = value;
        m_dirty = true;
    }

    /// Append a copy of the element at `source`. Empty buffers stay empty.
    void append_copy(std::size_t source) {
        if (m_data.empty()) {
            return;
        }
        T value = m_data[source];
        m_data.push_back(value);
        m_dirty = true;
    }

    /// Drop all elements
    void clear() {
        if (!m_data.empty()) {
            m_data.clear();
            m_dirty = true;
        }
    }

    /// Replace the contents
    void assign(std::span<const T> values) {
        m_data.assign(values.begin(), values.end());
        m_dirty = true;
    }

private:
    std::vector<T> m_data;
    bool m_dirty = false;
};

// =============================================================================
// SourceArray
// =============================================================================

/// Last-seen copy of a source array, compared bytewise
template<typename T>
class SourceArray {
    static_assert(std::is_trivially_copyable_v<T>, "source arrays are compared bytewise");

public:
    using value_type = T;

    [[nodiscard]] std::size_t size() const noexcept { return m_data.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_data.empty(); }
    [[nodiscard]] const T& operator[](std::size_t index) const { return m_data[index]; }
    [[nodiscard]] std::span<const T> span() const noexcept { return m_data; }

    [[nodiscard]] bool equals(std::span<const T> other) const noexcept {
        if (other.size() != m_data.size()) {
            return false;
        }
        return m_data.empty() ||
            std::memcmp(m_data.data(), other.data(), m_data.size() * sizeof(T)) == 0;
    }

    void copy_from(std::span<const T> other) {
        m_data.assign(other.begin(), other.end());
    }

    void clear() noexcept { m_data.clear(); }

private:
    std::vector<T> m_data;
};

} // namespace coherence_mesh
