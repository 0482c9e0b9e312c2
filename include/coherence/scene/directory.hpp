#pragma once

/// @file directory.hpp
/// @brief Keyed ownership of scene entities

#include "fwd.hpp"

#include <coherence/core/error.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace coherence_scene {

/// Owns entities by key. Iteration follows key order.
template<typename Key, typename Entity>
class Directory {
public:
    using Map = std::map<Key, std::unique_ptr<Entity>>;

    /// @param kind_name used in error messages ("Object", "Viewport", ...)
    explicit Directory(std::string kind_name)
        : m_kind_name(std::move(kind_name)) {}

    // Non-copyable
    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;

    /// Take ownership of a new entity
    [[nodiscard]] coherence_core::Result<Entity*> insert(const Key& key, std::unique_ptr<Entity> entity) {
        auto [it, inserted] = m_entries.try_emplace(key, nullptr);
        if (!inserted) {
            return coherence_core::Err<Entity*>(coherence_core::SceneError::already_exists(m_kind_name, key_string(key)));
        }
        it->second = std::move(entity);
        return coherence_core::Ok(it->second.get());
    }

    /// @return nullptr if absent
    [[nodiscard]] Entity* find(const Key& key) const {
        auto it = m_entries.find(key);
        return it != m_entries.end() ? it->second.get() : nullptr;
    }

    /// @return the entity or a NotFound error
    [[nodiscard]] coherence_core::Result<Entity*> get(const Key& key) const {
        if (auto* entity = find(key)) {
            return coherence_core::Ok(entity);
        }
        return coherence_core::Err<Entity*>(coherence_core::SceneError::not_found(m_kind_name, key_string(key)));
    }

    /// Remove and hand back ownership
    [[nodiscard]] std::unique_ptr<Entity> take(const Key& key) {
        auto it = m_entries.find(key);
        if (it == m_entries.end()) {
            return nullptr;
        }
        auto entity = std::move(it->second);
        m_entries.erase(it);
        return entity;
    }

    [[nodiscard]] bool contains(const Key& key) const { return m_entries.count(key) > 0; }
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] const std::string& kind_name() const noexcept { return m_kind_name; }

    void clear() { m_entries.clear(); }

    [[nodiscard]] typename Map::const_iterator begin() const { return m_entries.begin(); }
    [[nodiscard]] typename Map::const_iterator end() const { return m_entries.end(); }

private:
    [[nodiscard]] static std::string key_string(const Key& key) {
        if constexpr (std::is_convertible_v<Key, std::string>) {
            return key;
        } else {
            return std::to_string(key);
        }
    }

    std::string m_kind_name;
    Map m_entries;
};

} // namespace coherence_scene
