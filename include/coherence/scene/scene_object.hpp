#pragma once

/// @file scene_object.hpp
/// @brief A named object placed in the scene

#include "fwd.hpp"
#include "interop.hpp"

#include <coherence/core/error.hpp>

#include <cstdint>
#include <string>

namespace coherence_scene {

class SceneObject {
public:
    using interop_type = InteropSceneObject;

    /// @throws coherence_core::ErrorException if `name` does not fit an InteropString64
    SceneObject(std::string name, std::int32_t id, SceneObjectType type);

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] std::int32_t id() const noexcept { return m_data.id; }
    [[nodiscard]] SceneObjectType type() const noexcept { return m_data.type; }

    [[nodiscard]] InteropSceneObject serialize() const { return m_data; }

    /// Accepts transform, display and material pushed back by the peer.
    /// Id, mesh references and counts stay under local control.
    [[nodiscard]] coherence_core::Result<void> apply_inbound(const InteropSceneObject& data);

    /// @return true if the transform changed
    bool set_transform(const InteropTransform& transform);
    [[nodiscard]] const InteropTransform& transform() const noexcept { return m_data.transform; }

    /// @return true if the material changed, error if the name does not fit
    [[nodiscard]] coherence_core::Result<bool> set_material(const std::string& material);
    [[nodiscard]] std::string material() const { return m_data.material.str(); }

    void set_display_mode(DisplayMode mode) noexcept { m_data.display = mode; }
    [[nodiscard]] DisplayMode display_mode() const noexcept { return m_data.display; }

    /// Reference a mesh by name; several objects may share one mesh
    [[nodiscard]] coherence_core::Result<void> set_mesh(const std::string& mesh_name);
    [[nodiscard]] std::string mesh_name() const { return m_data.mesh.str(); }

    /// @return true if the counts changed
    bool set_mesh_counts(std::int32_t vertex_count, std::int32_t triangle_count) noexcept;
    [[nodiscard]] std::int32_t vertex_count() const noexcept { return m_data.vertex_count; }
    [[nodiscard]] std::int32_t triangle_count() const noexcept { return m_data.triangle_count; }

private:
    std::string m_name;
    InteropSceneObject m_data{};
};

} // namespace coherence_scene
