/// @file scene_object.cpp
/// @brief SceneObject implementation

#include <coherence/scene/scene_object.hpp>

namespace coherence_scene {

using coherence_core::Err;
using coherence_core::Ok;
using coherence_core::SceneError;

SceneObject::SceneObject(std::string name, std::int32_t id, SceneObjectType type)
    : m_name(std::move(name))
{
    m_data.name = InteropString64(m_name);
    m_data.id = id;
    m_data.type = type;
    m_data.display = DisplayMode::Material;
    m_data.transform = identity_transform();
    m_data.material = InteropString64("Default");
}

coherence_core::Result<void> SceneObject::apply_inbound(const InteropSceneObject& data) {
    if (data.name.str() != m_name) {
        return Err(SceneError::invalid_value(m_name, "inbound data names '" + data.name.str() + "'"));
    }

    m_data.transform = data.transform;
    m_data.display = data.display;
    m_data.material = data.material;
    return Ok();
}

bool SceneObject::set_transform(const InteropTransform& transform) {
    if (m_data.transform.approx_equal(transform)) {
        return false;
    }
    m_data.transform = transform;
    return true;
}

coherence_core::Result<bool> SceneObject::set_material(const std::string& material) {
    if (!InteropString64::fits(material)) {
        return Err<bool>(SceneError::invalid_value(m_name, "material name '" + material + "' is too long"));
    }
    if (m_data.material.str() == material) {
        return Ok(false);
    }
    m_data.material = InteropString64(material);
    return Ok(true);
}

coherence_core::Result<void> SceneObject::set_mesh(const std::string& mesh_name) {
    if (!InteropString64::fits(mesh_name)) {
        return Err(SceneError::invalid_value(m_name, "mesh name '" + mesh_name + "' is too long"));
    }
    m_data.mesh = InteropString64(mesh_name);
    return Ok();
}

bool SceneObject::set_mesh_counts(std::int32_t vertex_count, std::int32_t triangle_count) noexcept {
    if (m_data.vertex_count == vertex_count && m_data.triangle_count == triangle_count) {
        return false;
    }
    m_data.vertex_count = vertex_count;
    m_data.triangle_count = triangle_count;
    return true;
}

} // namespace coherence_scene
