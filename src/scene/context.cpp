/// @file context.cpp
/// @brief SceneContext implementation

#include <coherence/scene/context.hpp>
#include <coherence/core/log.hpp>

#include <algorithm>

namespace coherence_scene {

using coherence_core::Err;
using coherence_core::Ok;
using coherence_core::SceneError;

SceneContext::SceneContext() = default;

SceneContext::~SceneContext() {
    clear();
}

coherence_core::Result<void> SceneContext::check_name(const std::string& kind, const std::string& name) {
    if (name.empty()) {
        return Err(SceneError::invalid_value(kind, "name is empty"));
    }
    if (!InteropString64::fits(name)) {
        return Err(SceneError::invalid_value(name,
            kind + " names are limited to " + std::to_string(InteropString64::MAX_LENGTH) + " bytes"));
    }
    return Ok();
}

// =============================================================================
// Creation
// =============================================================================

coherence_core::Result<SceneObject*> SceneContext::add_object(
    const std::string& name, SceneObjectType type, std::int32_t id)
{
    if (auto valid = check_name("Object", name); !valid) {
        return Err<SceneObject*>(valid.error());
    }
    if (m_objects.contains(name)) {
        return Err<SceneObject*>(SceneError::already_exists("Object", name));
    }

    if (id <= 0) {
        id = m_next_object_id++;
    } else if (find_object_by_id(id)) {
        return Err<SceneObject*>(SceneError::already_exists("Object id", std::to_string(id)));
    } else {
        m_next_object_id = std::max(m_next_object_id, id + 1);
    }

    auto result = m_objects.insert(name, std::make_unique<SceneObject>(name, id, type));
    if (result) {
        coherence_core::scene_logger()->debug("Added object '{}' (id {}, {})", name, id, scene_object_type_name(type));
    }
    return result;
}

coherence_core::Result<Component*> SceneContext::add_component(const std::string& target, const std::string& name) {
    if (auto valid = check_name("Component", name); !valid) {
        return Err<Component*>(valid.error());
    }
    if (!m_objects.contains(target)) {
        return Err<Component*>(SceneError::not_found("Object", target));
    }

    return m_components.insert(Component::make_key(target, name), std::make_unique<Component>(name, target));
}

coherence_core::Result<Viewport*> SceneContext::add_viewport(std::int32_t id) {
    return m_viewports.insert(id, std::make_unique<Viewport>(id));
}

coherence_core::Result<Image*> SceneContext::add_image(const std::string& name) {
    if (auto valid = check_name("Image", name); !valid) {
        return Err<Image*>(valid.error());
    }
    return m_images.insert(name, std::make_unique<Image>(name));
}

coherence_core::Result<coherence_mesh::Mesh*> SceneContext::get_or_create_mesh(const std::string& name) {
    if (auto* mesh = m_meshes.find(name)) {
        return Ok(mesh);
    }
    if (auto valid = check_name("Mesh", name); !valid) {
        return Err<coherence_mesh::Mesh*>(valid.error());
    }
    coherence_core::scene_logger()->debug("Created mesh '{}'", name);
    return m_meshes.insert(name, std::make_unique<coherence_mesh::Mesh>(name));
}

coherence_core::Result<coherence_mesh::MeshBuffers*> SceneContext::get_or_create_mesh_buffers(const std::string& name) {
    if (auto* buffers = m_mesh_buffers.find(name)) {
        return Ok(buffers);
    }
    if (auto valid = check_name("Mesh", name); !valid) {
        return Err<coherence_mesh::MeshBuffers*>(valid.error());
    }
    return m_mesh_buffers.insert(name, std::make_unique<coherence_mesh::MeshBuffers>(name));
}

// =============================================================================
// Queries
// =============================================================================

SceneObject* SceneContext::find_object_by_id(std::int32_t id) const {
    for (const auto& [name, object] : m_objects) {
        if (object->id() == id) {
            return object.get();
        }
    }
    return nullptr;
}

std::vector<SceneObject*> SceneContext::objects_using_mesh(const std::string& mesh_name) const {
    std::vector<SceneObject*> result;
    for (const auto& [name, object] : m_objects) {
        if (object->mesh_name() == mesh_name) {
            result.push_back(object.get());
        }
    }
    return result;
}

std::vector<Component*> SceneContext::components_of(const std::string& target) const {
    std::vector<Component*> result;
    for (const auto& [key, component] : m_components) {
        if (component->target() == target) {
            result.push_back(component.get());
        }
    }
    return result;
}

std::size_t SceneContext::entity_count() const noexcept {
    return m_objects.size() + m_components.size() + m_meshes.size() +
           m_mesh_buffers.size() + m_viewports.size() + m_images.size();
}

void SceneContext::clear() {
    // Native buffers first, then the entries that own them. Viewport pixels
    // are shared with readers and go when the last holder lets go.
    for (const auto& [name, image] : m_images) {
        image->release();
    }

    m_components.clear();
    m_objects.clear();
    m_meshes.clear();
    m_mesh_buffers.clear();
    m_viewports.clear();
    m_images.clear();
    m_next_object_id = 1;
}

} // namespace coherence_scene
