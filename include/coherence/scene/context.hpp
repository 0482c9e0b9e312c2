#pragma once

/// @file context.hpp
/// @brief Entity directories owned by one connection
///
/// A SceneContext lives exactly as long as the connection that created it.
/// Destroying it releases every owned buffer; nothing in it is global, so
/// several connections can coexist in one process.

#include "fwd.hpp"
#include "component.hpp"
#include "directory.hpp"
#include "image.hpp"
#include "scene_object.hpp"
#include "viewport.hpp"

#include <coherence/core/error.hpp>
#include <coherence/mesh/mesh.hpp>
#include <coherence/mesh/mesh_buffers.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace coherence_scene {

class SceneContext {
public:
    using ObjectDirectory = Directory<std::string, SceneObject>;
    using ComponentDirectory = Directory<std::string, Component>;
    using MeshDirectory = Directory<std::string, coherence_mesh::Mesh>;
    using MeshBufferDirectory = Directory<std::string, coherence_mesh::MeshBuffers>;
    using ViewportDirectory = Directory<std::int32_t, Viewport>;
    using ImageDirectory = Directory<std::string, Image>;

    SceneContext();
    ~SceneContext();

    // Non-copyable
    SceneContext(const SceneContext&) = delete;
    SceneContext& operator=(const SceneContext&) = delete;

    // =========================================================================
    // Creation
    // =========================================================================

    /// Create an object. An id of 0 takes the next free id; a peer-assigned
    /// id is kept as is.
    [[nodiscard]] coherence_core::Result<SceneObject*> add_object(
        const std::string& name, SceneObjectType type, std::int32_t id = 0);

    /// Attach a component to an existing object
    [[nodiscard]] coherence_core::Result<Component*> add_component(const std::string& target, const std::string& name);

    [[nodiscard]] coherence_core::Result<Viewport*> add_viewport(std::int32_t id);

    [[nodiscard]] coherence_core::Result<Image*> add_image(const std::string& name);

    /// Meshes are created on first use and shared by name
    [[nodiscard]] coherence_core::Result<coherence_mesh::Mesh*> get_or_create_mesh(const std::string& name);

    /// Destination-side channel buffers, created on first inbound array
    [[nodiscard]] coherence_core::Result<coherence_mesh::MeshBuffers*> get_or_create_mesh_buffers(const std::string& name);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] SceneObject* find_object_by_id(std::int32_t id) const;

    /// Objects referencing `mesh_name`
    [[nodiscard]] std::vector<SceneObject*> objects_using_mesh(const std::string& mesh_name) const;

    /// Components attached to `target`
    [[nodiscard]] std::vector<Component*> components_of(const std::string& target) const;

    [[nodiscard]] std::size_t entity_count() const noexcept;

    // =========================================================================
    // Directories
    // =========================================================================

    [[nodiscard]] ObjectDirectory& objects() noexcept { return m_objects; }
    [[nodiscard]] const ObjectDirectory& objects() const noexcept { return m_objects; }
    [[nodiscard]] ComponentDirectory& components() noexcept { return m_components; }
    [[nodiscard]] const ComponentDirectory& components() const noexcept { return m_components; }
    [[nodiscard]] MeshDirectory& meshes() noexcept { return m_meshes; }
    [[nodiscard]] const MeshDirectory& meshes() const noexcept { return m_meshes; }
    [[nodiscard]] MeshBufferDirectory& mesh_buffers() noexcept { return m_mesh_buffers; }
    [[nodiscard]] const MeshBufferDirectory& mesh_buffers() const noexcept { return m_mesh_buffers; }
    [[nodiscard]] ViewportDirectory& viewports() noexcept { return m_viewports; }
    [[nodiscard]] const ViewportDirectory& viewports() const noexcept { return m_viewports; }
    [[nodiscard]] ImageDirectory& images() noexcept { return m_images; }
    [[nodiscard]] const ImageDirectory& images() const noexcept { return m_images; }

    /// Release buffers and drop every entity
    void clear();

private:
    [[nodiscard]] static coherence_core::Result<void> check_name(const std::string& kind, const std::string& name);

    ObjectDirectory m_objects{"Object"};
    ComponentDirectory m_components{"Component"};
    MeshDirectory m_meshes{"Mesh"};
    MeshBufferDirectory m_mesh_buffers{"Mesh buffers"};
    ViewportDirectory m_viewports{"Viewport"};
    ImageDirectory m_images{"Image"};

    std::int32_t m_next_object_id = 1;
};

} // namespace coherence_scene
