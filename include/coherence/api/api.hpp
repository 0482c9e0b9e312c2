#pragma once

/// @file api.hpp
/// @brief C entry points for the authoring host
///
/// Every function operates on one process-wide source-side Bridge and
/// never throws. Integer returns follow one convention:
///   1  success
///   0  soft failure (not connected yet, or nothing to do)
///  -1  error; coherence_get_last_error() describes it
///
/// Host loop:
/// @code
/// if (coherence_connect("Coherence", "4.2.0") == 1) {
///     coherence_add_viewport(1);
///     while (running) {
///         coherence_update();
///         coherence_consume_render_textures();
///         RenderTextureData rt = coherence_get_render_texture(1);
///         // ... upload rt.pixels ...
///         coherence_release_render_texture(1);
///     }
///     coherence_disconnect();
/// }
/// @endcode

#include <coherence/mesh/types.hpp>
#include <coherence/scene/interop.hpp>
#include <coherence/scene/viewport.hpp>

#include <cstdint>

#if defined(_WIN32) || defined(__CYGWIN__)
    #ifdef COHERENCE_API_EXPORT
        #define COHERENCE_API __declspec(dllexport)
    #else
        #define COHERENCE_API __declspec(dllimport)
    #endif
#else
    #if __GNUC__ >= 4
        #define COHERENCE_API __attribute__((visibility("default")))
    #else
        #define COHERENCE_API
    #endif
#endif

extern "C" {

using coherence_scene::InteropCamera;
using coherence_scene::InteropProperty;
using coherence_scene::InteropTransform;
using coherence_scene::RenderTextureData;

// =============================================================================
// Connection
// =============================================================================

/// Text of the most recent error, empty if none
COHERENCE_API const char* coherence_get_last_error();

/// Load buffer sizes and timing from a TOML file for the next connect
COHERENCE_API int coherence_load_config(const char* path);

/// Attach to the shared memory named `name`
/// @return 0 if the destination has not created it yet
COHERENCE_API int coherence_connect(const char* name, const char* version);

COHERENCE_API int coherence_disconnect();

/// Drop every entity while keeping the connection
COHERENCE_API int coherence_clear();

/// One poll tick; call at a steady rate from a single thread
COHERENCE_API int coherence_update();

/// @return 1 once the peer has answered the handshake
COHERENCE_API int coherence_is_connected();

COHERENCE_API int coherence_is_connected_to_shared_memory();

// =============================================================================
// Viewports
// =============================================================================

COHERENCE_API int coherence_add_viewport(std::int32_t viewport_id);
COHERENCE_API int coherence_remove_viewport(std::int32_t viewport_id);
COHERENCE_API int coherence_set_viewport_camera(std::int32_t viewport_id, const InteropCamera* camera);
COHERENCE_API int coherence_set_visible_objects(std::int32_t viewport_id, const std::int32_t* object_ids, std::int32_t count);

/// Copy every pending render frame into its viewport
COHERENCE_API int coherence_consume_render_textures();

/// Lock a viewport's pixels and return them. Must be paired with
/// coherence_release_render_texture() on the same thread.
/// @return viewport_id -1 on failure
COHERENCE_API RenderTextureData coherence_get_render_texture(std::int32_t viewport_id);

COHERENCE_API int coherence_release_render_texture(std::int32_t viewport_id);

// =============================================================================
// Objects and Meshes
// =============================================================================

COHERENCE_API int coherence_add_mesh_object(const char* name, const char* mesh_name, const InteropTransform* transform);
COHERENCE_API int coherence_set_object_transform(const char* name, const InteropTransform* transform);
COHERENCE_API int coherence_set_object_material(const char* name, const char* material);
COHERENCE_API int coherence_remove_object(const char* name);

/// Hand over the authoring arrays of a mesh.
/// @param uv_layers   `uv_layer_count` pointers, each to `loop_count` entries
/// @param loop_cols   nullptr or `loop_count` entries
COHERENCE_API int coherence_copy_mesh_data(
    const char* mesh_name,
    const coherence_mesh::MVert* verts, std::int32_t vert_count,
    const coherence_mesh::MLoop* loops, std::int32_t loop_count,
    const coherence_mesh::MLoopTri* loop_tris, std::int32_t loop_tri_count,
    const coherence_mesh::MLoopCol* loop_cols,
    const coherence_mesh::MLoopUV* const* uv_layers, std::int32_t uv_layer_count);

// =============================================================================
// Images
// =============================================================================

COHERENCE_API int coherence_add_image(const char* name);

/// @param pixels width * height RGBA floats
COHERENCE_API int coherence_copy_image(const char* name, std::int32_t width, std::int32_t height, const float* pixels);

COHERENCE_API int coherence_remove_image(const char* name);

// =============================================================================
// Components
// =============================================================================

COHERENCE_API int coherence_add_component(const char* target, const char* name, std::int32_t enabled);
COHERENCE_API int coherence_set_component_properties(
    const char* target, const char* name, const InteropProperty* properties, std::int32_t count);
COHERENCE_API int coherence_remove_component(const char* target, const char* name);

} // extern "C"
