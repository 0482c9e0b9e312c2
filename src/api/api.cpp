/// @file api.cpp
/// @brief C entry points over a process-wide source Bridge

#include <coherence/api/api.hpp>
#include <coherence/scene/bridge.hpp>
#include <coherence/core/config.hpp>
#include <coherence/core/log.hpp>

#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

using coherence_core::BridgeConfig;
using coherence_core::Error;
using coherence_core::ErrorCode;
using coherence_core::ErrorException;
using coherence_core::Result;
using coherence_scene::Bridge;
using coherence_scene::BridgeRole;

namespace {

BridgeConfig g_config;
std::unique_ptr<Bridge> g_bridge;
std::string g_last_error;

// Buffers locked by coherence_get_render_texture. Released through this
// table so a peer disconnect or viewport removal on the poll thread never
// strands a held lock.
std::mutex g_held_mutex;
std::map<std::int32_t, std::shared_ptr<coherence_scene::PixelBuffer>> g_held;

void set_last_error(const std::string& op, const std::string& message) {
    g_last_error = op + ": " + message;
    coherence_core::api_logger()->error("{}", g_last_error);
}

/// Map a Result onto the 1 / 0 / -1 convention
int status(const char* op, const Result<void>& result) {
    if (result) {
        return 1;
    }
    const Error& error = result.error();
    if (error.code() == ErrorCode::NotConnected) {
        g_last_error = std::string(op) + ": " + error.message();
        coherence_core::api_logger()->debug("{}", g_last_error);
        return 0;
    }
    set_last_error(op, coherence_core::format_error(error));
    coherence_core::debug::record_error(error);
    return -1;
}

/// Run an entry point body, turning exceptions into -1
template<typename F>
int guarded(const char* op, F&& body) {
    try {
        return body();
    } catch (const ErrorException& e) {
        set_last_error(op, coherence_core::format_error(e.error()));
        coherence_core::debug::record_error(e.error());
    } catch (const std::exception& e) {
        set_last_error(op, e.what());
    }
    return -1;
}

/// Entity operations need a bridge; before connect they are soft failures
template<typename F>
int with_bridge(const char* op, F&& body) {
    return guarded(op, [&]() -> int {
        if (!g_bridge) {
            return status(op, coherence_core::Err(coherence_core::SceneError::not_connected()));
        }
        return status(op, body(*g_bridge));
    });
}

std::string to_string(const char* text) {
    return text ? std::string(text) : std::string();
}

template<typename T>
std::span<const T> to_span(const T* data, std::int32_t count) {
    if (!data || count <= 0) {
        return {};
    }
    return {data, static_cast<std::size_t>(count)};
}

Result<void> require(bool condition, const char* what) {
    if (!condition) {
        return coherence_core::Err(Error(ErrorCode::InvalidArgument, std::string(what) + " is null"));
    }
    return coherence_core::Ok();
}

} // anonymous namespace

extern "C" {

// =============================================================================
// Connection
// =============================================================================

COHERENCE_API const char* coherence_get_last_error() {
    return g_last_error.c_str();
}

COHERENCE_API int coherence_load_config(const char* path) {
    return guarded("load_config", [&]() -> int {
        auto loaded = coherence_core::load_config(to_string(path));
        if (!loaded) {
            return status("load_config", coherence_core::Err(loaded.error()));
        }
        if (auto valid = coherence_core::validate_config(*loaded); !valid) {
            return status("load_config", valid);
        }
        g_config = std::move(loaded).value();
        coherence_core::apply_logging_config(g_config);
        return 1;
    });
}

COHERENCE_API int coherence_connect(const char* name, const char* version) {
    return guarded("connect", [&]() -> int {
        if (g_bridge && g_bridge->is_connected_to_shared_memory()) {
            return status("connect", coherence_core::Err(Error(ErrorCode::InvalidState,
                "already connected to '" + g_bridge->config().connection_name + "'")));
        }

        BridgeConfig config = g_config;
        if (name && *name) {
            config.connection_name = name;
        }
        if (auto valid = coherence_core::validate_config(config); !valid) {
            return status("connect", valid);
        }

        g_bridge = std::make_unique<Bridge>(std::move(config), BridgeRole::Source);
        auto connected = g_bridge->connect(to_string(version));
        if (!connected) {
            g_bridge.reset();
            return status("connect", coherence_core::Err(connected.error()));
        }
        if (!*connected) {
            g_bridge.reset();
            return 0;
        }
        return 1;
    });
}

COHERENCE_API int coherence_disconnect() {
    return guarded("disconnect", [&]() -> int {
        if (g_bridge) {
            g_bridge->disconnect();
            g_bridge.reset();
        }
        return 1;
    });
}

COHERENCE_API int coherence_clear() {
    return guarded("clear", [&]() -> int {
        if (g_bridge) {
            g_bridge->clear();
        }
        return 1;
    });
}

COHERENCE_API int coherence_update() {
    return guarded("update", [&]() -> int {
        if (!g_bridge) {
            return 0;
        }
        g_bridge->update();
        return g_bridge->is_connected_to_shared_memory() ? 1 : 0;
    });
}

COHERENCE_API int coherence_is_connected() {
    return g_bridge && g_bridge->is_connected() ? 1 : 0;
}

COHERENCE_API int coherence_is_connected_to_shared_memory() {
    return g_bridge && g_bridge->is_connected_to_shared_memory() ? 1 : 0;
}

// =============================================================================
// Viewports
// =============================================================================

COHERENCE_API int coherence_add_viewport(std::int32_t viewport_id) {
    coherence_core::api_logger()->debug("Adding viewport {}", viewport_id);
    return with_bridge("add_viewport", [&](Bridge& bridge) {
        return bridge.add_viewport(viewport_id);
    });
}

COHERENCE_API int coherence_remove_viewport(std::int32_t viewport_id) {
    coherence_core::api_logger()->debug("Removing viewport {}", viewport_id);
    return with_bridge("remove_viewport", [&](Bridge& bridge) {
        return bridge.remove_viewport(viewport_id);
    });
}

COHERENCE_API int coherence_set_viewport_camera(std::int32_t viewport_id, const InteropCamera* camera) {
    return with_bridge("set_viewport_camera", [&](Bridge& bridge) -> Result<void> {
        if (auto ok = require(camera != nullptr, "camera"); !ok) {
            return ok;
        }
        return bridge.set_viewport_camera(viewport_id, *camera);
    });
}

COHERENCE_API int coherence_set_visible_objects(std::int32_t viewport_id, const std::int32_t* object_ids, std::int32_t count) {
    return with_bridge("set_visible_objects", [&](Bridge& bridge) {
        return bridge.set_visible_objects(viewport_id, to_span(object_ids, count));
    });
}

COHERENCE_API int coherence_consume_render_textures() {
    return guarded("consume_render_textures", [&]() -> int {
        if (!g_bridge) {
            return 0;
        }
        return g_bridge->consume_pixels() > 0 ? 1 : 0;
    });
}

COHERENCE_API RenderTextureData coherence_get_render_texture(std::int32_t viewport_id) {
    RenderTextureData result{};
    guarded("get_render_texture", [&]() -> int {
        if (!g_bridge) {
            return status("get_render_texture", coherence_core::Err(coherence_core::SceneError::not_connected()));
        }
        auto buffer = g_bridge->find_pixel_buffer(viewport_id);
        if (!buffer) {
            return status("get_render_texture", coherence_core::Err(
                coherence_core::SceneError::not_found("Viewport", coherence_scene::Viewport::make_name(viewport_id))));
        }

        // Blocks while the poll thread copies a frame in
        result = buffer->acquire();

        std::lock_guard<std::mutex> lock(g_held_mutex);
        g_held[viewport_id] = std::move(buffer);
        return 1;
    });
    return result;
}

COHERENCE_API int coherence_release_render_texture(std::int32_t viewport_id) {
    return guarded("release_render_texture", [&]() -> int {
        std::lock_guard<std::mutex> lock(g_held_mutex);
        auto it = g_held.find(viewport_id);
        if (it == g_held.end()) {
            return status("release_render_texture", coherence_core::Err(Error(ErrorCode::InvalidState,
                coherence_scene::Viewport::make_name(viewport_id) + " render texture is not locked")));
        }

        auto released = it->second->release();
        if (released) {
            g_held.erase(it);
        }
        return status("release_render_texture", released);
    });
}

// =============================================================================
// Objects and Meshes
// =============================================================================

COHERENCE_API int coherence_add_mesh_object(const char* name, const char* mesh_name, const InteropTransform* transform) {
    coherence_core::api_logger()->debug("Adding mesh object '{}' ({})", to_string(name), to_string(mesh_name));
    return with_bridge("add_mesh_object", [&](Bridge& bridge) {
        const InteropTransform value = transform ? *transform : coherence_scene::identity_transform();
        return bridge.add_mesh_object(to_string(name), to_string(mesh_name), value);
    });
}

COHERENCE_API int coherence_set_object_transform(const char* name, const InteropTransform* transform) {
    return with_bridge("set_object_transform", [&](Bridge& bridge) -> Result<void> {
        if (auto ok = require(transform != nullptr, "transform"); !ok) {
            return ok;
        }
        return bridge.set_object_transform(to_string(name), *transform);
    });
}

COHERENCE_API int coherence_set_object_material(const char* name, const char* material) {
    return with_bridge("set_object_material", [&](Bridge& bridge) {
        return bridge.set_object_material(to_string(name), to_string(material));
    });
}

COHERENCE_API int coherence_remove_object(const char* name) {
    coherence_core::api_logger()->debug("Removing object '{}'", to_string(name));
    return with_bridge("remove_object", [&](Bridge& bridge) {
        return bridge.remove_object(to_string(name));
    });
}

COHERENCE_API int coherence_copy_mesh_data(
    const char* mesh_name,
    const coherence_mesh::MVert* verts, std::int32_t vert_count,
    const coherence_mesh::MLoop* loops, std::int32_t loop_count,
    const coherence_mesh::MLoopTri* loop_tris, std::int32_t loop_tri_count,
    const coherence_mesh::MLoopCol* loop_cols,
    const coherence_mesh::MLoopUV* const* uv_layers, std::int32_t uv_layer_count)
{
    return with_bridge("copy_mesh_data", [&](Bridge& bridge) {
        std::vector<std::span<const coherence_mesh::MLoopUV>> layers;
        if (uv_layers) {
            for (std::int32_t i = 0; i < uv_layer_count; ++i) {
                layers.push_back(to_span(uv_layers[i], loop_count));
            }
        }

        return bridge.copy_mesh_data(
            to_string(mesh_name),
            to_span(verts, vert_count),
            to_span(loops, loop_count),
            to_span(loop_tris, loop_tri_count),
            to_span(loop_cols, loop_count),
            layers);
    });
}

// =============================================================================
// Images
// =============================================================================

COHERENCE_API int coherence_add_image(const char* name) {
    return with_bridge("add_image", [&](Bridge& bridge) {
        return bridge.add_image(to_string(name));
    });
}

COHERENCE_API int coherence_copy_image(const char* name, std::int32_t width, std::int32_t height, const float* pixels) {
    return with_bridge("copy_image", [&](Bridge& bridge) {
        // RGBA floats, sized in std::size_t so large images cannot overflow
        std::span<const float> data;
        if (pixels && width > 0 && height > 0) {
            data = {pixels, static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4};
        }
        return bridge.copy_image(to_string(name), width, height, data);
    });
}

COHERENCE_API int coherence_remove_image(const char* name) {
    return with_bridge("remove_image", [&](Bridge& bridge) {
        return bridge.remove_image(to_string(name));
    });
}

// =============================================================================
// Components
// =============================================================================

COHERENCE_API int coherence_add_component(const char* target, const char* name, std::int32_t enabled) {
    return with_bridge("add_component", [&](Bridge& bridge) {
        return bridge.add_component(to_string(target), to_string(name), enabled != 0);
    });
}

COHERENCE_API int coherence_set_component_properties(
    const char* target, const char* name, const InteropProperty* properties, std::int32_t count)
{
    return with_bridge("set_component_properties", [&](Bridge& bridge) {
        return bridge.set_component_properties(to_string(target), to_string(name), to_span(properties, count));
    });
}

COHERENCE_API int coherence_remove_component(const char* target, const char* name) {
    return with_bridge("remove_component", [&](Bridge& bridge) {
        return bridge.remove_component(to_string(target), to_string(name));
    });
}

} // extern "C"
