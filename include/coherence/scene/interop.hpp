#pragma once

/// @file interop.hpp
/// @brief Flat values exchanged for scene entities
///
/// Every structure here is copied byte for byte into a message payload, so
/// layouts are packed and append-only.

#include "fwd.hpp"

#include <coherence/ipc/wire.hpp>
#include <coherence/math/types.hpp>

#include <cstdint>
#include <type_traits>

namespace coherence_scene {

using coherence_ipc::InteropString64;
using coherence_math::Vec3;
using coherence_math::Vec4;

// =============================================================================
// Enums
// =============================================================================

enum class SceneObjectType : std::int32_t {
    Mesh = 1,
    Other,
};

/// How the destination shades an object
enum class DisplayMode : std::int32_t {
    Material = 0,
    Normals,
    VertexColors,
    UV,
    UV2,
    UV3,
    UV4,
};

enum class PropertyType : std::int32_t {
    Boolean = 1,
    Integer,
    Float,
    String,
    Enum,
    Color,
    FloatVector2,
    FloatVector3,
    FloatVector4,
};

[[nodiscard]] inline const char* scene_object_type_name(SceneObjectType type) {
    switch (type) {
        case SceneObjectType::Mesh: return "Mesh";
        case SceneObjectType::Other: return "Other";
        default: return "Unknown";
    }
}

[[nodiscard]] inline const char* display_mode_name(DisplayMode mode) {
    switch (mode) {
        case DisplayMode::Material: return "Material";
        case DisplayMode::Normals: return "Normals";
        case DisplayMode::VertexColors: return "VertexColors";
        case DisplayMode::UV: return "UV";
        case DisplayMode::UV2: return "UV2";
        case DisplayMode::UV3: return "UV3";
        case DisplayMode::UV4: return "UV4";
        default: return "Unknown";
    }
}

// =============================================================================
// Flat Values
// =============================================================================

#pragma pack(push, 1)

/// Sent with Connect and UpdateState
struct InteropClientState {
    InteropString64 version;
    InteropString64 name;
    std::int32_t protocol;
};

struct InteropCamera {
    std::int32_t width;
    std::int32_t height;
    std::int32_t is_perspective;
    float lens;
    float view_distance;
    Vec3 position;
    Vec3 forward;
    Vec3 up;

    /// Integer fields exact, floats within EPSILON
    [[nodiscard]] bool approx_equal(const InteropCamera& other) const noexcept {
        return width == other.width
            && height == other.height
            && is_perspective == other.is_perspective
            && coherence_math::approx_equal(lens, other.lens)
            && coherence_math::approx_equal(view_distance, other.view_distance)
            && coherence_math::approx_equal(position, other.position)
            && coherence_math::approx_equal(forward, other.forward)
            && coherence_math::approx_equal(up, other.up);
    }
};

struct InteropViewport {
    std::int32_t id;
    InteropCamera camera;
};

struct InteropTransform {
    InteropString64 parent;
    Vec3 position;
    Vec4 rotation;  // x, y, z, w
    Vec3 scale;

    [[nodiscard]] bool approx_equal(const InteropTransform& other) const noexcept {
        return parent == other.parent
            && coherence_math::approx_equal(position, other.position)
            && coherence_math::approx_equal(rotation, other.rotation)
            && coherence_math::approx_equal(scale, other.scale);
    }
};

struct InteropSceneObject {
    InteropString64 name;
    std::int32_t id;
    SceneObjectType type;
    DisplayMode display;
    InteropTransform transform;
    InteropString64 material;
    InteropString64 mesh;
    std::int32_t vertex_count;
    std::int32_t triangle_count;
};

struct InteropComponent {
    InteropString64 name;
    InteropString64 target;
    InteropString64 mesh;
    InteropString64 material;
    std::int32_t enabled;
};

/// One typed component property. Scalars use int_value or vector_value.x.
struct InteropProperty {
    InteropString64 name;
    PropertyType type;
    std::int32_t int_value;
    Vec4 vector_value;
    InteropString64 string_value;
};

struct InteropImage {
    InteropString64 name;
    std::int32_t width;
    std::int32_t height;
};

#pragma pack(pop)

static_assert(coherence_ipc::WireValue<InteropClientState>);
static_assert(coherence_ipc::WireValue<InteropCamera>);
static_assert(coherence_ipc::WireValue<InteropViewport>);
static_assert(coherence_ipc::WireValue<InteropSceneObject>);
static_assert(coherence_ipc::WireValue<InteropComponent>);
static_assert(coherence_ipc::WireValue<InteropProperty>);
static_assert(coherence_ipc::WireValue<InteropImage>);

/// Identity transform with no parent
[[nodiscard]] inline InteropTransform identity_transform() {
    InteropTransform transform{};
    transform.position = Vec3(0.0f);
    transform.rotation = Vec4(0.0f, 0.0f, 0.0f, 1.0f);
    transform.scale = Vec3(1.0f);
    return transform;
}

/// Protocol revision carried in InteropClientState
inline constexpr std::int32_t PROTOCOL_VERSION = 1;

} // namespace coherence_scene
