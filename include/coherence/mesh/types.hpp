#pragma once

/// @file types.hpp
/// @brief Source mesh layouts and derived per-vertex value types
///
/// The source layouts mirror the host application's native arrays and are
/// read in place from memory the host hands us. Derived types are what the
/// destination renderer consumes.

#include <coherence/math/types.hpp>

#include <cstdint>
#include <type_traits>

namespace coherence_mesh {

using coherence_math::Vec2;
using coherence_math::Vec3;

// =============================================================================
// Source Layouts
// =============================================================================

/// Packed normals are stored as signed 16 bit fixed point
inline constexpr float NORMAL_SCALE = 1.0f / 32767.0f;

/// Maximum UV layers carried per mesh
inline constexpr std::size_t MAX_UV_LAYERS = 4;

#pragma pack(push, 1)

/// Unique vertex: position and packed normal
struct MVert {
    float co[3];
    std::int16_t no[3];
    char flag;
    char bweight;
};

/// Corner: which vertex and edge a face corner references
struct MLoop {
    std::uint32_t v;
    std::uint32_t e;
};

/// Triangle as three corner indices
struct MLoopTri {
    std::uint32_t tri[3];
    std::uint32_t poly;
};

/// Per-corner color
struct MLoopCol {
    std::uint8_t r;
    std::uint8_t g;
    std::uint8_t b;
    std::uint8_t a;
};

/// Per-corner texture coordinate
struct MLoopUV {
    float uv[2];
    std::int32_t flag;
};

#pragma pack(pop)

static_assert(sizeof(MVert) == 20);
static_assert(sizeof(MLoop) == 8);
static_assert(sizeof(MLoopTri) == 16);
static_assert(sizeof(MLoopCol) == 4);
static_assert(sizeof(MLoopUV) == 12);

// =============================================================================
// Derived Types
// =============================================================================

#pragma pack(push, 1)

struct InteropColor32 {
    std::uint8_t r;
    std::uint8_t g;
    std::uint8_t b;
    std::uint8_t a;

    bool operator==(const InteropColor32&) const = default;
};

#pragma pack(pop)

static_assert(std::is_trivially_copyable_v<InteropColor32>);

// =============================================================================
// Conversions
// =============================================================================

/// Source position to destination space
[[nodiscard]] inline Vec3 to_position(const MVert& vert) noexcept {
    return coherence_math::swap_yz(Vec3(vert.co[0], vert.co[1], vert.co[2]));
}

/// Packed source normal to a unit-range destination normal
[[nodiscard]] inline Vec3 to_normal(const MVert& vert) noexcept {
    return coherence_math::swap_yz(Vec3(
        static_cast<float>(vert.no[0]) * NORMAL_SCALE,
        static_cast<float>(vert.no[1]) * NORMAL_SCALE,
        static_cast<float>(vert.no[2]) * NORMAL_SCALE));
}

[[nodiscard]] inline InteropColor32 to_interop(const MLoopCol& col) noexcept {
    return InteropColor32{col.r, col.g, col.b, col.a};
}

[[nodiscard]] inline Vec2 to_interop(const MLoopUV& uv) noexcept {
    return Vec2(uv.uv[0], uv.uv[1]);
}

} // namespace coherence_mesh
