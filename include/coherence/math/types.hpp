#pragma once

/// @file types.hpp
/// @brief Vector types and conversions shared by the interop layer

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cmath>
#include <type_traits>

namespace coherence_math {

// =============================================================================
// Types (GLM aliases)
// =============================================================================

using Vec2 = glm::vec2;
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;
using Quat = glm::quat;

static_assert(std::is_trivially_copyable_v<Vec3>, "interop vectors must be trivially copyable");
static_assert(sizeof(Vec3) == 3 * sizeof(float), "interop vectors must be tightly packed");

namespace consts {
inline constexpr float EPSILON = 1e-6f;
} // namespace consts

// =============================================================================
// Comparison
// =============================================================================

/// Check if two floats are approximately equal
[[nodiscard]] inline bool approx_equal(float a, float b,
                                        float epsilon = consts::EPSILON) noexcept {
    return std::abs(a - b) <= epsilon;
}

/// Check if two vectors are approximately equal
template<typename T>
[[nodiscard]] inline bool approx_equal(const T& a, const T& b,
                                        float epsilon = consts::EPSILON) noexcept {
    return glm::all(glm::lessThanEqual(glm::abs(a - b), T(epsilon)));
}

// =============================================================================
// Axis Conversion
// =============================================================================

/// Z-up right-handed to Y-up left-handed
[[nodiscard]] inline Vec3 swap_yz(const Vec3& v) noexcept {
    return Vec3(v.x, v.z, v.y);
}

} // namespace coherence_math
