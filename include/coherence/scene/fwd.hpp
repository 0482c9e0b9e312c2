#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for coherence_scene module

#include <cstdint>

namespace coherence_scene {

enum class SceneObjectType : std::int32_t;
enum class DisplayMode : std::int32_t;
enum class PropertyType : std::int32_t;

struct InteropClientState;
struct InteropCamera;
struct InteropViewport;
struct InteropTransform;
struct InteropSceneObject;
struct InteropComponent;
struct InteropProperty;
struct InteropImage;

struct RenderTextureData;
class PixelLock;
class PixelBuffer;

class SceneObject;
class Component;
class Viewport;
class Image;

template<typename Key, typename Entity>
class Directory;

class SceneContext;

enum class BridgeRole : std::uint8_t;
class Bridge;

} // namespace coherence_scene
