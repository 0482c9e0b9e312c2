#pragma once

/// @file scene.hpp
/// @brief Main include file for coherence_scene

#include "fwd.hpp"
#include "interop.hpp"
#include "directory.hpp"
#include "scene_object.hpp"
#include "component.hpp"
#include "viewport.hpp"
#include "image.hpp"
#include "context.hpp"
#include "bridge.hpp"
