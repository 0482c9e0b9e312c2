#pragma once

/// @file coherence.hpp
/// @brief Everything needed to embed a bridge in C++

#include "core/core.hpp"
#include "math/types.hpp"
#include "ipc/ipc.hpp"
#include "mesh/types.hpp"
#include "mesh/array_buffer.hpp"
#include "mesh/mesh.hpp"
#include "mesh/mesh_buffers.hpp"
#include "scene/scene.hpp"
