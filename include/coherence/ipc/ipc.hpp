#pragma once

/// @file ipc.hpp
/// @brief Main include file for coherence_ipc

#include "fwd.hpp"
#include "wire.hpp"
#include "shared_memory.hpp"
#include "ring_buffer.hpp"
#include "messenger.hpp"
#include "entity.hpp"
