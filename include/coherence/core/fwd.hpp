#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for coherence_core module

#include <cstdint>

namespace coherence_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct IpcError;
struct SceneError;
class Error;
class ErrorException;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

// =============================================================================
// Configuration
// =============================================================================

struct BridgeConfig;

} // namespace coherence_core
