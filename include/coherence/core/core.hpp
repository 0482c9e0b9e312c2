#pragma once

/// @file core.hpp
/// @brief Main include file for coherence_core
///
/// coherence_core provides the pieces every other module leans on:
///
/// - **Error Handling**: Result<T> with IpcError and SceneError kinds
/// - **Logging**: named spdlog loggers per module
/// - **Configuration**: TOML-backed BridgeConfig

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "config.hpp"
