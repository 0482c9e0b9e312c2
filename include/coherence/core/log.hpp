#pragma once

/// @file log.hpp
/// @brief Named spdlog loggers for the bridge layers
///
/// Every logger writes through the same sinks: colored stderr and, when a
/// log directory is configured, one rotating coherence.log. Stdout is left
/// to the embedding application.

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace coherence_core {

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig {
    bool console_enabled = true;
    /// Empty disables the file sink
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Rebuild the shared sinks and apply the level to every logger,
/// including loggers created earlier.
void configure_logging(const LogConfig& config);

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a logger on the shared sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Config loading and error records
std::shared_ptr<spdlog::logger> core_logger();

/// Shared memory and message transport
std::shared_ptr<spdlog::logger> ipc_logger();

/// Mesh diff engine
std::shared_ptr<spdlog::logger> mesh_logger();

/// Scene directories and bridge
std::shared_ptr<spdlog::logger> scene_logger();

/// Host API entry points
std::shared_ptr<spdlog::logger> api_logger();

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush and drop every logger. Called when the host unloads the library.
void shutdown_logging();

} // namespace coherence_core
