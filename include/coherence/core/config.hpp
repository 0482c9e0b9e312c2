#pragma once

/// @file config.hpp
/// @brief Connection and buffer configuration
///
/// Loaded from a TOML file:
/// @code
/// [connection]
/// name = "Coherence"
/// timeout_ms = 5000
///
/// [buffers]
/// message_node_count = 100
/// message_node_size = 1048576
/// pixel_node_count = 2
/// pixel_node_size = 16777216
///
/// [timing]
/// read_wait_ms = 0
/// write_wait_ms = 0
/// disconnect_wait_ms = 1000
/// outbound_warn_threshold = 10
///
/// [logging]
/// level = "info"
/// directory = "logs"
/// @endcode

#include "fwd.hpp"
#include "error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace coherence_core {

/// Settings shared by both sides of a connection
struct BridgeConfig {
    // [connection]
    std::string connection_name = "Coherence";
    std::uint32_t connection_timeout_ms = 5000;

    // [buffers]
    std::uint32_t message_node_count = 100;
    std::uint32_t message_node_size = 1024 * 1024;
    std::uint32_t pixel_node_count = 2;
    std::uint32_t pixel_node_size = 16 * 1024 * 1024;

    // [timing]
    std::uint32_t read_wait_ms = 0;
    std::uint32_t write_wait_ms = 0;
    std::uint32_t disconnect_wait_ms = 1000;
    std::size_t outbound_warn_threshold = 10;

    // [logging]
    std::string log_level = "info";
    std::string log_directory;
};

/// Parse configuration from TOML text
[[nodiscard]] Result<BridgeConfig> parse_config(const std::string& content,
                                                const std::string& source_name = "config");

/// Load configuration from a TOML file
[[nodiscard]] Result<BridgeConfig> load_config(const std::filesystem::path& path);

/// Check sizes and names are usable
[[nodiscard]] Result<void> validate_config(const BridgeConfig& config);

/// Apply the [logging] section to the logging system
void apply_logging_config(const BridgeConfig& config);

} // namespace coherence_core
