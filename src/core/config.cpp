/// @file config.cpp
/// @brief TOML configuration loading

#include <coherence/core/config.hpp>
#include <coherence/core/log.hpp>

#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace coherence_core {

namespace {

// Smallest frame: 4 byte target length, empty target, 9 byte header
constexpr std::uint32_t k_min_node_size = 4 + 9;

Result<void> read_u32(const toml::table& tbl, const char* key, std::uint32_t& out) {
    auto node = tbl[key];
    if (!node) {
        return Ok();
    }

    auto value = node.value<std::int64_t>();
    if (!value) {
        return Err(Error(ErrorCode::ParseError,
            std::string("Expected integer for '") + key + "'"));
    }
    if (*value < 0 || *value > static_cast<std::int64_t>(UINT32_MAX)) {
        return Err(Error(ErrorCode::InvalidArgument,
            std::string("Value out of range for '") + key + "'"));
    }

    out = static_cast<std::uint32_t>(*value);
    return Ok();
}

Result<void> read_string(const toml::table& tbl, const char* key, std::string& out) {
    auto node = tbl[key];
    if (!node) {
        return Ok();
    }

    auto value = node.value<std::string>();
    if (!value) {
        return Err(Error(ErrorCode::ParseError,
            std::string("Expected string for '") + key + "'"));
    }

    out = *value;
    return Ok();
}

} // anonymous namespace

Result<BridgeConfig> parse_config(const std::string& content, const std::string& source_name) {
    BridgeConfig config;

    try {
        toml::table tbl = toml::parse(content, source_name);

        if (auto conn = tbl["connection"].as_table()) {
            if (auto r = read_string(*conn, "name", config.connection_name); !r) {
                return Err<BridgeConfig>(r.error());
            }
            if (auto r = read_u32(*conn, "timeout_ms", config.connection_timeout_ms); !r) {
                return Err<BridgeConfig>(r.error());
            }
        }

        if (auto buffers = tbl["buffers"].as_table()) {
            for (auto [key, field] : {
                     std::pair{"message_node_count", &config.message_node_count},
                     std::pair{"message_node_size", &config.message_node_size},
                     std::pair{"pixel_node_count", &config.pixel_node_count},
                     std::pair{"pixel_node_size", &config.pixel_node_size}}) {
                if (auto r = read_u32(*buffers, key, *field); !r) {
                    return Err<BridgeConfig>(r.error());
                }
            }
        }

        if (auto timing = tbl["timing"].as_table()) {
            for (auto [key, field] : {
                     std::pair{"read_wait_ms", &config.read_wait_ms},
                     std::pair{"write_wait_ms", &config.write_wait_ms},
                     std::pair{"disconnect_wait_ms", &config.disconnect_wait_ms}}) {
                if (auto r = read_u32(*timing, key, *field); !r) {
                    return Err<BridgeConfig>(r.error());
                }
            }

            std::uint32_t threshold = static_cast<std::uint32_t>(config.outbound_warn_threshold);
            if (auto r = read_u32(*timing, "outbound_warn_threshold", threshold); !r) {
                return Err<BridgeConfig>(r.error());
            }
            config.outbound_warn_threshold = threshold;
        }

        if (auto logging = tbl["logging"].as_table()) {
            if (auto r = read_string(*logging, "level", config.log_level); !r) {
                return Err<BridgeConfig>(r.error());
            }
            if (auto r = read_string(*logging, "directory", config.log_directory); !r) {
                return Err<BridgeConfig>(r.error());
            }
        }

    } catch (const toml::parse_error& err) {
        return Err<BridgeConfig>(Error(ErrorCode::ParseError,
            "TOML parse error: " + std::string(err.what())));
    }

    if (auto r = validate_config(config); !r) {
        return Err<BridgeConfig>(r.error());
    }

    return config;
}

Result<BridgeConfig> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<BridgeConfig>(Error(ErrorCode::IOError,
            "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_config(buffer.str(), path.string());
    if (config) {
        core_logger()->debug("Loaded config from {} (connection '{}')", path.string(), config->connection_name);
    }
    return config;
}

Result<void> validate_config(const BridgeConfig& config) {
    if (config.connection_name.empty()) {
        return Err(Error(ErrorCode::InvalidArgument, "Connection name must not be empty"));
    }
    if (config.message_node_count == 0 || config.pixel_node_count == 0) {
        return Err(Error(ErrorCode::InvalidArgument, "Node counts must be positive"));
    }
    if (config.message_node_size < k_min_node_size) {
        return Err(Error(ErrorCode::InvalidArgument,
            "message_node_size must hold at least one frame header"));
    }
    if (config.pixel_node_size < 12) {
        return Err(Error(ErrorCode::InvalidArgument,
            "pixel_node_size must hold a render frame header"));
    }
    if (!parse_log_level(config.log_level)) {
        return Err(Error(ErrorCode::InvalidArgument, "Unknown log level: " + config.log_level));
    }
    return Ok();
}

void apply_logging_config(const BridgeConfig& config) {
    LogConfig log_config;
    log_config.level = parse_log_level(config.log_level).value_or(spdlog::level::info);
    log_config.log_directory = config.log_directory;
    configure_logging(log_config);
}

} // namespace coherence_core
