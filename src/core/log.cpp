/// @file log.cpp
/// @brief Shared-sink logger registry

#include <coherence/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace coherence_core {

namespace {

constexpr const char* k_console_pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* k_file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [pid %P] %v";

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    std::vector<spdlog::sink_ptr> sinks;
    spdlog::level::level_enum level = spdlog::level::info;
    bool configured = false;
};

LoggerRegistry& registry() {
    static LoggerRegistry instance;
    return instance;
}

std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern(k_console_pattern);
        sinks.push_back(std::move(console));
    }

    if (!config.log_directory.empty()) {
        try {
            std::filesystem::create_directories(config.log_directory);
            const auto path = std::filesystem::path(config.log_directory) / "coherence.log";
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern(k_file_pattern);
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Logging to '{}' disabled: {}", config.log_directory, e.what());
        } catch (const std::filesystem::filesystem_error& e) {
            spdlog::warn("Logging to '{}' disabled: {}", config.log_directory, e.what());
        }
    }

    return sinks;
}

/// Caller holds the registry mutex
void ensure_configured(LoggerRegistry& reg) {
    if (!reg.configured) {
        reg.sinks = make_sinks(LogConfig{});
        reg.configured = true;
    }
}

} // anonymous namespace

void configure_logging(const LogConfig& config) {
    auto sinks = make_sinks(config);

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.sinks = std::move(sinks);
    reg.level = config.level;
    reg.configured = true;

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
        logger->sinks() = reg.sinks;
        logger->set_level(reg.level);
    }
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    ensure_configured(reg);

    auto logger = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
    logger->set_level(reg.level);
    logger->flush_on(spdlog::level::warn);
    reg.loggers.emplace(name, logger);

    // Several copies of this library may share one spdlog registry
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static auto logger = get_logger("coherence");
    return logger;
}

std::shared_ptr<spdlog::logger> ipc_logger() {
    static auto logger = get_logger("ipc");
    return logger;
}

std::shared_ptr<spdlog::logger> mesh_logger() {
    static auto logger = get_logger("mesh");
    return logger;
}

std::shared_ptr<spdlog::logger> scene_logger() {
    static auto logger = get_logger("scene");
    return logger;
}

std::shared_ptr<spdlog::logger> api_logger() {
    static auto logger = get_logger("api");
    return logger;
}

void shutdown_logging() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
        if (spdlog::get(name) == logger) {
            spdlog::drop(name);
        }
    }
}

} // namespace coherence_core
