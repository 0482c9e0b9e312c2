/// @file error.cpp
/// @brief Error formatting and API error counters

#include <coherence/core/error.hpp>
#include <coherence/core/log.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <atomic>

namespace coherence_core {

namespace {

const char* ipc_kind_name(IpcError::Kind kind) {
    switch (kind) {
        case IpcError::Kind::ChannelNotFound: return "ChannelNotFound";
        case IpcError::Kind::ChannelExists: return "ChannelExists";
        case IpcError::Kind::MapFailed: return "MapFailed";
        case IpcError::Kind::DimensionMismatch: return "DimensionMismatch";
        case IpcError::Kind::ChannelClosed: return "ChannelClosed";
        case IpcError::Kind::FrameDesync: return "FrameDesync";
        case IpcError::Kind::PayloadTooLarge: return "PayloadTooLarge";
        default: return "Unknown";
    }
}

const char* scene_kind_name(SceneError::Kind kind) {
    switch (kind) {
        case SceneError::Kind::NotFound: return "NotFound";
        case SceneError::Kind::AlreadyExists: return "AlreadyExists";
        case SceneError::Kind::NotConnected: return "NotConnected";
        case SceneError::Kind::InboundNotSupported: return "InboundNotSupported";
        case SceneError::Kind::InvalidValue: return "InvalidValue";
        default: return "Unknown";
    }
}

constexpr std::size_t k_code_count = static_cast<std::size_t>(ErrorCode::NotSupported) + 1;

std::array<std::atomic<std::uint64_t>, k_code_count> s_counts{};

} // anonymous namespace

// =============================================================================
// Formatting
// =============================================================================

std::string format_error(const Error& error) {
    std::string out = fmt::format("[{}] ", error_code_name(error.code()));

    if (const auto* ipc = error.as<IpcError>()) {
        out += fmt::format("[IpcError:{}] {}", ipc_kind_name(ipc->kind), ipc->message);
        if (!ipc->channel.empty()) {
            out += fmt::format(" (channel: {})", ipc->channel);
        }
    } else if (const auto* scene = error.as<SceneError>()) {
        out += fmt::format("[SceneError:{}] {}", scene_kind_name(scene->kind), scene->message);
        if (!scene->entity.empty()) {
            out += fmt::format(" (entity: {})", scene->entity);
        }
    } else {
        out += error.message();
    }

    return out;
}

// =============================================================================
// Counters
// =============================================================================

namespace debug {

void record_error(const Error& error) {
    const auto index = static_cast<std::size_t>(error.code());
    if (index < k_code_count) {
        s_counts[index].fetch_add(1, std::memory_order_relaxed);
    }
    core_logger()->trace("Recorded {} error", error_code_name(error.code()));
}

std::uint64_t error_count(ErrorCode code) {
    const auto index = static_cast<std::size_t>(code);
    return index < k_code_count ? s_counts[index].load(std::memory_order_relaxed) : 0;
}

std::uint64_t total_error_count() {
    std::uint64_t total = 0;
    for (const auto& count : s_counts) {
        total += count.load(std::memory_order_relaxed);
    }
    return total;
}

void reset_error_stats() {
    for (auto& count : s_counts) {
        count.store(0, std::memory_order_relaxed);
    }
}

} // namespace debug

} // namespace coherence_core
