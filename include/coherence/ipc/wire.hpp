#pragma once

/// @file wire.hpp
/// @brief Message framing shared by both processes
///
/// Every message occupies one ring node:
/// @code
/// [int32 target_len][target_len bytes UTF-8][MessageHeader][payload]
/// @endcode
/// All integers are little-endian and structures are packed to 1 byte.

#include "fwd.hpp"

#include <coherence/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>

namespace coherence_ipc {

// =============================================================================
// RpcRequest
// =============================================================================

/// Message type. Values are part of the wire format: append only.
enum class RpcRequest : std::uint8_t {
    Connect = 1,
    Disconnect,
    UpdateState,

    AddViewport,
    RemoveViewport,
    UpdateViewport,
    UpdateVisibleObjects,

    AddObject,
    RemoveObject,
    UpdateObject,

    AddComponent,
    DestroyComponent,
    UpdateComponent,
    UpdateProperties,

    UpdateVertices,
    UpdateNormals,
    UpdateVertexColors,
    UpdateUV,
    UpdateUV2,
    UpdateUV3,
    UpdateUV4,
    UpdateTriangles,

    AddImage,
    RemoveImage,
    UpdateImage,
    UpdateImageData,

    /// Apply all channel updates received for a mesh
    UpdateMesh,
};

inline constexpr std::uint8_t RPC_REQUEST_FIRST = static_cast<std::uint8_t>(RpcRequest::Connect);
inline constexpr std::uint8_t RPC_REQUEST_LAST = static_cast<std::uint8_t>(RpcRequest::UpdateMesh);

/// Check a raw type byte against the types this build understands
[[nodiscard]] constexpr bool is_known_request(std::uint8_t raw) noexcept {
    return raw >= RPC_REQUEST_FIRST && raw <= RPC_REQUEST_LAST;
}

/// Get request name
[[nodiscard]] inline const char* rpc_request_name(RpcRequest type) {
    switch (type) {
        case RpcRequest::Connect: return "Connect";
        case RpcRequest::Disconnect: return "Disconnect";
        case RpcRequest::UpdateState: return "UpdateState";
        case RpcRequest::AddViewport: return "AddViewport";
        case RpcRequest::RemoveViewport: return "RemoveViewport";
        case RpcRequest::UpdateViewport: return "UpdateViewport";
        case RpcRequest::UpdateVisibleObjects: return "UpdateVisibleObjects";
        case RpcRequest::AddObject: return "AddObject";
        case RpcRequest::RemoveObject: return "RemoveObject";
        case RpcRequest::UpdateObject: return "UpdateObject";
        case RpcRequest::AddComponent: return "AddComponent";
        case RpcRequest::DestroyComponent: return "DestroyComponent";
        case RpcRequest::UpdateComponent: return "UpdateComponent";
        case RpcRequest::UpdateProperties: return "UpdateProperties";
        case RpcRequest::UpdateVertices: return "UpdateVertices";
        case RpcRequest::UpdateNormals: return "UpdateNormals";
        case RpcRequest::UpdateVertexColors: return "UpdateVertexColors";
        case RpcRequest::UpdateUV: return "UpdateUV";
        case RpcRequest::UpdateUV2: return "UpdateUV2";
        case RpcRequest::UpdateUV3: return "UpdateUV3";
        case RpcRequest::UpdateUV4: return "UpdateUV4";
        case RpcRequest::UpdateTriangles: return "UpdateTriangles";
        case RpcRequest::AddImage: return "AddImage";
        case RpcRequest::RemoveImage: return "RemoveImage";
        case RpcRequest::UpdateImage: return "UpdateImage";
        case RpcRequest::UpdateImageData: return "UpdateImageData";
        case RpcRequest::UpdateMesh: return "UpdateMesh";
        default: return "Unknown";
    }
}

// =============================================================================
// Headers
// =============================================================================

#pragma pack(push, 1)

/// Follows the target string in every message
struct MessageHeader {
    RpcRequest type;
    /// First element index for array payloads
    std::int32_t index;
    /// Element count for array payloads, 0 for single values
    std::int32_t count;
};

/// Prefix of every node on the pixel ring, followed by RGB24 pixels
struct RenderFrameHeader {
    std::int32_t viewport_id;
    std::int32_t width;
    std::int32_t height;
};

#pragma pack(pop)

static_assert(sizeof(MessageHeader) == 9, "MessageHeader is part of the wire format");
static_assert(sizeof(RenderFrameHeader) == 12, "RenderFrameHeader is part of the wire format");

// =============================================================================
// Fixed Strings
// =============================================================================

/// Fixed 64 byte UTF-8 string, NUL terminated, as embedded in flat values
struct InteropString64 {
    static constexpr std::size_t CAPACITY = 64;
    static constexpr std::size_t MAX_LENGTH = CAPACITY - 1;

    char buffer[CAPACITY];

    InteropString64() noexcept { std::memset(buffer, 0, CAPACITY); }

    /// @throws coherence_core::ErrorException if `value` has more than MAX_LENGTH bytes
    explicit InteropString64(std::string_view value) : InteropString64() {
        if (value.size() > MAX_LENGTH) {
            throw coherence_core::ErrorException(coherence_core::SceneError::invalid_value(
                std::string(value), "longer than " + std::to_string(MAX_LENGTH) + " bytes"));
        }
        std::memcpy(buffer, value.data(), value.size());
    }

    [[nodiscard]] static bool fits(std::string_view value) noexcept {
        return value.size() <= MAX_LENGTH;
    }

    [[nodiscard]] std::string str() const {
        return std::string(buffer, strnlen(buffer, CAPACITY));
    }

    [[nodiscard]] bool empty() const noexcept { return buffer[0] == '\0'; }

    bool operator==(const InteropString64& other) const noexcept {
        return std::strncmp(buffer, other.buffer, CAPACITY) == 0;
    }
};

static_assert(sizeof(InteropString64) == 64, "InteropString64 is part of the wire format");

/// Bytes taken by framing before the payload
[[nodiscard]] inline std::size_t frame_overhead(const std::string& target) noexcept {
    return sizeof(std::int32_t) + target.size() + sizeof(MessageHeader);
}

/// Values that may be copied straight into a node
template<typename T>
concept WireValue = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;

// =============================================================================
// Channel Names
// =============================================================================

/// Source to destination messages
[[nodiscard]] inline std::string destination_messages_name(const std::string& connection) {
    return connection + "_DestinationMessages";
}

/// Destination to source messages
[[nodiscard]] inline std::string source_messages_name(const std::string& connection) {
    return connection + "_SourceMessages";
}

/// Rendered viewport frames, destination to source
[[nodiscard]] inline std::string viewport_pixels_name(const std::string& connection) {
    return connection + "_ViewportPixels";
}

} // namespace coherence_ipc
