#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for coherence_ipc module

#include <cstdint>

namespace coherence_ipc {

class SharedMemoryRegion;
class RingBuffer;
struct RingBufferHeader;

enum class RpcRequest : std::uint8_t;
struct MessageHeader;
struct RenderFrameHeader;

struct OutboundMessage;
class Messenger;

} // namespace coherence_ipc
