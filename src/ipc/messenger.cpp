/// @file messenger.cpp
/// @brief Outbound queue, framing and dispatch

#include <coherence/ipc/messenger.hpp>
#include <coherence/core/log.hpp>

#include <algorithm>

namespace coherence_ipc {

using coherence_core::ErrorException;
using coherence_core::IpcError;
using coherence_core::SceneError;

Messenger::Messenger(std::size_t warn_threshold)
    : m_warn_threshold(warn_threshold) {}

Messenger::~Messenger() {
    close();
}

// =============================================================================
// Connection
// =============================================================================

coherence_core::Result<void> Messenger::connect_as_master(
    const std::string& inbound_name, const std::string& outbound_name,
    std::uint32_t node_count, std::uint32_t node_size)
{
    auto inbound = RingBuffer::create(inbound_name, node_count, node_size);
    if (!inbound) {
        return coherence_core::Err(inbound.error());
    }

    auto outbound = RingBuffer::create(outbound_name, node_count, node_size);
    if (!outbound) {
        return coherence_core::Err(outbound.error());
    }

    m_inbound = std::move(inbound).value();
    m_outbound = std::move(outbound).value();
    return coherence_core::Ok();
}

coherence_core::Result<void> Messenger::connect_as_slave(
    const std::string& inbound_name, const std::string& outbound_name,
    std::uint32_t node_count, std::uint32_t node_size)
{
    auto inbound = RingBuffer::open(inbound_name, node_count, node_size);
    if (!inbound) {
        return coherence_core::Err(inbound.error());
    }

    auto outbound = RingBuffer::open(outbound_name, node_count, node_size);
    if (!outbound) {
        return coherence_core::Err(outbound.error());
    }

    m_inbound = std::move(inbound).value();
    m_outbound = std::move(outbound).value();
    return coherence_core::Ok();
}

void Messenger::close() {
    if (m_inbound || m_outbound) {
        coherence_core::ipc_logger()->debug("Closing messenger ({} written, {} read, {} still queued)",
            m_messages_written, m_messages_read, m_queue.size());
    }
    m_inbound.reset();
    m_outbound.reset();
}

// =============================================================================
// Queuing
// =============================================================================

void Messenger::queue_signal(RpcRequest type, const std::string& target) {
    OutboundMessage msg;
    msg.target = target;
    msg.header = MessageHeader{type, 0, 0};
    m_queue.push_back(std::move(msg));
}

void Messenger::check_array_fits(const std::string& target, std::size_t payload_bytes) const {
    if (!m_outbound) {
        throw ErrorException(SceneError::not_connected());
    }

    const std::size_t frame = sizeof(std::int32_t) + target.size() + sizeof(MessageHeader) + payload_bytes;
    if (frame > m_outbound->node_size()) {
        throw ErrorException(IpcError::payload_too_large(target, frame, m_outbound->node_size()));
    }
}

std::size_t Messenger::discard_queued(const std::string& target) {
    const auto before = m_queue.size();
    m_queue.erase(
        std::remove_if(m_queue.begin(), m_queue.end(), [&target](const OutboundMessage& msg) {
            return msg.is_array() && msg.target == target;
        }),
        m_queue.end());
    return before - m_queue.size();
}

// =============================================================================
// Framing
// =============================================================================

std::size_t Messenger::encode(const OutboundMessage& msg, std::span<std::byte> node) {
    const auto target_len = static_cast<std::int32_t>(msg.target.size());
    std::size_t offset = 0;

    std::memcpy(node.data() + offset, &target_len, sizeof(target_len));
    offset += sizeof(target_len);

    std::memcpy(node.data() + offset, msg.target.data(), msg.target.size());
    offset += msg.target.size();

    MessageHeader header = msg.header;
    if (msg.is_array()) {
        header.index = 0;
        header.count = static_cast<std::int32_t>(msg.array_bytes() / msg.element_size);
    }
    std::memcpy(node.data() + offset, &header, sizeof(header));
    offset += sizeof(header);

    auto payload = node.subspan(offset);
    if (msg.is_array()) {
        offset += msg.producer(payload);
    } else if (!msg.payload.empty()) {
        std::memcpy(payload.data(), msg.payload.data(), msg.payload.size());
        offset += msg.payload.size();
    }

    return offset;
}

// =============================================================================
// Transfer
// =============================================================================

std::size_t Messenger::process_outbound_queue(std::chrono::milliseconds timeout) {
    if (!m_outbound || m_queue.empty()) {
        return 0;
    }

    if (m_queue.size() > m_warn_threshold) {
        coherence_core::ipc_logger()->warn("Outbound queue has {} messages waiting", m_queue.size());
    }

    std::size_t sent = 0;
    while (!m_queue.empty()) {
        const OutboundMessage& msg = m_queue.front();

        const std::size_t required = frame_overhead(msg.target) + msg.payload_size();
        if (required > m_outbound->node_size()) {
            // Array grew past the node size after it was queued
            coherence_core::ipc_logger()->error("Dropping {} for '{}': {} bytes exceeds node size {}",
                rpc_request_name(msg.header.type), msg.target, required, m_outbound->node_size());
            m_queue.pop_front();
            continue;
        }

        const std::size_t written = m_outbound->write(
            [&msg](std::span<std::byte> node) { return encode(msg, node); }, timeout);

        if (written == 0) {
            break;
        }

        coherence_core::ipc_logger()->trace("Sent {} for '{}' ({} bytes)",
            rpc_request_name(msg.header.type), msg.target, written);

        m_queue.pop_front();
        ++m_messages_written;
        ++sent;
    }

    return sent;
}

std::size_t Messenger::read(const Dispatcher& dispatch, std::chrono::milliseconds timeout) {
    if (!m_inbound) {
        return 0;
    }

    const std::string& channel = m_inbound->name();

    return m_inbound->read([&](std::span<const std::byte> node) -> std::size_t {
        std::int32_t target_len = 0;
        if (node.size() < sizeof(target_len) + sizeof(MessageHeader)) {
            throw ErrorException(IpcError::frame_desync(channel,
                "node of " + std::to_string(node.size()) + " bytes is too short for a frame"));
        }

        std::memcpy(&target_len, node.data(), sizeof(target_len));
        const std::size_t max_target = node.size() - sizeof(target_len) - sizeof(MessageHeader);
        if (target_len < 0 || static_cast<std::size_t>(target_len) > max_target) {
            throw ErrorException(IpcError::frame_desync(channel,
                "invalid target length " + std::to_string(target_len)));
        }

        std::size_t offset = sizeof(target_len);
        std::string target(reinterpret_cast<const char*>(node.data() + offset),
                           static_cast<std::size_t>(target_len));
        offset += static_cast<std::size_t>(target_len);

        MessageHeader header{};
        std::memcpy(&header, node.data() + offset, sizeof(header));
        offset += sizeof(header);

        ++m_messages_read;

        const auto raw_type = static_cast<std::uint8_t>(header.type);
        if (!is_known_request(raw_type)) {
            coherence_core::ipc_logger()->warn("Skipping unknown message type {} for '{}'", raw_type, target);
            return offset;
        }

        auto payload = node.subspan(offset);
        const std::size_t consumed = dispatch(target, header, payload);
        if (consumed > payload.size()) {
            coherence_core::ipc_logger()->warn("{} handler for '{}' consumed {} of {} payload bytes",
                rpc_request_name(header.type), target, consumed, payload.size());
        }

        coherence_core::ipc_logger()->trace("Received {} for '{}' ({} bytes)",
            rpc_request_name(header.type), target, offset + consumed);

        return offset + std::min(consumed, payload.size());
    }, timeout);
}

bool Messenger::write_disconnect(std::chrono::milliseconds timeout) {
    if (!m_outbound) {
        return false;
    }

    OutboundMessage msg;
    msg.header = MessageHeader{RpcRequest::Disconnect, 0, 0};

    const std::size_t written = m_outbound->write(
        [&msg](std::span<std::byte> node) { return encode(msg, node); }, timeout);

    if (written == 0) {
        coherence_core::ipc_logger()->warn("Peer did not take the disconnect notice within {}ms",
            timeout.count());
        return false;
    }
    return true;
}

} // namespace coherence_ipc
