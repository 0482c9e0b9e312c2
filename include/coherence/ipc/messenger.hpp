#pragma once

/// @file messenger.hpp
/// @brief Typed, targeted messages over a pair of ring buffers
///
/// The Messenger owns the inbound and outbound rings of one connection plus
/// the outbound queue. Producers enqueue; the poll loop drains the queue
/// with process_outbound_queue() and pulls inbound messages with read().

#include "fwd.hpp"
#include "ring_buffer.hpp"
#include "wire.hpp"

#include <coherence/core/error.hpp>

#include <chrono>
#include <concepts>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace coherence_ipc {

// =============================================================================
// Array Sources
// =============================================================================

/// Contiguous arrays that can be sent with queue_array()
template<typename A>
concept ArraySource = requires(const A& a) {
    typename A::value_type;
    { a.data() } -> std::convertible_to<const typename A::value_type*>;
    { a.size() } -> std::convertible_to<std::size_t>;
} && WireValue<typename A::value_type>;

// =============================================================================
// OutboundMessage
// =============================================================================

/// A queued message. Single values carry a payload snapshot; arrays carry a
/// producer that copies the array's contents when the node is written.
struct OutboundMessage {
    using ArrayProducer = std::function<std::size_t(std::span<std::byte>)>;
    using ArraySize = std::function<std::size_t()>;

    std::string target;
    MessageHeader header{};
    std::vector<std::byte> payload;

    ArrayProducer producer;
    ArraySize array_bytes;
    std::size_t element_size = 0;
    const void* array_ref = nullptr;

    [[nodiscard]] bool is_array() const noexcept { return static_cast<bool>(producer); }

    /// Payload size if written now
    [[nodiscard]] std::size_t payload_size() const {
        return is_array() ? array_bytes() : payload.size();
    }

    [[nodiscard]] bool same_slot(RpcRequest type, const std::string& other_target, std::int32_t index) const {
        return header.type == type && header.index == index && target == other_target;
    }
};

// =============================================================================
// Messenger
// =============================================================================

class Messenger {
public:
    /// Handles one inbound message; returns payload bytes consumed
    using Dispatcher = std::function<std::size_t(
        const std::string& target, const MessageHeader& header, std::span<const std::byte> payload)>;

    explicit Messenger(std::size_t warn_threshold = 10);
    ~Messenger();

    // Non-copyable
    Messenger(const Messenger&) = delete;
    Messenger& operator=(const Messenger&) = delete;

    // =========================================================================
    // Connection
    // =========================================================================

    /// Create both rings
    [[nodiscard]] coherence_core::Result<void> connect_as_master(
        const std::string& inbound_name, const std::string& outbound_name,
        std::uint32_t node_count, std::uint32_t node_size);

    /// Attach to rings created by the peer. Zero dimensions accept the master's layout.
    [[nodiscard]] coherence_core::Result<void> connect_as_slave(
        const std::string& inbound_name, const std::string& outbound_name,
        std::uint32_t node_count = 0, std::uint32_t node_size = 0);

    /// Release both rings. Queued messages are kept until clear_queue().
    void close();

    [[nodiscard]] bool is_connected() const noexcept { return m_inbound && m_outbound; }
    [[nodiscard]] bool is_master() const noexcept { return m_outbound && m_outbound->is_master(); }

    /// Outbound node capacity, 0 while disconnected
    [[nodiscard]] std::uint32_t node_size() const noexcept {
        return m_outbound ? m_outbound->node_size() : 0;
    }

    // =========================================================================
    // Queuing
    // =========================================================================

    /// Append a single-value message
    template<WireValue T>
    void queue(RpcRequest type, const std::string& target, const T& value) {
        m_queue.push_back(make_message(type, target, value));
    }

    /// Append a message with no payload
    void queue_signal(RpcRequest type, const std::string& target);

    /// Overwrite the payload of a queued message in the same slot, keeping
    /// its position, or append if there is none.
    /// @return true if a queued message was replaced
    template<WireValue T>
    bool replace_or_queue(RpcRequest type, const std::string& target, const T& value) {
        for (auto& msg : m_queue) {
            if (!msg.is_array() && msg.same_slot(type, target, 0)) {
                msg.payload.resize(sizeof(T));
                std::memcpy(msg.payload.data(), &value, sizeof(T));
                return true;
            }
        }
        queue(type, target, value);
        return false;
    }

    /// Drop any queued message in the same slot and append at the back.
    /// Used for notifications that must follow everything queued before them.
    template<WireValue T>
    void requeue(RpcRequest type, const std::string& target, const T& value) {
        std::erase_if(m_queue, [&](const OutboundMessage& msg) {
            return !msg.is_array() && msg.same_slot(type, target, 0);
        });
        queue(type, target, value);
    }

    /// Queue an array by reference. Its contents are copied when the message
    /// is written, so the peer always receives the current data. An array
    /// already queued in the same slot is not queued twice.
    /// @throws coherence_core::ErrorException if the frame cannot fit in one node
    ///         or the messenger is not connected
    template<ArraySource A>
    void queue_array(RpcRequest type, const std::string& target, const A& array) {
        using T = typename A::value_type;

        const std::size_t bytes = array.size() * sizeof(T);
        check_array_fits(target, bytes);

        OutboundMessage msg;
        msg.target = target;
        msg.header = MessageHeader{type, 0, 0};
        msg.element_size = sizeof(T);
        msg.array_ref = &array;
        msg.array_bytes = [&array]() { return array.size() * sizeof(T); };
        msg.producer = [&array](std::span<std::byte> dest) -> std::size_t {
            const std::size_t size = array.size() * sizeof(T);
            if (size > dest.size()) {
                return 0;
            }
            if (size > 0) {
                std::memcpy(dest.data(), array.data(), size);
            }
            return size;
        };

        for (auto& queued : m_queue) {
            if (queued.is_array() && queued.same_slot(type, target, 0)) {
                queued = std::move(msg);
                return;
            }
        }
        m_queue.push_back(std::move(msg));
    }

    /// Drop every queued array message for a target whose storage is about to go away
    std::size_t discard_queued(const std::string& target);

    /// Drop everything queued
    void clear_queue() noexcept { m_queue.clear(); }

    [[nodiscard]] std::size_t queued_count() const noexcept { return m_queue.size(); }
    [[nodiscard]] const std::deque<OutboundMessage>& queued_messages() const noexcept { return m_queue; }

    // =========================================================================
    // Transfer
    // =========================================================================

    /// Write queued messages in order until the queue is empty or no node is
    /// available within `timeout`. The head message stays queued on timeout.
    /// @return number of messages written
    std::size_t process_outbound_queue(std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /// Read at most one message and hand it to `dispatch`.
    /// @return bytes read including framing, 0 if nothing arrived
    /// @throws coherence_core::ErrorException on a malformed frame or closed channel
    std::size_t read(const Dispatcher& dispatch, std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /// Write a Disconnect message immediately, bypassing the queue
    /// @return true if the peer can receive it
    bool write_disconnect(std::chrono::milliseconds timeout);

    [[nodiscard]] std::uint64_t messages_written() const noexcept { return m_messages_written; }
    [[nodiscard]] std::uint64_t messages_read() const noexcept { return m_messages_read; }

private:
    template<WireValue T>
    static OutboundMessage make_message(RpcRequest type, const std::string& target, const T& value) {
        OutboundMessage msg;
        msg.target = target;
        msg.header = MessageHeader{type, 0, 0};
        msg.payload.resize(sizeof(T));
        std::memcpy(msg.payload.data(), &value, sizeof(T));
        return msg;
    }

    void check_array_fits(const std::string& target, std::size_t payload_bytes) const;

    /// Encode a message into a node, returns bytes used
    static std::size_t encode(const OutboundMessage& msg, std::span<std::byte> node);

    std::unique_ptr<RingBuffer> m_inbound;
    std::unique_ptr<RingBuffer> m_outbound;
    std::deque<OutboundMessage> m_queue;
    std::size_t m_warn_threshold;
    std::uint64_t m_messages_written = 0;
    std::uint64_t m_messages_read = 0;
};

} // namespace coherence_ipc
