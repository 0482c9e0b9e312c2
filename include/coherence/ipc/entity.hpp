#pragma once

/// @file entity.hpp
/// @brief Contract for synchronized entities and the generic send helpers
///
/// An entity exposes a stable name, a flat trivially copyable snapshot of
/// its state and a way to apply a snapshot received from the peer. The
/// helpers below move any such entity through a Messenger without knowing
/// its concrete type.

#include "messenger.hpp"
#include "wire.hpp"

#include <coherence/core/error.hpp>

#include <concepts>
#include <string>

namespace coherence_ipc {

/// Synchronized entity
template<typename E>
concept InteropEntity = requires(E& entity, const E& const_entity, const typename E::interop_type& flat) {
    typename E::interop_type;
    { const_entity.name() } -> std::convertible_to<std::string>;
    { const_entity.serialize() } -> std::same_as<typename E::interop_type>;
    { entity.apply_inbound(flat) } -> std::same_as<coherence_core::Result<void>>;
} && WireValue<typename E::interop_type>;

/// Announce a new entity
template<InteropEntity E>
void add_entity(Messenger& messenger, RpcRequest type, const E& entity) {
    messenger.queue(type, entity.name(), entity.serialize());
}

/// Send the latest state; an unsent update for the same entity is overwritten
template<InteropEntity E>
void send_entity(Messenger& messenger, RpcRequest type, const E& entity) {
    messenger.replace_or_queue(type, entity.name(), entity.serialize());
}

/// Announce removal and drop queued arrays that reference the entity's storage
template<InteropEntity E>
void remove_entity(Messenger& messenger, RpcRequest type, const E& entity) {
    messenger.discard_queued(entity.name());
    messenger.queue(type, entity.name(), entity.serialize());
}

/// Queue an array for `target`. Empty arrays are never sent.
/// @return true if the array was queued
template<ArraySource A>
bool send_array(Messenger& messenger, RpcRequest type, const std::string& target, const A& array) {
    if (array.size() < 1) {
        return false;
    }
    messenger.queue_array(type, target, array);
    return true;
}

/// Decode a single flat value from a payload
/// @return false if the payload is too short
template<WireValue T>
[[nodiscard]] bool read_value(std::span<const std::byte> payload, T& out) {
    if (payload.size() < sizeof(T)) {
        return false;
    }
    std::memcpy(&out, payload.data(), sizeof(T));
    return true;
}

} // namespace coherence_ipc
