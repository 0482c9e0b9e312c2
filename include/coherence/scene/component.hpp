#pragma once

/// @file component.hpp
/// @brief Named component attached to a scene object
///
/// The entity name combines target object and component as
/// "<object>:<component>" so coalescing and peer-side routing treat each
/// attachment as its own slot.

#include "fwd.hpp"
#include "interop.hpp"

#include <coherence/core/error.hpp>
#include <coherence/ipc/wire.hpp>

#include <span>
#include <string>
#include <vector>

namespace coherence_scene {

class Component {
public:
    using interop_type = InteropComponent;

    /// @throws coherence_core::ErrorException if either name does not fit an InteropString64
    Component(const std::string& name, const std::string& target);

    /// Directory key for a component
    [[nodiscard]] static std::string make_key(const std::string& target, const std::string& name) {
        return target + ":" + name;
    }

    [[nodiscard]] const std::string& name() const noexcept { return m_key; }
    [[nodiscard]] std::string component_name() const { return m_data.name.str(); }
    [[nodiscard]] std::string target() const { return m_data.target.str(); }

    [[nodiscard]] InteropComponent serialize() const { return m_data; }
    [[nodiscard]] coherence_core::Result<void> apply_inbound(const InteropComponent& data);

    [[nodiscard]] bool enabled() const noexcept { return m_data.enabled != 0; }
    void set_enabled(bool enabled) noexcept { m_data.enabled = enabled ? 1 : 0; }

    // =========================================================================
    // Properties
    // =========================================================================

    /// Replace the property list
    /// @return true if anything changed
    bool set_properties(std::span<const InteropProperty> properties);

    /// Replace the property list from an inbound array
    /// @return payload bytes consumed
    [[nodiscard]] coherence_core::Result<std::size_t> apply_properties(
        const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);

    [[nodiscard]] const std::vector<InteropProperty>& properties() const noexcept { return m_properties; }

    /// Find a property by name
    [[nodiscard]] const InteropProperty* property(const std::string& name) const;

private:
    std::string m_key;
    InteropComponent m_data{};
    std::vector<InteropProperty> m_properties;
};

} // namespace coherence_scene
