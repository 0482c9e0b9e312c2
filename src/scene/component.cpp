/// @file component.cpp
/// @brief Component implementation

#include <coherence/scene/component.hpp>

#include <cstring>

namespace coherence_scene {

using coherence_core::Err;
using coherence_core::Error;
using coherence_core::ErrorCode;
using coherence_core::Ok;
using coherence_core::SceneError;

Component::Component(const std::string& name, const std::string& target)
    : m_key(make_key(target, name))
{
    m_data.name = InteropString64(name);
    m_data.target = InteropString64(target);
    m_data.enabled = 1;
}

coherence_core::Result<void> Component::apply_inbound(const InteropComponent& data) {
    if (!(data.name == m_data.name) || !(data.target == m_data.target)) {
        return Err(SceneError::invalid_value(m_key,
            "inbound data names '" + make_key(data.target.str(), data.name.str()) + "'"));
    }

    m_data.mesh = data.mesh;
    m_data.material = data.material;
    m_data.enabled = data.enabled;
    return Ok();
}

bool Component::set_properties(std::span<const InteropProperty> properties) {
    if (properties.size() == m_properties.size() &&
        (properties.empty() ||
         std::memcmp(properties.data(), m_properties.data(), properties.size_bytes()) == 0)) {
        return false;
    }
    m_properties.assign(properties.begin(), properties.end());
    return true;
}

coherence_core::Result<std::size_t> Component::apply_properties(
    const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload)
{
    if (header.count < 0) {
        return Err<std::size_t>(Error(ErrorCode::ProtocolError,
            "negative property count for '" + m_key + "'"));
    }

    const std::size_t bytes = static_cast<std::size_t>(header.count) * sizeof(InteropProperty);
    if (bytes > payload.size()) {
        return Err<std::size_t>(Error(ErrorCode::ProtocolError,
            std::to_string(header.count) + " properties do not fit a " +
            std::to_string(payload.size()) + " byte payload"));
    }

    m_properties.resize(static_cast<std::size_t>(header.count));
    if (bytes > 0) {
        std::memcpy(m_properties.data(), payload.data(), bytes);
    }
    return Ok(bytes);
}

const InteropProperty* Component::property(const std::string& name) const {
    for (const auto& prop : m_properties) {
        if (prop.name.str() == name) {
            return &prop;
        }
    }
    return nullptr;
}

} // namespace coherence_scene
