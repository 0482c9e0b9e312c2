#pragma once

/// @file mesh_buffers.hpp
/// @brief Destination-side mesh channels assembled from inbound arrays
///
/// Channel arrays arrive one message at a time and are staged. The staged
/// channels become visible together when the apply-changes notification
/// (RpcRequest::UpdateMesh) for the mesh arrives.

#include "fwd.hpp"
#include "array_buffer.hpp"
#include "mesh.hpp"
#include "types.hpp"

#include <coherence/core/error.hpp>
#include <coherence/ipc/wire.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace coherence_mesh {

class MeshBuffers {
public:
    explicit MeshBuffers(std::string name);

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    /// Stage one inbound channel array
    /// @return payload bytes consumed
    [[nodiscard]] coherence_core::Result<std::size_t> apply_array(
        coherence_ipc::RpcRequest type,
        const coherence_ipc::MessageHeader& header,
        std::span<const std::byte> payload);

    /// Publish staged channels. Channels whose length no longer matches the
    /// vertex count are dropped, as are colors and UV layers the mesh
    /// description marks absent.
    void apply_changes(const InteropMesh& info);

    /// True for the channel update types this class accepts
    [[nodiscard]] static bool is_channel_request(coherence_ipc::RpcRequest type) noexcept;

    [[nodiscard]] const ArrayBuffer<Vec3>& vertices() const noexcept { return m_vertices; }
    [[nodiscard]] const ArrayBuffer<Vec3>& normals() const noexcept { return m_normals; }
    [[nodiscard]] const ArrayBuffer<InteropColor32>& colors() const noexcept { return m_colors; }
    [[nodiscard]] const ArrayBuffer<Vec2>& uv(std::size_t layer) const { return m_uvs.at(layer); }
    [[nodiscard]] const ArrayBuffer<std::int32_t>& triangles() const noexcept { return m_triangles; }

    [[nodiscard]] const InteropMesh& info() const noexcept { return m_info; }

    /// Number of apply-changes notifications received
    [[nodiscard]] std::uint64_t version() const noexcept { return m_version; }

    /// Channels staged but not yet published
    [[nodiscard]] std::size_t staged_count() const noexcept;

private:
    template<typename T>
    [[nodiscard]] coherence_core::Result<std::size_t> stage(
        std::vector<T>& out, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload);

    std::string m_name;
    InteropMesh m_info{};
    std::uint64_t m_version = 0;

    ArrayBuffer<Vec3> m_vertices;
    ArrayBuffer<Vec3> m_normals;
    ArrayBuffer<InteropColor32> m_colors;
    std::array<ArrayBuffer<Vec2>, MAX_UV_LAYERS> m_uvs;
    ArrayBuffer<std::int32_t> m_triangles;

    std::optional<std::vector<Vec3>> m_staged_vertices;
    std::optional<std::vector<Vec3>> m_staged_normals;
    std::optional<std::vector<InteropColor32>> m_staged_colors;
    std::array<std::optional<std::vector<Vec2>>, MAX_UV_LAYERS> m_staged_uvs;
    std::optional<std::vector<std::int32_t>> m_staged_triangles;
};

} // namespace coherence_mesh
