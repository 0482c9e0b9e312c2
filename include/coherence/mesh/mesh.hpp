#pragma once

/// @file mesh.hpp
/// @brief Loop-aligned source mesh to deduplicated per-vertex buffers
///
/// The source hands over one entry per unique vertex plus per-corner
/// ("loop") attributes. The destination wants one entry per vertex for
/// every channel, so a vertex whose corners disagree on a color or UV is
/// split into several vertices. Each call to copy_mesh_data() compares the
/// new source arrays with the cached ones and rebuilds only what changed.

#include "fwd.hpp"
#include "array_buffer.hpp"
#include "types.hpp"

#include <coherence/core/error.hpp>
#include <coherence/ipc/fwd.hpp>
#include <coherence/ipc/wire.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace coherence_mesh {

/// Flat mesh description sent with the apply-changes notification
#pragma pack(push, 1)
struct InteropMesh {
    coherence_ipc::InteropString64 name;
    std::int32_t vertex_count;
    std::int32_t triangle_count;
    /// Bit n set when UV layer n is present
    std::uint32_t uv_layer_mask;
    std::int32_t has_colors;
};
#pragma pack(pop)

class Mesh {
public:
    using interop_type = InteropMesh;

    explicit Mesh(std::string name);

    // Non-copyable: queued array messages reference the channel buffers
    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    [[nodiscard]] InteropMesh serialize() const;

    /// Geometry is owned by the source side
    [[nodiscard]] coherence_core::Result<void> apply_inbound(const InteropMesh& data);

    // =========================================================================
    // Diffing
    // =========================================================================

    /// Diff new source arrays against the cached copies and rebuild the
    /// derived channels that changed.
    /// @param uv_layers one span per UV layer, at most MAX_UV_LAYERS are used
    [[nodiscard]] coherence_core::Result<void> copy_mesh_data(
        std::span<const MVert> verts,
        std::span<const MLoop> loops,
        std::span<const MLoopTri> loop_tris,
        std::span<const MLoopCol> loop_cols,
        std::span<const std::span<const MLoopUV>> uv_layers);

    // =========================================================================
    // Sending
    // =========================================================================

    /// Queue every non-empty channel and the apply-changes notification
    /// @return channels queued
    std::size_t send_all(coherence_ipc::Messenger& messenger);

    /// Queue only dirty channels, then apply-changes if anything was queued
    /// @return channels queued
    std::size_t send_dirty(coherence_ipc::Messenger& messenger);

    /// Clear every channel's dirty flag
    void clean_all() noexcept;

    // =========================================================================
    // Derived State
    // =========================================================================

    [[nodiscard]] const ArrayBuffer<Vec3>& vertices() const noexcept { return m_vertices; }
    [[nodiscard]] const ArrayBuffer<Vec3>& normals() const noexcept { return m_normals; }
    [[nodiscard]] const ArrayBuffer<InteropColor32>& colors() const noexcept { return m_colors; }
    [[nodiscard]] const ArrayBuffer<Vec2>& uv(std::size_t layer) const { return m_uvs.at(layer); }
    [[nodiscard]] const ArrayBuffer<std::int32_t>& triangles() const noexcept { return m_triangles; }

    /// Derived vertex index for a corner
    [[nodiscard]] std::uint32_t resolve(std::uint32_t corner) const;

    /// Corner to split vertex entries
    [[nodiscard]] const std::unordered_map<std::uint32_t, std::uint32_t>& split_map() const noexcept {
        return m_split_map;
    }

    /// Vertices added by splits since the last full rebuild
    [[nodiscard]] std::size_t split_count() const noexcept { return m_split_origins.size(); }

    [[nodiscard]] std::size_t source_vertex_count() const noexcept { return m_source_verts.size(); }
    [[nodiscard]] std::size_t triangle_count() const noexcept { return m_source_tris.size(); }
    [[nodiscard]] std::size_t dirty_channel_count() const noexcept;
    [[nodiscard]] std::uint64_t full_rebuild_count() const noexcept { return m_full_rebuilds; }

private:
    [[nodiscard]] coherence_core::Result<void> validate(
        std::span<const MVert> verts,
        std::span<const MLoop> loops,
        std::span<const MLoopTri> loop_tris,
        std::span<const MLoopCol> loop_cols,
        std::span<const std::span<const MLoopUV>> uv_layers) const;

    void rebuild_all();
    void rebuild_vertices();
    void rebuild_triangles();

    /// @return true when a corner was moved to another vertex
    template<typename S, typename D, typename Convert>
    bool rebuild_buffer(ArrayBuffer<D>& target, const SourceArray<S>& source, Convert convert);

    template<typename D>
    [[nodiscard]] std::optional<std::uint32_t> find_matching_vertex(
        std::uint32_t base, std::uint32_t current, const ArrayBuffer<D>& target,
        const D& value, const std::vector<bool>& written) const;

    [[nodiscard]] bool same_vertex_data(std::size_t a, std::size_t b, const void* skip) const;

    std::uint32_t split(std::uint32_t corner, std::uint32_t from_index);

    void clear_splits();

    template<typename F>
    void for_each_channel(F&& func);

    std::size_t send_channels(coherence_ipc::Messenger& messenger, bool dirty_only);

    std::string m_name;

    // Cached source arrays
    SourceArray<MVert> m_source_verts;
    SourceArray<MLoop> m_source_loops;
    SourceArray<MLoopTri> m_source_tris;
    SourceArray<MLoopCol> m_source_cols;
    std::array<SourceArray<MLoopUV>, MAX_UV_LAYERS> m_source_uvs;

    // Derived channels
    ArrayBuffer<Vec3> m_vertices;
    ArrayBuffer<Vec3> m_normals;
    ArrayBuffer<InteropColor32> m_colors;
    std::array<ArrayBuffer<Vec2>, MAX_UV_LAYERS> m_uvs;
    ArrayBuffer<std::int32_t> m_triangles;

    // Split bookkeeping
    std::unordered_map<std::uint32_t, std::uint32_t> m_split_map;
    std::unordered_map<std::uint32_t, std::vector<std::uint32_t>> m_vertex_splits;
    std::vector<std::uint32_t> m_split_origins;

    std::uint64_t m_full_rebuilds = 0;
};

} // namespace coherence_mesh
