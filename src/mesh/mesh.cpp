/// @file mesh.cpp
/// @brief Mesh diff engine

#include <coherence/mesh/mesh.hpp>
#include <coherence/ipc/entity.hpp>
#include <coherence/ipc/messenger.hpp>
#include <coherence/core/log.hpp>

namespace coherence_mesh {

using coherence_core::Err;
using coherence_core::Ok;
using coherence_core::SceneError;
using coherence_ipc::RpcRequest;

namespace {

RpcRequest uv_request(std::size_t layer) {
    return static_cast<RpcRequest>(static_cast<std::uint8_t>(RpcRequest::UpdateUV) + layer);
}

std::span<const MLoopUV> layer_or_empty(std::span<const std::span<const MLoopUV>> layers, std::size_t index) {
    return index < layers.size() ? layers[index] : std::span<const MLoopUV>{};
}

} // anonymous namespace

Mesh::Mesh(std::string name)
    : m_name(std::move(name)) {}

InteropMesh Mesh::serialize() const {
    InteropMesh data{};
    data.name = coherence_ipc::InteropString64(m_name);
    data.vertex_count = static_cast<std::int32_t>(m_vertices.size());
    data.triangle_count = static_cast<std::int32_t>(m_triangles.size() / 3);

    data.uv_layer_mask = 0;
    for (std::size_t layer = 0; layer < MAX_UV_LAYERS; ++layer) {
        if (!m_uvs[layer].empty()) {
            data.uv_layer_mask |= 1u << layer;
        }
    }
    data.has_colors = m_colors.empty() ? 0 : 1;
    return data;
}

coherence_core::Result<void> Mesh::apply_inbound(const InteropMesh&) {
    return Err(SceneError::inbound_not_supported(m_name));
}

// =============================================================================
// Diffing
// =============================================================================

coherence_core::Result<void> Mesh::validate(
    std::span<const MVert> verts,
    std::span<const MLoop> loops,
    std::span<const MLoopTri> loop_tris,
    std::span<const MLoopCol> loop_cols,
    std::span<const std::span<const MLoopUV>> uv_layers) const
{
    for (const auto& loop : loops) {
        if (loop.v >= verts.size()) {
            return Err(SceneError::invalid_value(m_name,
                "loop references vertex " + std::to_string(loop.v) +
                " of " + std::to_string(verts.size())));
        }
    }

    for (const auto& tri : loop_tris) {
        for (auto corner : tri.tri) {
            if (corner >= loops.size()) {
                return Err(SceneError::invalid_value(m_name,
                    "triangle references corner " + std::to_string(corner) +
                    " of " + std::to_string(loops.size())));
            }
        }
    }

    if (!loop_cols.empty() && loop_cols.size() != loops.size()) {
        return Err(SceneError::invalid_value(m_name, "color count does not match corner count"));
    }

    for (const auto& layer : uv_layers) {
        if (!layer.empty() && layer.size() != loops.size()) {
            return Err(SceneError::invalid_value(m_name, "UV count does not match corner count"));
        }
    }

    return Ok();
}

coherence_core::Result<void> Mesh::copy_mesh_data(
    std::span<const MVert> verts,
    std::span<const MLoop> loops,
    std::span<const MLoopTri> loop_tris,
    std::span<const MLoopCol> loop_cols,
    std::span<const std::span<const MLoopUV>> uv_layers)
{
    if (auto valid = validate(verts, loops, loop_tris, loop_cols, uv_layers); !valid) {
        return valid;
    }

    if (uv_layers.size() > MAX_UV_LAYERS) {
        coherence_core::mesh_logger()->warn("Mesh '{}' has {} UV layers, only {} are sent",
            m_name, uv_layers.size(), MAX_UV_LAYERS);
    }

    const bool full_rebuild = verts.size() != m_source_verts.size() || !m_source_loops.equals(loops);

    if (full_rebuild) {
        m_source_verts.copy_from(verts);
        m_source_loops.copy_from(loops);
        m_source_tris.copy_from(loop_tris);
        m_source_cols.copy_from(loop_cols);
        for (std::size_t layer = 0; layer < MAX_UV_LAYERS; ++layer) {
            m_source_uvs[layer].copy_from(layer_or_empty(uv_layers, layer));
        }

        rebuild_all();

        coherence_core::mesh_logger()->debug("Rebuilt mesh '{}': {} source vertices, {} splits, {} triangles",
            m_name, m_source_verts.size(), m_split_origins.size(), m_source_tris.size());
        return Ok();
    }

    bool remapped = false;

    // Positions and normals come from the same array
    if (!m_source_verts.equals(verts)) {
        m_source_verts.copy_from(verts);
        rebuild_vertices();
    }

    if (!m_source_cols.equals(loop_cols)) {
        m_source_cols.copy_from(loop_cols);
        remapped |= rebuild_buffer(m_colors, m_source_cols, [](const MLoopCol& col) { return to_interop(col); });
    }

    for (std::size_t layer = 0; layer < MAX_UV_LAYERS; ++layer) {
        auto source = layer_or_empty(uv_layers, layer);
        if (!m_source_uvs[layer].equals(source)) {
            m_source_uvs[layer].copy_from(source);
            remapped |= rebuild_buffer(m_uvs[layer], m_source_uvs[layer], [](const MLoopUV& uv) { return to_interop(uv); });
        }
    }

    // A corner that moved to another vertex changes the index buffer even
    // when the vertex count does not
    if (remapped || !m_source_tris.equals(loop_tris)) {
        m_source_tris.copy_from(loop_tris);
        rebuild_triangles();
    }

    return Ok();
}

void Mesh::rebuild_all() {
    ++m_full_rebuilds;

    clear_splits();
    rebuild_vertices();

    // Cleared first so splits raised by earlier channels skip them
    m_colors.clear();
    for (auto& uv : m_uvs) {
        uv.clear();
    }

    rebuild_buffer(m_colors, m_source_cols, [](const MLoopCol& col) { return to_interop(col); });
    for (std::size_t layer = 0; layer < MAX_UV_LAYERS; ++layer) {
        rebuild_buffer(m_uvs[layer], m_source_uvs[layer], [](const MLoopUV& uv) { return to_interop(uv); });
    }

    rebuild_triangles();
}

void Mesh::rebuild_vertices() {
    const std::size_t base_count = m_source_verts.size();
    const std::size_t total = base_count + m_split_origins.size();

    m_vertices.resize(total);
    m_normals.resize(total);

    for (std::size_t i = 0; i < base_count; ++i) {
        m_vertices.set(i, to_position(m_source_verts[i]));
        m_normals.set(i, to_normal(m_source_verts[i]));
    }

    for (std::size_t k = 0; k < m_split_origins.size(); ++k) {
        const std::uint32_t origin = m_split_origins[k];
        m_vertices.set(base_count + k, m_vertices[origin]);
        m_normals.set(base_count + k, m_normals[origin]);
    }
}

template<typename S, typename D, typename Convert>
bool Mesh::rebuild_buffer(ArrayBuffer<D>& target, const SourceArray<S>& source, Convert convert) {
    if (source.empty()) {
        target.clear();
        return false;
    }

    bool remapped = false;

    target.resize(m_vertices.size());
    std::vector<bool> written(m_vertices.size(), false);

    const auto corners = static_cast<std::uint32_t>(m_source_loops.size());
    for (std::uint32_t corner = 0; corner < corners; ++corner) {
        const D value = convert(source[corner]);
        const std::uint32_t index = resolve(corner);

        if (!written[index]) {
            target.set(index, value);
            written[index] = true;
            continue;
        }

        if (target[index] == value) {
            continue;
        }

        const std::uint32_t base = m_source_loops[corner].v;
        if (auto match = find_matching_vertex(base, index, target, value, written)) {
            if (*match == base) {
                m_split_map.erase(corner);
            } else {
                m_split_map[corner] = *match;
            }
            remapped = true;
            continue;
        }

        const std::uint32_t new_index = split(corner, index);
        written.push_back(true);
        target.set(new_index, value);
        remapped = true;
    }

    return remapped;
}

template<typename D>
std::optional<std::uint32_t> Mesh::find_matching_vertex(
    std::uint32_t base, std::uint32_t current, const ArrayBuffer<D>& target,
    const D& value, const std::vector<bool>& written) const
{
    auto matches = [&](std::uint32_t candidate) {
        return candidate != current
            && candidate < written.size()
            && written[candidate]
            && target[candidate] == value
            && same_vertex_data(candidate, current, &target);
    };

    if (matches(base)) {
        return base;
    }

    auto it = m_vertex_splits.find(base);
    if (it != m_vertex_splits.end()) {
        for (auto candidate : it->second) {
            if (matches(candidate)) {
                return candidate;
            }
        }
    }

    return std::nullopt;
}

bool Mesh::same_vertex_data(std::size_t a, std::size_t b, const void* skip) const {
    auto equal = [&](const auto& buffer) {
        if (static_cast<const void*>(&buffer) == skip || buffer.empty() ||
            a >= buffer.size() || b >= buffer.size()) {
            return true;
        }
        return buffer[a] == buffer[b];
    };

    if (!equal(m_vertices) || !equal(m_normals) || !equal(m_colors)) {
        return false;
    }
    for (const auto& uv : m_uvs) {
        if (!equal(uv)) {
            return false;
        }
    }
    return true;
}

std::uint32_t Mesh::split(std::uint32_t corner, std::uint32_t from_index) {
    const auto new_index = static_cast<std::uint32_t>(m_vertices.size());
    const std::uint32_t base = m_source_loops[corner].v;

    m_split_map[corner] = new_index;
    m_vertex_splits[base].push_back(new_index);
    m_split_origins.push_back(base);

    for_each_channel([from_index](auto& buffer) { buffer.append_copy(from_index); });

    return new_index;
}

void Mesh::rebuild_triangles() {
    m_triangles.resize(m_source_tris.size() * 3);

    for (std::size_t t = 0; t < m_source_tris.size(); ++t) {
        const auto& tri = m_source_tris[t];

        // Reversed winding for the handedness flip in to_position()
        m_triangles.set(t * 3 + 0, static_cast<std::int32_t>(resolve(tri.tri[2])));
        m_triangles.set(t * 3 + 1, static_cast<std::int32_t>(resolve(tri.tri[1])));
        m_triangles.set(t * 3 + 2, static_cast<std::int32_t>(resolve(tri.tri[0])));
    }
}

std::uint32_t Mesh::resolve(std::uint32_t corner) const {
    auto it = m_split_map.find(corner);
    if (it != m_split_map.end()) {
        return it->second;
    }
    return m_source_loops[corner].v;
}

void Mesh::clear_splits() {
    m_split_map.clear();
    m_vertex_splits.clear();
    m_split_origins.clear();
}

template<typename F>
void Mesh::for_each_channel(F&& func) {
    func(m_vertices);
    func(m_normals);
    func(m_colors);
    for (auto& uv : m_uvs) {
        func(uv);
    }
}

// =============================================================================
// Sending
// =============================================================================

std::size_t Mesh::send_channels(coherence_ipc::Messenger& messenger, bool dirty_only) {
    std::size_t sent = 0;

    auto send = [&](RpcRequest type, const auto& buffer) {
        if (dirty_only && !buffer.is_dirty()) {
            return;
        }
        if (coherence_ipc::send_array(messenger, type, m_name, buffer)) {
            ++sent;
        }
    };

    send(RpcRequest::UpdateVertices, m_vertices);
    send(RpcRequest::UpdateNormals, m_normals);
    send(RpcRequest::UpdateVertexColors, m_colors);
    for (std::size_t layer = 0; layer < MAX_UV_LAYERS; ++layer) {
        send(uv_request(layer), m_uvs[layer]);
    }
    send(RpcRequest::UpdateTriangles, m_triangles);

    return sent;
}

std::size_t Mesh::send_all(coherence_ipc::Messenger& messenger) {
    const std::size_t sent = send_channels(messenger, false);
    messenger.requeue(RpcRequest::UpdateMesh, m_name, serialize());
    clean_all();
    return sent;
}

std::size_t Mesh::send_dirty(coherence_ipc::Messenger& messenger) {
    const std::size_t sent = send_channels(messenger, true);
    if (sent > 0) {
        messenger.requeue(RpcRequest::UpdateMesh, m_name, serialize());
    }
    clean_all();
    return sent;
}

void Mesh::clean_all() noexcept {
    m_vertices.clean();
    m_normals.clean();
    m_colors.clean();
    for (auto& uv : m_uvs) {
        uv.clean();
    }
    m_triangles.clean();
}

std::size_t Mesh::dirty_channel_count() const noexcept {
    std::size_t count = 0;
    count += m_vertices.is_dirty() ? 1 : 0;
    count += m_normals.is_dirty() ? 1 : 0;
    count += m_colors.is_dirty() ? 1 : 0;
    for (const auto& uv : m_uvs) {
        count += uv.is_dirty() ? 1 : 0;
    }
    count += m_triangles.is_dirty() ? 1 : 0;
    return count;
}

} // namespace coherence_mesh
