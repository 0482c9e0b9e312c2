/// @file mesh_buffers.cpp
/// @brief Destination-side mesh channel assembly

#include <coherence/mesh/mesh_buffers.hpp>
#include <coherence/core/log.hpp>

#include <cstring>

namespace coherence_mesh {

using coherence_core::Err;
using coherence_core::Error;
using coherence_core::ErrorCode;
using coherence_core::Ok;
using coherence_ipc::RpcRequest;

namespace {

template<typename T>
void publish(ArrayBuffer<T>& live, std::optional<std::vector<T>>& staged) {
    if (staged) {
        live.assign(*staged);
        staged.reset();
    }
}

template<typename T>
bool drop_if_stale(ArrayBuffer<T>& buffer, std::size_t expected) {
    if (buffer.empty() || buffer.size() == expected) {
        return false;
    }
    buffer.clear();
    return true;
}

} // anonymous namespace

MeshBuffers::MeshBuffers(std::string name)
    : m_name(std::move(name)) {}

bool MeshBuffers::is_channel_request(RpcRequest type) noexcept {
    switch (type) {
        case RpcRequest::UpdateVertices:
        case RpcRequest::UpdateNormals:
        case RpcRequest::UpdateVertexColors:
        case RpcRequest::UpdateUV:
        case RpcRequest::UpdateUV2:
        case RpcRequest::UpdateUV3:
        case RpcRequest::UpdateUV4:
        case RpcRequest::UpdateTriangles:
            return true;
        default:
            return false;
    }
}

template<typename T>
coherence_core::Result<std::size_t> MeshBuffers::stage(
    std::vector<T>& out, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload)
{
    if (header.count < 0 || header.index != 0) {
        return Err<std::size_t>(Error(ErrorCode::ProtocolError,
            "bad array range index=" + std::to_string(header.index) +
            " count=" + std::to_string(header.count) + " for mesh '" + m_name + "'"));
    }

    const std::size_t bytes = static_cast<std::size_t>(header.count) * sizeof(T);
    if (bytes > payload.size()) {
        return Err<std::size_t>(Error(ErrorCode::ProtocolError,
            "array of " + std::to_string(header.count) + " elements needs " + std::to_string(bytes) +
            " bytes, payload has " + std::to_string(payload.size())));
    }

    // Payload is not necessarily aligned for T
    out.resize(static_cast<std::size_t>(header.count));
    if (bytes > 0) {
        std::memcpy(out.data(), payload.data(), bytes);
    }
    return Ok(bytes);
}

coherence_core::Result<std::size_t> MeshBuffers::apply_array(
    RpcRequest type, const coherence_ipc::MessageHeader& header, std::span<const std::byte> payload)
{
    switch (type) {
        case RpcRequest::UpdateVertices:
            return stage(m_staged_vertices.emplace(), header, payload);
        case RpcRequest::UpdateNormals:
            return stage(m_staged_normals.emplace(), header, payload);
        case RpcRequest::UpdateVertexColors:
            return stage(m_staged_colors.emplace(), header, payload);
        case RpcRequest::UpdateUV:
        case RpcRequest::UpdateUV2:
        case RpcRequest::UpdateUV3:
        case RpcRequest::UpdateUV4: {
            const auto layer = static_cast<std::size_t>(type) - static_cast<std::size_t>(RpcRequest::UpdateUV);
            return stage(m_staged_uvs[layer].emplace(), header, payload);
        }
        case RpcRequest::UpdateTriangles:
            return stage(m_staged_triangles.emplace(), header, payload);
        default:
            return Err<std::size_t>(Error(ErrorCode::InvalidArgument,
                std::string(coherence_ipc::rpc_request_name(type)) + " is not a mesh channel"));
    }
}

void MeshBuffers::apply_changes(const InteropMesh& info) {
    publish(m_vertices, m_staged_vertices);
    publish(m_normals, m_staged_normals);
    publish(m_colors, m_staged_colors);
    for (std::size_t layer = 0; layer < MAX_UV_LAYERS; ++layer) {
        publish(m_uvs[layer], m_staged_uvs[layer]);
    }
    publish(m_triangles, m_staged_triangles);

    m_info = info;
    ++m_version;

    const auto vertex_count = static_cast<std::size_t>(info.vertex_count < 0 ? 0 : info.vertex_count);

    if (m_vertices.size() != vertex_count) {
        coherence_core::mesh_logger()->warn("Mesh '{}' announced {} vertices but holds {}",
            m_name, vertex_count, m_vertices.size());
    }

    std::size_t dropped = 0;
    dropped += drop_if_stale(m_normals, m_vertices.size()) ? 1 : 0;
    dropped += drop_if_stale(m_colors, m_vertices.size()) ? 1 : 0;
    for (auto& uv : m_uvs) {
        dropped += drop_if_stale(uv, m_vertices.size()) ? 1 : 0;
    }
    if (info.has_colors == 0) {
        m_colors.clear();
    }
    for (std::size_t layer = 0; layer < MAX_UV_LAYERS; ++layer) {
        if ((info.uv_layer_mask & (1u << layer)) == 0) {
            m_uvs[layer].clear();
        }
    }

    if (dropped > 0) {
        coherence_core::mesh_logger()->debug("Mesh '{}' dropped {} stale channels", m_name, dropped);
    }

    coherence_core::mesh_logger()->debug("Mesh '{}' v{}: {} vertices, {} triangles",
        m_name, m_version, m_vertices.size(), m_triangles.size() / 3);
}

std::size_t MeshBuffers::staged_count() const noexcept {
    std::size_t count = 0;
    count += m_staged_vertices ? 1 : 0;
    count += m_staged_normals ? 1 : 0;
    count += m_staged_colors ? 1 : 0;
    for (const auto& uv : m_staged_uvs) {
        count += uv ? 1 : 0;
    }
    count += m_staged_triangles ? 1 : 0;
    return count;
}

} // namespace coherence_mesh
