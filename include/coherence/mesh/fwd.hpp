#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for coherence_mesh module

namespace coherence_mesh {

struct MVert;
struct MLoop;
struct MLoopTri;
struct MLoopCol;
struct MLoopUV;
struct InteropColor32;
struct InteropMesh;

template<typename T>
class ArrayBuffer;

template<typename T>
class SourceArray;

class Mesh;
class MeshBuffers;

} // namespace coherence_mesh
