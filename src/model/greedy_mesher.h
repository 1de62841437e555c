#pragma once

#include "core/grid3.h"
#include "math/math.h"
#include "model/material_atlas.h"
#include "model/palette.h"
#include "model/voxel_grid.h"

#include <cstdint>
#include <vector>

// Greedy Mesher subsystem
// Responsible for: collapsing visible voxel faces into maximal same-material quads.
// Should NOT do: decide materials or own voxel storage.
namespace voxscene::model {

enum class FaceCulling : std::uint8_t {
    // Faces between two different palette indices are both emitted.
    MaterialBoundary,
    // Opaque neighbours hide each other; translucent faces only show against
    // empty space or other translucent indices.
    OpaqueOccludes,
};

struct MeshingOptions {
    FaceCulling culling = FaceCulling::MaterialBoundary;
    // When false the margin occludes, so faces on the model boundary are dropped.
    bool meshOuterFaces = true;
    float voxelSize = 1.0f;
    // Fraction of the model size subtracted from every vertex; 0.5 centres the model.
    math::Vector3 unitOffset{0.5f, 0.5f, 0.5f};
};

// Rectangle in a face slice. `slice` runs along the face normal axis; u/v follow
// faceSliceCell().
struct MeshQuad {
    core::Dir6 face = core::Dir6::PosX;
    int slice = 0;
    int u = 0;
    int v = 0;
    int width = 0;
    int height = 0;
    std::uint8_t paletteIndex = 0;

    bool operator==(const MeshQuad&) const = default;
};

struct VoxelMesh {
    std::vector<math::Vector3> positions;
    std::vector<math::Vector3> normals;
    std::vector<math::Vector2> uvs;
    std::vector<std::uint32_t> indices;
    std::vector<MeshQuad> quads;

    [[nodiscard]] bool empty() const { return quads.empty(); }
};

// A solid face shows when its neighbour is empty or holds a different palette index.
// Callers pass solid indices, so cloud neighbours arrive as 0.
[[nodiscard]] bool isFaceVisible(std::uint8_t self, std::uint8_t neighbor);
[[nodiscard]] bool isFaceVisible(const Palette& palette, FaceCulling culling, std::uint8_t self, std::uint8_t neighbor);

// Grid cell addressed by (slice, u, v) for the given face direction.
[[nodiscard]] core::Cell3i faceSliceCell(core::Dir6 face, int slice, int u, int v);

// Fails when a solid voxel uses a palette index without an atlas cell.
bool buildVoxelMesh(
    const VoxelGrid& grid,
    const Palette& palette,
    const MaterialAtlas& atlas,
    const MeshingOptions& options,
    VoxelMesh& outMesh
);

} // namespace voxscene::model
