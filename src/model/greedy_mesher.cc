#include "model/greedy_mesher.h"

#include "core/log.h"

#include <algorithm>
#include <utility>

namespace voxscene::model {

namespace {

constexpr std::uint8_t kEmptyMaskKey = 0u;

void faceSliceDimensions(
    core::Dir6 face,
    const core::Cell3i& size,
    int& outSliceCount,
    int& outUCount,
    int& outVCount
) {
    switch (face) {
    case core::Dir6::PosX:
    case core::Dir6::NegX:
        outSliceCount = size.x;
        outUCount = size.y;
        outVCount = size.z;
        break;
    case core::Dir6::PosY:
    case core::Dir6::NegY:
        outSliceCount = size.y;
        outUCount = size.x;
        outVCount = size.z;
        break;
    case core::Dir6::PosZ:
    case core::Dir6::NegZ:
    default:
        outSliceCount = size.z;
        outUCount = size.x;
        outVCount = size.y;
        break;
    }
}

// Corner lattice points of a merged rectangle, ordered counter-clockwise seen from outside.
core::Cell3i faceRectCorner(const MeshQuad& quad, int corner) {
    const int s = quad.slice;
    const int u = quad.u;
    const int v = quad.v;
    const int w = quad.width;
    const int h = quad.height;
    switch (quad.face) {
    case core::Dir6::PosX:
        if (corner == 0) { return core::Cell3i{s + 1, u, v}; }
        if (corner == 1) { return core::Cell3i{s + 1, u + w, v}; }
        if (corner == 2) { return core::Cell3i{s + 1, u + w, v + h}; }
        return core::Cell3i{s + 1, u, v + h};
    case core::Dir6::NegX:
        if (corner == 0) { return core::Cell3i{s, u, v + h}; }
        if (corner == 1) { return core::Cell3i{s, u + w, v + h}; }
        if (corner == 2) { return core::Cell3i{s, u + w, v}; }
        return core::Cell3i{s, u, v};
    case core::Dir6::PosY:
        if (corner == 0) { return core::Cell3i{u, s + 1, v}; }
        if (corner == 1) { return core::Cell3i{u, s + 1, v + h}; }
        if (corner == 2) { return core::Cell3i{u + w, s + 1, v + h}; }
        return core::Cell3i{u + w, s + 1, v};
    case core::Dir6::NegY:
        if (corner == 0) { return core::Cell3i{u, s, v + h}; }
        if (corner == 1) { return core::Cell3i{u, s, v}; }
        if (corner == 2) { return core::Cell3i{u + w, s, v}; }
        return core::Cell3i{u + w, s, v + h};
    case core::Dir6::PosZ:
        if (corner == 0) { return core::Cell3i{u + w, v, s + 1}; }
        if (corner == 1) { return core::Cell3i{u + w, v + h, s + 1}; }
        if (corner == 2) { return core::Cell3i{u, v + h, s + 1}; }
        return core::Cell3i{u, v, s + 1};
    case core::Dir6::NegZ:
    default:
        if (corner == 0) { return core::Cell3i{u, v, s}; }
        if (corner == 1) { return core::Cell3i{u, v + h, s}; }
        if (corner == 2) { return core::Cell3i{u + w, v + h, s}; }
        return core::Cell3i{u + w, v, s};
    }
}

void appendQuad(
    VoxelMesh& mesh,
    const MeshQuad& quad,
    const math::Vector2& uv,
    const math::Vector3& origin,
    float voxelSize
) {
    const std::uint32_t baseVertex = static_cast<std::uint32_t>(mesh.positions.size());
    const math::Vector3 normal = core::dirToUnitVector(quad.face);
    for (int corner = 0; corner < 4; ++corner) {
        const core::Cell3i lattice = faceRectCorner(quad, corner);
        const math::Vector3 point{
            static_cast<float>(lattice.x),
            static_cast<float>(lattice.y),
            static_cast<float>(lattice.z)
        };
        mesh.positions.push_back((point - origin) * voxelSize);
        mesh.normals.push_back(normal);
        mesh.uvs.push_back(uv);
    }

    mesh.indices.push_back(baseVertex + 0u);
    mesh.indices.push_back(baseVertex + 1u);
    mesh.indices.push_back(baseVertex + 2u);
    mesh.indices.push_back(baseVertex + 0u);
    mesh.indices.push_back(baseVertex + 2u);
    mesh.indices.push_back(baseVertex + 3u);
    mesh.quads.push_back(quad);
}

} // namespace

bool isFaceVisible(std::uint8_t self, std::uint8_t neighbor) {
    return self != 0u && neighbor != self;
}

bool isFaceVisible(const Palette& palette, FaceCulling culling, std::uint8_t self, std::uint8_t neighbor) {
    if (culling == FaceCulling::MaterialBoundary || self == 0u || neighbor == 0u) {
        return isFaceVisible(self, neighbor);
    }
    const bool neighborTranslucent = isTranslucent(palette[neighbor]);
    if (!isTranslucent(palette[self])) {
        return neighborTranslucent;
    }
    return neighborTranslucent && neighbor != self;
}

core::Cell3i faceSliceCell(core::Dir6 face, int slice, int u, int v) {
    switch (face) {
    case core::Dir6::PosX:
    case core::Dir6::NegX:
        return core::Cell3i{slice, u, v};
    case core::Dir6::PosY:
    case core::Dir6::NegY:
        return core::Cell3i{u, slice, v};
    case core::Dir6::PosZ:
    case core::Dir6::NegZ:
    default:
        return core::Cell3i{u, v, slice};
    }
}

bool buildVoxelMesh(
    const VoxelGrid& grid,
    const Palette& palette,
    const MaterialAtlas& atlas,
    const MeshingOptions& options,
    VoxelMesh& outMesh
) {
    outMesh = VoxelMesh{};
    if (grid.empty() || grid.solidCount() == 0u) {
        return true;
    }

    for (const std::uint8_t paletteIndex : grid.usedSolidIndices()) {
        if (!atlas.hasCell(paletteIndex)) {
            VOXSCENE_LOGE("model") << "palette index " << static_cast<int>(paletteIndex) << " has no atlas cell";
            return false;
        }
    }

    const core::Cell3i size = grid.size();
    const math::Vector3 origin{
        options.unitOffset.x * static_cast<float>(size.x),
        options.unitOffset.y * static_cast<float>(size.y),
        options.unitOffset.z * static_cast<float>(size.z)
    };

    VoxelMesh mesh{};
    for (const core::Dir6 face : core::kAllDir6) {
        int sliceCount = 0;
        int uCount = 0;
        int vCount = 0;
        faceSliceDimensions(face, size, sliceCount, uCount, vCount);
        std::vector<std::uint8_t> mask(static_cast<std::size_t>(uCount * vCount), kEmptyMaskKey);

        for (int slice = 0; slice < sliceCount; ++slice) {
            std::fill(mask.begin(), mask.end(), kEmptyMaskKey);

            for (int v = 0; v < vCount; ++v) {
                for (int u = 0; u < uCount; ++u) {
                    const core::Cell3i cell = faceSliceCell(face, slice, u, v);
                    const std::uint8_t paletteIndex = grid.solidIndexAt(cell);
                    if (paletteIndex == 0u) {
                        continue;
                    }
                    const core::Cell3i neighbor = core::neighborCell(cell, face);
                    if (!options.meshOuterFaces && !grid.contains(neighbor)) {
                        continue;
                    }
                    if (!isFaceVisible(palette, options.culling, paletteIndex, grid.solidIndexAt(neighbor))) {
                        continue;
                    }
                    mask[static_cast<std::size_t>(u + (v * uCount))] = paletteIndex;
                }
            }

            for (int v = 0; v < vCount; ++v) {
                for (int u = 0; u < uCount;) {
                    const std::size_t startIndex = static_cast<std::size_t>(u + (v * uCount));
                    const std::uint8_t key = mask[startIndex];
                    if (key == kEmptyMaskKey) {
                        ++u;
                        continue;
                    }

                    int width = 1;
                    while ((u + width) < uCount) {
                        const std::size_t widthIndex = static_cast<std::size_t>((u + width) + (v * uCount));
                        if (mask[widthIndex] != key) {
                            break;
                        }
                        ++width;
                    }

                    int height = 1;
                    bool canGrow = true;
                    while ((v + height) < vCount && canGrow) {
                        for (int offsetU = 0; offsetU < width; ++offsetU) {
                            const std::size_t growIndex =
                                static_cast<std::size_t>((u + offsetU) + ((v + height) * uCount));
                            if (mask[growIndex] != key) {
                                canGrow = false;
                                break;
                            }
                        }
                        if (canGrow) {
                            ++height;
                        }
                    }

                    MeshQuad quad{};
                    quad.face = face;
                    quad.slice = slice;
                    quad.u = u;
                    quad.v = v;
                    quad.width = width;
                    quad.height = height;
                    quad.paletteIndex = key;
                    appendQuad(mesh, quad, *atlas.uvForPaletteIndex(key), origin, options.voxelSize);

                    for (int clearV = 0; clearV < height; ++clearV) {
                        for (int clearU = 0; clearU < width; ++clearU) {
                            const std::size_t clearIndex =
                                static_cast<std::size_t>((u + clearU) + ((v + clearV) * uCount));
                            mask[clearIndex] = kEmptyMaskKey;
                        }
                    }

                    u += width;
                }
            }
        }
    }

    VOXSCENE_LOGT("model") << "meshed " << size.x << "x" << size.y << "x" << size.z << " grid into "
                           << mesh.quads.size() << " quads";
    outMesh = std::move(mesh);
    return true;
}

} // namespace voxscene::model
