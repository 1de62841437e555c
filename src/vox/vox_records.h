#pragma once

#include "core/load_error.h"
#include "vox/byte_reader.h"
#include "vox/chunk_reader.h"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

// Vox Records subsystem
// Responsible for: turning chunk payloads into typed model, node, layer and material records.
// Should NOT do: resolve node references or build voxel grids.
namespace voxscene::vox {

constexpr int kMaxModelExtent = 256;
// Packed rotation byte for the identity matrix (row 0 -> column 0, row 1 -> column 1).
constexpr std::uint8_t kIdentityRotation = 0x04u;

struct RawVoxel {
    std::uint8_t x = 0;
    std::uint8_t y = 0;
    std::uint8_t z = 0;
    std::uint8_t paletteIndex = 0;
};

// Model as stored in the file: MagicaVoxel space, Z up.
struct RawModel {
    int sizeX = 0;
    int sizeY = 0;
    int sizeZ = 0;
    std::vector<RawVoxel> voxels;
};

enum class SceneNodeKind : std::uint8_t {
    Transform = 0,
    Group = 1,
    Shape = 2
};

struct TransformFrame {
    std::int32_t frameIndex = 0;
    std::uint8_t rotation = kIdentityRotation;
    std::array<std::int32_t, 3> translation{};
};

struct ShapeModelRef {
    std::int32_t modelId = 0;
    std::int32_t frameIndex = 0;
};

struct SceneNodeRecord {
    std::int32_t id = 0;
    SceneNodeKind kind = SceneNodeKind::Transform;
    VoxDict attributes;

    // Transform only.
    std::int32_t childId = -1;
    std::int32_t layerId = -1;
    std::vector<TransformFrame> frames;

    // Group only.
    std::vector<std::int32_t> childIds;

    // Shape only. One entry per animation frame.
    std::vector<ShapeModelRef> models;
};

struct LayerRecord {
    std::int32_t id = 0;
    VoxDict attributes;
};

struct MaterialRecord {
    std::int32_t paletteIndex = 0;
    VoxDict properties;
};

struct VoxRecords {
    std::int32_t version = 0;
    std::vector<RawModel> models;
    std::vector<SceneNodeRecord> nodes;
    std::vector<LayerRecord> layers;
    std::vector<MaterialRecord> materials;
    // Indexed by palette index, packed RGBA (r in the low byte). Index 0 is unused.
    std::optional<std::array<std::uint32_t, 256>> paletteRgba;
    std::vector<core::LoadDiagnostic> diagnostics;
};

// Expands a packed rotation byte into a signed permutation matrix (rows).
bool decodeRotation(std::uint8_t packed, int outRows[3][3]);

bool decodeVoxRecords(const ChunkStream& stream, VoxRecords& outRecords, core::LoadError* outError = nullptr);
bool parseVoxRecords(std::span<const std::uint8_t> bytes, VoxRecords& outRecords, core::LoadError* outError = nullptr);

} // namespace voxscene::vox
