#pragma once

#include "core/grid3.h"
#include "model/palette.h"
#include "vox/vox_records.h"

#include <cstddef>
#include <cstdint>
#include <vector>

// Voxel Grid subsystem
// Responsible for: the dense, margin-padded per-model voxel array in Y-up grid space.
// Should NOT do: build meshes or decide face visibility.
namespace voxscene::model {

// Cells are addressed in model space (0..size-1 on each axis). The one-cell margin on
// every side is readable (coordinate -1 or size) and always empty.
class VoxelGrid {
public:
    VoxelGrid() = default;
    VoxelGrid(int sizeX, int sizeY, int sizeZ);

    [[nodiscard]] int sizeX() const { return m_sizeX; }
    [[nodiscard]] int sizeY() const { return m_sizeY; }
    [[nodiscard]] int sizeZ() const { return m_sizeZ; }
    [[nodiscard]] core::Cell3i size() const { return core::Cell3i{m_sizeX, m_sizeY, m_sizeZ}; }
    [[nodiscard]] bool empty() const { return m_sizeX <= 0 || m_sizeY <= 0 || m_sizeZ <= 0; }

    [[nodiscard]] bool contains(const core::Cell3i& cell) const;

    // Solid palette index; 0 for empty, cloud and out-of-range cells.
    [[nodiscard]] std::uint8_t solidIndexAt(const core::Cell3i& cell) const;
    [[nodiscard]] std::uint8_t cloudIndexAt(const core::Cell3i& cell) const;
    [[nodiscard]] float cloudDensityAt(const core::Cell3i& cell) const;
    // Whatever occupies the cell, solid or cloud.
    [[nodiscard]] std::uint8_t paletteIndexAt(const core::Cell3i& cell) const;

    // Routes cloud indices to the density layer. Index 0 clears the cell.
    bool setVoxel(const core::Cell3i& cell, std::uint8_t paletteIndex, const Palette& palette);

    [[nodiscard]] std::size_t solidCount() const { return m_solidCount; }
    [[nodiscard]] std::size_t cloudCount() const { return m_cloudCount; }

    // Sorted, distinct solid palette indices.
    [[nodiscard]] std::vector<std::uint8_t> usedSolidIndices() const;

private:
    [[nodiscard]] std::size_t paddedIndex(const core::Cell3i& cell) const;

    int m_sizeX = 0;
    int m_sizeY = 0;
    int m_sizeZ = 0;
    std::vector<std::uint8_t> m_solid;
    std::vector<std::uint8_t> m_cloud;
    std::vector<float> m_cloudDensity;
    std::size_t m_solidCount = 0;
    std::size_t m_cloudCount = 0;
};

// MagicaVoxel (x, y, z) -> grid (sizeX-1-x, z, y).
[[nodiscard]] core::Cell3i voxToGridCell(const vox::RawModel& model, const vox::RawVoxel& voxel);
[[nodiscard]] core::Cell3i gridSizeForModel(const vox::RawModel& model);

bool buildVoxelGrid(const vox::RawModel& model, const Palette& palette, VoxelGrid& outGrid);

} // namespace voxscene::model
