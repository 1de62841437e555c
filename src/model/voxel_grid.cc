#include "model/voxel_grid.h"

#include "core/log.h"

#include <array>
#include <utility>

namespace voxscene::model {

VoxelGrid::VoxelGrid(int sizeX, int sizeY, int sizeZ)
    : m_sizeX(sizeX), m_sizeY(sizeY), m_sizeZ(sizeZ) {
    if (empty()) {
        m_sizeX = 0;
        m_sizeY = 0;
        m_sizeZ = 0;
        return;
    }
    const std::size_t paddedCount =
        static_cast<std::size_t>(m_sizeX + 2) * static_cast<std::size_t>(m_sizeY + 2) *
        static_cast<std::size_t>(m_sizeZ + 2);
    m_solid.assign(paddedCount, 0u);
    m_cloud.assign(paddedCount, 0u);
    m_cloudDensity.assign(paddedCount, 0.0f);
}

bool VoxelGrid::contains(const core::Cell3i& cell) const {
    return cell.x >= 0 && cell.x < m_sizeX &&
           cell.y >= 0 && cell.y < m_sizeY &&
           cell.z >= 0 && cell.z < m_sizeZ;
}

std::size_t VoxelGrid::paddedIndex(const core::Cell3i& cell) const {
    const std::size_t px = static_cast<std::size_t>(cell.x + 1);
    const std::size_t py = static_cast<std::size_t>(cell.y + 1);
    const std::size_t pz = static_cast<std::size_t>(cell.z + 1);
    const std::size_t strideX = static_cast<std::size_t>(m_sizeX + 2);
    const std::size_t strideY = static_cast<std::size_t>(m_sizeY + 2);
    return px + (py * strideX) + (pz * strideX * strideY);
}

std::uint8_t VoxelGrid::solidIndexAt(const core::Cell3i& cell) const {
    if (!contains(cell)) {
        return 0u;
    }
    return m_solid[paddedIndex(cell)];
}

std::uint8_t VoxelGrid::cloudIndexAt(const core::Cell3i& cell) const {
    if (!contains(cell)) {
        return 0u;
    }
    return m_cloud[paddedIndex(cell)];
}

float VoxelGrid::cloudDensityAt(const core::Cell3i& cell) const {
    if (!contains(cell)) {
        return 0.0f;
    }
    return m_cloudDensity[paddedIndex(cell)];
}

std::uint8_t VoxelGrid::paletteIndexAt(const core::Cell3i& cell) const {
    const std::uint8_t solid = solidIndexAt(cell);
    return solid != 0u ? solid : cloudIndexAt(cell);
}

bool VoxelGrid::setVoxel(const core::Cell3i& cell, std::uint8_t paletteIndex, const Palette& palette) {
    if (!contains(cell)) {
        return false;
    }
    const std::size_t index = paddedIndex(cell);
    if (m_solid[index] != 0u) {
        --m_solidCount;
    }
    if (m_cloud[index] != 0u) {
        --m_cloudCount;
    }
    m_solid[index] = 0u;
    m_cloud[index] = 0u;
    m_cloudDensity[index] = 0.0f;

    if (paletteIndex == 0u) {
        return true;
    }
    const PaletteEntry& entry = palette[paletteIndex];
    if (isCloud(entry)) {
        m_cloud[index] = paletteIndex;
        m_cloudDensity[index] = entry.density;
        ++m_cloudCount;
    } else {
        m_solid[index] = paletteIndex;
        ++m_solidCount;
    }
    return true;
}

std::vector<std::uint8_t> VoxelGrid::usedSolidIndices() const {
    std::array<bool, kPaletteSize> seen{};
    for (const std::uint8_t index : m_solid) {
        seen[index] = true;
    }
    std::vector<std::uint8_t> used;
    for (std::size_t index = 1; index < seen.size(); ++index) {
        if (seen[index]) {
            used.push_back(static_cast<std::uint8_t>(index));
        }
    }
    return used;
}

core::Cell3i voxToGridCell(const vox::RawModel& model, const vox::RawVoxel& voxel) {
    return core::Cell3i{model.sizeX - 1 - static_cast<int>(voxel.x), voxel.z, voxel.y};
}

core::Cell3i gridSizeForModel(const vox::RawModel& model) {
    return core::Cell3i{model.sizeX, model.sizeZ, model.sizeY};
}

bool buildVoxelGrid(const vox::RawModel& model, const Palette& palette, VoxelGrid& outGrid) {
    const core::Cell3i size = gridSizeForModel(model);
    if (size.x <= 0 || size.y <= 0 || size.z <= 0 ||
        size.x > vox::kMaxModelExtent || size.y > vox::kMaxModelExtent || size.z > vox::kMaxModelExtent) {
        VOXSCENE_LOGE("model") << "cannot build grid for model of size " << model.sizeX << "x" << model.sizeY << "x"
                               << model.sizeZ;
        return false;
    }

    VoxelGrid grid(size.x, size.y, size.z);
    for (const vox::RawVoxel& voxel : model.voxels) {
        if (!grid.setVoxel(voxToGridCell(model, voxel), voxel.paletteIndex, palette)) {
            VOXSCENE_LOGD("model") << "dropping voxel outside model bounds at " << static_cast<int>(voxel.x) << ","
                                   << static_cast<int>(voxel.y) << "," << static_cast<int>(voxel.z);
        }
    }

    VOXSCENE_LOGT("model") << "grid " << size.x << "x" << size.y << "x" << size.z << ": " << grid.solidCount()
                           << " solid, " << grid.cloudCount() << " cloud";
    outGrid = std::move(grid);
    return true;
}

} // namespace voxscene::model
