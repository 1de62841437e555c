#pragma once

#include "model/voxel_grid.h"

#include <cstddef>
#include <vector>

namespace voxscene::model {

// R32F volume at model resolution, x fastest then y then z.
struct CloudDensityVolume {
    int sizeX = 0;
    int sizeY = 0;
    int sizeZ = 0;
    std::vector<float> values;

    [[nodiscard]] float at(int x, int y, int z) const {
        return values[static_cast<std::size_t>(x) +
                      (static_cast<std::size_t>(y) * static_cast<std::size_t>(sizeX)) +
                      (static_cast<std::size_t>(z) * static_cast<std::size_t>(sizeX) * static_cast<std::size_t>(sizeY))];
    }
};

constexpr float kCloudDensityScale = 10.0f;

// Soft falloff around cloud voxels: max over cloud cells c within falloffRadius of
// density(c) * 10 * (1 - distance / (falloffRadius + 1)).
// Returns false when the grid holds no cloud voxels.
bool buildCloudDensity(const VoxelGrid& grid, int falloffRadius, CloudDensityVolume& outVolume);

} // namespace voxscene::model
