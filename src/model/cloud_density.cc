#include "model/cloud_density.h"

#include "core/log.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace voxscene::model {

bool buildCloudDensity(const VoxelGrid& grid, int falloffRadius, CloudDensityVolume& outVolume) {
    outVolume = CloudDensityVolume{};
    if (grid.empty() || grid.cloudCount() == 0u) {
        return false;
    }

    const int radius = std::max(falloffRadius, 0);
    const float falloffSpan = static_cast<float>(radius + 1);

    CloudDensityVolume volume{};
    volume.sizeX = grid.sizeX();
    volume.sizeY = grid.sizeY();
    volume.sizeZ = grid.sizeZ();
    volume.values.assign(
        static_cast<std::size_t>(volume.sizeX) * static_cast<std::size_t>(volume.sizeY) *
            static_cast<std::size_t>(volume.sizeZ),
        0.0f);

    const auto linear = [&volume](int x, int y, int z) {
        return static_cast<std::size_t>(x) +
               (static_cast<std::size_t>(y) * static_cast<std::size_t>(volume.sizeX)) +
               (static_cast<std::size_t>(z) * static_cast<std::size_t>(volume.sizeX) *
                static_cast<std::size_t>(volume.sizeY));
    };

    for (int z = 0; z < volume.sizeZ; ++z) {
        for (int y = 0; y < volume.sizeY; ++y) {
            for (int x = 0; x < volume.sizeX; ++x) {
                if (grid.cloudIndexAt(core::Cell3i{x, y, z}) == 0u) {
                    continue;
                }
                const float peak = grid.cloudDensityAt(core::Cell3i{x, y, z}) * kCloudDensityScale;

                const int minZ = std::max(z - radius, 0);
                const int maxZ = std::min(z + radius, volume.sizeZ - 1);
                const int minY = std::max(y - radius, 0);
                const int maxY = std::min(y + radius, volume.sizeY - 1);
                const int minX = std::max(x - radius, 0);
                const int maxX = std::min(x + radius, volume.sizeX - 1);
                for (int tz = minZ; tz <= maxZ; ++tz) {
                    for (int ty = minY; ty <= maxY; ++ty) {
                        for (int tx = minX; tx <= maxX; ++tx) {
                            const int dx = tx - x;
                            const int dy = ty - y;
                            const int dz = tz - z;
                            const float distance =
                                std::sqrt(static_cast<float>((dx * dx) + (dy * dy) + (dz * dz)));
                            if (distance > static_cast<float>(radius)) {
                                continue;
                            }
                            const float value = peak * (1.0f - (distance / falloffSpan));
                            float& target = volume.values[linear(tx, ty, tz)];
                            target = std::max(target, value);
                        }
                    }
                }
            }
        }
    }

    VOXSCENE_LOGT("model") << "cloud density " << volume.sizeX << "x" << volume.sizeY << "x" << volume.sizeZ
                           << " from " << grid.cloudCount() << " cloud voxels";
    outVolume = std::move(volume);
    return true;
}

} // namespace voxscene::model
