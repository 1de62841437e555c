#include "model/voxel_model.h"

#include "core/log.h"

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace voxscene::model {

namespace {

// Mean over every translucent solid voxel, so larger glass regions weigh more.
std::optional<float> averageVoxelIor(const VoxelGrid& grid, const Palette& palette) {
    double iorSum = 0.0;
    std::size_t iorCount = 0;
    for (int z = 0; z < grid.sizeZ(); ++z) {
        for (int y = 0; y < grid.sizeY(); ++y) {
            for (int x = 0; x < grid.sizeX(); ++x) {
                const std::uint8_t index = grid.solidIndexAt(core::Cell3i{x, y, z});
                if (index == 0u) {
                    continue;
                }
                const PaletteEntry& entry = palette[index];
                if (isTranslucent(entry) && entry.ior > 0.0f) {
                    iorSum += entry.ior;
                    ++iorCount;
                }
            }
        }
    }
    if (iorCount == 0u) {
        return std::nullopt;
    }
    return static_cast<float>(iorSum / static_cast<double>(iorCount));
}

} // namespace

bool VoxelModel::build(
    const vox::RawModel& source,
    std::shared_ptr<const Palette> palette,
    std::shared_ptr<const MaterialAtlas> atlas,
    const ModelSettings& settings,
    VoxelModel& outModel,
    core::LoadError* outError
) {
    if (!palette || !atlas) {
        return core::failLoad(outError, core::LoadErrorKind::Parse, "model build needs a palette and an atlas");
    }

    VoxelGrid grid{};
    if (!buildVoxelGrid(source, *palette, grid)) {
        return core::failLoad(
            outError,
            core::LoadErrorKind::Parse,
            "model size " + std::to_string(source.sizeX) + "x" + std::to_string(source.sizeY) + "x" +
                std::to_string(source.sizeZ) + " is out of range");
    }
    for (const std::uint8_t paletteIndex : grid.usedSolidIndices()) {
        if (!atlas->hasCell(paletteIndex)) {
            return core::failLoad(
                outError,
                core::LoadErrorKind::AtlasOverflow,
                "palette index " + std::to_string(paletteIndex) + " has no atlas cell");
        }
    }

    VoxelModel model{};
    model.m_size = grid.size();
    model.m_palette = std::move(palette);
    model.m_atlas = std::move(atlas);
    model.m_settings = settings;
    if (!model.rebuildFrom(grid)) {
        return core::failLoad(outError, core::LoadErrorKind::Parse, "meshing failed");
    }
    if (settings.supportsRemeshing) {
        model.m_grid = std::move(grid);
    }
    outModel = std::move(model);
    return true;
}

bool VoxelModel::rebuildFrom(const VoxelGrid& grid) {
    auto mesh = std::make_shared<VoxelMesh>();
    if (!buildVoxelMesh(grid, *m_palette, *m_atlas, m_settings.meshing, *mesh)) {
        return false;
    }
    CloudDensityVolume volume{};
    const bool hasCloud = buildCloudDensity(grid, m_settings.cloudFalloffRadius, volume);

    m_mesh = std::move(mesh);
    m_averageIor = averageVoxelIor(grid, *m_palette);
    if (hasCloud) {
        m_cloudDensity = std::move(volume);
    } else {
        m_cloudDensity.reset();
    }
    return true;
}

std::optional<std::uint8_t> VoxelModel::voxelAt(const core::Cell3i& cell) const {
    if (!m_grid || !m_grid->contains(cell)) {
        return std::nullopt;
    }
    return m_grid->paletteIndexAt(cell);
}

core::Cell3i VoxelModel::localPointToVoxel(const math::Vector3& localPoint) const {
    const MeshingOptions& meshing = m_settings.meshing;
    const float scale = meshing.voxelSize != 0.0f ? meshing.voxelSize : 1.0f;
    return core::Cell3i{
        static_cast<std::int32_t>(std::floor((localPoint.x / scale) + (meshing.unitOffset.x * static_cast<float>(m_size.x)))),
        static_cast<std::int32_t>(std::floor((localPoint.y / scale) + (meshing.unitOffset.y * static_cast<float>(m_size.y)))),
        static_cast<std::int32_t>(std::floor((localPoint.z / scale) + (meshing.unitOffset.z * static_cast<float>(m_size.z))))
    };
}

math::Vector3 VoxelModel::voxelToLocalPoint(const core::Cell3i& cell) const {
    const MeshingOptions& meshing = m_settings.meshing;
    return math::Vector3{
        (static_cast<float>(cell.x) - (meshing.unitOffset.x * static_cast<float>(m_size.x))) * meshing.voxelSize,
        (static_cast<float>(cell.y) - (meshing.unitOffset.y * static_cast<float>(m_size.y))) * meshing.voxelSize,
        (static_cast<float>(cell.z) - (meshing.unitOffset.z * static_cast<float>(m_size.z))) * meshing.voxelSize
    };
}

core::Cell3i VoxelModel::globalPointToVoxel(const math::Vector3& globalPoint, const math::Matrix4& globalTransform) const {
    return localPointToVoxel(math::transformPoint(math::inverse(globalTransform), globalPoint));
}

bool VoxelModel::modifyVoxels(const core::CellAabb& region, const VoxelEditFn& edit) {
    if (!m_grid) {
        VOXSCENE_LOGW("model") << "modifyVoxels on a model loaded without remeshing support";
        return false;
    }
    if (!edit) {
        return false;
    }

    const core::CellAabb clipped =
        core::intersectAabb(region, core::CellAabb::fromOriginSize(core::Cell3i{}, m_size));
    if (clipped.empty()) {
        return true;
    }

    VoxelGrid edited = *m_grid;
    for (int z = clipped.minInclusive.z; z < clipped.maxExclusive.z; ++z) {
        for (int y = clipped.minInclusive.y; y < clipped.maxExclusive.y; ++y) {
            for (int x = clipped.minInclusive.x; x < clipped.maxExclusive.x; ++x) {
                const core::Cell3i cell{x, y, z};
                const std::uint8_t next = edit(cell, edited.paletteIndexAt(cell));
                if (next != 0u && !isCloud((*m_palette)[next]) && !m_atlas->hasCell(next)) {
                    VOXSCENE_LOGW("model") << "edit rejected: palette index " << static_cast<int>(next)
                                           << " has no atlas cell";
                    return false;
                }
                edited.setVoxel(cell, next, *m_palette);
            }
        }
    }

    if (!rebuildFrom(edited)) {
        return false;
    }
    m_grid = std::move(edited);
    return true;
}

} // namespace voxscene::model
