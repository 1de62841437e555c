#pragma once

#include "core/grid3.h"
#include "core/load_error.h"
#include "math/math.h"
#include "model/cloud_density.h"
#include "model/greedy_mesher.h"
#include "model/material_atlas.h"
#include "model/palette.h"
#include "model/voxel_grid.h"
#include "vox/vox_records.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

// Voxel Model subsystem
// Responsible for: one model's mesh, cloud volume and (optionally) its editable grid.
// Should NOT do: parse files or own the shared palette and atlas.
namespace voxscene::model {

struct ModelSettings {
    MeshingOptions meshing{};
    int cloudFalloffRadius = 2;
    bool supportsRemeshing = false;
};

// Returns the palette index to store at `cell`; `current` is what is there now.
using VoxelEditFn = std::function<std::uint8_t(const core::Cell3i& cell, std::uint8_t current)>;

class VoxelModel {
public:
    VoxelModel() = default;

    static bool build(
        const vox::RawModel& source,
        std::shared_ptr<const Palette> palette,
        std::shared_ptr<const MaterialAtlas> atlas,
        const ModelSettings& settings,
        VoxelModel& outModel,
        core::LoadError* outError = nullptr
    );

    // Grid-space (Y-up) dimensions.
    [[nodiscard]] core::Cell3i size() const { return m_size; }

    // The mesh is replaced wholesale by modifyVoxels; holders of the previous pointer keep it alive.
    [[nodiscard]] std::shared_ptr<const VoxelMesh> mesh() const { return m_mesh; }
    [[nodiscard]] const std::optional<CloudDensityVolume>& cloudDensity() const { return m_cloudDensity; }
    // Index of refraction averaged over the model's translucent voxels; nullopt without any.
    // Recomputed by modifyVoxels.
    [[nodiscard]] std::optional<float> averageIor() const { return m_averageIor; }
    [[nodiscard]] const std::shared_ptr<const Palette>& palette() const { return m_palette; }
    [[nodiscard]] const std::shared_ptr<const MaterialAtlas>& atlas() const { return m_atlas; }

    [[nodiscard]] bool supportsRemeshing() const { return m_grid.has_value(); }

    // nullopt when the grid was not retained or the cell lies outside the model.
    [[nodiscard]] std::optional<std::uint8_t> voxelAt(const core::Cell3i& cell) const;

    [[nodiscard]] core::Cell3i localPointToVoxel(const math::Vector3& localPoint) const;
    [[nodiscard]] math::Vector3 voxelToLocalPoint(const core::Cell3i& cell) const;
    [[nodiscard]] core::Cell3i globalPointToVoxel(const math::Vector3& globalPoint, const math::Matrix4& globalTransform) const;

    // Applies `edit` to every cell of `region` clipped to the model, then rebuilds the mesh and
    // cloud volume before swapping them in. Rejected (model untouched) when remeshing is off or
    // the edit introduces a solid palette index that has no atlas cell.
    bool modifyVoxels(const core::CellAabb& region, const VoxelEditFn& edit);

private:
    bool rebuildFrom(const VoxelGrid& grid);

    core::Cell3i m_size{};
    std::shared_ptr<const Palette> m_palette;
    std::shared_ptr<const MaterialAtlas> m_atlas;
    ModelSettings m_settings{};
    std::optional<VoxelGrid> m_grid;
    std::shared_ptr<const VoxelMesh> m_mesh;
    std::optional<CloudDensityVolume> m_cloudDensity;
    std::optional<float> m_averageIor;
};

} // namespace voxscene::model
