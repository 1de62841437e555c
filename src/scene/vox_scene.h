#pragma once

#include "core/load_error.h"
#include "math/math.h"
#include "model/material_atlas.h"
#include "model/palette.h"
#include "model/voxel_model.h"
#include "scene/scene_graph.h"

#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

// Scene loader
// Responsible for: turning one .vox byte buffer into meshes, shared materials and a named node tree.
// Should NOT do: file I/O, GPU upload, or spawning host-side entities.
namespace voxscene::scene {

struct LoadOptions {
    bool linearizeColors = true;
    bool supportsRemeshing = false;
    bool meshOuterFaces = true;
    model::FaceCulling culling = model::FaceCulling::MaterialBoundary;
    float voxelSize = 1.0f;
    math::Vector3 unitOffset{0.5f, 0.5f, 0.5f};
    float diffuseRoughness = 0.8f;
    float emissionStrength = 10.0f;
    int cloudFalloffRadius = 2;
    model::AtlasOptions atlas{};
};

struct VoxScene {
    std::int32_t version = 0;
    VoxelNode root{};
    std::map<std::int32_t, vox::SceneNodeRecord> nodes;
    std::map<std::int32_t, LayerInfo> layers;
    std::map<std::int32_t, model::VoxelModel> models;
    std::shared_ptr<const model::Palette> palette;
    std::shared_ptr<const model::MaterialAtlas> atlas;
    std::vector<core::LoadDiagnostic> diagnostics;

    [[nodiscard]] bool empty() const { return models.empty() && nodes.empty(); }

    // Accepts either a bare node path ("workstation/desk") or an asset label ("study.vox#workstation/desk").
    [[nodiscard]] const VoxelNode* findNode(std::string_view label) const;
    [[nodiscard]] const model::VoxelModel* findModel(std::int32_t modelId) const;
    [[nodiscard]] model::VoxelModel* findModel(std::int32_t modelId);
    [[nodiscard]] bool isVisible(const VoxelNode& node) const { return isNodeVisible(node, layers); }
};

// On failure outScene is left empty and outError (when given) says why.
bool loadVoxScene(
    std::span<const std::uint8_t> bytes,
    const LoadOptions& options,
    VoxScene& outScene,
    core::LoadError* outError = nullptr
);

} // namespace voxscene::scene
