#include "scene/vox_scene.h"

#include "core/log.h"
#include "vox/vox_records.h"

#include <array>
#include <string>
#include <utility>

namespace voxscene::scene {

namespace {

std::vector<std::uint8_t> collectSolidIndices(
    const std::map<std::int32_t, vox::RawModel>& models,
    const model::Palette& palette
) {
    std::array<bool, model::kPaletteSize> seen{};
    for (const auto& [modelId, rawModel] : models) {
        (void)modelId;
        for (const vox::RawVoxel& voxel : rawModel.voxels) {
            if (voxel.paletteIndex != 0u && !model::isCloud(palette[voxel.paletteIndex])) {
                seen[voxel.paletteIndex] = true;
            }
        }
    }
    std::vector<std::uint8_t> used;
    for (std::size_t index = 1; index < seen.size(); ++index) {
        if (seen[index]) {
            used.push_back(static_cast<std::uint8_t>(index));
        }
    }
    return used;
}

} // namespace

const VoxelNode* VoxScene::findNode(std::string_view label) const {
    const std::size_t hash = label.find('#');
    if (hash != std::string_view::npos) {
        label = label.substr(hash + 1u);
    }
    return findNodeByName(root, label);
}

const model::VoxelModel* VoxScene::findModel(std::int32_t modelId) const {
    const auto found = models.find(modelId);
    return found == models.end() ? nullptr : &found->second;
}

model::VoxelModel* VoxScene::findModel(std::int32_t modelId) {
    const auto found = models.find(modelId);
    return found == models.end() ? nullptr : &found->second;
}

bool loadVoxScene(
    std::span<const std::uint8_t> bytes,
    const LoadOptions& options,
    VoxScene& outScene,
    core::LoadError* outError
) {
    outScene = VoxScene{};

    vox::VoxRecords records{};
    if (!vox::parseVoxRecords(bytes, records, outError)) {
        return false;
    }

    VoxScene scene{};
    scene.version = records.version;
    scene.diagnostics = std::move(records.diagnostics);

    model::PaletteOptions paletteOptions{};
    paletteOptions.linearizeColors = options.linearizeColors;
    paletteOptions.diffuseRoughness = options.diffuseRoughness;
    paletteOptions.emissionStrength = options.emissionStrength;
    std::shared_ptr<const model::Palette> palette = std::make_shared<model::Palette>(
        model::resolvePalette(records.paletteRgba, records.materials, paletteOptions));

    SceneGraph graph{};
    if (!buildSceneGraph(std::move(records), graph, outError)) {
        return false;
    }
    if (!resolveSceneTree(graph, scene.root, outError)) {
        return false;
    }

    // Palette and atlas are complete before any model is meshed; models only read them.
    auto atlas = std::make_shared<model::MaterialAtlas>();
    const std::vector<std::uint8_t> usedIndices = collectSolidIndices(graph.models, *palette);
    if (!model::buildMaterialAtlas(usedIndices, *palette, options.atlas, *atlas, outError)) {
        return false;
    }
    std::shared_ptr<const model::MaterialAtlas> sharedAtlas = std::move(atlas);

    model::ModelSettings settings{};
    settings.meshing.meshOuterFaces = options.meshOuterFaces;
    settings.meshing.culling = options.culling;
    settings.meshing.voxelSize = options.voxelSize;
    settings.meshing.unitOffset = options.unitOffset;
    settings.cloudFalloffRadius = options.cloudFalloffRadius;
    settings.supportsRemeshing = options.supportsRemeshing;

    for (const auto& [modelId, rawModel] : graph.models) {
        model::VoxelModel built{};
        if (!model::VoxelModel::build(rawModel, palette, sharedAtlas, settings, built, outError)) {
            VOXSCENE_LOGE("scene") << "failed to build model " << modelId;
            if (outError != nullptr) {
                outError->message = "model " + std::to_string(modelId) + ": " + outError->message;
            }
            return false;
        }
        scene.models.emplace(modelId, std::move(built));
    }

    scene.nodes = std::move(graph.nodes);
    scene.layers = std::move(graph.layers);
    scene.palette = std::move(palette);
    scene.atlas = std::move(sharedAtlas);

    VOXSCENE_LOGI("scene") << "loaded .vox v" << scene.version << ": " << scene.models.size() << " models, "
                           << scene.nodes.size() << " nodes, " << scene.layers.size() << " layers, "
                           << scene.atlas->cellCount() << " materials";
    outScene = std::move(scene);
    return true;
}

} // namespace voxscene::scene
