#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/grid3.h"
#include "core/load_error.h"
#include "math/math.h"
#include "model/material_atlas.h"
#include "model/palette.h"
#include "model/voxel_model.h"
#include "scene/vox_scene.h"
#include "vox/vox_records.h"
#include "vox_test_writer.h"

namespace {

std::vector<std::uint8_t> namedBoxScene(int size, std::uint8_t paletteIndex, const std::string& name) {
    voxscene::test::VoxWriter writer;
    writer.addModel(size, size, size, voxscene::test::filledBox(size, size, size, paletteIndex));
    writer.addTransform(0, 1);
    writer.addGroup(1, {2});
    writer.addTransform(2, 3, 0, {{"_name", name}});
    writer.addShape(3, {0});
    writer.addLayer(0, {{"_name", "base"}});
    return writer.build();
}

bool load(
    const std::vector<std::uint8_t>& bytes,
    voxscene::scene::VoxScene& scene,
    voxscene::core::LoadError* error = nullptr,
    bool supportsRemeshing = false
) {
    voxscene::scene::LoadOptions options{};
    options.supportsRemeshing = supportsRemeshing;
    return voxscene::scene::loadVoxScene(bytes, options, scene, error);
}

} // namespace

TEST(VoxSceneTest, LoadsSingleModelScene) {
    voxscene::scene::VoxScene scene;
    voxscene::core::LoadError error;
    ASSERT_TRUE(load(namedBoxScene(2, 1, "crate"), scene, &error)) << error.message;

    EXPECT_EQ(scene.version, 200);
    EXPECT_FALSE(scene.empty());
    EXPECT_TRUE(scene.diagnostics.empty());
    ASSERT_EQ(scene.models.size(), 1u);
    ASSERT_NE(scene.palette, nullptr);
    ASSERT_NE(scene.atlas, nullptr);
    EXPECT_EQ(scene.atlas->paletteIndices, (std::vector<std::uint8_t>{1}));
    EXPECT_EQ(scene.layers.size(), 1u);
    EXPECT_EQ(scene.nodes.size(), 4u);

    const voxscene::model::VoxelModel* model = scene.findModel(0);
    ASSERT_NE(model, nullptr);
    EXPECT_EQ(model->size(), (voxscene::core::Cell3i{2, 2, 2}));
    ASSERT_NE(model->mesh(), nullptr);
    EXPECT_EQ(model->mesh()->quads.size(), 6u);
    EXPECT_FALSE(model->cloudDensity().has_value());
    EXPECT_EQ(model->palette(), scene.palette);
    EXPECT_EQ(model->atlas(), scene.atlas);
    EXPECT_EQ(scene.findModel(1), nullptr);

    EXPECT_EQ(scene.root.nodeId, 0);
    ASSERT_EQ(scene.root.children.size(), 1u);
    EXPECT_EQ(scene.root.children[0].modelId, std::optional<std::int32_t>(0));
    EXPECT_TRUE(scene.isVisible(scene.root.children[0]));
}

TEST(VoxSceneTest, RedCubeMeshesToSixMergedQuads) {
    std::array<std::uint32_t, 256> palette{};
    palette[1] = 0xFF0000FFu;
    voxscene::test::VoxWriter writer;
    writer.setPalette(palette);
    writer.addSingleModelScene(2, 2, 2, voxscene::test::filledBox(2, 2, 2, 1));

    voxscene::scene::VoxScene scene;
    voxscene::core::LoadError error;
    ASSERT_TRUE(load(writer.build(), scene, &error)) << error.message;

    const voxscene::model::VoxelModel* model = scene.findModel(0);
    ASSERT_NE(model, nullptr);
    const voxscene::model::VoxelMesh& mesh = *model->mesh();
    EXPECT_EQ(mesh.quads.size(), 6u);
    EXPECT_EQ(mesh.positions.size(), 24u);
    EXPECT_EQ(mesh.indices.size(), 36u);
    const voxscene::math::Vector2 uv = *scene.atlas->uvForPaletteIndex(1);
    for (const voxscene::math::Vector2& vertexUv : mesh.uvs) {
        EXPECT_EQ(vertexUv, uv);
    }

    EXPECT_EQ(scene.atlas->color[0], 255u);
    EXPECT_EQ(scene.atlas->color[1], 0u);
    EXPECT_EQ(scene.atlas->color[2], 0u);
    EXPECT_EQ(scene.atlas->color[3], 255u);
}

TEST(VoxSceneTest, FindsNodesByPathOrAssetLabel) {
    voxscene::scene::VoxScene scene;
    ASSERT_TRUE(load(namedBoxScene(1, 1, "crate"), scene));

    const voxscene::scene::VoxelNode* byPath = scene.findNode("crate");
    ASSERT_NE(byPath, nullptr);
    EXPECT_EQ(byPath->nodeId, 2);
    EXPECT_EQ(scene.findNode("room.vox#crate"), byPath);
    EXPECT_EQ(scene.findNode("barrel"), nullptr);
}

TEST(VoxSceneTest, TranslationIsConvertedToYUp) {
    voxscene::test::VoxWriter writer;
    writer.addModel(1, 1, 1, voxscene::test::filledBox(1, 1, 1, 1));
    writer.addTransform(0, 1, -1, {{"_name", "moved"}}, {{"_t", "4 5 6"}});
    writer.addShape(1, {0});

    voxscene::scene::VoxScene scene;
    voxscene::core::LoadError error;
    ASSERT_TRUE(load(writer.build(), scene, &error)) << error.message;

    const voxscene::scene::VoxelNode* node = scene.findNode("moved");
    ASSERT_NE(node, nullptr);
    const voxscene::math::Vector3 translation = node->transform.translationPart();
    EXPECT_FLOAT_EQ(translation.x, -4.0f);
    EXPECT_FLOAT_EQ(translation.y, 6.0f);
    EXPECT_FLOAT_EQ(translation.z, 5.0f);
}

TEST(VoxSceneTest, HiddenLayerHidesItsNodes) {
    voxscene::test::VoxWriter writer;
    writer.addModel(1, 1, 1, voxscene::test::filledBox(1, 1, 1, 1));
    writer.addTransform(0, 1);
    writer.addGroup(1, {2});
    writer.addTransform(2, 3, 4, {{"_name", "ghost"}});
    writer.addShape(3, {0});
    writer.addLayer(4, {{"_hidden", "1"}});

    voxscene::scene::VoxScene scene;
    ASSERT_TRUE(load(writer.build(), scene));
    const voxscene::scene::VoxelNode* ghost = scene.findNode("ghost");
    ASSERT_NE(ghost, nullptr);
    EXPECT_EQ(ghost->layerId, 4);
    EXPECT_FALSE(scene.isVisible(*ghost));
    EXPECT_TRUE(scene.isVisible(scene.root));
}

TEST(VoxSceneTest, FileWithoutSceneGraphStillLoads) {
    voxscene::test::VoxWriter writer;
    writer.addModel(2, 1, 1, voxscene::test::filledBox(2, 1, 1, 3));

    voxscene::scene::VoxScene scene;
    voxscene::core::LoadError error;
    ASSERT_TRUE(load(writer.build(), scene, &error)) << error.message;
    ASSERT_EQ(scene.models.size(), 1u);
    ASSERT_EQ(scene.root.children.size(), 1u);
    EXPECT_EQ(scene.root.children[0].modelId, std::optional<std::int32_t>(0));
}

TEST(VoxSceneTest, FailedLoadLeavesSceneEmpty) {
    voxscene::scene::VoxScene scene;
    ASSERT_TRUE(load(namedBoxScene(1, 1, "crate"), scene));
    ASSERT_FALSE(scene.empty());

    std::vector<std::uint8_t> corrupt = namedBoxScene(1, 1, "crate");
    corrupt[0] = 'X';
    voxscene::core::LoadError error;
    EXPECT_FALSE(load(corrupt, scene, &error));
    EXPECT_EQ(error.kind, voxscene::core::LoadErrorKind::Parse);
    EXPECT_TRUE(scene.empty());
    EXPECT_EQ(scene.palette, nullptr);
    EXPECT_EQ(scene.atlas, nullptr);
}

TEST(VoxSceneTest, DanglingModelReferenceFailsLoad) {
    voxscene::test::VoxWriter writer;
    writer.addModel(1, 1, 1, voxscene::test::filledBox(1, 1, 1, 1));
    writer.addTransform(0, 1);
    writer.addShape(1, {4});

    voxscene::scene::VoxScene scene;
    voxscene::core::LoadError error;
    EXPECT_FALSE(load(writer.build(), scene, &error));
    EXPECT_EQ(error.kind, voxscene::core::LoadErrorKind::DanglingReference);
    EXPECT_TRUE(scene.empty());
}

TEST(VoxSceneTest, AtlasOverflowFailsLoad) {
    voxscene::test::VoxWriter writer;
    writer.addModel(1, 1, 1, voxscene::test::filledBox(1, 1, 1, 1));
    writer.addModel(1, 1, 1, voxscene::test::filledBox(1, 1, 1, 2));
    writer.addModel(1, 1, 1, voxscene::test::filledBox(1, 1, 1, 3));

    voxscene::scene::LoadOptions options{};
    options.atlas.cellsPerRow = 2;
    options.atlas.rowCount = 1;
    voxscene::scene::VoxScene scene;
    voxscene::core::LoadError error;
    EXPECT_FALSE(voxscene::scene::loadVoxScene(writer.build(), options, scene, &error));
    EXPECT_EQ(error.kind, voxscene::core::LoadErrorKind::AtlasOverflow);
    EXPECT_TRUE(scene.empty());
}

TEST(VoxSceneTest, UnknownChunksAreReportedAsDiagnostics) {
    voxscene::test::VoxWriter writer;
    writer.addModel(1, 1, 1, voxscene::test::filledBox(1, 1, 1, 1));
    writer.addChunk("ZZZZ", {1, 2, 3, 4});

    voxscene::scene::VoxScene scene;
    ASSERT_TRUE(load(writer.build(), scene));
    ASSERT_EQ(scene.diagnostics.size(), 1u);
    EXPECT_EQ(scene.diagnostics[0].kind, voxscene::core::LoadDiagnosticKind::UnsupportedChunk);
    EXPECT_EQ(voxscene::core::tagToString(scene.diagnostics[0].tag), "ZZZZ");
}

TEST(VoxSceneTest, CloudVoxelsBecomeDensityNotGeometry) {
    voxscene::test::VoxWriter writer;
    std::vector<voxscene::vox::RawVoxel> voxels = voxscene::test::filledBox(3, 1, 1, 9);
    voxels[0].paletteIndex = 1;
    writer.addModel(3, 1, 1, voxels);
    writer.addMaterial(9, {{"_type", "_media"}, {"_d", "0.3"}});

    voxscene::scene::VoxScene scene;
    voxscene::core::LoadError error;
    ASSERT_TRUE(load(writer.build(), scene, &error)) << error.message;

    EXPECT_EQ(scene.atlas->paletteIndices, (std::vector<std::uint8_t>{1}));
    const voxscene::model::VoxelModel* model = scene.findModel(0);
    ASSERT_NE(model, nullptr);
    EXPECT_EQ(model->mesh()->quads.size(), 6u);
    ASSERT_TRUE(model->cloudDensity().has_value());
    // MagicaVoxel x = 1 lands at grid x = 1 in a three-wide model.
    EXPECT_FLOAT_EQ(model->cloudDensity()->at(1, 0, 0), 3.0f);
}

TEST(VoxSceneTest, ModelsWithoutRemeshingRejectEdits) {
    voxscene::scene::VoxScene scene;
    ASSERT_TRUE(load(namedBoxScene(2, 1, "crate"), scene));
    voxscene::model::VoxelModel* model = scene.findModel(0);
    ASSERT_NE(model, nullptr);
    EXPECT_FALSE(model->supportsRemeshing());
    EXPECT_FALSE(model->voxelAt(voxscene::core::Cell3i{0, 0, 0}).has_value());

    const std::shared_ptr<const voxscene::model::VoxelMesh> before = model->mesh();
    const bool edited = model->modifyVoxels(
        voxscene::core::CellAabb::fromOriginSize(voxscene::core::Cell3i{}, voxscene::core::Cell3i{1, 1, 1}),
        [](const voxscene::core::Cell3i&, std::uint8_t) { return std::uint8_t{0}; });
    EXPECT_FALSE(edited);
    EXPECT_EQ(model->mesh(), before);
}

TEST(VoxSceneTest, RemeshingSwapsInANewMesh) {
    voxscene::scene::VoxScene scene;
    ASSERT_TRUE(load(namedBoxScene(2, 1, "crate"), scene, nullptr, true));
    voxscene::model::VoxelModel* model = scene.findModel(0);
    ASSERT_NE(model, nullptr);
    ASSERT_TRUE(model->supportsRemeshing());
    EXPECT_EQ(model->voxelAt(voxscene::core::Cell3i{0, 0, 0}), std::optional<std::uint8_t>(1));
    EXPECT_FALSE(model->voxelAt(voxscene::core::Cell3i{2, 0, 0}).has_value());

    const std::shared_ptr<const voxscene::model::VoxelMesh> before = model->mesh();
    ASSERT_TRUE(model->modifyVoxels(
        voxscene::core::CellAabb::fromOriginSize(voxscene::core::Cell3i{}, voxscene::core::Cell3i{2, 2, 2}),
        [](const voxscene::core::Cell3i& cell, std::uint8_t current) {
            return cell == voxscene::core::Cell3i{0, 0, 0} ? std::uint8_t{0} : current;
        }));

    EXPECT_EQ(model->voxelAt(voxscene::core::Cell3i{0, 0, 0}), std::optional<std::uint8_t>(0));
    EXPECT_EQ(model->voxelAt(voxscene::core::Cell3i{1, 1, 1}), std::optional<std::uint8_t>(1));
    ASSERT_NE(model->mesh(), before);
    // Earlier readers keep the mesh they were handed.
    EXPECT_EQ(before->quads.size(), 6u);
    EXPECT_GT(model->mesh()->quads.size(), 6u);
}

TEST(VoxSceneTest, EditsClipToModelBounds) {
    voxscene::scene::VoxScene scene;
    ASSERT_TRUE(load(namedBoxScene(2, 1, "crate"), scene, nullptr, true));
    voxscene::model::VoxelModel* model = scene.findModel(0);
    ASSERT_NE(model, nullptr);

    int visited = 0;
    ASSERT_TRUE(model->modifyVoxels(
        voxscene::core::CellAabb::fromOriginSize(voxscene::core::Cell3i{-5, -5, -5}, voxscene::core::Cell3i{20, 20, 20}),
        [&visited](const voxscene::core::Cell3i&, std::uint8_t current) {
            ++visited;
            return current;
        }));
    EXPECT_EQ(visited, 8);

    visited = 0;
    EXPECT_TRUE(model->modifyVoxels(
        voxscene::core::CellAabb::fromOriginSize(voxscene::core::Cell3i{5, 5, 5}, voxscene::core::Cell3i{2, 2, 2}),
        [&visited](const voxscene::core::Cell3i&, std::uint8_t current) {
            ++visited;
            return current;
        }));
    EXPECT_EQ(visited, 0);
}

TEST(VoxSceneTest, EditWithMaterialOutsideAtlasIsRejected) {
    voxscene::scene::VoxScene scene;
    ASSERT_TRUE(load(namedBoxScene(2, 1, "crate"), scene, nullptr, true));
    voxscene::model::VoxelModel* model = scene.findModel(0);
    ASSERT_NE(model, nullptr);

    const std::shared_ptr<const voxscene::model::VoxelMesh> before = model->mesh();
    EXPECT_FALSE(model->modifyVoxels(
        voxscene::core::CellAabb::fromOriginSize(voxscene::core::Cell3i{}, voxscene::core::Cell3i{1, 1, 1}),
        [](const voxscene::core::Cell3i&, std::uint8_t) { return std::uint8_t{50}; }));
    EXPECT_EQ(model->mesh(), before);
    EXPECT_EQ(model->voxelAt(voxscene::core::Cell3i{0, 0, 0}), std::optional<std::uint8_t>(1));
}

TEST(VoxelModelTest, MissingAtlasCellIsAtlasOverflow) {
    const auto palette = std::make_shared<const voxscene::model::Palette>(voxscene::model::resolvePalette(
        std::nullopt, {}, voxscene::model::PaletteOptions{}));
    auto atlas = std::make_shared<voxscene::model::MaterialAtlas>();
    const std::vector<std::uint8_t> used = {1};
    ASSERT_TRUE(voxscene::model::buildMaterialAtlas(used, *palette, voxscene::model::AtlasOptions{}, *atlas));

    voxscene::vox::RawModel source{};
    source.sizeX = 2;
    source.sizeY = 1;
    source.sizeZ = 1;
    source.voxels = {voxscene::vox::RawVoxel{0, 0, 0, 1}, voxscene::vox::RawVoxel{1, 0, 0, 7}};

    voxscene::model::VoxelModel model;
    voxscene::core::LoadError error;
    EXPECT_FALSE(voxscene::model::VoxelModel::build(
        source, palette, atlas, voxscene::model::ModelSettings{}, model, &error));
    EXPECT_EQ(error.kind, voxscene::core::LoadErrorKind::AtlasOverflow);
    EXPECT_NE(error.message.find("palette index 7"), std::string::npos);
    EXPECT_EQ(model.mesh(), nullptr);

    source.sizeX = 0;
    EXPECT_FALSE(voxscene::model::VoxelModel::build(
        source, palette, atlas, voxscene::model::ModelSettings{}, model, &error));
    EXPECT_EQ(error.kind, voxscene::core::LoadErrorKind::Parse);
}

TEST(VoxSceneTest, AverageIorIsWeightedPerModel) {
    voxscene::test::VoxWriter writer;
    std::vector<voxscene::vox::RawVoxel> glassy = voxscene::test::filledBox(5, 1, 1, 2);
    glassy[3].paletteIndex = 3;
    glassy[4].paletteIndex = 1;
    writer.addModel(5, 1, 1, glassy);
    writer.addModel(1, 1, 1, voxscene::test::filledBox(1, 1, 1, 1));
    writer.addMaterial(2, {{"_type", "_glass"}, {"_trans", "0.5"}, {"_ior", "0.5"}});
    writer.addMaterial(3, {{"_type", "_glass"}, {"_trans", "0.5"}, {"_ior", "0.3"}});

    voxscene::scene::VoxScene scene;
    voxscene::core::LoadError error;
    ASSERT_TRUE(load(writer.build(), scene, &error, true)) << error.message;

    // The shared atlas averages materials; each model averages its own voxels.
    ASSERT_TRUE(scene.atlas->averageIor.has_value());
    EXPECT_NEAR(*scene.atlas->averageIor, 1.4f, 1e-5f);

    voxscene::model::VoxelModel* glassModel = scene.findModel(0);
    ASSERT_NE(glassModel, nullptr);
    ASSERT_TRUE(glassModel->averageIor().has_value());
    EXPECT_NEAR(*glassModel->averageIor(), ((3.0f * 1.5f) + 1.3f) / 4.0f, 1e-5f);

    const voxscene::model::VoxelModel* stoneModel = scene.findModel(1);
    ASSERT_NE(stoneModel, nullptr);
    EXPECT_FALSE(stoneModel->averageIor().has_value());

    // Clearing the 1.3 glass leaves only the 1.5 voxels.
    ASSERT_TRUE(glassModel->modifyVoxels(
        voxscene::core::CellAabb::fromOriginSize(voxscene::core::Cell3i{}, glassModel->size()),
        [](const voxscene::core::Cell3i&, std::uint8_t current) {
            return current == 3u ? std::uint8_t{0} : current;
        }));
    ASSERT_TRUE(glassModel->averageIor().has_value());
    EXPECT_NEAR(*glassModel->averageIor(), 1.5f, 1e-5f);
}

TEST(VoxSceneTest, PointQueriesRoundTripThroughVoxelSpace) {
    voxscene::scene::VoxScene scene;
    ASSERT_TRUE(load(namedBoxScene(2, 1, "crate"), scene));
    const voxscene::model::VoxelModel* model = scene.findModel(0);
    ASSERT_NE(model, nullptr);

    EXPECT_EQ(model->localPointToVoxel(voxscene::math::Vector3{0.25f, -0.25f, 0.75f}),
              (voxscene::core::Cell3i{1, 0, 1}));
    const voxscene::math::Vector3 corner = model->voxelToLocalPoint(voxscene::core::Cell3i{0, 0, 0});
    EXPECT_FLOAT_EQ(corner.x, -1.0f);
    EXPECT_FLOAT_EQ(corner.y, -1.0f);
    EXPECT_FLOAT_EQ(corner.z, -1.0f);

    const voxscene::math::Matrix4 placed =
        voxscene::math::Matrix4::translation(voxscene::math::Vector3{10.0f, 0.0f, 0.0f});
    EXPECT_EQ(model->globalPointToVoxel(voxscene::math::Vector3{10.25f, -0.25f, 0.75f}, placed),
              (voxscene::core::Cell3i{1, 0, 1}));
}

TEST(VoxSceneTest, MirroredAxisPlacesVoxelsOnTheFarSide) {
    voxscene::test::VoxWriter writer;
    writer.addModel(3, 1, 1, {voxscene::vox::RawVoxel{0, 0, 0, 1}});

    voxscene::scene::VoxScene scene;
    ASSERT_TRUE(load(writer.build(), scene, nullptr, true));
    const voxscene::model::VoxelModel* model = scene.findModel(0);
    ASSERT_NE(model, nullptr);
    EXPECT_EQ(model->size(), (voxscene::core::Cell3i{3, 1, 1}));
    EXPECT_EQ(model->voxelAt(voxscene::core::Cell3i{2, 0, 0}), std::optional<std::uint8_t>(1));
    EXPECT_EQ(model->voxelAt(voxscene::core::Cell3i{0, 0, 0}), std::optional<std::uint8_t>(0));
}
