#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "model/palette.h"
#include "vox/vox_records.h"

namespace {

voxscene::vox::MaterialRecord material(std::int32_t index, voxscene::vox::VoxDict properties) {
    voxscene::vox::MaterialRecord record{};
    record.paletteIndex = index;
    record.properties = std::move(properties);
    return record;
}

voxscene::model::Palette resolveWith(const std::vector<voxscene::vox::MaterialRecord>& materials) {
    return voxscene::model::resolvePalette(std::nullopt, materials, voxscene::model::PaletteOptions{});
}

} // namespace

TEST(PaletteTest, DefaultPaletteMatchesMagicaVoxel) {
    const std::array<std::uint32_t, 256> rgba = voxscene::model::makeDefaultPaletteRgba();
    EXPECT_EQ(rgba[0], 0u);
    EXPECT_EQ(rgba[1], 0xFFFFFFFFu);
    EXPECT_EQ(rgba[2], 0xFFCCFFFFu);
    EXPECT_EQ(rgba[215], 0xFF330000u);
    EXPECT_EQ(rgba[216], 0xFF0000EEu);
    EXPECT_EQ(rgba[226], 0xFF00EE00u);
    EXPECT_EQ(rgba[236], 0xFFEE0000u);
    EXPECT_EQ(rgba[246], 0xFFEEEEEEu);
    EXPECT_EQ(rgba[255], 0xFF111111u);
}

TEST(PaletteTest, FileColorsReplaceDefaultsAndSlotZeroStaysEmpty) {
    std::array<std::uint32_t, 256> fileRgba{};
    fileRgba[1] = 0xFF0000FFu;
    const voxscene::model::Palette palette = voxscene::model::resolvePalette(
        fileRgba, {}, voxscene::model::PaletteOptions{});

    EXPECT_EQ(palette[0].rgba8, 0u);
    EXPECT_FLOAT_EQ(palette[0].color.w, 0.0f);
    EXPECT_EQ(palette[1].rgba8, 0xFF0000FFu);
    EXPECT_FLOAT_EQ(palette[1].color.x, 1.0f);
    EXPECT_FLOAT_EQ(palette[1].color.y, 0.0f);
    EXPECT_FLOAT_EQ(palette[1].color.w, 1.0f);
}

TEST(PaletteTest, ColorsAreLinearizedOnRequest) {
    std::array<std::uint32_t, 256> fileRgba{};
    fileRgba[1] = 0xFF808080u;

    voxscene::model::PaletteOptions options{};
    options.linearizeColors = true;
    const voxscene::model::Palette linear = voxscene::model::resolvePalette(fileRgba, {}, options);
    options.linearizeColors = false;
    const voxscene::model::Palette srgb = voxscene::model::resolvePalette(fileRgba, {}, options);

    EXPECT_NEAR(srgb[1].color.x, 128.0f / 255.0f, 1e-6f);
    EXPECT_NEAR(linear[1].color.x, 0.2158605f, 1e-4f);
    // Alpha is never converted.
    EXPECT_FLOAT_EQ(linear[1].color.w, 1.0f);

    EXPECT_FLOAT_EQ(voxscene::model::srgbToLinear(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(voxscene::model::srgbToLinear(1.0f), 1.0f);
    EXPECT_NEAR(voxscene::model::srgbToLinear(0.04f), 0.04f / 12.92f, 1e-7f);
}

TEST(PaletteTest, EntriesWithoutMaterialAreRoughDiffuse) {
    const voxscene::model::Palette palette = resolveWith({});
    for (std::size_t index = 1; index < palette.size(); ++index) {
        EXPECT_EQ(palette[index].kind, voxscene::model::MaterialKind::Diffuse) << "index " << index;
        EXPECT_FLOAT_EQ(palette[index].roughness, 0.8f);
        EXPECT_FLOAT_EQ(palette[index].emission, 0.0f);
        EXPECT_FLOAT_EQ(palette[index].ior, 0.0f);
    }
}

TEST(PaletteTest, MaterialTypesMapToKinds) {
    const voxscene::model::Palette palette = resolveWith({
        material(1, {{"_type", "_metal"}, {"_rough", "0.25"}, {"_metal", "0.9"}}),
        material(2, {{"_type", "_glass"}, {"_trans", "0.5"}, {"_ior", "0.3"}}),
        material(3, {{"_type", "_emit"}, {"_emit", "0.5"}, {"_flux", "1"}}),
        material(4, {{"_type", "_media"}, {"_d", "0.4"}}),
        material(5, {{"_type", "_blend"}}),
        material(6, {{"_type", "_plastic"}, {"_rough", "0.1"}}),
    });

    EXPECT_EQ(palette[1].kind, voxscene::model::MaterialKind::Metal);
    EXPECT_FLOAT_EQ(palette[1].roughness, 0.25f);
    EXPECT_FLOAT_EQ(palette[1].metalness, 0.9f);

    EXPECT_EQ(palette[2].kind, voxscene::model::MaterialKind::Glass);
    EXPECT_FLOAT_EQ(palette[2].transparency, 0.5f);
    EXPECT_FLOAT_EQ(palette[2].ior, 1.3f);
    EXPECT_TRUE(voxscene::model::isTranslucent(palette[2]));

    EXPECT_EQ(palette[3].kind, voxscene::model::MaterialKind::Emissive);
    // emit * (flux + 1) * emissionStrength
    EXPECT_FLOAT_EQ(palette[3].emission, 10.0f);

    EXPECT_EQ(palette[4].kind, voxscene::model::MaterialKind::Cloud);
    EXPECT_FLOAT_EQ(palette[4].density, 0.4f);
    EXPECT_TRUE(voxscene::model::isCloud(palette[4]));
    EXPECT_FALSE(voxscene::model::isTranslucent(palette[4]));

    EXPECT_EQ(palette[5].kind, voxscene::model::MaterialKind::Metal);

    // Unknown types fall back to diffuse with the diffuse roughness.
    EXPECT_EQ(palette[6].kind, voxscene::model::MaterialKind::Diffuse);
    EXPECT_FLOAT_EQ(palette[6].roughness, 0.8f);
}

TEST(PaletteTest, LaterMaterialChunksOverrideKeyByKey) {
    const voxscene::model::Palette palette = resolveWith({
        material(7, {{"_type", "_metal"}, {"_rough", "0.2"}, {"_metal", "0.5"}}),
        material(7, {{"_rough", "0.6"}}),
    });

    EXPECT_EQ(palette[7].kind, voxscene::model::MaterialKind::Metal);
    EXPECT_FLOAT_EQ(palette[7].roughness, 0.6f);
    EXPECT_FLOAT_EQ(palette[7].metalness, 0.5f);
}

TEST(PaletteTest, AlphaIsUsedWhenTransIsMissing) {
    const voxscene::model::Palette palette = resolveWith({
        material(9, {{"_type", "_glass"}, {"_alpha", "0.75"}}),
    });
    EXPECT_FLOAT_EQ(palette[9].transparency, 0.75f);
}

TEST(PaletteTest, MalformedNumbersKeepDefaults) {
    const voxscene::model::Palette palette = resolveWith({
        material(10, {{"_type", "_metal"}, {"_rough", "rough"}, {"_metal", "0.3x"}}),
    });
    EXPECT_FLOAT_EQ(palette[10].roughness, 0.0f);
    EXPECT_FLOAT_EQ(palette[10].metalness, 0.0f);
}

TEST(PaletteTest, MaterialForEmptyIndexIsIgnored) {
    const voxscene::model::Palette palette = resolveWith({
        material(0, {{"_type", "_emit"}, {"_emit", "1"}}),
    });
    EXPECT_EQ(palette[0].kind, voxscene::model::MaterialKind::Diffuse);
    EXPECT_FLOAT_EQ(palette[0].emission, 0.0f);
    EXPECT_EQ(palette[0].rgba8, 0u);
}

TEST(PaletteTest, OptionsScaleEmissionAndDiffuseRoughness) {
    voxscene::model::PaletteOptions options{};
    options.diffuseRoughness = 0.5f;
    options.emissionStrength = 2.0f;
    const std::vector<voxscene::vox::MaterialRecord> materials = {
        material(1, {{"_type", "_emit"}, {"_emit", "1"}, {"_flux", "2"}}),
    };
    const voxscene::model::Palette palette = voxscene::model::resolvePalette(std::nullopt, materials, options);

    EXPECT_FLOAT_EQ(palette[1].emission, 6.0f);
    EXPECT_FLOAT_EQ(palette[2].roughness, 0.5f);
}

TEST(PaletteTest, KindNames) {
    EXPECT_STREQ(voxscene::model::materialKindName(voxscene::model::MaterialKind::Diffuse), "diffuse");
    EXPECT_STREQ(voxscene::model::materialKindName(voxscene::model::MaterialKind::Cloud), "cloud");
}
