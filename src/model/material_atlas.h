#pragma once

#include "core/load_error.h"
#include "math/math.h"
#include "model/palette.h"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

// Material Atlas subsystem
// Responsible for: assigning each used palette index a texel cell and filling the per-channel material images.
// Should NOT do: know about meshes beyond handing out cell-centre UVs.
namespace voxscene::model {

struct AtlasOptions {
    int cellsPerRow = 16;
    int rowCount = 16;
};

// One texel per cell, cells laid out row by row in ascending palette index.
struct MaterialAtlas {
    int width = 0;
    int height = 0;
    // Ascending, distinct, never 0.
    std::vector<std::uint8_t> paletteIndices;
    // Cell number per palette index, -1 when the index has no cell.
    std::array<std::int16_t, kPaletteSize> cellForIndex{};

    // RGBA8.
    std::vector<std::uint8_t> color;
    // RGBA16: G roughness, B metalness. Present when either property varies.
    std::optional<std::vector<std::uint16_t>> metallicRoughness;
    // RGBA32F: color * emission. Present when any used material emits.
    std::optional<std::vector<float>> emission;
    // R16. Present when transparency varies.
    std::optional<std::vector<std::uint16_t>> transmission;

    // Set when the matching image is absent.
    std::optional<float> uniformRoughness;
    std::optional<float> uniformMetalness;
    std::optional<float> uniformEmission;
    std::optional<float> uniformTransmission;
    // Mean index of refraction over translucent materials that declare one.
    std::optional<float> averageIor;

    [[nodiscard]] std::size_t cellCount() const { return paletteIndices.size(); }
    [[nodiscard]] bool hasCell(std::uint8_t paletteIndex) const { return cellForIndex[paletteIndex] >= 0; }
    [[nodiscard]] std::optional<math::Vector2> uvForPaletteIndex(std::uint8_t paletteIndex) const;
};

bool buildMaterialAtlas(
    std::span<const std::uint8_t> usedIndices,
    const Palette& palette,
    const AtlasOptions& options,
    MaterialAtlas& outAtlas,
    core::LoadError* outError = nullptr
);

} // namespace voxscene::model
