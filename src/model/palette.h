#pragma once

#include "math/math.h"
#include "vox/vox_records.h"

#include <array>
#include <cstdint>
#include <optional>
#include <span>

// Palette subsystem
// Responsible for: resolving the 256 palette slots into colors and physical material properties.
// Should NOT do: decide which slots a model uses or lay them out in an atlas.
namespace voxscene::model {

enum class MaterialKind : std::uint8_t {
    Diffuse = 0,
    Metal = 1,
    Glass = 2,
    Emissive = 3,
    Cloud = 4
};

struct PaletteEntry {
    // Packed RGBA8 as stored in the file (r in the low byte).
    std::uint32_t rgba8 = 0;
    // Normalized RGBA; RGB is linear when the palette was resolved with linearizeColors.
    math::Vector4 color{};
    MaterialKind kind = MaterialKind::Diffuse;
    float roughness = 0.0f;
    float metalness = 0.0f;
    float emission = 0.0f;
    float transparency = 0.0f;
    float ior = 0.0f;
    float density = 0.0f;
};

struct PaletteOptions {
    bool linearizeColors = true;
    float diffuseRoughness = 0.8f;
    float emissionStrength = 10.0f;
};

constexpr std::size_t kPaletteSize = 256;
using Palette = std::array<PaletteEntry, kPaletteSize>;

// MagicaVoxel's built-in palette, indexed by palette index (slot 0 is empty).
[[nodiscard]] std::array<std::uint32_t, kPaletteSize> makeDefaultPaletteRgba();

[[nodiscard]] Palette resolvePalette(
    const std::optional<std::array<std::uint32_t, kPaletteSize>>& fileRgba,
    std::span<const vox::MaterialRecord> materials,
    const PaletteOptions& options
);

[[nodiscard]] const char* materialKindName(MaterialKind kind);
[[nodiscard]] float srgbToLinear(float value);

inline bool isCloud(const PaletteEntry& entry) {
    return entry.kind == MaterialKind::Cloud;
}

inline bool isTranslucent(const PaletteEntry& entry) {
    return entry.kind != MaterialKind::Cloud && entry.transparency > 0.0f;
}

} // namespace voxscene::model
