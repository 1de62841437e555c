#include "model/material_atlas.h"

#include "core/log.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace voxscene::model {

namespace {

constexpr float kConstantTolerance = 0.001f;

template <typename Getter>
bool propertyVaries(const std::vector<std::uint8_t>& indices, const Palette& palette, Getter getter) {
    if (indices.empty()) {
        return false;
    }
    float minValue = getter(palette[indices.front()]);
    float maxValue = minValue;
    for (const std::uint8_t index : indices) {
        const float value = getter(palette[index]);
        minValue = std::min(minValue, value);
        maxValue = std::max(maxValue, value);
    }
    return (maxValue - minValue) >= kConstantTolerance;
}

template <typename Getter>
float firstValue(const std::vector<std::uint8_t>& indices, const Palette& palette, Getter getter) {
    return indices.empty() ? 0.0f : getter(palette[indices.front()]);
}

std::uint8_t toUnorm8(float value) {
    return static_cast<std::uint8_t>(std::lround(std::clamp(value, 0.0f, 1.0f) * 255.0f));
}

std::uint16_t toUnorm16(float value) {
    return static_cast<std::uint16_t>(std::lround(std::clamp(value, 0.0f, 1.0f) * 65535.0f));
}

} // namespace

std::optional<math::Vector2> MaterialAtlas::uvForPaletteIndex(std::uint8_t paletteIndex) const {
    const int cell = cellForIndex[paletteIndex];
    if (cell < 0 || width <= 0 || height <= 0) {
        return std::nullopt;
    }
    const int column = cell % width;
    const int row = cell / width;
    return math::Vector2{
        (static_cast<float>(column) + 0.5f) / static_cast<float>(width),
        (static_cast<float>(row) + 0.5f) / static_cast<float>(height)
    };
}

bool buildMaterialAtlas(
    std::span<const std::uint8_t> usedIndices,
    const Palette& palette,
    const AtlasOptions& options,
    MaterialAtlas& outAtlas,
    core::LoadError* outError
) {
    outAtlas = MaterialAtlas{};
    if (options.cellsPerRow <= 0 || options.rowCount <= 0) {
        return core::failLoad(outError, core::LoadErrorKind::AtlasOverflow, "atlas has no cells");
    }

    std::vector<std::uint8_t> indices(usedIndices.begin(), usedIndices.end());
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    indices.erase(std::remove(indices.begin(), indices.end(), std::uint8_t{0}), indices.end());

    const std::size_t capacity =
        static_cast<std::size_t>(options.cellsPerRow) * static_cast<std::size_t>(options.rowCount);
    if (indices.size() > capacity) {
        return core::failLoad(
            outError,
            core::LoadErrorKind::AtlasOverflow,
            std::to_string(indices.size()) + " materials do not fit in " + std::to_string(capacity) + " atlas cells");
    }

    MaterialAtlas atlas{};
    atlas.width = options.cellsPerRow;
    atlas.height = options.rowCount;
    atlas.cellForIndex.fill(-1);
    for (std::size_t cell = 0; cell < indices.size(); ++cell) {
        atlas.cellForIndex[indices[cell]] = static_cast<std::int16_t>(cell);
    }

    const auto roughnessOf = [](const PaletteEntry& entry) { return entry.roughness; };
    const auto metalnessOf = [](const PaletteEntry& entry) { return entry.metalness; };
    const auto emissionOf = [](const PaletteEntry& entry) { return entry.emission; };
    const auto transparencyOf = [](const PaletteEntry& entry) { return entry.transparency; };

    const bool hasMetallicRoughness =
        propertyVaries(indices, palette, roughnessOf) || propertyVaries(indices, palette, metalnessOf);
    const bool hasEmission = std::any_of(indices.begin(), indices.end(), [&](std::uint8_t index) {
        return palette[index].emission > 0.0f;
    });
    const bool hasTransmission = propertyVaries(indices, palette, transparencyOf);

    const std::size_t texelCount = capacity;
    atlas.color.assign(texelCount * 4u, 0u);
    if (hasMetallicRoughness) {
        atlas.metallicRoughness.emplace(texelCount * 4u, std::uint16_t{0});
    } else {
        atlas.uniformRoughness = firstValue(indices, palette, roughnessOf);
        atlas.uniformMetalness = firstValue(indices, palette, metalnessOf);
    }
    if (hasEmission) {
        atlas.emission.emplace(texelCount * 4u, 0.0f);
    } else {
        atlas.uniformEmission = 0.0f;
    }
    if (hasTransmission) {
        atlas.transmission.emplace(texelCount, std::uint16_t{0});
    } else {
        atlas.uniformTransmission = firstValue(indices, palette, transparencyOf);
    }

    float iorSum = 0.0f;
    int iorCount = 0;
    for (std::size_t cell = 0; cell < indices.size(); ++cell) {
        const PaletteEntry& entry = palette[indices[cell]];
        const std::size_t texel = cell * 4u;
        atlas.color[texel + 0u] = toUnorm8(entry.color.x);
        atlas.color[texel + 1u] = toUnorm8(entry.color.y);
        atlas.color[texel + 2u] = toUnorm8(entry.color.z);
        atlas.color[texel + 3u] = toUnorm8(entry.color.w);

        if (atlas.metallicRoughness) {
            (*atlas.metallicRoughness)[texel + 1u] = toUnorm16(entry.roughness);
            (*atlas.metallicRoughness)[texel + 2u] = toUnorm16(entry.metalness);
        }
        if (atlas.emission) {
            (*atlas.emission)[texel + 0u] = entry.color.x * entry.emission;
            (*atlas.emission)[texel + 1u] = entry.color.y * entry.emission;
            (*atlas.emission)[texel + 2u] = entry.color.z * entry.emission;
            (*atlas.emission)[texel + 3u] = entry.color.w * entry.emission;
        }
        if (atlas.transmission) {
            (*atlas.transmission)[cell] = toUnorm16(entry.transparency);
        }
        if (isTranslucent(entry) && entry.ior > 0.0f) {
            iorSum += entry.ior;
            ++iorCount;
        }
    }
    if (iorCount > 0) {
        atlas.averageIor = iorSum / static_cast<float>(iorCount);
    }
    atlas.paletteIndices = std::move(indices);

    VOXSCENE_LOGD("atlas") << "atlas " << atlas.width << "x" << atlas.height << " with " << atlas.cellCount()
                           << " cells" << (atlas.metallicRoughness ? ", metallic-roughness" : "")
                           << (atlas.emission ? ", emission" : "") << (atlas.transmission ? ", transmission" : "");
    outAtlas = std::move(atlas);
    return true;
}

} // namespace voxscene::model
