#include "model/palette.h"

#include "core/log.h"

#include <charconv>
#include <cmath>
#include <string>
#include <string_view>
#include <system_error>

namespace voxscene::model {

namespace {

constexpr std::array<std::uint8_t, 6> kCubeSteps = {0xFFu, 0xCCu, 0x99u, 0x66u, 0x33u, 0x00u};
constexpr std::array<std::uint8_t, 10> kRampSteps = {0xEEu, 0xDDu, 0xBBu, 0xAAu, 0x88u, 0x77u, 0x55u, 0x44u, 0x22u, 0x11u};

std::uint32_t packRgba(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a) {
    return
        static_cast<std::uint32_t>(r) |
        (static_cast<std::uint32_t>(g) << 8u) |
        (static_cast<std::uint32_t>(b) << 16u) |
        (static_cast<std::uint32_t>(a) << 24u);
}

std::uint8_t channel(std::uint32_t rgba, std::uint32_t shift) {
    return static_cast<std::uint8_t>((rgba >> shift) & 0xFFu);
}

math::Vector4 colorFromRgba(std::uint32_t rgba, bool linearize) {
    float r = static_cast<float>(channel(rgba, 0u)) / 255.0f;
    float g = static_cast<float>(channel(rgba, 8u)) / 255.0f;
    float b = static_cast<float>(channel(rgba, 16u)) / 255.0f;
    const float a = static_cast<float>(channel(rgba, 24u)) / 255.0f;
    if (linearize) {
        r = srgbToLinear(r);
        g = srgbToLinear(g);
        b = srgbToLinear(b);
    }
    return math::Vector4{r, g, b, a};
}

MaterialKind kindFromType(std::string_view type, int paletteIndex) {
    if (type == "_diffuse") {
        return MaterialKind::Diffuse;
    }
    if (type == "_metal" || type == "_blend") {
        return MaterialKind::Metal;
    }
    if (type == "_glass") {
        return MaterialKind::Glass;
    }
    if (type == "_emit") {
        return MaterialKind::Emissive;
    }
    if (type == "_media") {
        return MaterialKind::Cloud;
    }
    VOXSCENE_LOGW("palette") << "unknown material type '" << type << "' on index " << paletteIndex
                             << ", treating as diffuse";
    return MaterialKind::Diffuse;
}

// Keeps outValue untouched when the key is absent or malformed.
bool readProperty(const vox::VoxDict& properties, std::string_view key, int paletteIndex, float& outValue) {
    const std::string* text = vox::findDictValue(properties, key);
    if (text == nullptr) {
        return false;
    }
    float value = 0.0f;
    const char* begin = text->data();
    const char* end = begin + text->size();
    const std::from_chars_result result = std::from_chars(begin, end, value);
    if (result.ec != std::errc{} || result.ptr != end || !std::isfinite(value)) {
        VOXSCENE_LOGW("palette") << "invalid " << key << " value '" << *text << "' on index " << paletteIndex;
        return false;
    }
    outValue = value;
    return true;
}

struct RawMaterial {
    std::optional<std::string> type;
    vox::VoxDict properties;
};

void applyMaterial(PaletteEntry& entry, const RawMaterial& material, int paletteIndex, const PaletteOptions& options) {
    entry.kind = material.type ? kindFromType(*material.type, paletteIndex) : MaterialKind::Diffuse;

    float rough = 0.0f;
    float metal = 0.0f;
    float trans = 0.0f;
    float ior = 0.0f;
    float emit = 0.0f;
    float flux = 0.0f;
    float density = 0.0f;
    readProperty(material.properties, "_rough", paletteIndex, rough);
    readProperty(material.properties, "_metal", paletteIndex, metal);
    if (!readProperty(material.properties, "_trans", paletteIndex, trans)) {
        readProperty(material.properties, "_alpha", paletteIndex, trans);
    }
    readProperty(material.properties, "_ior", paletteIndex, ior);
    readProperty(material.properties, "_emit", paletteIndex, emit);
    readProperty(material.properties, "_flux", paletteIndex, flux);
    readProperty(material.properties, "_d", paletteIndex, density);

    entry.roughness = entry.kind == MaterialKind::Diffuse ? options.diffuseRoughness : rough;
    entry.metalness = metal;
    entry.transparency = trans;
    entry.ior = entry.kind == MaterialKind::Glass ? (1.0f + ior) : 0.0f;
    entry.emission = emit * (flux + 1.0f) * options.emissionStrength;
    entry.density = entry.kind == MaterialKind::Cloud ? density : 0.0f;
}

} // namespace

std::array<std::uint32_t, kPaletteSize> makeDefaultPaletteRgba() {
    std::array<std::uint32_t, kPaletteSize> palette{};
    std::size_t index = 1;
    for (const std::uint8_t r : kCubeSteps) {
        for (const std::uint8_t g : kCubeSteps) {
            for (const std::uint8_t b : kCubeSteps) {
                if (r == 0u && g == 0u && b == 0u) {
                    continue;
                }
                palette[index++] = packRgba(r, g, b, 0xFFu);
            }
        }
    }
    for (const std::uint8_t step : kRampSteps) {
        palette[index++] = packRgba(step, 0u, 0u, 0xFFu);
    }
    for (const std::uint8_t step : kRampSteps) {
        palette[index++] = packRgba(0u, step, 0u, 0xFFu);
    }
    for (const std::uint8_t step : kRampSteps) {
        palette[index++] = packRgba(0u, 0u, step, 0xFFu);
    }
    for (const std::uint8_t step : kRampSteps) {
        palette[index++] = packRgba(step, step, step, 0xFFu);
    }
    return palette;
}

Palette resolvePalette(
    const std::optional<std::array<std::uint32_t, kPaletteSize>>& fileRgba,
    std::span<const vox::MaterialRecord> materials,
    const PaletteOptions& options
) {
    const std::array<std::uint32_t, kPaletteSize> rgba = fileRgba ? *fileRgba : makeDefaultPaletteRgba();

    // Later MATL chunks override earlier ones key by key.
    std::array<RawMaterial, kPaletteSize> merged{};
    for (const vox::MaterialRecord& material : materials) {
        if (material.paletteIndex == 0) {
            VOXSCENE_LOGW("palette") << "ignoring material override for empty index 0";
            continue;
        }
        RawMaterial& target = merged[static_cast<std::size_t>(material.paletteIndex)];
        for (const auto& [key, value] : material.properties) {
            if (key == "_type") {
                target.type = value;
            } else {
                target.properties.emplace_back(key, value);
            }
        }
    }

    Palette palette{};
    for (std::size_t index = 1; index < kPaletteSize; ++index) {
        PaletteEntry& entry = palette[index];
        entry.rgba8 = rgba[index];
        entry.color = colorFromRgba(rgba[index], options.linearizeColors);
        applyMaterial(entry, merged[index], static_cast<int>(index), options);
    }

    VOXSCENE_LOGD("palette") << "resolved palette (" << (fileRgba ? "file" : "default") << " colors, "
                             << materials.size() << " material overrides)";
    return palette;
}

const char* materialKindName(MaterialKind kind) {
    switch (kind) {
    case MaterialKind::Diffuse:
        return "diffuse";
    case MaterialKind::Metal:
        return "metal";
    case MaterialKind::Glass:
        return "glass";
    case MaterialKind::Emissive:
        return "emissive";
    case MaterialKind::Cloud:
        return "cloud";
    }
    return "unknown";
}

float srgbToLinear(float value) {
    if (value <= 0.04045f) {
        return value / 12.92f;
    }
    return std::pow((value + 0.055f) / 1.055f, 2.4f);
}

} // namespace voxscene::model
