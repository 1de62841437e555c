#include "vox/vox_records.h"

#include "core/log.h"

#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace voxscene::vox {

namespace {

std::uint32_t packRgba(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a) {
    return
        static_cast<std::uint32_t>(r) |
        (static_cast<std::uint32_t>(g) << 8u) |
        (static_cast<std::uint32_t>(b) << 16u) |
        (static_cast<std::uint32_t>(a) << 24u);
}

bool failChunk(core::LoadError* outError, const ChunkRecord& chunk, const std::string& what) {
    return core::failLoad(
        outError,
        core::LoadErrorKind::Parse,
        "malformed '" + core::tagToString(chunk.tag) + "' chunk at byte " + std::to_string(chunk.offset) + ": " + what);
}

bool parseInt3(std::string_view text, std::array<std::int32_t, 3>& outValues) {
    std::size_t cursor = 0;
    for (std::int32_t& value : outValues) {
        while (cursor < text.size() && text[cursor] == ' ') {
            ++cursor;
        }
        const char* begin = text.data() + cursor;
        const char* end = text.data() + text.size();
        const std::from_chars_result result = std::from_chars(begin, end, value);
        if (result.ec != std::errc{} || result.ptr == begin) {
            return false;
        }
        cursor = static_cast<std::size_t>(result.ptr - text.data());
    }
    return true;
}

bool parseInt(std::string_view text, std::int32_t& outValue) {
    const std::from_chars_result result = std::from_chars(text.data(), text.data() + text.size(), outValue);
    return result.ec == std::errc{} && result.ptr != text.data();
}

bool decodeTransformFrame(const VoxDict& dict, TransformFrame& outFrame) {
    if (const std::string* rotation = findDictValue(dict, "_r")) {
        std::int32_t packed = 0;
        if (!parseInt(*rotation, packed) || packed < 0 || packed > 0x7F) {
            return false;
        }
        int rows[3][3]{};
        if (!decodeRotation(static_cast<std::uint8_t>(packed), rows)) {
            return false;
        }
        outFrame.rotation = static_cast<std::uint8_t>(packed);
    }
    if (const std::string* translation = findDictValue(dict, "_t")) {
        if (!parseInt3(*translation, outFrame.translation)) {
            return false;
        }
    }
    if (const std::string* frame = findDictValue(dict, "_f")) {
        if (!parseInt(*frame, outFrame.frameIndex)) {
            return false;
        }
    }
    return true;
}

struct PendingSize {
    bool valid = false;
    int x = 0;
    int y = 0;
    int z = 0;
};

bool decodeSize(const ChunkRecord& chunk, PendingSize& pending, core::LoadError* outError) {
    if (pending.valid) {
        return failChunk(outError, chunk, "SIZE without matching XYZI");
    }
    ByteReader reader(chunk.content);
    const std::int32_t sx = reader.readI32();
    const std::int32_t sy = reader.readI32();
    const std::int32_t sz = reader.readI32();
    if (!reader.ok()) {
        return failChunk(outError, chunk, "truncated");
    }
    if (sx <= 0 || sy <= 0 || sz <= 0 || sx > kMaxModelExtent || sy > kMaxModelExtent || sz > kMaxModelExtent) {
        return failChunk(
            outError,
            chunk,
            "model size " + std::to_string(sx) + "x" + std::to_string(sy) + "x" + std::to_string(sz) + " out of range");
    }
    pending = PendingSize{true, sx, sy, sz};
    return true;
}

bool decodeXyzi(const ChunkRecord& chunk, PendingSize& pending, VoxRecords& records, core::LoadError* outError) {
    if (!pending.valid) {
        return failChunk(outError, chunk, "XYZI without preceding SIZE");
    }
    ByteReader reader(chunk.content);
    const std::int32_t voxelCount = reader.readI32();
    if (!reader.ok() || voxelCount < 0 || (static_cast<std::size_t>(voxelCount) * 4u) > reader.remaining()) {
        return failChunk(outError, chunk, "voxel count exceeds payload");
    }

    RawModel model{};
    model.sizeX = pending.x;
    model.sizeY = pending.y;
    model.sizeZ = pending.z;
    model.voxels.reserve(static_cast<std::size_t>(voxelCount));
    std::size_t dropped = 0;
    for (std::int32_t i = 0; i < voxelCount; ++i) {
        RawVoxel voxel{};
        voxel.x = reader.readU8();
        voxel.y = reader.readU8();
        voxel.z = reader.readU8();
        voxel.paletteIndex = reader.readU8();
        if (voxel.paletteIndex == 0u ||
            static_cast<int>(voxel.x) >= model.sizeX ||
            static_cast<int>(voxel.y) >= model.sizeY ||
            static_cast<int>(voxel.z) >= model.sizeZ) {
            ++dropped;
            continue;
        }
        model.voxels.push_back(voxel);
    }
    if (dropped > 0u) {
        VOXSCENE_LOGD("vox") << "model " << records.models.size() << ": dropped " << dropped
                             << " voxels outside bounds or with palette index 0";
    }

    records.models.push_back(std::move(model));
    pending = PendingSize{};
    return true;
}

bool decodeRgba(const ChunkRecord& chunk, VoxRecords& records, core::LoadError* outError) {
    if (chunk.content.size() < 1024u) {
        return failChunk(outError, chunk, "palette shorter than 256 entries");
    }
    std::array<std::uint32_t, 256> palette{};
    palette[0] = 0u;
    for (std::size_t paletteIndex = 1u; paletteIndex < palette.size(); ++paletteIndex) {
        const std::size_t byteOffset = (paletteIndex - 1u) * 4u;
        palette[paletteIndex] = packRgba(
            chunk.content[byteOffset + 0u],
            chunk.content[byteOffset + 1u],
            chunk.content[byteOffset + 2u],
            chunk.content[byteOffset + 3u]);
    }
    records.paletteRgba = palette;
    return true;
}

bool decodeTransformNode(const ChunkRecord& chunk, VoxRecords& records, core::LoadError* outError) {
    ByteReader reader(chunk.content);
    SceneNodeRecord node{};
    node.kind = SceneNodeKind::Transform;
    node.id = reader.readI32();
    node.attributes = reader.readDict();
    node.childId = reader.readI32();
    (void)reader.readI32(); // reserved, always -1
    node.layerId = reader.readI32();
    const std::int32_t frameCount = reader.readI32();
    if (!reader.ok() || frameCount < 0) {
        return failChunk(outError, chunk, "truncated transform node");
    }
    for (std::int32_t i = 0; i < frameCount; ++i) {
        const VoxDict frameDict = reader.readDict();
        if (!reader.ok()) {
            return failChunk(outError, chunk, "truncated transform frame");
        }
        TransformFrame frame{};
        if (!decodeTransformFrame(frameDict, frame)) {
            return failChunk(outError, chunk, "invalid frame attributes on node " + std::to_string(node.id));
        }
        node.frames.push_back(frame);
    }
    records.nodes.push_back(std::move(node));
    return true;
}

bool decodeGroupNode(const ChunkRecord& chunk, VoxRecords& records, core::LoadError* outError) {
    ByteReader reader(chunk.content);
    SceneNodeRecord node{};
    node.kind = SceneNodeKind::Group;
    node.id = reader.readI32();
    node.attributes = reader.readDict();
    const std::int32_t childCount = reader.readI32();
    if (!reader.ok() || childCount < 0 || (static_cast<std::size_t>(childCount) * 4u) > reader.remaining()) {
        return failChunk(outError, chunk, "truncated group node");
    }
    node.childIds.reserve(static_cast<std::size_t>(childCount));
    for (std::int32_t i = 0; i < childCount; ++i) {
        node.childIds.push_back(reader.readI32());
    }
    records.nodes.push_back(std::move(node));
    return true;
}

bool decodeShapeNode(const ChunkRecord& chunk, VoxRecords& records, core::LoadError* outError) {
    ByteReader reader(chunk.content);
    SceneNodeRecord node{};
    node.kind = SceneNodeKind::Shape;
    node.id = reader.readI32();
    node.attributes = reader.readDict();
    const std::int32_t modelCount = reader.readI32();
    if (!reader.ok() || modelCount < 1) {
        return failChunk(outError, chunk, "shape node without models");
    }
    for (std::int32_t i = 0; i < modelCount; ++i) {
        ShapeModelRef ref{};
        ref.modelId = reader.readI32();
        const VoxDict modelDict = reader.readDict();
        if (!reader.ok()) {
            return failChunk(outError, chunk, "truncated shape model list");
        }
        if (const std::string* frame = findDictValue(modelDict, "_f")) {
            if (!parseInt(*frame, ref.frameIndex)) {
                return failChunk(outError, chunk, "invalid frame index on node " + std::to_string(node.id));
            }
        } else {
            ref.frameIndex = i;
        }
        node.models.push_back(ref);
    }
    records.nodes.push_back(std::move(node));
    return true;
}

bool decodeLayer(const ChunkRecord& chunk, VoxRecords& records, core::LoadError* outError) {
    ByteReader reader(chunk.content);
    LayerRecord layer{};
    layer.id = reader.readI32();
    layer.attributes = reader.readDict();
    if (!reader.ok()) {
        return failChunk(outError, chunk, "truncated layer");
    }
    records.layers.push_back(std::move(layer));
    return true;
}

bool decodeMaterial(const ChunkRecord& chunk, VoxRecords& records, core::LoadError* outError) {
    ByteReader reader(chunk.content);
    MaterialRecord material{};
    material.paletteIndex = reader.readI32();
    material.properties = reader.readDict();
    if (!reader.ok()) {
        return failChunk(outError, chunk, "truncated material");
    }
    if (material.paletteIndex < 0 || material.paletteIndex > 255) {
        return failChunk(outError, chunk, "material index " + std::to_string(material.paletteIndex) + " out of range");
    }
    records.materials.push_back(std::move(material));
    return true;
}

// Chunks we recognise but do not consume. They are still bounds-checked.
bool validateIgnoredChunk(const ChunkRecord& chunk, core::LoadError* outError) {
    ByteReader reader(chunk.content);
    switch (chunk.id) {
    case kChunkPack:
        (void)reader.readI32();
        break;
    case kChunkRenderObject:
        (void)reader.readDict();
        break;
    case kChunkRenderCamera:
        (void)reader.readI32();
        (void)reader.readDict();
        break;
    case kChunkPaletteNote: {
        const std::int32_t nameCount = reader.readI32();
        for (std::int32_t i = 0; i < nameCount && reader.ok(); ++i) {
            (void)reader.readString();
        }
        break;
    }
    case kChunkIndexMap:
        reader.skip(256u);
        break;
    default:
        break;
    }
    if (!reader.ok()) {
        return failChunk(outError, chunk, "truncated");
    }
    return true;
}

} // namespace

bool decodeRotation(std::uint8_t packed, int outRows[3][3]) {
    const int firstIndex = static_cast<int>(packed & 0x3u);
    const int secondIndex = static_cast<int>((packed >> 2u) & 0x3u);
    if (firstIndex > 2 || secondIndex > 2 || firstIndex == secondIndex) {
        return false;
    }
    const int thirdIndex = 3 - firstIndex - secondIndex;
    const int columns[3] = {firstIndex, secondIndex, thirdIndex};
    for (int row = 0; row < 3; ++row) {
        const bool negative = ((packed >> (4u + static_cast<unsigned>(row))) & 0x1u) != 0u;
        for (int col = 0; col < 3; ++col) {
            outRows[row][col] = 0;
        }
        outRows[row][columns[row]] = negative ? -1 : 1;
    }
    return true;
}

bool decodeVoxRecords(const ChunkStream& stream, VoxRecords& outRecords, core::LoadError* outError) {
    outRecords = VoxRecords{};

    VoxRecords records{};
    records.version = stream.version;
    records.diagnostics = stream.diagnostics;
    PendingSize pendingSize{};

    for (const ChunkRecord& chunk : stream.chunks) {
        bool decoded = true;
        switch (chunk.id) {
        case kChunkMain:
            break;
        case kChunkSize:
            decoded = decodeSize(chunk, pendingSize, outError);
            break;
        case kChunkXyzi:
            decoded = decodeXyzi(chunk, pendingSize, records, outError);
            break;
        case kChunkRgba:
            decoded = decodeRgba(chunk, records, outError);
            break;
        case kChunkTransform:
            decoded = decodeTransformNode(chunk, records, outError);
            break;
        case kChunkGroup:
            decoded = decodeGroupNode(chunk, records, outError);
            break;
        case kChunkShape:
            decoded = decodeShapeNode(chunk, records, outError);
            break;
        case kChunkLayer:
            decoded = decodeLayer(chunk, records, outError);
            break;
        case kChunkMaterial:
            decoded = decodeMaterial(chunk, records, outError);
            break;
        case kChunkLegacyMaterial:
            VOXSCENE_LOGD("vox") << "ignoring legacy MATT chunk at byte " << chunk.offset;
            break;
        default:
            decoded = validateIgnoredChunk(chunk, outError);
            break;
        }
        if (!decoded) {
            return false;
        }
    }

    if (pendingSize.valid) {
        return core::failLoad(outError, core::LoadErrorKind::Parse, "trailing SIZE chunk without XYZI");
    }

    VOXSCENE_LOGD("vox") << "decoded " << records.models.size() << " models, " << records.nodes.size() << " nodes, "
                         << records.layers.size() << " layers, " << records.materials.size() << " materials";
    outRecords = std::move(records);
    return true;
}

bool parseVoxRecords(std::span<const std::uint8_t> bytes, VoxRecords& outRecords, core::LoadError* outError) {
    outRecords = VoxRecords{};
    ChunkStream stream{};
    if (!readChunks(bytes, stream, outError)) {
        return false;
    }
    return decodeVoxRecords(stream, outRecords, outError);
}

} // namespace voxscene::vox
