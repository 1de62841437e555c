#include "vox/chunk_reader.h"

#include "core/log.h"
#include "vox/byte_reader.h"

#include <cstring>
#include <string>
#include <utility>

namespace voxscene::vox {

namespace {

constexpr std::size_t kFileHeaderBytes = 8u;

std::array<char, 4> tagFromBytes(std::span<const std::uint8_t> bytes, std::size_t offset) {
    std::array<char, 4> tag{};
    for (std::size_t i = 0; i < tag.size(); ++i) {
        tag[i] = static_cast<char>(bytes[offset + i]);
    }
    return tag;
}

std::string describeOffset(std::size_t offset) {
    return " at byte " + std::to_string(offset);
}

bool readChunkRange(
    std::span<const std::uint8_t> bytes,
    std::size_t begin,
    std::size_t end,
    std::uint32_t depth,
    ChunkStream& outStream,
    core::LoadError* outError
) {
    if (depth > kMaxChunkDepth) {
        return core::failLoad(outError, core::LoadErrorKind::Parse, "chunk nesting too deep" + describeOffset(begin));
    }

    std::size_t cursor = begin;
    while (cursor < end) {
        if ((end - cursor) < kChunkHeaderBytes) {
            return core::failLoad(outError, core::LoadErrorKind::Parse, "truncated chunk header" + describeOffset(cursor));
        }

        const std::uint32_t chunkId = readU32Le(bytes, cursor + 0u);
        const std::uint32_t contentSize = readU32Le(bytes, cursor + 4u);
        const std::uint32_t childrenSize = readU32Le(bytes, cursor + 8u);
        const std::size_t contentBegin = cursor + kChunkHeaderBytes;
        const std::size_t available = end - contentBegin;
        if (static_cast<std::size_t>(contentSize) > available ||
            static_cast<std::size_t>(childrenSize) > (available - static_cast<std::size_t>(contentSize))) {
            return core::failLoad(
                outError,
                core::LoadErrorKind::Parse,
                "chunk '" + core::tagToString(tagFromBytes(bytes, cursor)) + "' size points past its parent" +
                    describeOffset(cursor));
        }
        const std::size_t contentEnd = contentBegin + static_cast<std::size_t>(contentSize);
        const std::size_t childrenEnd = contentEnd + static_cast<std::size_t>(childrenSize);

        if (!isKnownChunkId(chunkId)) {
            core::LoadDiagnostic diagnostic{};
            diagnostic.kind = core::LoadDiagnosticKind::UnsupportedChunk;
            diagnostic.tag = tagFromBytes(bytes, cursor);
            diagnostic.offset = cursor;
            VOXSCENE_LOGW("vox") << "skipping unsupported chunk '" << core::tagToString(diagnostic.tag) << "'"
                                 << describeOffset(cursor) << " (" << (childrenEnd - contentBegin) << " bytes)";
            outStream.diagnostics.push_back(diagnostic);
            cursor = childrenEnd;
            continue;
        }

        ChunkRecord record{};
        record.id = chunkId;
        record.tag = tagFromBytes(bytes, cursor);
        record.contentSize = contentSize;
        record.childrenSize = childrenSize;
        record.offset = cursor;
        record.depth = depth;
        record.content = bytes.subspan(contentBegin, static_cast<std::size_t>(contentSize));
        outStream.chunks.push_back(record);

        if (childrenSize > 0u &&
            !readChunkRange(bytes, contentEnd, childrenEnd, depth + 1u, outStream, outError)) {
            return false;
        }
        cursor = childrenEnd;
    }
    return true;
}

} // namespace

bool isKnownChunkId(std::uint32_t id) {
    switch (id) {
    case kChunkMain:
    case kChunkPack:
    case kChunkSize:
    case kChunkXyzi:
    case kChunkRgba:
    case kChunkTransform:
    case kChunkGroup:
    case kChunkShape:
    case kChunkLayer:
    case kChunkMaterial:
    case kChunkLegacyMaterial:
    case kChunkRenderObject:
    case kChunkRenderCamera:
    case kChunkPaletteNote:
    case kChunkIndexMap:
        return true;
    default:
        return false;
    }
}

bool isSupportedVoxVersion(std::int32_t version) {
    return version == 150 || version == 200;
}

bool readChunks(std::span<const std::uint8_t> bytes, ChunkStream& outStream, core::LoadError* outError) {
    outStream = ChunkStream{};

    if (bytes.size() < (kFileHeaderBytes + kChunkHeaderBytes)) {
        return core::failLoad(outError, core::LoadErrorKind::Parse, "buffer too small for a .vox header");
    }
    if (std::memcmp(bytes.data(), "VOX ", 4) != 0) {
        return core::failLoad(outError, core::LoadErrorKind::Parse, "missing 'VOX ' magic");
    }

    const std::int32_t version = readI32Le(bytes, 4u);
    if (!isSupportedVoxVersion(version)) {
        return core::failLoad(
            outError, core::LoadErrorKind::Parse, "unsupported .vox version " + std::to_string(version));
    }

    if (readU32Le(bytes, kFileHeaderBytes) != kChunkMain) {
        return core::failLoad(outError, core::LoadErrorKind::Parse, "first chunk is not MAIN");
    }

    ChunkStream stream{};
    stream.version = version;
    if (!readChunkRange(bytes, kFileHeaderBytes, bytes.size(), 0u, stream, outError)) {
        return false;
    }

    std::size_t mainCount = 0;
    for (const ChunkRecord& chunk : stream.chunks) {
        if (chunk.depth == 0u) {
            if (chunk.id != kChunkMain) {
                return core::failLoad(
                    outError,
                    core::LoadErrorKind::Parse,
                    "unexpected top-level chunk '" + core::tagToString(chunk.tag) + "'" + describeOffset(chunk.offset));
            }
            ++mainCount;
        }
    }
    if (mainCount != 1u) {
        return core::failLoad(outError, core::LoadErrorKind::Parse, "expected exactly one MAIN chunk");
    }

    VOXSCENE_LOGD("vox") << "read " << stream.chunks.size() << " chunks (version " << version << ", "
                         << stream.diagnostics.size() << " skipped)";
    outStream = std::move(stream);
    return true;
}

} // namespace voxscene::vox
