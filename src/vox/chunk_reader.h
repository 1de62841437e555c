#pragma once

#include "core/load_error.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Vox ChunkReader subsystem
// Responsible for: validating the .vox container and flattening its nested chunks.
// Should NOT do: interpret chunk payloads beyond their sizes.
namespace voxscene::vox {

constexpr std::uint32_t fourCc(const char a, const char b, const char c, const char d) {
    return
        static_cast<std::uint32_t>(static_cast<std::uint8_t>(a)) |
        (static_cast<std::uint32_t>(static_cast<std::uint8_t>(b)) << 8u) |
        (static_cast<std::uint32_t>(static_cast<std::uint8_t>(c)) << 16u) |
        (static_cast<std::uint32_t>(static_cast<std::uint8_t>(d)) << 24u);
}

constexpr std::uint32_t kChunkMain = fourCc('M', 'A', 'I', 'N');
constexpr std::uint32_t kChunkPack = fourCc('P', 'A', 'C', 'K');
constexpr std::uint32_t kChunkSize = fourCc('S', 'I', 'Z', 'E');
constexpr std::uint32_t kChunkXyzi = fourCc('X', 'Y', 'Z', 'I');
constexpr std::uint32_t kChunkRgba = fourCc('R', 'G', 'B', 'A');
constexpr std::uint32_t kChunkTransform = fourCc('n', 'T', 'R', 'N');
constexpr std::uint32_t kChunkGroup = fourCc('n', 'G', 'R', 'P');
constexpr std::uint32_t kChunkShape = fourCc('n', 'S', 'H', 'P');
constexpr std::uint32_t kChunkLayer = fourCc('L', 'A', 'Y', 'R');
constexpr std::uint32_t kChunkMaterial = fourCc('M', 'A', 'T', 'L');
constexpr std::uint32_t kChunkLegacyMaterial = fourCc('M', 'A', 'T', 'T');
constexpr std::uint32_t kChunkRenderObject = fourCc('r', 'O', 'B', 'J');
constexpr std::uint32_t kChunkRenderCamera = fourCc('r', 'C', 'A', 'M');
constexpr std::uint32_t kChunkPaletteNote = fourCc('N', 'O', 'T', 'E');
constexpr std::uint32_t kChunkIndexMap = fourCc('I', 'M', 'A', 'P');

constexpr std::size_t kChunkHeaderBytes = 12u;
constexpr std::uint32_t kMaxChunkDepth = 64u;

struct ChunkRecord {
    std::uint32_t id = 0;
    std::array<char, 4> tag{};
    std::uint32_t contentSize = 0;
    std::uint32_t childrenSize = 0;
    // Byte offset of the chunk header in the source buffer.
    std::size_t offset = 0;
    std::uint32_t depth = 0;
    // Views into the caller's buffer; valid only while that buffer lives.
    std::span<const std::uint8_t> content;
};

struct ChunkStream {
    std::int32_t version = 0;
    // Depth-first, file order. MAIN is the first record.
    std::vector<ChunkRecord> chunks;
    std::vector<core::LoadDiagnostic> diagnostics;
};

[[nodiscard]] bool isKnownChunkId(std::uint32_t id);
[[nodiscard]] bool isSupportedVoxVersion(std::int32_t version);

bool readChunks(std::span<const std::uint8_t> bytes, ChunkStream& outStream, core::LoadError* outError = nullptr);

} // namespace voxscene::vox
