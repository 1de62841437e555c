#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Core LoadError subsystem
// Responsible for: describing why a .vox load failed and what was skipped along the way.
// Should NOT do: recover from failures; every error kind aborts the whole file.
namespace voxscene::core {

enum class LoadErrorKind : std::uint8_t {
    Parse = 0,
    DanglingReference = 1,
    AtlasOverflow = 2
};

struct LoadError {
    LoadErrorKind kind = LoadErrorKind::Parse;
    std::string message;
};

enum class LoadDiagnosticKind : std::uint8_t {
    UnsupportedChunk = 0
};

// Non-fatal findings surfaced to the caller next to the loaded scene.
struct LoadDiagnostic {
    LoadDiagnosticKind kind = LoadDiagnosticKind::UnsupportedChunk;
    std::array<char, 4> tag{};
    std::size_t offset = 0;
};

[[nodiscard]] const char* loadErrorKindName(LoadErrorKind kind);

// Logs the failure and fills outError when present. Always returns false so callers
// can write `return failLoad(...)`.
bool failLoad(LoadError* outError, LoadErrorKind kind, std::string message);

[[nodiscard]] std::string tagToString(const std::array<char, 4>& tag);

} // namespace voxscene::core
