#pragma once

#include <array>
#include <cstdint>

#include "math/math.h"

// Core Grid subsystem
// Responsible for: integer voxel-space primitives shared by grids, meshing and editing.
// Should NOT do: own voxel storage or know about the .vox container.
namespace voxscene::core {

struct Cell3i {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t z = 0;

    constexpr Cell3i() = default;
    constexpr Cell3i(std::int32_t xIn, std::int32_t yIn, std::int32_t zIn) : x(xIn), y(yIn), z(zIn) {}

    constexpr bool operator==(const Cell3i&) const = default;

    constexpr Cell3i operator+(const Cell3i& rhs) const {
        return Cell3i{x + rhs.x, y + rhs.y, z + rhs.z};
    }

    constexpr Cell3i operator-(const Cell3i& rhs) const {
        return Cell3i{x - rhs.x, y - rhs.y, z - rhs.z};
    }
};

// Half-open box of cells.
struct CellAabb {
    Cell3i minInclusive{};
    Cell3i maxExclusive{};
    bool valid = false;

    static constexpr CellAabb fromOriginSize(const Cell3i& origin, const Cell3i& size) {
        return CellAabb{origin, origin + size, true};
    }

    constexpr bool empty() const {
        if (!valid) {
            return true;
        }
        return maxExclusive.x <= minInclusive.x ||
               maxExclusive.y <= minInclusive.y ||
               maxExclusive.z <= minInclusive.z;
    }

    constexpr bool contains(const Cell3i& cell) const {
        if (!valid || empty()) {
            return false;
        }
        return cell.x >= minInclusive.x && cell.x < maxExclusive.x &&
               cell.y >= minInclusive.y && cell.y < maxExclusive.y &&
               cell.z >= minInclusive.z && cell.z < maxExclusive.z;
    }
};

inline constexpr CellAabb intersectAabb(const CellAabb& lhs, const CellAabb& rhs) {
    if (!lhs.valid || lhs.empty() || !rhs.valid || rhs.empty()) {
        return CellAabb{};
    }

    CellAabb result{};
    result.valid = true;
    result.minInclusive.x = lhs.minInclusive.x > rhs.minInclusive.x ? lhs.minInclusive.x : rhs.minInclusive.x;
    result.minInclusive.y = lhs.minInclusive.y > rhs.minInclusive.y ? lhs.minInclusive.y : rhs.minInclusive.y;
    result.minInclusive.z = lhs.minInclusive.z > rhs.minInclusive.z ? lhs.minInclusive.z : rhs.minInclusive.z;
    result.maxExclusive.x = lhs.maxExclusive.x < rhs.maxExclusive.x ? lhs.maxExclusive.x : rhs.maxExclusive.x;
    result.maxExclusive.y = lhs.maxExclusive.y < rhs.maxExclusive.y ? lhs.maxExclusive.y : rhs.maxExclusive.y;
    result.maxExclusive.z = lhs.maxExclusive.z < rhs.maxExclusive.z ? lhs.maxExclusive.z : rhs.maxExclusive.z;

    if (result.empty()) {
        return CellAabb{};
    }
    return result;
}

// Face directions in the fixed meshing order.
enum class Dir6 : std::uint8_t {
    PosX = 0,
    NegX = 1,
    PosY = 2,
    NegY = 3,
    PosZ = 4,
    NegZ = 5
};

inline constexpr std::array<Dir6, 6> kAllDir6 = {
    Dir6::PosX,
    Dir6::NegX,
    Dir6::PosY,
    Dir6::NegY,
    Dir6::PosZ,
    Dir6::NegZ
};

inline constexpr Cell3i dirToOffset(Dir6 dir) {
    switch (dir) {
    case Dir6::PosX: return Cell3i{1, 0, 0};
    case Dir6::NegX: return Cell3i{-1, 0, 0};
    case Dir6::PosY: return Cell3i{0, 1, 0};
    case Dir6::NegY: return Cell3i{0, -1, 0};
    case Dir6::PosZ: return Cell3i{0, 0, 1};
    case Dir6::NegZ: return Cell3i{0, 0, -1};
    }
    return Cell3i{0, 0, 0};
}

inline constexpr Cell3i neighborCell(const Cell3i& cell, Dir6 dir) {
    return cell + dirToOffset(dir);
}

inline constexpr math::Vector3 dirToUnitVector(Dir6 dir) {
    switch (dir) {
    case Dir6::PosX: return math::Vector3{1.0f, 0.0f, 0.0f};
    case Dir6::NegX: return math::Vector3{-1.0f, 0.0f, 0.0f};
    case Dir6::PosY: return math::Vector3{0.0f, 1.0f, 0.0f};
    case Dir6::NegY: return math::Vector3{0.0f, -1.0f, 0.0f};
    case Dir6::PosZ: return math::Vector3{0.0f, 0.0f, 1.0f};
    case Dir6::NegZ: return math::Vector3{0.0f, 0.0f, -1.0f};
    }
    return math::Vector3{0.0f, 1.0f, 0.0f};
}

} // namespace voxscene::core
