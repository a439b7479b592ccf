#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <glm/glm.hpp>
#ifndef GLM_ENABLE_EXPERIMENTAL
#define GLM_ENABLE_EXPERIMENTAL
#endif
#include <glm/gtx/hash.hpp>

namespace Cellvox::Residency {

/// Integer chunk coordinate (one unit = one chunk edge)
using ChunkPosition = glm::ivec3;

/// Stable residency identity; never reused while the process runs
using LogicalIndex = uint64_t;

/// Dense slot in [0, count) addressing a chunk's payload in backing storage
using PhysicalOffset = uint32_t;

/**
 * @brief Hash for ChunkPosition keys in unordered containers
 *
 * Delegates to glm's component hash-combine so neighbouring positions in the
 * atlas domain spread across buckets.
 */
struct IVec3Hash {
    size_t operator()(const glm::ivec3& v) const {
        return std::hash<glm::ivec3>{}(v);
    }
};

struct ResidencyBinding {
    LogicalIndex index = 0;
    PhysicalOffset offset = 0;
};

/**
 * @brief Registry entry for one resident chunk
 *
 * binding stays empty from insertion until the next finalize assigns one.
 */
struct ChunkRecord {
    ChunkPosition position{0};
    uint32_t neighborCount = 0;     // 0-26
    std::optional<ResidencyBinding> binding;
};

/**
 * @brief Per-offset row uploaded for the simulation stage
 */
struct ChunkInfo {
    ChunkPosition position{0};
    uint32_t neighborCount = 0;
};

/// 3x3x3 neighborhood minus the center
constexpr std::array<std::array<int, 3>, 26> NEIGHBOR_OFFSETS = {{
    {-1, -1, -1}, { 0, -1, -1}, { 1, -1, -1},
    {-1,  0, -1}, { 0,  0, -1}, { 1,  0, -1},
    {-1,  1, -1}, { 0,  1, -1}, { 1,  1, -1},
    {-1, -1,  0}, { 0, -1,  0}, { 1, -1,  0},
    {-1,  0,  0},               { 1,  0,  0},
    {-1,  1,  0}, { 0,  1,  0}, { 1,  1,  0},
    {-1, -1,  1}, { 0, -1,  1}, { 1, -1,  1},
    {-1,  0,  1}, { 0,  0,  1}, { 1,  0,  1},
    {-1,  1,  1}, { 0,  1,  1}, { 1,  1,  1},
}};

inline ChunkPosition NeighborOf(const ChunkPosition& position, size_t neighbor) {
    const auto& delta = NEIGHBOR_OFFSETS[neighbor];
    return position + ChunkPosition(delta[0], delta[1], delta[2]);
}

} // namespace Cellvox::Residency
