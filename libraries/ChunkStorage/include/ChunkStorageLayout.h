#pragma once

#include "ChunkStorageTypes.h"
#include <cstdint>

namespace Cellvox::ChunkStorage {

/**
 * @brief Location of a physical offset inside the group list
 */
struct GroupLocation {
    uint32_t group = 0;  // offset / chunksPerGroup
    uint32_t slot = 0;   // offset % chunksPerGroup

    bool operator==(const GroupLocation& other) const = default;
};

/**
 * @brief Geometric layout of chunk payloads inside storage groups
 *
 * A group stores chunksPerGroup chunks side by side along X. Each chunk owns
 * an edge × edge × (2·edge) block: parity 0 occupies z ∈ [0, edge), parity 1
 * occupies z ∈ [edge, 2·edge).
 *
 *   group extent = (edge · chunksPerGroup, edge, 2 · edge)
 *   offset o, parity w  →  group o / N, texel origin ((o % N) · edge, 0, w · edge)
 */
class ChunkStorageLayout {
public:
    ChunkStorageLayout(uint32_t chunkEdge, uint32_t chunksPerGroup);

    uint32_t getChunkEdge() const { return m_chunkEdge; }
    uint32_t getChunksPerGroup() const { return m_chunksPerGroup; }

    /// Cells in one parity slot of one chunk (edge³)
    size_t getPayloadCellCount() const { return m_payloadCellCount; }

    TexelCoord getGroupExtent() const;
    TexelCoord getPayloadExtent() const;           // one parity slot
    TexelCoord getDoubleBufferedExtent() const;    // both parity slots

    GroupLocation locate(uint32_t offset) const;
    TexelCoord texelOrigin(uint32_t offset, uint32_t parity) const;

    /// Number of groups needed to hold offsetCount offsets
    uint32_t groupsRequired(uint32_t offsetCount) const;

private:
    uint32_t m_chunkEdge;
    uint32_t m_chunksPerGroup;
    size_t m_payloadCellCount;
};

} // namespace Cellvox::ChunkStorage
