#include "ChunkStorageLayout.h"
#include <stdexcept>

namespace Cellvox::ChunkStorage {

ChunkStorageLayout::ChunkStorageLayout(uint32_t chunkEdge, uint32_t chunksPerGroup)
    : m_chunkEdge(chunkEdge)
    , m_chunksPerGroup(chunksPerGroup)
    , m_payloadCellCount(static_cast<size_t>(chunkEdge) * chunkEdge * chunkEdge)
{
    if (chunkEdge == 0) {
        throw std::invalid_argument("Chunk edge must be positive");
    }
    if (chunksPerGroup == 0) {
        throw std::invalid_argument("Chunks per group must be positive");
    }
}

TexelCoord ChunkStorageLayout::getGroupExtent() const {
    return TexelCoord(m_chunkEdge * m_chunksPerGroup, m_chunkEdge, m_chunkEdge * 2);
}

TexelCoord ChunkStorageLayout::getPayloadExtent() const {
    return TexelCoord(m_chunkEdge, m_chunkEdge, m_chunkEdge);
}

TexelCoord ChunkStorageLayout::getDoubleBufferedExtent() const {
    return TexelCoord(m_chunkEdge, m_chunkEdge, m_chunkEdge * 2);
}

GroupLocation ChunkStorageLayout::locate(uint32_t offset) const {
    return GroupLocation{offset / m_chunksPerGroup, offset % m_chunksPerGroup};
}

TexelCoord ChunkStorageLayout::texelOrigin(uint32_t offset, uint32_t parity) const {
    const GroupLocation location = locate(offset);
    return TexelCoord(location.slot * m_chunkEdge, 0, parity * m_chunkEdge);
}

uint32_t ChunkStorageLayout::groupsRequired(uint32_t offsetCount) const {
    return (offsetCount + m_chunksPerGroup - 1) / m_chunksPerGroup;
}

} // namespace Cellvox::ChunkStorage
