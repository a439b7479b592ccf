#include "ChunkRegistry.h"
#include "ContractViolation.h"

namespace Cellvox::Residency {

ChunkRegistry::ChunkRegistry(OffsetTracker& tracker)
    : m_tracker(&tracker)
{}

void ChunkRegistry::insert(const ChunkPosition& position) {
    if (m_chunks.contains(position)) {
        throw ContractViolation("ChunkRegistry::insert", "chunk " + FormatPosition(position) + " already present");
    }

    uint32_t found = 0;
    for (size_t i = 0; i < NEIGHBOR_OFFSETS.size(); ++i) {
        auto it = m_chunks.find(NeighborOf(position, i));
        if (it != m_chunks.end()) {
            ++it->second.neighborCount;
            ++found;
        }
    }

    ChunkRecord record;
    record.position = position;
    record.neighborCount = found;
    m_chunks.emplace(position, record);
    m_atlasRefresh.insert(position);
}

ChunkRecord ChunkRegistry::remove(const ChunkPosition& position) {
    auto it = m_chunks.find(position);
    if (it == m_chunks.end()) {
        throw ContractViolation("ChunkRegistry::remove", "chunk " + FormatPosition(position) + " is absent");
    }

    ChunkRecord record = it->second;
    m_chunks.erase(it);

    for (size_t i = 0; i < NEIGHBOR_OFFSETS.size(); ++i) {
        auto neighbor = m_chunks.find(NeighborOf(position, i));
        if (neighbor != m_chunks.end()) {
            --neighbor->second.neighborCount;
        }
    }

    if (record.binding) {
        m_tracker->release(record.binding->index);
    }
    m_atlasRefresh.insert(position);

    record.neighborCount = 0;
    return record;
}

PhysicalOffset ChunkRegistry::offsetOf(const ChunkPosition& position) const {
    const ChunkRecord* record = find(position);
    if (!record) {
        throw ContractViolation("ChunkRegistry::offsetOf", "chunk " + FormatPosition(position) + " is absent");
    }
    if (!record->binding) {
        throw ContractViolation("ChunkRegistry::offsetOf", "chunk " + FormatPosition(position) +
                                " has no offset before finalize");
    }
    return record->binding->offset;
}

void ChunkRegistry::rebind(const ChunkPosition& position, PhysicalOffset offset) {
    auto it = m_chunks.find(position);
    if (it == m_chunks.end() || !it->second.binding) {
        throw ContractViolation("ChunkRegistry::rebind", "chunk " + FormatPosition(position) + " is not bound");
    }
    it->second.binding->offset = offset;
    m_atlasRefresh.insert(position);
}

void ChunkRegistry::unbind(const ChunkPosition& position) {
    auto it = m_chunks.find(position);
    if (it == m_chunks.end() || !it->second.binding) {
        throw ContractViolation("ChunkRegistry::unbind", "chunk " + FormatPosition(position) + " is not bound");
    }
    m_tracker->release(it->second.binding->index);
    it->second.binding.reset();
}

const ChunkRecord* ChunkRegistry::find(const ChunkPosition& position) const {
    auto it = m_chunks.find(position);
    return it != m_chunks.end() ? &it->second : nullptr;
}

void ChunkRegistry::forEach(const std::function<void(const ChunkRecord&)>& visitor) const {
    for (const auto& [position, record] : m_chunks) {
        visitor(record);
    }
}

void ChunkRegistry::forEachMutable(const std::function<void(ChunkRecord&)>& visitor) {
    for (auto& [position, record] : m_chunks) {
        visitor(record);
    }
}

} // namespace Cellvox::Residency
