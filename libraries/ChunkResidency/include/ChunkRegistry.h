#pragma once

#include "OffsetTracker.h"
#include "ResidencyTypes.h"
#include <functional>
#include <unordered_map>
#include <unordered_set>

namespace Cellvox::Residency {

/**
 * @brief Resident chunks keyed by position, with 26-neighbor adjacency counts
 *
 * Inserted chunks start unbound; the residency manager binds them on the next
 * finalize. Every insert and remove queues an atlas refresh for the position.
 * The tracker must outlive the registry.
 */
class ChunkRegistry {
public:
    using AtlasRefreshSet = std::unordered_set<ChunkPosition, IVec3Hash>;

    explicit ChunkRegistry(OffsetTracker& tracker);

    ChunkRegistry(const ChunkRegistry&) = delete;
    ChunkRegistry& operator=(const ChunkRegistry&) = delete;

    /**
     * @brief Add an unbound chunk and update neighbor counts around it
     * @throws ContractViolation if position is already present
     */
    void insert(const ChunkPosition& position);

    /**
     * @brief Remove a chunk, releasing its logical index if it had one
     * @return The removed record with neighborCount zeroed
     * @throws ContractViolation if position is absent
     */
    ChunkRecord remove(const ChunkPosition& position);

    /**
     * @throws ContractViolation if position is absent or not yet bound
     */
    PhysicalOffset offsetOf(const ChunkPosition& position) const;

    /**
     * @brief Record a bound chunk's new offset after its payload was moved
     *
     * Queues an atlas refresh, since the summary value encodes the offset.
     * @throws ContractViolation if position is absent or unbound
     */
    void rebind(const ChunkPosition& position, PhysicalOffset offset);

    /**
     * @brief Drop a chunk's binding and release its index, keeping the chunk
     * @throws ContractViolation if position is absent or unbound
     */
    void unbind(const ChunkPosition& position);

    bool contains(const ChunkPosition& position) const { return m_chunks.contains(position); }
    const ChunkRecord* find(const ChunkPosition& position) const;
    size_t size() const { return m_chunks.size(); }

    void forEach(const std::function<void(const ChunkRecord&)>& visitor) const;
    void forEachMutable(const std::function<void(ChunkRecord&)>& visitor);

    // Atlas refresh queue
    const AtlasRefreshSet& getPendingAtlasRefreshes() const { return m_atlasRefresh; }
    void queueAtlasRefresh(const ChunkPosition& position) { m_atlasRefresh.insert(position); }
    void clearAtlasRefreshes() { m_atlasRefresh.clear(); }

private:
    OffsetTracker* m_tracker;  // Non-owning
    std::unordered_map<ChunkPosition, ChunkRecord, IVec3Hash> m_chunks;
    AtlasRefreshSet m_atlasRefresh;
};

} // namespace Cellvox::Residency
