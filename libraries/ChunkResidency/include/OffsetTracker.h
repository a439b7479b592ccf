#pragma once

#include "ResidencyTypes.h"
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace Cellvox::Residency {

/**
 * @brief Maps stable logical indices to a dense range of physical offsets
 *
 * Offsets always form [0, count()). Releasing an index whose offset is not the
 * last one moves the owner of the last offset into the hole (swap-to-end), so
 * removal is O(1) and exactly one chunk changes offset.
 *
 * Usage:
 * @code
 * OffsetTracker tracker;
 * LogicalIndex a = tracker.allocate();   // offset 0
 * LogicalIndex b = tracker.allocate();   // offset 1
 * tracker.release(a);
 * tracker.offsetOf(b);                   // 0
 * @endcode
 */
class OffsetTracker {
public:
    OffsetTracker() = default;

    /**
     * @brief Hand out a fresh index bound to offset count()
     */
    LogicalIndex allocate();

    /**
     * @brief Drop an index, compacting the offset range
     * @throws ContractViolation if index is not tracked
     */
    void release(LogicalIndex index);

    /**
     * @throws ContractViolation if index is not tracked
     */
    PhysicalOffset offsetOf(LogicalIndex index) const;

    /**
     * @throws ContractViolation if offset >= count()
     */
    LogicalIndex indexAt(PhysicalOffset offset) const;

    bool isTracked(LogicalIndex index) const { return m_offsets.contains(index); }
    uint32_t count() const { return static_cast<uint32_t>(m_owners.size()); }
    bool empty() const { return m_owners.empty(); }

    /// Index the next allocate() will return
    LogicalIndex peekNextIndex() const { return m_nextIndex; }

private:
    std::vector<LogicalIndex> m_owners;                          // offset -> index
    std::unordered_map<LogicalIndex, PhysicalOffset> m_offsets;  // index -> offset
    LogicalIndex m_nextIndex = 0;
};

} // namespace Cellvox::Residency
