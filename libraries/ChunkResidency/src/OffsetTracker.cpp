#include "OffsetTracker.h"
#include "ContractViolation.h"
#include <string>

namespace Cellvox::Residency {

LogicalIndex OffsetTracker::allocate() {
    const LogicalIndex index = m_nextIndex++;
    m_offsets.emplace(index, count());
    m_owners.push_back(index);
    return index;
}

void OffsetTracker::release(LogicalIndex index) {
    auto it = m_offsets.find(index);
    if (it == m_offsets.end()) {
        throw ContractViolation("OffsetTracker::release", "index " + std::to_string(index) + " is not tracked");
    }

    const PhysicalOffset freed = it->second;
    const PhysicalOffset last = count() - 1;
    m_offsets.erase(it);

    if (freed != last) {
        // Move the owner of the last offset into the hole
        const LogicalIndex moved = m_owners[last];
        m_owners[freed] = moved;
        m_offsets[moved] = freed;
    }
    m_owners.pop_back();
}

PhysicalOffset OffsetTracker::offsetOf(LogicalIndex index) const {
    auto it = m_offsets.find(index);
    if (it == m_offsets.end()) {
        throw ContractViolation("OffsetTracker::offsetOf", "index " + std::to_string(index) + " is not tracked");
    }
    return it->second;
}

LogicalIndex OffsetTracker::indexAt(PhysicalOffset offset) const {
    if (offset >= count()) {
        throw ContractViolation("OffsetTracker::indexAt", "offset " + std::to_string(offset) +
                                " beyond count " + std::to_string(count()));
    }
    return m_owners[offset];
}

} // namespace Cellvox::Residency
