#pragma once

#include <cstdint>

namespace Cellvox::Residency {

enum class TransactionState : uint8_t {
    Clean,  ///< Offsets are stable and may be read
    Dirty   ///< Inserts/removes pending; offsets are not yet valid
};

const char* TransactionStateToString(TransactionState state);

/**
 * @brief Per-frame guard between structural mutation and offset reads
 *
 * Any insert or remove marks the transaction dirty; only a completed finalize
 * marks it clean again. Offset-dependent reads call requireClean() first.
 */
class FrameTransaction {
public:
    TransactionState getState() const { return m_state; }
    bool isDirty() const { return m_state == TransactionState::Dirty; }

    void markDirty() { m_state = TransactionState::Dirty; }
    void markClean() { m_state = TransactionState::Clean; }

    /**
     * @throws ContractViolation naming operation when the transaction is dirty
     */
    void requireClean(const char* operation) const;

    /// Completed finalizes that applied pending changes
    uint64_t getCommitCount() const { return m_commits; }
    void recordCommit() { ++m_commits; }

private:
    TransactionState m_state = TransactionState::Clean;
    uint64_t m_commits = 0;
};

} // namespace Cellvox::Residency
