#include "FrameTransaction.h"
#include "ContractViolation.h"

namespace Cellvox::Residency {

const char* TransactionStateToString(TransactionState state) {
    switch (state) {
        case TransactionState::Clean: return "Clean";
        case TransactionState::Dirty: return "Dirty";
    }
    return "Unknown";
}

void FrameTransaction::requireClean(const char* operation) const {
    if (m_state != TransactionState::Clean) {
        throw ContractViolation(operation, "offsets read while the frame has unfinalized changes");
    }
}

} // namespace Cellvox::Residency
