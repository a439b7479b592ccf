#pragma once

#include "ResidencyTypes.h"
#include <stdexcept>
#include <string>

namespace Cellvox::Residency {

/**
 * @brief Thrown when a caller breaks the residency API contract
 *
 * Duplicate inserts, removing absent chunks, offset reads while the frame is
 * dirty and similar misuse. Not a runtime condition: production code lets it
 * propagate.
 */
class ContractViolation : public std::logic_error {
public:
    ContractViolation(const std::string& operation, const std::string& detail)
        : std::logic_error(operation + ": " + detail)
        , m_operation(operation)
    {}

    const std::string& operation() const { return m_operation; }

private:
    std::string m_operation;
};

inline std::string FormatPosition(const ChunkPosition& position) {
    return "(" + std::to_string(position.x) + ", " + std::to_string(position.y) + ", " +
           std::to_string(position.z) + ")";
}

} // namespace Cellvox::Residency
