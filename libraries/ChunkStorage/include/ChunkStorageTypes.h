#pragma once

#include <cstdint>
#include <expected>
#include <limits>
#include <string>
#include <string_view>
#include <glm/glm.hpp>

namespace Cellvox::ChunkStorage {

/**
 * @brief Opaque handle to a device-side 3D storage resource (group or atlas)
 */
using GroupHandle = uint32_t;
constexpr GroupHandle INVALID_GROUP_HANDLE = std::numeric_limits<uint32_t>::max();

/**
 * @brief Opaque handle to a device-side binding (group array + atlas)
 */
using BindingHandle = uint64_t;
constexpr BindingHandle INVALID_BINDING_HANDLE = 0;

/// Texel coordinate or extent inside a 3D storage resource
using TexelCoord = glm::uvec3;

/// Upper bound on the number of group entries a binding can expose
constexpr uint32_t MAX_BINDING_ARITY = 16;

/**
 * @brief Storage failure codes
 *
 * Only resource exhaustion and device failures travel through this channel.
 * Caller bugs (bad parity, wrong payload size) are contract violations.
 */
enum class StorageErrorCode : uint8_t {
    OutOfDeviceMemory,
    OutOfHostMemory,
    GroupLimitExceeded,
    InvalidHandle,
    InvalidRegion,
    DeviceLost,
    Unknown
};

constexpr std::string_view StorageErrorCodeToString(StorageErrorCode code) {
    switch (code) {
        case StorageErrorCode::OutOfDeviceMemory:  return "Out of device memory";
        case StorageErrorCode::OutOfHostMemory:    return "Out of host memory";
        case StorageErrorCode::GroupLimitExceeded: return "Group limit exceeded";
        case StorageErrorCode::InvalidHandle:      return "Invalid handle";
        case StorageErrorCode::InvalidRegion:      return "Invalid region";
        case StorageErrorCode::DeviceLost:         return "Device lost";
        case StorageErrorCode::Unknown:            return "Unknown error";
    }
    return "Unknown error";
}

struct StorageError {
    StorageErrorCode code = StorageErrorCode::Unknown;
    std::string message;

    std::string toString() const {
        return std::string(StorageErrorCodeToString(code)) + ": " + message;
    }
};

/**
 * @brief Result type for storage operations that return a value
 *
 * Usage:
 * @code
 * StorageResult<GroupHandle> createGroup(const TexelCoord& extent) {
 *     if (outOfMemory) {
 *         return std::unexpected(StorageError{StorageErrorCode::OutOfDeviceMemory, "group image"});
 *     }
 *     return handle;
 * }
 * @endcode
 */
template<typename T>
using StorageResult = std::expected<T, StorageError>;

/// Status type for storage operations that don't return a value
using StorageStatus = std::expected<void, StorageError>;

/**
 * @brief Return the error from a failed StorageResult/StorageStatus
 */
#define CELLVOX_PROPAGATE_ERROR(result) \
    do { \
        if (!(result)) { \
            return std::unexpected((result).error()); \
        } \
    } while(0)

} // namespace Cellvox::ChunkStorage
