#pragma once

#include "ChunkStorageTypes.h"
#include "BindingSlots.h"
#include <cstdint>
#include <span>

namespace Cellvox::ChunkStorage {

using GroupBindingSlots = BindingSlots<GroupHandle, MAX_BINDING_ARITY>;

/**
 * @brief Device-side storage for chunk payloads and the residency atlas
 *
 * Every resource is a 3D grid of uint32_t cells addressed by texel.
 * Operations are recorded in submission order; an implementation may defer
 * execution until flush(), but must preserve that order.
 *
 * Implementations:
 * - HostChunkStorageDevice: host memory, immediate, used headless and in tests
 * - VulkanChunkStorageDevice: R32_UINT storage images
 */
class IChunkStorageDevice {
public:
    virtual ~IChunkStorageDevice() = default;

    /**
     * @brief Create a zero-initialized payload group
     * @param extent Texel extent of the whole group
     */
    [[nodiscard]] virtual StorageResult<GroupHandle> createGroup(const TexelCoord& extent) = 0;

    /**
     * @brief Create a zero-initialized atlas
     */
    [[nodiscard]] virtual StorageResult<GroupHandle> createAtlas(const TexelCoord& extent) = 0;

    /**
     * @brief Overwrite a region with tightly packed x-fastest data
     * @param cells extent.x * extent.y * extent.z values
     */
    [[nodiscard]] virtual StorageStatus writeRegion(
        GroupHandle group,
        const TexelCoord& origin,
        const TexelCoord& extent,
        std::span<const uint32_t> cells) = 0;

    /**
     * @brief Copy a region between (or within) groups
     *
     * Source and destination regions never overlap when issued by the
     * coordinator.
     */
    [[nodiscard]] virtual StorageStatus copyRegion(
        GroupHandle srcGroup,
        const TexelCoord& srcOrigin,
        GroupHandle dstGroup,
        const TexelCoord& dstOrigin,
        const TexelCoord& extent) = 0;

    [[nodiscard]] virtual StorageStatus writeScalar(
        GroupHandle atlas,
        const TexelCoord& texel,
        uint32_t value) = 0;

    /**
     * @brief Build a binding exposing the atlas plus slots.Arity() groups
     * @param readWrite Whether consumers may write through the binding
     */
    [[nodiscard]] virtual StorageResult<BindingHandle> createBinding(
        GroupHandle atlas,
        const GroupBindingSlots& slots,
        bool readWrite) = 0;

    virtual void destroyBinding(BindingHandle binding) = 0;

    /**
     * @brief Create a 1x1x1 resource used to pad unused binding entries
     */
    [[nodiscard]] virtual StorageResult<GroupHandle> createPlaceholder() = 0;

    /**
     * @brief Submit every operation recorded since the previous flush
     */
    [[nodiscard]] virtual StorageStatus flush() = 0;
};

} // namespace Cellvox::ChunkStorage
