#pragma once

#include "IChunkStorageDevice.h"
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace Cellvox::ChunkStorage {

/**
 * @brief Storage device backed by host memory
 *
 * Operations apply immediately, so flush() only counts submissions.
 * Read-back and failure injection make it the reference backend for tests.
 */
class HostChunkStorageDevice : public IChunkStorageDevice {
public:
    /**
     * @brief Snapshot of a binding as the device received it
     */
    struct BindingRecord {
        GroupHandle atlas = INVALID_GROUP_HANDLE;
        GroupBindingSlots slots;
        bool readWrite = false;
    };

    HostChunkStorageDevice() = default;
    ~HostChunkStorageDevice() override = default;

    HostChunkStorageDevice(const HostChunkStorageDevice&) = delete;
    HostChunkStorageDevice& operator=(const HostChunkStorageDevice&) = delete;

    // IChunkStorageDevice
    [[nodiscard]] StorageResult<GroupHandle> createGroup(const TexelCoord& extent) override;
    [[nodiscard]] StorageResult<GroupHandle> createAtlas(const TexelCoord& extent) override;
    [[nodiscard]] StorageStatus writeRegion(GroupHandle group, const TexelCoord& origin,
                                            const TexelCoord& extent,
                                            std::span<const uint32_t> cells) override;
    [[nodiscard]] StorageStatus copyRegion(GroupHandle srcGroup, const TexelCoord& srcOrigin,
                                           GroupHandle dstGroup, const TexelCoord& dstOrigin,
                                           const TexelCoord& extent) override;
    [[nodiscard]] StorageStatus writeScalar(GroupHandle atlas, const TexelCoord& texel,
                                            uint32_t value) override;
    [[nodiscard]] StorageResult<BindingHandle> createBinding(GroupHandle atlas,
                                                             const GroupBindingSlots& slots,
                                                             bool readWrite) override;
    void destroyBinding(BindingHandle binding) override;
    [[nodiscard]] StorageResult<GroupHandle> createPlaceholder() override;
    [[nodiscard]] StorageStatus flush() override;

    // Read-back
    [[nodiscard]] StorageResult<std::vector<uint32_t>> readRegion(
        GroupHandle group, const TexelCoord& origin, const TexelCoord& extent) const;
    [[nodiscard]] StorageResult<uint32_t> readScalar(GroupHandle atlas, const TexelCoord& texel) const;
    std::optional<BindingRecord> getBinding(BindingHandle binding) const;
    std::optional<TexelCoord> getExtent(GroupHandle group) const;

    // Failure injection
    /// Fail createGroup once this many payload groups exist (nullopt = unlimited)
    void setGroupAllocationLimit(std::optional<uint32_t> limit) { m_groupLimit = limit; }
    void setSimulateOutOfMemory(bool enable) { m_simulateOOM = enable; }

    // Statistics
    uint32_t getGroupCount() const { return m_groupCount; }
    uint32_t getCopyCount() const { return m_copyCount; }
    uint32_t getFlushCount() const { return m_flushCount; }
    uint32_t getScalarWriteCount() const { return m_scalarWriteCount; }
    size_t getLiveBindingCount() const { return m_bindings.size(); }

private:
    struct Resource {
        TexelCoord extent{0};
        std::vector<uint32_t> cells;
    };

    StorageResult<GroupHandle> allocateResource(const TexelCoord& extent);
    const Resource* findResource(GroupHandle handle) const;
    Resource* findResource(GroupHandle handle);
    static bool regionFits(const Resource& resource, const TexelCoord& origin, const TexelCoord& extent);
    static size_t linearIndex(const Resource& resource, uint32_t x, uint32_t y, uint32_t z);

    std::vector<Resource> m_resources;
    std::unordered_map<BindingHandle, BindingRecord> m_bindings;
    BindingHandle m_nextBinding = 1;

    std::optional<uint32_t> m_groupLimit;
    bool m_simulateOOM = false;

    uint32_t m_groupCount = 0;
    uint32_t m_copyCount = 0;
    uint32_t m_flushCount = 0;
    uint32_t m_scalarWriteCount = 0;
};

} // namespace Cellvox::ChunkStorage
