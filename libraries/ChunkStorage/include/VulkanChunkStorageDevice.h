#pragma once

#include "IChunkStorageDevice.h"
#include "ILoggable.h"
#include <cstdint>
#include <unordered_map>
#include <variant>
#include <vector>
#include <vulkan/vulkan.h>

namespace Cellvox::ChunkStorage {

/**
 * @brief Device objects the storage backend records and submits against
 *
 * The queue must support transfer operations. Ownership stays with the caller.
 */
struct VulkanStorageContext {
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
    VkDevice device = VK_NULL_HANDLE;
    VkQueue queue = VK_NULL_HANDLE;
    uint32_t queueFamilyIndex = 0;
};

/**
 * @brief Storage device backed by R32_UINT 3D storage images
 *
 * All images live in VK_IMAGE_LAYOUT_GENERAL so compute stages can bind them
 * as storage images without further transitions. Operations are queued and
 * recorded, in order, into a single command buffer on flush(); writes share
 * one host-visible staging buffer per batch. Staging memory and retired
 * descriptor sets are released once the batch fence has signaled.
 *
 * Bindings are descriptor sets:
 *   binding 0: atlas (storage image)
 *   binding 1: storage image array of bindingArity groups
 */
class VulkanChunkStorageDevice : public IChunkStorageDevice, public Log::ILoggable {
public:
    VulkanChunkStorageDevice(const VulkanStorageContext& context, uint32_t bindingArity);
    ~VulkanChunkStorageDevice() override;

    VulkanChunkStorageDevice(const VulkanChunkStorageDevice&) = delete;
    VulkanChunkStorageDevice& operator=(const VulkanChunkStorageDevice&) = delete;

    /**
     * @brief Create the command pool, fence and descriptor set layouts
     */
    [[nodiscard]] StorageStatus initialize();

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

    /**
     * @brief Flush, then copy a region back to the host and wait for it
     *
     * Blocks the calling thread; intended for verification and debugging.
     */
    [[nodiscard]] StorageResult<std::vector<uint32_t>> readRegion(
        GroupHandle group, const TexelCoord& origin, const TexelCoord& extent);

    // Raw handles for pipeline construction
    VkDescriptorSetLayout getDescriptorSetLayout(bool readWrite) const;
    VkDescriptorSet getDescriptorSet(BindingHandle binding) const;
    VkImageView getImageView(GroupHandle group) const;
    uint32_t getBindingArity() const { return m_bindingArity; }

private:
    struct ImageResource {
        VkImage image = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        VkImageView view = VK_NULL_HANDLE;
        TexelCoord extent{0};
    };

    struct HostBuffer {
        VkBuffer buffer = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        VkDeviceSize size = 0;
    };

    struct DescriptorBinding {
        VkDescriptorPool pool = VK_NULL_HANDLE;
        VkDescriptorSet set = VK_NULL_HANDLE;
    };

    // Queued operations, recorded on flush
    struct ClearOp { GroupHandle image; };
    struct WriteOp { GroupHandle image; TexelCoord origin; TexelCoord extent; VkDeviceSize stagingOffset; };
    struct CopyOp { GroupHandle src; TexelCoord srcOrigin; GroupHandle dst; TexelCoord dstOrigin; TexelCoord extent; };
    using PendingOp = std::variant<ClearOp, WriteOp, CopyOp>;

    StorageResult<GroupHandle> createImage(const TexelCoord& extent, const char* debugName);
    StorageResult<uint32_t> findMemoryType(uint32_t typeBits, VkMemoryPropertyFlags properties) const;
    StorageResult<HostBuffer> createHostBuffer(VkDeviceSize size, VkBufferUsageFlags usage);
    void destroyHostBuffer(HostBuffer& buffer);
    void destroyImage(ImageResource& image);
    void destroyDescriptorBinding(DescriptorBinding& binding);

    StorageStatus waitForInFlightBatch();
    StorageStatus recordPendingOps(VkBuffer staging);
    StorageStatus submitAndTrack();
    void recordTransferBarrier(VkCommandBuffer cmd) const;
    bool validRegion(GroupHandle handle, const TexelCoord& origin, const TexelCoord& extent) const;

    VulkanStorageContext m_context;
    uint32_t m_bindingArity;
    bool m_initialized = false;

    VkCommandPool m_commandPool = VK_NULL_HANDLE;
    VkCommandBuffer m_commandBuffer = VK_NULL_HANDLE;
    VkFence m_fence = VK_NULL_HANDLE;
    bool m_batchInFlight = false;

    VkDescriptorSetLayout m_layoutReadWrite = VK_NULL_HANDLE;
    VkDescriptorSetLayout m_layoutReadOnly = VK_NULL_HANDLE;

    std::vector<ImageResource> m_images;
    std::unordered_map<BindingHandle, DescriptorBinding> m_bindings;
    BindingHandle m_nextBinding = 1;

    std::vector<PendingOp> m_pendingOps;
    std::vector<uint32_t> m_pendingStagingCells;

    // Released once m_fence signals
    HostBuffer m_inFlightStaging;
    std::vector<DescriptorBinding> m_retiredBindings;
    std::vector<DescriptorBinding> m_inFlightRetiredBindings;
};

} // namespace Cellvox::ChunkStorage
