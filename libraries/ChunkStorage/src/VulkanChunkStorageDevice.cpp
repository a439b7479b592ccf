#include "VulkanChunkStorageDevice.h"
#include <array>
#include <cstring>
#include <stdexcept>
#include <string>

namespace Cellvox::ChunkStorage {

namespace {

StorageErrorCode ToStorageErrorCode(VkResult result) {
    switch (result) {
        case VK_ERROR_OUT_OF_DEVICE_MEMORY:
        case VK_ERROR_FRAGMENTED_POOL:
        case VK_ERROR_OUT_OF_POOL_MEMORY:
            return StorageErrorCode::OutOfDeviceMemory;
        case VK_ERROR_OUT_OF_HOST_MEMORY:
            return StorageErrorCode::OutOfHostMemory;
        case VK_ERROR_DEVICE_LOST:
            return StorageErrorCode::DeviceLost;
        default:
            return StorageErrorCode::Unknown;
    }
}

std::string VkResultName(VkResult result) {
    switch (result) {
        case VK_SUCCESS: return "VK_SUCCESS";
        case VK_TIMEOUT: return "VK_TIMEOUT";
        case VK_ERROR_OUT_OF_HOST_MEMORY: return "VK_ERROR_OUT_OF_HOST_MEMORY";
        case VK_ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
        case VK_ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
        case VK_ERROR_DEVICE_LOST: return "VK_ERROR_DEVICE_LOST";
        case VK_ERROR_MEMORY_MAP_FAILED: return "VK_ERROR_MEMORY_MAP_FAILED";
        case VK_ERROR_FORMAT_NOT_SUPPORTED: return "VK_ERROR_FORMAT_NOT_SUPPORTED";
        case VK_ERROR_FRAGMENTED_POOL: return "VK_ERROR_FRAGMENTED_POOL";
        case VK_ERROR_OUT_OF_POOL_MEMORY: return "VK_ERROR_OUT_OF_POOL_MEMORY";
        default: return "VkResult(" + std::to_string(static_cast<int>(result)) + ")";
    }
}

VkOffset3D ToOffset(const TexelCoord& coord) {
    return VkOffset3D{static_cast<int32_t>(coord.x), static_cast<int32_t>(coord.y), static_cast<int32_t>(coord.z)};
}

VkExtent3D ToExtent(const TexelCoord& coord) {
    return VkExtent3D{coord.x, coord.y, coord.z};
}

VkImageSubresourceLayers ColorLayers() {
    VkImageSubresourceLayers layers{};
    layers.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    layers.mipLevel = 0;
    layers.baseArrayLayer = 0;
    layers.layerCount = 1;
    return layers;
}

VkImageSubresourceRange ColorRange() {
    VkImageSubresourceRange range{};
    range.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    range.baseMipLevel = 0;
    range.levelCount = 1;
    range.baseArrayLayer = 0;
    range.layerCount = 1;
    return range;
}

} // namespace

/**
 * @brief Return a StorageError from the enclosing function if a Vulkan call fails
 */
#define CELLVOX_VK_CHECK(expr, msg) \
    do { \
        VkResult _vk_result = (expr); \
        if (_vk_result != VK_SUCCESS) { \
            return std::unexpected(StorageError{ToStorageErrorCode(_vk_result), \
                std::string(msg) + " (" + VkResultName(_vk_result) + ")"}); \
        } \
    } while(0)

VulkanChunkStorageDevice::VulkanChunkStorageDevice(const VulkanStorageContext& context, uint32_t bindingArity)
    : m_context(context)
    , m_bindingArity(bindingArity)
{
    if (context.device == VK_NULL_HANDLE || context.physicalDevice == VK_NULL_HANDLE ||
        context.queue == VK_NULL_HANDLE) {
        throw std::invalid_argument("VulkanStorageContext requires a device, physical device and queue");
    }
    if (bindingArity == 0 || bindingArity > MAX_BINDING_ARITY) {
        throw std::invalid_argument("Binding arity must be 1-" + std::to_string(MAX_BINDING_ARITY));
    }

    InitializeLogger("VulkanChunkStorage");
}

VulkanChunkStorageDevice::~VulkanChunkStorageDevice() {
    if (!m_initialized) {
        return;
    }

    if (m_batchInFlight) {
        vkWaitForFences(m_context.device, 1, &m_fence, VK_TRUE, UINT64_MAX);
        m_batchInFlight = false;
    }

    destroyHostBuffer(m_inFlightStaging);
    for (auto& binding : m_inFlightRetiredBindings) {
        destroyDescriptorBinding(binding);
    }
    for (auto& binding : m_retiredBindings) {
        destroyDescriptorBinding(binding);
    }
    for (auto& [handle, binding] : m_bindings) {
        destroyDescriptorBinding(binding);
    }
    for (auto& image : m_images) {
        destroyImage(image);
    }

    vkDestroyDescriptorSetLayout(m_context.device, m_layoutReadWrite, nullptr);
    vkDestroyDescriptorSetLayout(m_context.device, m_layoutReadOnly, nullptr);
    vkDestroyFence(m_context.device, m_fence, nullptr);
    vkDestroyCommandPool(m_context.device, m_commandPool, nullptr);
}

StorageStatus VulkanChunkStorageDevice::initialize() {
    if (m_initialized) {
        return {};
    }

    VkCommandPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolInfo.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    poolInfo.queueFamilyIndex = m_context.queueFamilyIndex;
    CELLVOX_VK_CHECK(vkCreateCommandPool(m_context.device, &poolInfo, nullptr, &m_commandPool),
                     "Failed to create storage command pool");

    VkCommandBufferAllocateInfo cmdAllocInfo{};
    cmdAllocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    cmdAllocInfo.commandPool = m_commandPool;
    cmdAllocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    cmdAllocInfo.commandBufferCount = 1;
    CELLVOX_VK_CHECK(vkAllocateCommandBuffers(m_context.device, &cmdAllocInfo, &m_commandBuffer),
                     "Failed to allocate storage command buffer");

    VkFenceCreateInfo fenceInfo{};
    fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    CELLVOX_VK_CHECK(vkCreateFence(m_context.device, &fenceInfo, nullptr, &m_fence),
                     "Failed to create storage fence");

    // Read-only and read-write sets share a shape; access is declared by the consuming shader
    std::array<VkDescriptorSetLayoutBinding, 2> layoutBindings{};
    layoutBindings[0].binding = 0;
    layoutBindings[0].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    layoutBindings[0].descriptorCount = 1;
    layoutBindings[0].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
    layoutBindings[1].binding = 1;
    layoutBindings[1].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    layoutBindings[1].descriptorCount = m_bindingArity;
    layoutBindings[1].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;

    VkDescriptorSetLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutInfo.bindingCount = static_cast<uint32_t>(layoutBindings.size());
    layoutInfo.pBindings = layoutBindings.data();
    CELLVOX_VK_CHECK(vkCreateDescriptorSetLayout(m_context.device, &layoutInfo, nullptr, &m_layoutReadWrite),
                     "Failed to create read-write descriptor set layout");
    CELLVOX_VK_CHECK(vkCreateDescriptorSetLayout(m_context.device, &layoutInfo, nullptr, &m_layoutReadOnly),
                     "Failed to create read-only descriptor set layout");

    m_initialized = true;
    LOG_INFO("Vulkan chunk storage ready (binding arity " + std::to_string(m_bindingArity) + ")");
    return {};
}

StorageResult<GroupHandle> VulkanChunkStorageDevice::createGroup(const TexelCoord& extent) {
    return createImage(extent, "group");
}

StorageResult<GroupHandle> VulkanChunkStorageDevice::createAtlas(const TexelCoord& extent) {
    return createImage(extent, "atlas");
}

StorageResult<GroupHandle> VulkanChunkStorageDevice::createPlaceholder() {
    return createImage(TexelCoord(1, 1, 1), "placeholder");
}

StorageResult<GroupHandle> VulkanChunkStorageDevice::createImage(const TexelCoord& extent, const char* debugName) {
    if (!m_initialized) {
        throw std::logic_error("VulkanChunkStorageDevice used before initialize");
    }

    ImageResource resource;
    resource.extent = extent;

    VkImageCreateInfo imageInfo{};
    imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    imageInfo.imageType = VK_IMAGE_TYPE_3D;
    imageInfo.format = VK_FORMAT_R32_UINT;
    imageInfo.extent = ToExtent(extent);
    imageInfo.mipLevels = 1;
    imageInfo.arrayLayers = 1;
    imageInfo.samples = VK_SAMPLE_COUNT_1_BIT;
    imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
    imageInfo.usage = VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    CELLVOX_VK_CHECK(vkCreateImage(m_context.device, &imageInfo, nullptr, &resource.image),
                     std::string("Failed to create ") + debugName + " image");

    VkMemoryRequirements memRequirements;
    vkGetImageMemoryRequirements(m_context.device, resource.image, &memRequirements);

    auto memoryType = findMemoryType(memRequirements.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
    if (!memoryType) {
        destroyImage(resource);
        return std::unexpected(memoryType.error());
    }

    VkMemoryAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocInfo.allocationSize = memRequirements.size;
    allocInfo.memoryTypeIndex = *memoryType;

    VkResult result = vkAllocateMemory(m_context.device, &allocInfo, nullptr, &resource.memory);
    if (result != VK_SUCCESS) {
        destroyImage(resource);
        LOG_ERROR(std::string("Out of memory for ") + debugName + " image: " + VkResultName(result));
        return std::unexpected(StorageError{ToStorageErrorCode(result),
            std::string("Failed to allocate ") + debugName + " memory (" + VkResultName(result) + ")"});
    }

    result = vkBindImageMemory(m_context.device, resource.image, resource.memory, 0);
    if (result != VK_SUCCESS) {
        destroyImage(resource);
        return std::unexpected(StorageError{ToStorageErrorCode(result),
            std::string("Failed to bind ") + debugName + " memory (" + VkResultName(result) + ")"});
    }

    VkImageViewCreateInfo viewInfo{};
    viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    viewInfo.image = resource.image;
    viewInfo.viewType = VK_IMAGE_VIEW_TYPE_3D;
    viewInfo.format = VK_FORMAT_R32_UINT;
    viewInfo.subresourceRange = ColorRange();

    result = vkCreateImageView(m_context.device, &viewInfo, nullptr, &resource.view);
    if (result != VK_SUCCESS) {
        destroyImage(resource);
        return std::unexpected(StorageError{ToStorageErrorCode(result),
            std::string("Failed to create ") + debugName + " view (" + VkResultName(result) + ")"});
    }

    m_images.push_back(resource);
    const auto handle = static_cast<GroupHandle>(m_images.size() - 1);

    // Transition to GENERAL and zero-fill as part of the next batch
    m_pendingOps.emplace_back(ClearOp{handle});

    LOG_DEBUG(std::string("Created ") + debugName + " image " + std::to_string(handle) + " (" +
              std::to_string(extent.x) + "x" + std::to_string(extent.y) + "x" + std::to_string(extent.z) + ")");
    return handle;
}

StorageStatus VulkanChunkStorageDevice::writeRegion(GroupHandle group, const TexelCoord& origin,
                                                    const TexelCoord& extent,
                                                    std::span<const uint32_t> cells) {
    if (!validRegion(group, origin, extent)) {
        return std::unexpected(StorageError{StorageErrorCode::InvalidRegion,
                                            "writeRegion outside image " + std::to_string(group)});
    }
    const size_t expected = static_cast<size_t>(extent.x) * extent.y * extent.z;
    if (cells.size() != expected) {
        return std::unexpected(StorageError{StorageErrorCode::InvalidRegion,
            "writeRegion expects " + std::to_string(expected) + " cells, got " + std::to_string(cells.size())});
    }

    const VkDeviceSize stagingOffset = m_pendingStagingCells.size() * sizeof(uint32_t);
    m_pendingStagingCells.insert(m_pendingStagingCells.end(), cells.begin(), cells.end());
    m_pendingOps.emplace_back(WriteOp{group, origin, extent, stagingOffset});
    return {};
}

StorageStatus VulkanChunkStorageDevice::copyRegion(GroupHandle srcGroup, const TexelCoord& srcOrigin,
                                                   GroupHandle dstGroup, const TexelCoord& dstOrigin,
                                                   const TexelCoord& extent) {
    if (!validRegion(srcGroup, srcOrigin, extent) || !validRegion(dstGroup, dstOrigin, extent)) {
        return std::unexpected(StorageError{StorageErrorCode::InvalidRegion,
            "copyRegion outside image " + std::to_string(srcGroup) + " or " + std::to_string(dstGroup)});
    }
    m_pendingOps.emplace_back(CopyOp{srcGroup, srcOrigin, dstGroup, dstOrigin, extent});
    return {};
}

StorageStatus VulkanChunkStorageDevice::writeScalar(GroupHandle atlas, const TexelCoord& texel, uint32_t value) {
    const std::array<uint32_t, 1> cell{value};
    return writeRegion(atlas, texel, TexelCoord(1, 1, 1), cell);
}

StorageResult<BindingHandle> VulkanChunkStorageDevice::createBinding(GroupHandle atlas,
                                                                     const GroupBindingSlots& slots,
                                                                     bool readWrite) {
    if (slots.Arity() != m_bindingArity) {
        throw std::invalid_argument("Binding needs " + std::to_string(m_bindingArity) + " entries, got " +
                                    std::to_string(slots.Arity()));
    }
    if (atlas >= m_images.size()) {
        return std::unexpected(StorageError{StorageErrorCode::InvalidHandle, "Unknown atlas image"});
    }

    DescriptorBinding binding;

    VkDescriptorPoolSize poolSize{};
    poolSize.type = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    poolSize.descriptorCount = 1 + m_bindingArity;

    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.maxSets = 1;
    poolInfo.poolSizeCount = 1;
    poolInfo.pPoolSizes = &poolSize;
    CELLVOX_VK_CHECK(vkCreateDescriptorPool(m_context.device, &poolInfo, nullptr, &binding.pool),
                     "Failed to create binding descriptor pool");

    VkDescriptorSetLayout layout = readWrite ? m_layoutReadWrite : m_layoutReadOnly;
    VkDescriptorSetAllocateInfo setInfo{};
    setInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    setInfo.descriptorPool = binding.pool;
    setInfo.descriptorSetCount = 1;
    setInfo.pSetLayouts = &layout;
    VkResult result = vkAllocateDescriptorSets(m_context.device, &setInfo, &binding.set);
    if (result != VK_SUCCESS) {
        destroyDescriptorBinding(binding);
        return std::unexpected(StorageError{ToStorageErrorCode(result),
            "Failed to allocate binding descriptor set (" + VkResultName(result) + ")"});
    }

    VkDescriptorImageInfo atlasInfo{};
    atlasInfo.imageView = m_images[atlas].view;
    atlasInfo.imageLayout = VK_IMAGE_LAYOUT_GENERAL;

    std::vector<VkDescriptorImageInfo> groupInfos;
    groupInfos.reserve(slots.Arity());
    for (GroupHandle group : slots) {
        if (group >= m_images.size()) {
            destroyDescriptorBinding(binding);
            return std::unexpected(StorageError{StorageErrorCode::InvalidHandle,
                                                "Unknown group image " + std::to_string(group)});
        }
        VkDescriptorImageInfo info{};
        info.imageView = m_images[group].view;
        info.imageLayout = VK_IMAGE_LAYOUT_GENERAL;
        groupInfos.push_back(info);
    }

    std::array<VkWriteDescriptorSet, 2> writes{};
    writes[0].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    writes[0].dstSet = binding.set;
    writes[0].dstBinding = 0;
    writes[0].descriptorCount = 1;
    writes[0].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    writes[0].pImageInfo = &atlasInfo;
    writes[1].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    writes[1].dstSet = binding.set;
    writes[1].dstBinding = 1;
    writes[1].descriptorCount = static_cast<uint32_t>(groupInfos.size());
    writes[1].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    writes[1].pImageInfo = groupInfos.data();
    vkUpdateDescriptorSets(m_context.device, static_cast<uint32_t>(writes.size()), writes.data(), 0, nullptr);

    const BindingHandle handle = m_nextBinding++;
    m_bindings[handle] = binding;
    return handle;
}

void VulkanChunkStorageDevice::destroyBinding(BindingHandle binding) {
    auto it = m_bindings.find(binding);
    if (it == m_bindings.end()) {
        return;
    }
    // Work already submitted may still reference the set
    m_retiredBindings.push_back(it->second);
    m_bindings.erase(it);
}

StorageStatus VulkanChunkStorageDevice::flush() {
    if (!m_initialized) {
        throw std::logic_error("VulkanChunkStorageDevice used before initialize");
    }

    auto waited = waitForInFlightBatch();
    CELLVOX_PROPAGATE_ERROR(waited);

    if (m_pendingOps.empty()) {
        return {};
    }

    HostBuffer staging;
    if (!m_pendingStagingCells.empty()) {
        const VkDeviceSize size = m_pendingStagingCells.size() * sizeof(uint32_t);
        auto buffer = createHostBuffer(size, VK_BUFFER_USAGE_TRANSFER_SRC_BIT);
        CELLVOX_PROPAGATE_ERROR(buffer);
        staging = *buffer;

        void* mapped = nullptr;
        VkResult result = vkMapMemory(m_context.device, staging.memory, 0, size, 0, &mapped);
        if (result != VK_SUCCESS) {
            destroyHostBuffer(staging);
            return std::unexpected(StorageError{ToStorageErrorCode(result),
                "Failed to map staging memory (" + VkResultName(result) + ")"});
        }
        std::memcpy(mapped, m_pendingStagingCells.data(), size);
        vkUnmapMemory(m_context.device, staging.memory);
    }

    auto recorded = recordPendingOps(staging.buffer);
    if (!recorded) {
        destroyHostBuffer(staging);
        return std::unexpected(recorded.error());
    }

    auto submitted = submitAndTrack();
    if (!submitted) {
        destroyHostBuffer(staging);
        return std::unexpected(submitted.error());
    }

    LOG_DEBUG("Submitted " + std::to_string(m_pendingOps.size()) + " storage operations (" +
              std::to_string(staging.size) + " staging bytes)");

    m_inFlightStaging = staging;
    m_pendingOps.clear();
    m_pendingStagingCells.clear();
    return {};
}

StorageResult<std::vector<uint32_t>> VulkanChunkStorageDevice::readRegion(
    GroupHandle group, const TexelCoord& origin, const TexelCoord& extent) {
    if (!validRegion(group, origin, extent)) {
        return std::unexpected(StorageError{StorageErrorCode::InvalidRegion,
                                            "readRegion outside image " + std::to_string(group)});
    }

    auto flushed = flush();
    CELLVOX_PROPAGATE_ERROR(flushed);
    auto waited = waitForInFlightBatch();
    CELLVOX_PROPAGATE_ERROR(waited);

    const size_t cellCount = static_cast<size_t>(extent.x) * extent.y * extent.z;
    auto readback = createHostBuffer(cellCount * sizeof(uint32_t), VK_BUFFER_USAGE_TRANSFER_DST_BIT);
    CELLVOX_PROPAGATE_ERROR(readback);
    HostBuffer buffer = *readback;

    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    VkResult result = vkBeginCommandBuffer(m_commandBuffer, &beginInfo);
    if (result == VK_SUCCESS) {
        recordTransferBarrier(m_commandBuffer);

        VkBufferImageCopy region{};
        region.bufferOffset = 0;
        region.bufferRowLength = 0;
        region.bufferImageHeight = 0;
        region.imageSubresource = ColorLayers();
        region.imageOffset = ToOffset(origin);
        region.imageExtent = ToExtent(extent);
        vkCmdCopyImageToBuffer(m_commandBuffer, m_images[group].image, VK_IMAGE_LAYOUT_GENERAL,
                               buffer.buffer, 1, &region);
        result = vkEndCommandBuffer(m_commandBuffer);
    }
    if (result == VK_SUCCESS) {
        result = submitAndTrack() ? VK_SUCCESS : VK_ERROR_DEVICE_LOST;
    }
    if (result == VK_SUCCESS) {
        auto done = waitForInFlightBatch();
        result = done ? VK_SUCCESS : VK_ERROR_DEVICE_LOST;
    }

    std::vector<uint32_t> cells;
    if (result == VK_SUCCESS) {
        void* mapped = nullptr;
        result = vkMapMemory(m_context.device, buffer.memory, 0, buffer.size, 0, &mapped);
        if (result == VK_SUCCESS) {
            const auto* data = static_cast<const uint32_t*>(mapped);
            cells.assign(data, data + cellCount);
            vkUnmapMemory(m_context.device, buffer.memory);
        }
    }

    destroyHostBuffer(buffer);
    if (result != VK_SUCCESS) {
        return std::unexpected(StorageError{ToStorageErrorCode(result),
            "Read-back of image " + std::to_string(group) + " failed (" + VkResultName(result) + ")"});
    }
    return cells;
}

VkDescriptorSetLayout VulkanChunkStorageDevice::getDescriptorSetLayout(bool readWrite) const {
    return readWrite ? m_layoutReadWrite : m_layoutReadOnly;
}

VkDescriptorSet VulkanChunkStorageDevice::getDescriptorSet(BindingHandle binding) const {
    auto it = m_bindings.find(binding);
    return it != m_bindings.end() ? it->second.set : VK_NULL_HANDLE;
}

VkImageView VulkanChunkStorageDevice::getImageView(GroupHandle group) const {
    return group < m_images.size() ? m_images[group].view : VK_NULL_HANDLE;
}

StorageResult<uint32_t> VulkanChunkStorageDevice::findMemoryType(uint32_t typeBits,
                                                                 VkMemoryPropertyFlags properties) const {
    VkPhysicalDeviceMemoryProperties memProperties;
    vkGetPhysicalDeviceMemoryProperties(m_context.physicalDevice, &memProperties);

    for (uint32_t i = 0; i < memProperties.memoryTypeCount; ++i) {
        if ((typeBits & (1u << i)) &&
            (memProperties.memoryTypes[i].propertyFlags & properties) == properties) {
            return i;
        }
    }
    return std::unexpected(StorageError{StorageErrorCode::OutOfDeviceMemory, "No suitable memory type"});
}

StorageResult<VulkanChunkStorageDevice::HostBuffer> VulkanChunkStorageDevice::createHostBuffer(
    VkDeviceSize size, VkBufferUsageFlags usage) {
    HostBuffer buffer;
    buffer.size = size;

    VkBufferCreateInfo bufferInfo{};
    bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufferInfo.size = size;
    bufferInfo.usage = usage;
    bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    CELLVOX_VK_CHECK(vkCreateBuffer(m_context.device, &bufferInfo, nullptr, &buffer.buffer),
                     "Failed to create host buffer");

    VkMemoryRequirements memRequirements;
    vkGetBufferMemoryRequirements(m_context.device, buffer.buffer, &memRequirements);

    auto memoryType = findMemoryType(memRequirements.memoryTypeBits,
        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);
    if (!memoryType) {
        destroyHostBuffer(buffer);
        return std::unexpected(memoryType.error());
    }

    VkMemoryAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocInfo.allocationSize = memRequirements.size;
    allocInfo.memoryTypeIndex = *memoryType;

    VkResult result = vkAllocateMemory(m_context.device, &allocInfo, nullptr, &buffer.memory);
    if (result == VK_SUCCESS) {
        result = vkBindBufferMemory(m_context.device, buffer.buffer, buffer.memory, 0);
    }
    if (result != VK_SUCCESS) {
        destroyHostBuffer(buffer);
        return std::unexpected(StorageError{ToStorageErrorCode(result),
            "Failed to back host buffer (" + VkResultName(result) + ")"});
    }
    return buffer;
}

void VulkanChunkStorageDevice::destroyHostBuffer(HostBuffer& buffer) {
    if (buffer.buffer != VK_NULL_HANDLE) {
        vkDestroyBuffer(m_context.device, buffer.buffer, nullptr);
    }
    if (buffer.memory != VK_NULL_HANDLE) {
        vkFreeMemory(m_context.device, buffer.memory, nullptr);
    }
    buffer = HostBuffer{};
}

void VulkanChunkStorageDevice::destroyImage(ImageResource& image) {
    if (image.view != VK_NULL_HANDLE) {
        vkDestroyImageView(m_context.device, image.view, nullptr);
    }
    if (image.image != VK_NULL_HANDLE) {
        vkDestroyImage(m_context.device, image.image, nullptr);
    }
    if (image.memory != VK_NULL_HANDLE) {
        vkFreeMemory(m_context.device, image.memory, nullptr);
    }
    image = ImageResource{};
}

void VulkanChunkStorageDevice::destroyDescriptorBinding(DescriptorBinding& binding) {
    // Destroying the pool frees its set
    if (binding.pool != VK_NULL_HANDLE) {
        vkDestroyDescriptorPool(m_context.device, binding.pool, nullptr);
    }
    binding = DescriptorBinding{};
}

StorageStatus VulkanChunkStorageDevice::waitForInFlightBatch() {
    if (!m_batchInFlight) {
        return {};
    }

    CELLVOX_VK_CHECK(vkWaitForFences(m_context.device, 1, &m_fence, VK_TRUE, UINT64_MAX),
                     "Waiting for storage batch failed");
    CELLVOX_VK_CHECK(vkResetFences(m_context.device, 1, &m_fence), "Failed to reset storage fence");
    m_batchInFlight = false;

    destroyHostBuffer(m_inFlightStaging);
    for (auto& binding : m_inFlightRetiredBindings) {
        destroyDescriptorBinding(binding);
    }
    m_inFlightRetiredBindings.clear();
    return {};
}

StorageStatus VulkanChunkStorageDevice::recordPendingOps(VkBuffer staging) {
    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    CELLVOX_VK_CHECK(vkBeginCommandBuffer(m_commandBuffer, &beginInfo), "Failed to begin storage batch");

    // Prior dispatches may still be reading or writing the images
    recordTransferBarrier(m_commandBuffer);

    for (const PendingOp& op : m_pendingOps) {
        if (const auto* clear = std::get_if<ClearOp>(&op)) {
            VkImageMemoryBarrier barrier{};
            barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
            barrier.oldLayout = VK_IMAGE_LAYOUT_UNDEFINED;
            barrier.newLayout = VK_IMAGE_LAYOUT_GENERAL;
            barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
            barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
            barrier.image = m_images[clear->image].image;
            barrier.subresourceRange = ColorRange();
            barrier.srcAccessMask = 0;
            barrier.dstAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
            vkCmdPipelineBarrier(m_commandBuffer,
                VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT,
                0, 0, nullptr, 0, nullptr, 1, &barrier);

            VkClearColorValue zero{};
            const VkImageSubresourceRange range = ColorRange();
            vkCmdClearColorImage(m_commandBuffer, m_images[clear->image].image,
                                 VK_IMAGE_LAYOUT_GENERAL, &zero, 1, &range);
        } else if (const auto* write = std::get_if<WriteOp>(&op)) {
            VkBufferImageCopy region{};
            region.bufferOffset = write->stagingOffset;
            region.bufferRowLength = 0;
            region.bufferImageHeight = 0;
            region.imageSubresource = ColorLayers();
            region.imageOffset = ToOffset(write->origin);
            region.imageExtent = ToExtent(write->extent);
            vkCmdCopyBufferToImage(m_commandBuffer, staging, m_images[write->image].image,
                                   VK_IMAGE_LAYOUT_GENERAL, 1, &region);
        } else if (const auto* copy = std::get_if<CopyOp>(&op)) {
            VkImageCopy region{};
            region.srcSubresource = ColorLayers();
            region.srcOffset = ToOffset(copy->srcOrigin);
            region.dstSubresource = ColorLayers();
            region.dstOffset = ToOffset(copy->dstOrigin);
            region.extent = ToExtent(copy->extent);
            vkCmdCopyImage(m_commandBuffer,
                           m_images[copy->src].image, VK_IMAGE_LAYOUT_GENERAL,
                           m_images[copy->dst].image, VK_IMAGE_LAYOUT_GENERAL,
                           1, &region);
        }
        // Keep later operations ordered after this one
        recordTransferBarrier(m_commandBuffer);
    }

    CELLVOX_VK_CHECK(vkEndCommandBuffer(m_commandBuffer), "Failed to end storage batch");
    return {};
}

StorageStatus VulkanChunkStorageDevice::submitAndTrack() {
    VkSubmitInfo submitInfo{};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submitInfo.commandBufferCount = 1;
    submitInfo.pCommandBuffers = &m_commandBuffer;
    CELLVOX_VK_CHECK(vkQueueSubmit(m_context.queue, 1, &submitInfo, m_fence), "Failed to submit storage batch");

    m_batchInFlight = true;
    m_inFlightRetiredBindings.insert(m_inFlightRetiredBindings.end(),
                                     m_retiredBindings.begin(), m_retiredBindings.end());
    m_retiredBindings.clear();
    return {};
}

void VulkanChunkStorageDevice::recordTransferBarrier(VkCommandBuffer cmd) const {
    VkMemoryBarrier barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER;
    barrier.srcAccessMask = VK_ACCESS_MEMORY_WRITE_BIT;
    barrier.dstAccessMask = VK_ACCESS_MEMORY_READ_BIT | VK_ACCESS_MEMORY_WRITE_BIT;
    vkCmdPipelineBarrier(cmd,
        VK_PIPELINE_STAGE_ALL_COMMANDS_BIT, VK_PIPELINE_STAGE_ALL_COMMANDS_BIT,
        0, 1, &barrier, 0, nullptr, 0, nullptr);
}

bool VulkanChunkStorageDevice::validRegion(GroupHandle handle, const TexelCoord& origin,
                                           const TexelCoord& extent) const {
    if (handle >= m_images.size()) {
        return false;
    }
    const TexelCoord& size = m_images[handle].extent;
    return static_cast<uint64_t>(origin.x) + extent.x <= size.x &&
           static_cast<uint64_t>(origin.y) + extent.y <= size.y &&
           static_cast<uint64_t>(origin.z) + extent.z <= size.z;
}

} // namespace Cellvox::ChunkStorage
