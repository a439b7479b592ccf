#include "HostChunkStorageDevice.h"
#include <new>
#include <string>

namespace Cellvox::ChunkStorage {

namespace {

size_t cellCount(const TexelCoord& extent) {
    return static_cast<size_t>(extent.x) * extent.y * extent.z;
}

StorageError invalidHandle(GroupHandle handle) {
    return StorageError{StorageErrorCode::InvalidHandle,
                        "Unknown storage resource " + std::to_string(handle)};
}

StorageError invalidRegion(const char* operation) {
    return StorageError{StorageErrorCode::InvalidRegion,
                        std::string(operation) + ": region exceeds resource extent"};
}

} // namespace

StorageResult<GroupHandle> HostChunkStorageDevice::createGroup(const TexelCoord& extent) {
    if (m_groupLimit && m_groupCount >= *m_groupLimit) {
        return std::unexpected(StorageError{StorageErrorCode::OutOfDeviceMemory,
            "Group allocation limit of " + std::to_string(*m_groupLimit) + " reached"});
    }
    auto handle = allocateResource(extent);
    if (handle) {
        ++m_groupCount;
    }
    return handle;
}

StorageResult<GroupHandle> HostChunkStorageDevice::createAtlas(const TexelCoord& extent) {
    return allocateResource(extent);
}

StorageResult<GroupHandle> HostChunkStorageDevice::createPlaceholder() {
    return allocateResource(TexelCoord(1, 1, 1));
}

StorageResult<GroupHandle> HostChunkStorageDevice::allocateResource(const TexelCoord& extent) {
    if (m_simulateOOM) {
        return std::unexpected(StorageError{StorageErrorCode::OutOfHostMemory,
                                            "Simulated host allocation failure"});
    }

    Resource resource;
    resource.extent = extent;
    try {
        resource.cells.assign(cellCount(extent), 0u);
    } catch (const std::bad_alloc&) {
        return std::unexpected(StorageError{StorageErrorCode::OutOfHostMemory,
            "Cannot allocate " + std::to_string(cellCount(extent)) + " cells"});
    }

    m_resources.push_back(std::move(resource));
    return static_cast<GroupHandle>(m_resources.size() - 1);
}

StorageStatus HostChunkStorageDevice::writeRegion(GroupHandle group, const TexelCoord& origin,
                                                  const TexelCoord& extent,
                                                  std::span<const uint32_t> cells) {
    Resource* resource = findResource(group);
    if (!resource) {
        return std::unexpected(invalidHandle(group));
    }
    if (!regionFits(*resource, origin, extent) || cells.size() != cellCount(extent)) {
        return std::unexpected(invalidRegion("writeRegion"));
    }

    size_t src = 0;
    for (uint32_t z = 0; z < extent.z; ++z) {
        for (uint32_t y = 0; y < extent.y; ++y) {
            for (uint32_t x = 0; x < extent.x; ++x) {
                resource->cells[linearIndex(*resource, origin.x + x, origin.y + y, origin.z + z)] = cells[src++];
            }
        }
    }
    return {};
}

StorageStatus HostChunkStorageDevice::copyRegion(GroupHandle srcGroup, const TexelCoord& srcOrigin,
                                                 GroupHandle dstGroup, const TexelCoord& dstOrigin,
                                                 const TexelCoord& extent) {
    // Read into a scratch buffer first so intra-group copies behave like inter-group ones
    auto scratch = readRegion(srcGroup, srcOrigin, extent);
    CELLVOX_PROPAGATE_ERROR(scratch);

    auto written = writeRegion(dstGroup, dstOrigin, extent, *scratch);
    CELLVOX_PROPAGATE_ERROR(written);

    ++m_copyCount;
    return {};
}

StorageStatus HostChunkStorageDevice::writeScalar(GroupHandle atlas, const TexelCoord& texel,
                                                  uint32_t value) {
    Resource* resource = findResource(atlas);
    if (!resource) {
        return std::unexpected(invalidHandle(atlas));
    }
    if (!regionFits(*resource, texel, TexelCoord(1, 1, 1))) {
        return std::unexpected(invalidRegion("writeScalar"));
    }
    resource->cells[linearIndex(*resource, texel.x, texel.y, texel.z)] = value;
    ++m_scalarWriteCount;
    return {};
}

StorageResult<BindingHandle> HostChunkStorageDevice::createBinding(GroupHandle atlas,
                                                                   const GroupBindingSlots& slots,
                                                                   bool readWrite) {
    if (!findResource(atlas)) {
        return std::unexpected(invalidHandle(atlas));
    }
    for (GroupHandle group : slots) {
        if (!findResource(group)) {
            return std::unexpected(invalidHandle(group));
        }
    }

    BindingHandle handle = m_nextBinding++;
    m_bindings[handle] = BindingRecord{atlas, slots, readWrite};
    return handle;
}

void HostChunkStorageDevice::destroyBinding(BindingHandle binding) {
    m_bindings.erase(binding);
}

StorageStatus HostChunkStorageDevice::flush() {
    ++m_flushCount;
    return {};
}

StorageResult<std::vector<uint32_t>> HostChunkStorageDevice::readRegion(
    GroupHandle group, const TexelCoord& origin, const TexelCoord& extent) const {
    const Resource* resource = findResource(group);
    if (!resource) {
        return std::unexpected(invalidHandle(group));
    }
    if (!regionFits(*resource, origin, extent)) {
        return std::unexpected(invalidRegion("readRegion"));
    }

    std::vector<uint32_t> cells;
    cells.reserve(cellCount(extent));
    for (uint32_t z = 0; z < extent.z; ++z) {
        for (uint32_t y = 0; y < extent.y; ++y) {
            for (uint32_t x = 0; x < extent.x; ++x) {
                cells.push_back(resource->cells[linearIndex(*resource, origin.x + x, origin.y + y, origin.z + z)]);
            }
        }
    }
    return cells;
}

StorageResult<uint32_t> HostChunkStorageDevice::readScalar(GroupHandle atlas, const TexelCoord& texel) const {
    const Resource* resource = findResource(atlas);
    if (!resource) {
        return std::unexpected(invalidHandle(atlas));
    }
    if (!regionFits(*resource, texel, TexelCoord(1, 1, 1))) {
        return std::unexpected(invalidRegion("readScalar"));
    }
    return resource->cells[linearIndex(*resource, texel.x, texel.y, texel.z)];
}

std::optional<HostChunkStorageDevice::BindingRecord> HostChunkStorageDevice::getBinding(BindingHandle binding) const {
    auto it = m_bindings.find(binding);
    if (it == m_bindings.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TexelCoord> HostChunkStorageDevice::getExtent(GroupHandle group) const {
    const Resource* resource = findResource(group);
    if (!resource) {
        return std::nullopt;
    }
    return resource->extent;
}

const HostChunkStorageDevice::Resource* HostChunkStorageDevice::findResource(GroupHandle handle) const {
    if (handle >= m_resources.size()) {
        return nullptr;
    }
    return &m_resources[handle];
}

HostChunkStorageDevice::Resource* HostChunkStorageDevice::findResource(GroupHandle handle) {
    if (handle >= m_resources.size()) {
        return nullptr;
    }
    return &m_resources[handle];
}

bool HostChunkStorageDevice::regionFits(const Resource& resource, const TexelCoord& origin,
                                        const TexelCoord& extent) {
    return static_cast<uint64_t>(origin.x) + extent.x <= resource.extent.x &&
           static_cast<uint64_t>(origin.y) + extent.y <= resource.extent.y &&
           static_cast<uint64_t>(origin.z) + extent.z <= resource.extent.z;
}

size_t HostChunkStorageDevice::linearIndex(const Resource& resource, uint32_t x, uint32_t y, uint32_t z) {
    return static_cast<size_t>(x)
         + static_cast<size_t>(y) * resource.extent.x
         + static_cast<size_t>(z) * resource.extent.x * resource.extent.y;
}

} // namespace Cellvox::ChunkStorage
