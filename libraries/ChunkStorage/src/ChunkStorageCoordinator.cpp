#include "ChunkStorageCoordinator.h"
#include <stdexcept>
#include <string>

namespace Cellvox::ChunkStorage {

ChunkStorageCoordinator::ChunkStorageCoordinator(IChunkStorageDevice& device, const ChunkStorageConfig& config)
    : m_device(&device)
    , m_config(config)
    , m_layout(config.chunkEdge, config.chunksPerGroup)
{
    if (config.maxGroups == 0 || config.maxGroups > MAX_BINDING_ARITY) {
        throw std::invalid_argument("maxGroups must be 1-" + std::to_string(MAX_BINDING_ARITY));
    }
    if (config.atlasExtent == 0 || config.atlasExtent % 2 != 0) {
        throw std::invalid_argument("atlasExtent must be a positive even number");
    }

    InitializeLogger("ChunkStorage");
}

ChunkStorageCoordinator::~ChunkStorageCoordinator() {
    releaseBindings();
}

StorageStatus ChunkStorageCoordinator::initialize() {
    if (m_initialized) {
        return {};
    }

    const uint32_t extent = m_config.atlasExtent;
    auto atlas = m_device->createAtlas(TexelCoord(extent, extent, extent));
    CELLVOX_PROPAGATE_ERROR(atlas);
    m_atlas = *atlas;

    auto placeholder = m_device->createPlaceholder();
    CELLVOX_PROPAGATE_ERROR(placeholder);
    m_placeholder = *placeholder;

    auto group = m_device->createGroup(m_layout.getGroupExtent());
    CELLVOX_PROPAGATE_ERROR(group);
    m_groups.push_back(*group);

    auto bindings = rebuildBindings();
    CELLVOX_PROPAGATE_ERROR(bindings);

    m_initialized = true;
    LOG_INFO("Initialized with " + std::to_string(groupCapacity()) + " chunks per group, up to " +
             std::to_string(m_config.maxGroups) + " groups");
    return {};
}

StorageStatus ChunkStorageCoordinator::ensureCapacity(uint32_t offsetCount) {
    if (!m_initialized) {
        throw std::logic_error("ChunkStorageCoordinator::ensureCapacity before initialize");
    }

    const uint32_t required = m_layout.groupsRequired(offsetCount);
    if (required <= groupCount()) {
        return {};
    }
    if (required > m_config.maxGroups) {
        LOG_ERROR("Cannot hold " + std::to_string(offsetCount) + " chunks: " +
                  std::to_string(required) + " groups needed, limit is " + std::to_string(m_config.maxGroups));
        return std::unexpected(StorageError{StorageErrorCode::GroupLimitExceeded,
            std::to_string(offsetCount) + " chunks need " + std::to_string(required) +
            " groups, limit is " + std::to_string(m_config.maxGroups)});
    }

    while (groupCount() < required) {
        auto group = m_device->createGroup(m_layout.getGroupExtent());
        if (!group) {
            LOG_ERROR("Group allocation failed: " + group.error().toString());
            // Groups appended so far stay; expose them before reporting
            auto rebuilt = rebuildBindings();
            CELLVOX_PROPAGATE_ERROR(rebuilt);
            return std::unexpected(group.error());
        }
        m_groups.push_back(*group);
        LOG_INFO("Allocated group " + std::to_string(groupCount() - 1) +
                 " (capacity " + std::to_string(totalCapacity()) + " chunks)");
    }

    return rebuildBindings();
}

StorageStatus ChunkStorageCoordinator::relocate(uint32_t fromOffset, uint32_t toOffset) {
    requireCapacityFor(fromOffset, "relocate");
    requireCapacityFor(toOffset, "relocate");
    if (fromOffset == toOffset) {
        return {};
    }

    const GroupLocation from = m_layout.locate(fromOffset);
    const GroupLocation to = m_layout.locate(toOffset);
    return m_device->copyRegion(
        m_groups[from.group], m_layout.texelOrigin(fromOffset, 0),
        m_groups[to.group], m_layout.texelOrigin(toOffset, 0),
        m_layout.getDoubleBufferedExtent());
}

StorageStatus ChunkStorageCoordinator::write(uint32_t offset, uint32_t parity, std::span<const uint32_t> payload) {
    if (parity > 1) {
        throw std::invalid_argument("Parity must be 0 or 1, got " + std::to_string(parity));
    }
    if (payload.size() != m_layout.getPayloadCellCount()) {
        throw std::invalid_argument("Payload must hold " + std::to_string(m_layout.getPayloadCellCount()) +
                                    " cells, got " + std::to_string(payload.size()));
    }
    requireCapacityFor(offset, "write");

    const GroupLocation location = m_layout.locate(offset);
    return m_device->writeRegion(m_groups[location.group], m_layout.texelOrigin(offset, parity),
                                 m_layout.getPayloadExtent(), payload);
}

StorageStatus ChunkStorageCoordinator::updateAtlas(const glm::ivec3& position, uint32_t value) {
    if (!m_initialized) {
        throw std::logic_error("ChunkStorageCoordinator::updateAtlas before initialize");
    }
    return m_device->writeScalar(m_atlas, atlasTexel(position), value);
}

bool ChunkStorageCoordinator::isInAtlasDomain(const glm::ivec3& position) const {
    const int half = static_cast<int>(m_config.atlasExtent / 2);
    return position.x >= -half && position.x < half &&
           position.y >= -half && position.y < half &&
           position.z >= -half && position.z < half;
}

TexelCoord ChunkStorageCoordinator::atlasTexel(const glm::ivec3& position) const {
    if (!isInAtlasDomain(position)) {
        throw std::out_of_range("Position (" + std::to_string(position.x) + ", " + std::to_string(position.y) +
                                ", " + std::to_string(position.z) + ") is outside the atlas");
    }
    const glm::ivec3 shifted = position + glm::ivec3(static_cast<int>(m_config.atlasExtent / 2));
    return TexelCoord(shifted);
}

ChunkStorageView ChunkStorageCoordinator::bindableView(bool readWrite) const {
    const Binding& binding = readWrite ? m_bindingReadWrite : m_bindingReadOnly;
    return ChunkStorageView{
        binding.handle,
        binding.liveGroups,
        m_config.maxGroups,
        m_generation,
        readWrite
    };
}

StorageStatus ChunkStorageCoordinator::flush() {
    return m_device->flush();
}

StorageStatus ChunkStorageCoordinator::rebuildBindings() {
    auto readWrite = buildBinding(true);
    CELLVOX_PROPAGATE_ERROR(readWrite);

    auto readOnly = buildBinding(false);
    if (!readOnly) {
        m_device->destroyBinding(*readWrite);
        return std::unexpected(readOnly.error());
    }

    releaseBindings();
    m_bindingReadWrite = Binding{*readWrite, groupCount()};
    m_bindingReadOnly = Binding{*readOnly, groupCount()};
    ++m_generation;

    LOG_DEBUG("Rebuilt bindings (generation " + std::to_string(m_generation) + ", " +
              std::to_string(groupCount()) + " live groups)");
    return {};
}

StorageResult<BindingHandle> ChunkStorageCoordinator::buildBinding(bool readWrite) const {
    GroupBindingSlots slots;
    for (GroupHandle group : m_groups) {
        slots.AddLive(group);
    }
    slots.FillPlaceholders(m_placeholder, m_config.maxGroups);
    return m_device->createBinding(m_atlas, slots, readWrite);
}

void ChunkStorageCoordinator::requireCapacityFor(uint32_t offset, const char* operation) const {
    if (offset >= totalCapacity()) {
        throw std::out_of_range(std::string("ChunkStorageCoordinator::") + operation + ": offset " +
                                std::to_string(offset) + " beyond capacity " + std::to_string(totalCapacity()));
    }
}

void ChunkStorageCoordinator::releaseBindings() {
    if (m_bindingReadWrite.handle != INVALID_BINDING_HANDLE) {
        m_device->destroyBinding(m_bindingReadWrite.handle);
    }
    if (m_bindingReadOnly.handle != INVALID_BINDING_HANDLE) {
        m_device->destroyBinding(m_bindingReadOnly.handle);
    }
    m_bindingReadWrite = Binding{};
    m_bindingReadOnly = Binding{};
}

} // namespace Cellvox::ChunkStorage
