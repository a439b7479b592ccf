#pragma once

#include "ChunkStorageLayout.h"
#include "ChunkStorageTypes.h"
#include "IChunkStorageDevice.h"
#include "ILoggable.h"
#include <cstdint>
#include <span>
#include <vector>
#include <glm/glm.hpp>

namespace Cellvox::ChunkStorage {

struct ChunkStorageConfig {
    uint32_t chunkEdge = 64;
    uint32_t chunksPerGroup = 32;
    uint32_t maxGroups = 8;
    uint32_t atlasExtent = 64;
};

/**
 * @brief What downstream stages bind to reach chunk payloads
 *
 * A view is invalidated whenever the group list grows; compare generation
 * against ChunkStorageCoordinator::getBindingGeneration() to detect that.
 */
struct ChunkStorageView {
    BindingHandle binding = INVALID_BINDING_HANDLE;
    uint32_t liveGroups = 0;
    uint32_t arity = 0;
    uint64_t generation = 0;
    bool readWrite = false;
};

/**
 * @brief Owns the payload groups and the atlas on a storage device
 *
 * Groups are append-only: capacity in offsets never decreases during the
 * lifetime of a coordinator. The device must outlive the coordinator.
 *
 * Usage:
 * @code
 * HostChunkStorageDevice device;
 * ChunkStorageCoordinator storage(device, ChunkStorageConfig{});
 * storage.initialize();
 * storage.ensureCapacity(40);                 // second group appears
 * storage.write(35, 0, payload);
 * auto view = storage.bindableView(true);
 * @endcode
 */
class ChunkStorageCoordinator : public Log::ILoggable {
public:
    ChunkStorageCoordinator(IChunkStorageDevice& device, const ChunkStorageConfig& config);
    ~ChunkStorageCoordinator() override;

    ChunkStorageCoordinator(const ChunkStorageCoordinator&) = delete;
    ChunkStorageCoordinator& operator=(const ChunkStorageCoordinator&) = delete;

    /**
     * @brief Create the atlas, the placeholder, the first group and both bindings
     */
    [[nodiscard]] StorageStatus initialize();
    bool isInitialized() const { return m_initialized; }

    /**
     * @brief Append groups until offsetCount offsets fit
     *
     * Groups created before a failure are kept. Fails with GroupLimitExceeded
     * when more than maxGroups would be needed.
     */
    [[nodiscard]] StorageStatus ensureCapacity(uint32_t offsetCount);

    /**
     * @brief Copy both parity slots of one chunk to another offset
     * @throws std::out_of_range if either offset is beyond current capacity
     */
    [[nodiscard]] StorageStatus relocate(uint32_t fromOffset, uint32_t toOffset);

    /**
     * @brief Overwrite one parity slot of one chunk
     * @throws std::invalid_argument for parity > 1 or a payload that is not edge³ cells
     * @throws std::out_of_range if offset is beyond current capacity
     */
    [[nodiscard]] StorageStatus write(uint32_t offset, uint32_t parity, std::span<const uint32_t> payload);

    /**
     * @brief Write the residency summary for a chunk position
     * @throws std::out_of_range if position is outside the atlas domain
     */
    [[nodiscard]] StorageStatus updateAtlas(const glm::ivec3& position, uint32_t value);

    bool isInAtlasDomain(const glm::ivec3& position) const;
    TexelCoord atlasTexel(const glm::ivec3& position) const;

    ChunkStorageView bindableView(bool readWrite) const;
    uint64_t getBindingGeneration() const { return m_generation; }

    [[nodiscard]] StorageStatus flush();

    // Geometry
    uint32_t groupCount() const { return static_cast<uint32_t>(m_groups.size()); }
    uint32_t groupCapacity() const { return m_layout.getChunksPerGroup(); }
    uint32_t totalCapacity() const { return groupCount() * groupCapacity(); }
    uint32_t maxGroups() const { return m_config.maxGroups; }
    GroupLocation offsetToGroupAndOrigin(uint32_t offset) const { return m_layout.locate(offset); }
    TexelCoord texelOrigin(uint32_t offset, uint32_t parity) const { return m_layout.texelOrigin(offset, parity); }
    const ChunkStorageLayout& getLayout() const { return m_layout; }

    // Device handles (for read-back and diagnostics)
    GroupHandle getGroup(uint32_t index) const { return m_groups.at(index); }
    GroupHandle getAtlas() const { return m_atlas; }
    GroupHandle getPlaceholder() const { return m_placeholder; }

private:
    struct Binding {
        BindingHandle handle = INVALID_BINDING_HANDLE;
        uint32_t liveGroups = 0;
    };

    StorageStatus rebuildBindings();
    StorageResult<BindingHandle> buildBinding(bool readWrite) const;
    void requireCapacityFor(uint32_t offset, const char* operation) const;
    void releaseBindings();

    IChunkStorageDevice* m_device;  // Non-owning
    ChunkStorageConfig m_config;
    ChunkStorageLayout m_layout;

    std::vector<GroupHandle> m_groups;
    GroupHandle m_atlas = INVALID_GROUP_HANDLE;
    GroupHandle m_placeholder = INVALID_GROUP_HANDLE;

    Binding m_bindingReadWrite;
    Binding m_bindingReadOnly;
    uint64_t m_generation = 0;
    bool m_initialized = false;
};

} // namespace Cellvox::ChunkStorage
