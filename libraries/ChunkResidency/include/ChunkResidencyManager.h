#pragma once

#include "ChunkRegistry.h"
#include "ChunkStorageCoordinator.h"
#include "FrameTransaction.h"
#include "ILoggable.h"
#include "OffsetTracker.h"
#include "ResidencyConfig.h"
#include "ResidencyTypes.h"
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace Cellvox::Residency {

/**
 * @brief What one finalize() applied
 */
struct FinalizeReport {
    uint32_t relocations = 0;    // payload copies for compacted chunks
    uint32_t newBindings = 0;    // chunks that received their first offset
    uint32_t atlasWrites = 0;
    uint32_t groupsAdded = 0;
    uint32_t liveChunks = 0;
};

/**
 * @brief Chunk residency: position -> stable index -> dense offset -> storage
 *
 * Owns the registry, the offset tracker, the storage coordinator, the frame
 * transaction and the double-buffer parity bit. Structural changes are
 * batched per frame and applied by finalize(); offsets may only be read
 * between a successful finalize() and the next insert or remove.
 *
 * Usage:
 * @code
 * HostChunkStorageDevice device;
 * ChunkResidencyManager residency(device, ResidencyConfig{});
 * residency.initialize();
 *
 * residency.insertChunk({0, 0, 0});
 * residency.insertChunk({1, 0, 0});
 * auto report = residency.finalize();          // offsets 0 and 1 assigned
 * if (!report) { handle(report.error()); }
 *
 * residency.uploadChunkData({0, 0, 0}, cells);  // current parity slot
 * auto view = residency.bindableView(true);
 * // ... dispatch simulation ...
 * residency.advanceParity(1);
 * @endcode
 *
 * Contract violations throw ContractViolation. Storage exhaustion is returned
 * from finalize(); the transaction then stays dirty and finalize() can be
 * called again.
 */
class ChunkResidencyManager : public Log::ILoggable {
public:
    using ChunkVisitor = std::function<void(const ChunkPosition&, uint32_t neighborCount, PhysicalOffset)>;

    /**
     * @throws std::invalid_argument if config fails ResidencyConfig::Validate()
     */
    ChunkResidencyManager(ChunkStorage::IChunkStorageDevice& device, const ResidencyConfig& config);
    ~ChunkResidencyManager() override;

    ChunkResidencyManager(const ChunkResidencyManager&) = delete;
    ChunkResidencyManager& operator=(const ChunkResidencyManager&) = delete;

    /**
     * @brief Create the backing storage (atlas, placeholder, first group)
     */
    [[nodiscard]] ChunkStorage::StorageStatus initialize();

    // ========================================================================
    // Structural changes (mark the frame dirty)
    // ========================================================================

    /**
     * @throws ContractViolation if present already or outside the atlas domain
     */
    void insertChunk(const ChunkPosition& position);

    /**
     * @throws ContractViolation if absent
     */
    ChunkRecord removeChunk(const ChunkPosition& position);

    /**
     * @brief Apply the frame's inserts and removes
     *
     * Relocates compacted payloads, binds new chunks, grows storage, refreshes
     * the atlas and flushes the device. A no-op when already clean.
     */
    [[nodiscard]] ChunkStorage::StorageResult<FinalizeReport> finalize();

    // ========================================================================
    // Queries valid in any state
    // ========================================================================

    bool contains(const ChunkPosition& position) const { return m_registry.contains(position); }
    const ChunkRecord* find(const ChunkPosition& position) const { return m_registry.find(position); }
    uint32_t liveChunkCount() const { return static_cast<uint32_t>(m_registry.size()); }
    TransactionState transactionState() const { return m_transaction.getState(); }

    // ========================================================================
    // Offset-dependent queries (clean only)
    // ========================================================================

    PhysicalOffset offsetOf(const ChunkPosition& position) const;
    uint32_t numOffsets() const;
    void forEachChunk(const ChunkVisitor& visitor) const;

    /**
     * @brief Rows indexed by offset, for upload ahead of a simulation dispatch
     */
    std::vector<ChunkInfo> buildChunkInfoTable() const;

    /**
     * @brief Write the current parity slot of a chunk's payload
     * @throws ContractViolation when dirty, unbound, or payload is not edge³ cells
     */
    [[nodiscard]] ChunkStorage::StorageStatus uploadChunkData(const ChunkPosition& position,
                                                              std::span<const uint32_t> payload);

    // ========================================================================
    // Storage surface for downstream stages
    // ========================================================================

    ChunkStorage::ChunkStorageView bindableView(bool readWrite) const { return m_storage.bindableView(readWrite); }
    uint32_t groupCapacity() const { return m_storage.groupCapacity(); }
    ChunkStorage::GroupLocation offsetToGroupAndOrigin(PhysicalOffset offset) const {
        return m_storage.offsetToGroupAndOrigin(offset);
    }
    [[nodiscard]] ChunkStorage::StorageStatus submitPendingTransfers() { return m_storage.flush(); }

    const ChunkStorage::ChunkStorageCoordinator& getStorage() const { return m_storage; }
    const ResidencyConfig& getConfig() const { return m_config; }

    // ========================================================================
    // Double-buffer parity
    // ========================================================================

    uint32_t currentParity() const { return m_parity; }
    void advanceParity(uint32_t steps) { m_parity = (m_parity + steps) % 2; }

private:
    struct Relocation {
        ChunkPosition position;
        PhysicalOffset from;
        PhysicalOffset to;
    };

    void applyLoggingConfig();

    ResidencyConfig m_config;
    OffsetTracker m_tracker;
    ChunkRegistry m_registry;
    FrameTransaction m_transaction;
    ChunkStorage::ChunkStorageCoordinator m_storage;
    uint32_t m_parity = 0;
};

} // namespace Cellvox::Residency
