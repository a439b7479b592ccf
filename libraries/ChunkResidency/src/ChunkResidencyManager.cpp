#include "ChunkResidencyManager.h"
#include "ContractViolation.h"
#include <stdexcept>
#include <string>

namespace Cellvox::Residency {

using ChunkStorage::StorageResult;
using ChunkStorage::StorageStatus;

namespace {

const ResidencyConfig& RequireValid(const ResidencyConfig& config) {
    auto errors = config.Validate();
    if (!errors.empty()) {
        std::string message = "Invalid residency configuration:";
        for (const auto& error : errors) {
            message += " " + error + ";";
        }
        throw std::invalid_argument(message);
    }
    return config;
}

ChunkStorage::ChunkStorageConfig ToStorageConfig(const ResidencyConfig& config) {
    ChunkStorage::ChunkStorageConfig storage;
    storage.chunkEdge = config.chunkEdge;
    storage.chunksPerGroup = config.chunksPerGroup;
    storage.maxGroups = config.maxGroups;
    storage.atlasExtent = config.atlasExtent;
    return storage;
}

} // anonymous namespace

ChunkResidencyManager::ChunkResidencyManager(ChunkStorage::IChunkStorageDevice& device, const ResidencyConfig& config)
    : m_config(RequireValid(config))
    , m_registry(m_tracker)
    , m_storage(device, ToStorageConfig(config))
{
    InitializeLogger("ChunkResidency");
    m_storage.RegisterToParentLogger(GetLogger());
    applyLoggingConfig();
}

ChunkResidencyManager::~ChunkResidencyManager() {
    m_storage.DeregisterFromParentLogger(GetLogger());
}

void ChunkResidencyManager::applyLoggingConfig() {
    const Log::LogLevel level = Log::ParseLogLevel(m_config.loggingLevel).value_or(Log::LogLevel::LOG_INFO);

    SetLoggerEnabled(m_config.loggingEnabled);
    SetLoggerTerminalOutput(m_config.loggingTerminal);
    SetLoggerMinLevel(level);

    m_storage.SetLoggerEnabled(m_config.loggingEnabled);
    m_storage.SetLoggerTerminalOutput(m_config.loggingTerminal);
    m_storage.SetLoggerMinLevel(level);
}

StorageStatus ChunkResidencyManager::initialize() {
    auto result = m_storage.initialize();
    if (!result) {
        LOG_ERROR("Storage initialization failed: " + result.error().toString());
    }
    return result;
}

void ChunkResidencyManager::insertChunk(const ChunkPosition& position) {
    if (!m_storage.isInAtlasDomain(position)) {
        throw ContractViolation("ChunkResidencyManager::insertChunk",
                                "chunk " + FormatPosition(position) + " is outside the atlas domain");
    }
    m_registry.insert(position);
    m_transaction.markDirty();
}

ChunkRecord ChunkResidencyManager::removeChunk(const ChunkPosition& position) {
    ChunkRecord record = m_registry.remove(position);
    m_transaction.markDirty();
    return record;
}

StorageResult<FinalizeReport> ChunkResidencyManager::finalize() {
    FinalizeReport report;
    report.liveChunks = liveChunkCount();
    if (!m_transaction.isDirty()) {
        return report;
    }

    // 1. Chunks whose offset moved since their binding was recorded
    std::vector<Relocation> relocations;
    m_registry.forEach([&](const ChunkRecord& record) {
        if (!record.binding) {
            return;
        }
        const PhysicalOffset current = m_tracker.offsetOf(record.binding->index);
        if (current != record.binding->offset) {
            relocations.push_back(Relocation{record.position, record.binding->offset, current});
        }
    });

    // 2. Copy payloads. No target is another survivor's source, so order does
    //    not matter and a failed batch can simply be replayed.
    for (const Relocation& relocation : relocations) {
        auto copied = m_storage.relocate(relocation.from, relocation.to);
        if (!copied) {
            LOG_ERROR("Relocation " + std::to_string(relocation.from) + " -> " +
                      std::to_string(relocation.to) + " failed: " + copied.error().toString());
            return std::unexpected(copied.error());
        }
    }
    for (const Relocation& relocation : relocations) {
        m_registry.rebind(relocation.position, relocation.to);
    }
    report.relocations = static_cast<uint32_t>(relocations.size());

    // 3. First offsets for chunks inserted this frame
    std::vector<ChunkPosition> bound;
    m_registry.forEachMutable([&](ChunkRecord& record) {
        if (record.binding) {
            return;
        }
        const LogicalIndex index = m_tracker.allocate();
        record.binding = ResidencyBinding{index, m_tracker.offsetOf(index)};
        bound.push_back(record.position);
    });
    report.newBindings = static_cast<uint32_t>(bound.size());

    // 4. Storage for the whole dense range
    const uint32_t groupsBefore = m_storage.groupCount();
    auto grown = m_storage.ensureCapacity(m_tracker.count());
    report.groupsAdded = m_storage.groupCount() - groupsBefore;
    if (!grown) {
        LOG_ERROR("Cannot grow storage to " + std::to_string(m_tracker.count()) + " chunks: " +
                  grown.error().toString());
        // Hand the new offsets back, newest first, so every bound offset has storage
        for (auto it = bound.rbegin(); it != bound.rend(); ++it) {
            m_registry.unbind(*it);
        }
        return std::unexpected(grown.error());
    }

    // 5. Atlas: offset + 1 for resident chunks, 0 for removed ones
    for (const ChunkPosition& position : m_registry.getPendingAtlasRefreshes()) {
        const ChunkRecord* record = m_registry.find(position);
        const uint32_t value = (record && record->binding) ? record->binding->offset + 1 : 0;
        auto written = m_storage.updateAtlas(position, value);
        if (!written) {
            LOG_ERROR("Atlas update at " + FormatPosition(position) + " failed: " + written.error().toString());
            return std::unexpected(written.error());
        }
        ++report.atlasWrites;
    }

    auto flushed = m_storage.flush();
    if (!flushed) {
        LOG_ERROR("Submitting frame changes failed: " + flushed.error().toString());
        return std::unexpected(flushed.error());
    }

    // 6. Offsets are stable until the next insert or remove
    m_registry.clearAtlasRefreshes();
    m_transaction.markClean();
    m_transaction.recordCommit();

    LOG_DEBUG("Finalized frame " + std::to_string(m_transaction.getCommitCount()) + ": " +
              std::to_string(report.relocations) + " relocations, " +
              std::to_string(report.newBindings) + " new, " +
              std::to_string(report.atlasWrites) + " atlas writes, " +
              std::to_string(report.liveChunks) + " live");
    return report;
}

PhysicalOffset ChunkResidencyManager::offsetOf(const ChunkPosition& position) const {
    m_transaction.requireClean("ChunkResidencyManager::offsetOf");
    return m_registry.offsetOf(position);
}

uint32_t ChunkResidencyManager::numOffsets() const {
    m_transaction.requireClean("ChunkResidencyManager::numOffsets");
    return m_tracker.count();
}

void ChunkResidencyManager::forEachChunk(const ChunkVisitor& visitor) const {
    m_transaction.requireClean("ChunkResidencyManager::forEachChunk");
    m_registry.forEach([&](const ChunkRecord& record) {
        visitor(record.position, record.neighborCount, record.binding->offset);
    });
}

std::vector<ChunkInfo> ChunkResidencyManager::buildChunkInfoTable() const {
    m_transaction.requireClean("ChunkResidencyManager::buildChunkInfoTable");

    std::vector<ChunkInfo> table(m_tracker.count());
    m_registry.forEach([&](const ChunkRecord& record) {
        table[record.binding->offset] = ChunkInfo{record.position, record.neighborCount};
    });
    return table;
}

StorageStatus ChunkResidencyManager::uploadChunkData(const ChunkPosition& position,
                                                     std::span<const uint32_t> payload) {
    m_transaction.requireClean("ChunkResidencyManager::uploadChunkData");

    const size_t expected = m_storage.getLayout().getPayloadCellCount();
    if (payload.size() != expected) {
        throw ContractViolation("ChunkResidencyManager::uploadChunkData",
                                "payload holds " + std::to_string(payload.size()) + " cells, expected " +
                                std::to_string(expected));
    }

    return m_storage.write(m_registry.offsetOf(position), m_parity, payload);
}

} // namespace Cellvox::Residency
