#include <gtest/gtest.h>
#include "ChunkResidencyManager.h"
#include "ContractViolation.h"
#include "HostChunkStorageDevice.h"
#include <algorithm>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <tuple>

using namespace Cellvox::Residency;
using namespace Cellvox::ChunkStorage;

// ============================================================================
// Fixture: 2³ chunks, 4 per group, up to 4 groups, 16³ atlas
// ============================================================================

class ChunkResidencyManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.chunkEdge = 2;
        config.chunksPerGroup = 4;
        config.maxGroups = 4;
        config.atlasExtent = 16;

        residency = std::make_unique<ChunkResidencyManager>(device, config);
        ASSERT_TRUE(residency->initialize().has_value());
    }

    void finalizeOrFail() {
        auto report = residency->finalize();
        ASSERT_TRUE(report.has_value()) << report.error().toString();
    }

    static std::vector<uint32_t> tagged(uint32_t tag) {
        return std::vector<uint32_t>(8, tag);
    }

    uint32_t atlasValue(const ChunkPosition& position) const {
        const auto& storage = residency->getStorage();
        auto value = device.readScalar(storage.getAtlas(), storage.atlasTexel(position));
        EXPECT_TRUE(value.has_value());
        return value.value_or(~0u);
    }

    std::vector<uint32_t> payloadAt(PhysicalOffset offset, uint32_t parity) const {
        const auto& storage = residency->getStorage();
        const GroupLocation location = storage.offsetToGroupAndOrigin(offset);
        auto cells = device.readRegion(storage.getGroup(location.group), storage.texelOrigin(offset, parity),
                                       storage.getLayout().getPayloadExtent());
        EXPECT_TRUE(cells.has_value());
        return cells.value_or(std::vector<uint32_t>{});
    }

    // Upload a tag into both parity slots, leaving parity unchanged
    void uploadBoth(const ChunkPosition& position, uint32_t tag) {
        ASSERT_TRUE(residency->uploadChunkData(position, tagged(tag)).has_value());
        residency->advanceParity(1);
        ASSERT_TRUE(residency->uploadChunkData(position, tagged(tag + 1)).has_value());
        residency->advanceParity(1);
    }

    HostChunkStorageDevice device;
    ResidencyConfig config;
    std::unique_ptr<ChunkResidencyManager> residency;
};

// ============================================================================
// Transaction state
// ============================================================================

TEST_F(ChunkResidencyManagerTest, MutationsMarkDirty) {
    EXPECT_EQ(residency->transactionState(), TransactionState::Clean);

    residency->insertChunk({0, 0, 0});
    EXPECT_EQ(residency->transactionState(), TransactionState::Dirty);

    finalizeOrFail();
    EXPECT_EQ(residency->transactionState(), TransactionState::Clean);

    residency->removeChunk({0, 0, 0});
    EXPECT_EQ(residency->transactionState(), TransactionState::Dirty);
}

TEST_F(ChunkResidencyManagerTest, OffsetReadsWhileDirtyAreContractViolations) {
    residency->insertChunk({0, 0, 0});
    finalizeOrFail();
    residency->insertChunk({1, 0, 0});

    EXPECT_THROW((void)residency->offsetOf({0, 0, 0}), ContractViolation);
    EXPECT_THROW((void)residency->numOffsets(), ContractViolation);
    EXPECT_THROW((void)residency->buildChunkInfoTable(), ContractViolation);
    EXPECT_THROW(residency->forEachChunk([](const ChunkPosition&, uint32_t, PhysicalOffset) {}),
                 ContractViolation);
    EXPECT_THROW((void)residency->uploadChunkData({0, 0, 0}, tagged(1)), ContractViolation);

    // Non-offset queries stay available
    EXPECT_TRUE(residency->contains({1, 0, 0}));
    EXPECT_EQ(residency->liveChunkCount(), 2u);
}

TEST_F(ChunkResidencyManagerTest, StructuralContractViolations) {
    residency->insertChunk({0, 0, 0});
    EXPECT_THROW(residency->insertChunk({0, 0, 0}), ContractViolation);
    EXPECT_THROW(residency->removeChunk({3, 3, 3}), ContractViolation);
    EXPECT_THROW(residency->insertChunk({8, 0, 0}), ContractViolation);    // outside atlas
    EXPECT_THROW(residency->insertChunk({0, -9, 0}), ContractViolation);
    finalizeOrFail();

    EXPECT_THROW((void)residency->offsetOf({3, 3, 3}), ContractViolation);
    EXPECT_THROW((void)residency->uploadChunkData({0, 0, 0}, std::vector<uint32_t>(3)), ContractViolation);
}

TEST_F(ChunkResidencyManagerTest, FinalizeIsIdempotent) {
    residency->insertChunk({0, 0, 0});
    residency->insertChunk({0, 0, 1});
    finalizeOrFail();

    const uint32_t copies = device.getCopyCount();
    const uint32_t flushes = device.getFlushCount();
    const uint32_t scalarWrites = device.getScalarWriteCount();

    auto again = residency->finalize();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->relocations, 0u);
    EXPECT_EQ(again->newBindings, 0u);
    EXPECT_EQ(again->atlasWrites, 0u);
    EXPECT_EQ(again->liveChunks, 2u);
    EXPECT_EQ(residency->transactionState(), TransactionState::Clean);
    EXPECT_EQ(device.getCopyCount(), copies);
    EXPECT_EQ(device.getFlushCount(), flushes);
    EXPECT_EQ(device.getScalarWriteCount(), scalarWrites);
}

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(ChunkResidencyManagerTest, TwoChunksThenRemoveFirst) {
    residency->insertChunk({0, 0, 0});
    residency->insertChunk({1, 0, 0});
    auto first = residency->finalize();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->newBindings, 2u);
    EXPECT_EQ(first->atlasWrites, 2u);

    EXPECT_EQ(residency->find({0, 0, 0})->neighborCount, 1u);
    EXPECT_EQ(residency->find({1, 0, 0})->neighborCount, 1u);
    const PhysicalOffset a = residency->offsetOf({0, 0, 0});
    const PhysicalOffset b = residency->offsetOf({1, 0, 0});
    EXPECT_EQ(std::set<PhysicalOffset>({a, b}), std::set<PhysicalOffset>({0, 1}));
    EXPECT_EQ(atlasValue({0, 0, 0}), a + 1);
    EXPECT_EQ(atlasValue({1, 0, 0}), b + 1);

    uploadBoth({1, 0, 0}, 500);

    residency->removeChunk({0, 0, 0});
    auto second = residency->finalize();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->relocations, b == 1 ? 1u : 0u);

    EXPECT_EQ(residency->find({1, 0, 0})->neighborCount, 0u);
    EXPECT_EQ(residency->offsetOf({1, 0, 0}), 0u);
    EXPECT_EQ(residency->numOffsets(), 1u);
    EXPECT_EQ(atlasValue({0, 0, 0}), 0u);
    EXPECT_EQ(atlasValue({1, 0, 0}), 1u);

    // Both parity slots followed the chunk
    EXPECT_EQ(payloadAt(0, 0), tagged(500));
    EXPECT_EQ(payloadAt(0, 1), tagged(501));
}

TEST_F(ChunkResidencyManagerTest, SecondGroupAppearsPastCapacity) {
    for (int x = 0; x < 6; ++x) {
        residency->insertChunk({x, 0, 0});
    }
    auto report = residency->finalize();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->groupsAdded, 1u);
    EXPECT_EQ(residency->getStorage().groupCount(), 2u);

    const auto view = residency->bindableView(false);
    EXPECT_EQ(view.liveGroups, 2u);
    EXPECT_EQ(view.arity, 4u);

    residency->forEachChunk([&](const ChunkPosition&, uint32_t, PhysicalOffset offset) {
        const GroupLocation location = residency->offsetToGroupAndOrigin(offset);
        if (offset >= residency->groupCapacity()) {
            EXPECT_EQ(location.group, 1u);
            EXPECT_EQ(location.slot, offset - 4);
        } else {
            EXPECT_EQ(location.group, 0u);
            EXPECT_EQ(location.slot, offset);
        }
    });
}

TEST_F(ChunkResidencyManagerTest, LogicalIndicesAreNotReused) {
    residency->insertChunk({0, 0, 0});
    finalizeOrFail();
    const LogicalIndex oldIndex = residency->find({0, 0, 0})->binding->index;
    const PhysicalOffset oldOffset = residency->offsetOf({0, 0, 0});

    residency->removeChunk({0, 0, 0});
    residency->insertChunk({2, 2, 2});
    finalizeOrFail();

    EXPECT_NE(residency->find({2, 2, 2})->binding->index, oldIndex);
    EXPECT_EQ(residency->offsetOf({2, 2, 2}), oldOffset);
}

TEST_F(ChunkResidencyManagerTest, RemoveBeforeFinalizeLeavesNoTrace) {
    residency->insertChunk({0, 0, 0});
    residency->removeChunk({0, 0, 0});
    auto report = residency->finalize();
    ASSERT_TRUE(report.has_value());

    EXPECT_EQ(report->newBindings, 0u);
    EXPECT_EQ(residency->numOffsets(), 0u);
    EXPECT_EQ(atlasValue({0, 0, 0}), 0u);
}

TEST_F(ChunkResidencyManagerTest, ChunkInfoTableIsIndexedByOffset) {
    residency->insertChunk({0, 0, 0});
    residency->insertChunk({1, 1, 0});
    residency->insertChunk({-3, 0, 0});
    finalizeOrFail();

    auto table = residency->buildChunkInfoTable();
    ASSERT_EQ(table.size(), 3u);
    for (const ChunkPosition& position : {ChunkPosition(0, 0, 0), ChunkPosition(1, 1, 0), ChunkPosition(-3, 0, 0)}) {
        const ChunkInfo& row = table[residency->offsetOf(position)];
        EXPECT_EQ(row.position, position);
        EXPECT_EQ(row.neighborCount, residency->find(position)->neighborCount);
    }
}

TEST_F(ChunkResidencyManagerTest, ParityAdvancesModuloTwo) {
    EXPECT_EQ(residency->currentParity(), 0u);
    residency->advanceParity(1);
    EXPECT_EQ(residency->currentParity(), 1u);
    residency->advanceParity(3);
    EXPECT_EQ(residency->currentParity(), 0u);
    residency->advanceParity(0);
    EXPECT_EQ(residency->currentParity(), 0u);

    // Parity does not touch the transaction
    residency->insertChunk({0, 0, 0});
    residency->advanceParity(1);
    EXPECT_EQ(residency->transactionState(), TransactionState::Dirty);
}

TEST_F(ChunkResidencyManagerTest, UploadTargetsCurrentParity) {
    residency->insertChunk({0, 0, 0});
    finalizeOrFail();

    residency->advanceParity(1);
    ASSERT_TRUE(residency->uploadChunkData({0, 0, 0}, tagged(9)).has_value());
    EXPECT_EQ(payloadAt(0, 1), tagged(9));
    EXPECT_EQ(payloadAt(0, 0), tagged(0));
}

// ============================================================================
// Storage failures
// ============================================================================

TEST_F(ChunkResidencyManagerTest, FailedGrowthKeepsFrameDirtyAndRetries) {
    device.setGroupAllocationLimit(1);
    for (int x = -2; x < 3; ++x) {
        residency->insertChunk({x, 0, 0});
    }

    auto failed = residency->finalize();
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, StorageErrorCode::OutOfDeviceMemory);
    EXPECT_EQ(residency->transactionState(), TransactionState::Dirty);
    EXPECT_THROW((void)residency->offsetOf({0, 0, 0}), ContractViolation);

    device.setGroupAllocationLimit(std::nullopt);
    auto retried = residency->finalize();
    ASSERT_TRUE(retried.has_value()) << retried.error().toString();
    EXPECT_EQ(retried->newBindings, 5u);     // the failed attempt handed its offsets back
    EXPECT_EQ(retried->groupsAdded, 1u);
    EXPECT_EQ(retried->atlasWrites, 5u);

    EXPECT_EQ(residency->numOffsets(), 5u);
    for (int x = -2; x < 3; ++x) {
        EXPECT_EQ(atlasValue({x, 0, 0}), residency->offsetOf({x, 0, 0}) + 1);
    }
}

TEST_F(ChunkResidencyManagerTest, GroupLimitSurfacesAsError) {
    // 4 groups of 4 chunks
    for (int i = 0; i < 17; ++i) {
        residency->insertChunk({i % 8 - 4, i / 8, 0});
    }
    auto result = residency->finalize();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, StorageErrorCode::GroupLimitExceeded);
    EXPECT_EQ(residency->transactionState(), TransactionState::Dirty);

    EXPECT_FALSE(residency->find({-4, 0, 0})->binding.has_value());

    // Shrinking the frame below the limit lets it commit
    residency->removeChunk({-4, 0, 0});
    ASSERT_TRUE(residency->finalize().has_value());
    EXPECT_EQ(residency->numOffsets(), 16u);
}

TEST(ChunkResidencyManagerConfigTest, InvalidConfigRejected) {
    HostChunkStorageDevice device;
    ResidencyConfig config;
    config.chunksPerGroup = 3;
    EXPECT_THROW({ ChunkResidencyManager residency(device, config); }, std::invalid_argument);
}

TEST(ChunkResidencyManagerConfigTest, LoggingFollowsConfig) {
    HostChunkStorageDevice device;
    ResidencyConfig config;
    config.chunkEdge = 2;
    config.loggingEnabled = true;
    config.loggingLevel = "debug";

    ChunkResidencyManager residency(device, config);
    ASSERT_TRUE(residency.initialize().has_value());
    residency.insertChunk({0, 0, 0});
    ASSERT_TRUE(residency.finalize().has_value());

    auto* logger = residency.GetLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->GetMinLevel(), Cellvox::Log::LogLevel::LOG_DEBUG);
    ASSERT_EQ(logger->GetChildren().size(), 1u);

    const std::string logs = logger->ExtractLogs();
    EXPECT_NE(logs.find("Finalized frame 1"), std::string::npos);
    EXPECT_NE(logs.find("[ChunkStorage]"), std::string::npos);
}

TEST(ChunkResidencyManagerConfigTest, StorageFailuresAreLoggedAsErrors) {
    HostChunkStorageDevice device;
    device.setGroupAllocationLimit(1);

    ResidencyConfig config;
    config.chunkEdge = 2;
    config.chunksPerGroup = 4;
    config.maxGroups = 4;
    config.atlasExtent = 16;
    config.loggingEnabled = true;
    config.loggingLevel = "warning";

    ChunkResidencyManager residency(device, config);
    ASSERT_TRUE(residency.initialize().has_value());
    for (int x = 0; x < 5; ++x) {
        residency.insertChunk({x, 0, 0});
    }
    ASSERT_FALSE(residency.finalize().has_value());

    auto* logger = residency.GetLogger();
    ASSERT_NE(logger, nullptr);
    // Manager and storage coordinator each report the failed growth
    EXPECT_GE(logger->CountEntries(Cellvox::Log::LogLevel::LOG_ERROR), 1u);
    EXPECT_GE(logger->CountEntries(Cellvox::Log::LogLevel::LOG_ERROR, true), 2u);
    // Nothing below the configured level was kept
    EXPECT_EQ(logger->CountEntries(Cellvox::Log::LogLevel::LOG_DEBUG, true),
              logger->CountEntries(Cellvox::Log::LogLevel::LOG_WARNING, true));
}

// ============================================================================
// Randomized soak
// ============================================================================

TEST_F(ChunkResidencyManagerTest, RandomFramesKeepInvariants) {
    // Room for every position in the 4x4x4 soak volume
    residency.reset();
    config.maxGroups = 16;
    residency = std::make_unique<ChunkResidencyManager>(device, config);
    ASSERT_TRUE(residency->initialize().has_value());

    std::mt19937 rng(20260417);
    std::uniform_int_distribution<int> coord(-2, 1);
    std::map<std::tuple<int, int, int>, uint32_t> tags;   // live chunk -> payload tag
    uint32_t nextTag = 10;

    auto key = [](const ChunkPosition& p) { return std::make_tuple(p.x, p.y, p.z); };

    for (int frame = 0; frame < 60; ++frame) {
        std::vector<ChunkPosition> inserted;
        const int operations = 1 + static_cast<int>(rng() % 8);
        for (int op = 0; op < operations; ++op) {
            ChunkPosition position(coord(rng), coord(rng), coord(rng));
            if (residency->contains(position)) {
                residency->removeChunk(position);
                tags.erase(key(position));
                inserted.erase(std::remove(inserted.begin(), inserted.end(), position), inserted.end());
            } else {
                residency->insertChunk(position);
                inserted.push_back(position);
            }
        }

        finalizeOrFail();

        for (const ChunkPosition& position : inserted) {
            tags[key(position)] = nextTag;
            uploadBoth(position, nextTag);
            nextTag += 2;
        }

        // Density
        ASSERT_EQ(residency->numOffsets(), residency->liveChunkCount());
        std::set<PhysicalOffset> offsets;
        residency->forEachChunk([&](const ChunkPosition& position, uint32_t neighbors, PhysicalOffset offset) {
            offsets.insert(offset);

            uint32_t expected = 0;
            for (size_t i = 0; i < NEIGHBOR_OFFSETS.size(); ++i) {
                expected += residency->contains(NeighborOf(position, i)) ? 1 : 0;
            }
            EXPECT_EQ(neighbors, expected);
            EXPECT_EQ(atlasValue(position), offset + 1);

            const uint32_t tag = tags.at(key(position));
            EXPECT_EQ(payloadAt(offset, 0), tagged(tag));
            EXPECT_EQ(payloadAt(offset, 1), tagged(tag + 1));
        });
        ASSERT_EQ(offsets.size(), residency->liveChunkCount());
        if (!offsets.empty()) {
            EXPECT_EQ(*offsets.rbegin(), residency->liveChunkCount() - 1);
        }

        // Removed positions read as absent
        for (int z = -2; z < 2; ++z) {
            for (int y = -2; y < 2; ++y) {
                for (int x = -2; x < 2; ++x) {
                    if (!residency->contains({x, y, z})) {
                        EXPECT_EQ(atlasValue({x, y, z}), 0u);
                    }
                }
            }
        }
    }
}
