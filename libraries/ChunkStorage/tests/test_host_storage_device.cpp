#include <gtest/gtest.h>
#include "HostChunkStorageDevice.h"
#include <numeric>

using namespace Cellvox::ChunkStorage;

class HostStorageDeviceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto created = device.createGroup(TexelCoord(8, 4, 4));
        ASSERT_TRUE(created.has_value());
        group = *created;
    }

    static std::vector<uint32_t> sequence(size_t count, uint32_t start) {
        std::vector<uint32_t> cells(count);
        std::iota(cells.begin(), cells.end(), start);
        return cells;
    }

    HostChunkStorageDevice device;
    GroupHandle group = INVALID_GROUP_HANDLE;
};

TEST_F(HostStorageDeviceTest, NewResourcesAreZeroed) {
    auto cells = device.readRegion(group, TexelCoord(0), TexelCoord(8, 4, 4));
    ASSERT_TRUE(cells.has_value());
    EXPECT_EQ(cells->size(), 128u);
    for (uint32_t cell : *cells) {
        EXPECT_EQ(cell, 0u);
    }
}

TEST_F(HostStorageDeviceTest, WriteThenReadRegion) {
    auto payload = sequence(2 * 2 * 2, 100);
    ASSERT_TRUE(device.writeRegion(group, TexelCoord(4, 1, 2), TexelCoord(2), payload).has_value());

    auto cells = device.readRegion(group, TexelCoord(4, 1, 2), TexelCoord(2));
    ASSERT_TRUE(cells.has_value());
    EXPECT_EQ(*cells, payload);

    // Neighbouring texels untouched
    auto before = device.readRegion(group, TexelCoord(3, 1, 2), TexelCoord(1));
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ((*before)[0], 0u);
}

TEST_F(HostStorageDeviceTest, WriteOutsideExtentFails) {
    auto payload = sequence(8, 1);
    auto result = device.writeRegion(group, TexelCoord(7, 0, 0), TexelCoord(2), payload);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, StorageErrorCode::InvalidRegion);
}

TEST_F(HostStorageDeviceTest, WriteWithWrongCellCountFails) {
    auto payload = sequence(7, 1);
    auto result = device.writeRegion(group, TexelCoord(0), TexelCoord(2), payload);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, StorageErrorCode::InvalidRegion);
}

TEST_F(HostStorageDeviceTest, UnknownHandleFails) {
    auto result = device.writeScalar(42, TexelCoord(0), 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, StorageErrorCode::InvalidHandle);
}

TEST_F(HostStorageDeviceTest, CopyBetweenResources) {
    auto other = device.createGroup(TexelCoord(8, 4, 4));
    ASSERT_TRUE(other.has_value());

    auto payload = sequence(4 * 4 * 4, 1);
    ASSERT_TRUE(device.writeRegion(group, TexelCoord(0), TexelCoord(4), payload).has_value());
    ASSERT_TRUE(device.copyRegion(group, TexelCoord(0), *other, TexelCoord(4, 0, 0), TexelCoord(4)).has_value());

    auto copied = device.readRegion(*other, TexelCoord(4, 0, 0), TexelCoord(4));
    ASSERT_TRUE(copied.has_value());
    EXPECT_EQ(*copied, payload);
    EXPECT_EQ(device.getCopyCount(), 1u);
}

TEST_F(HostStorageDeviceTest, OverlappingCopyWithinResource) {
    auto payload = sequence(4 * 4 * 4, 1);
    ASSERT_TRUE(device.writeRegion(group, TexelCoord(0), TexelCoord(4), payload).has_value());
    ASSERT_TRUE(device.copyRegion(group, TexelCoord(0), group, TexelCoord(2, 0, 0), TexelCoord(4)).has_value());

    auto copied = device.readRegion(group, TexelCoord(2, 0, 0), TexelCoord(4));
    ASSERT_TRUE(copied.has_value());
    EXPECT_EQ(*copied, payload);
}

TEST_F(HostStorageDeviceTest, ScalarWrites) {
    auto atlas = device.createAtlas(TexelCoord(4));
    ASSERT_TRUE(atlas.has_value());

    ASSERT_TRUE(device.writeScalar(*atlas, TexelCoord(1, 2, 3), 17).has_value());
    auto value = device.readScalar(*atlas, TexelCoord(1, 2, 3));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 17u);
    EXPECT_EQ(device.getScalarWriteCount(), 1u);

    EXPECT_FALSE(device.writeScalar(*atlas, TexelCoord(4, 0, 0), 1).has_value());
}

TEST_F(HostStorageDeviceTest, BindingRecordsSlots) {
    auto atlas = device.createAtlas(TexelCoord(4));
    auto placeholder = device.createPlaceholder();
    ASSERT_TRUE(atlas.has_value());
    ASSERT_TRUE(placeholder.has_value());
    EXPECT_EQ(device.getExtent(*placeholder), TexelCoord(1));

    GroupBindingSlots slots;
    slots.AddLive(group);
    slots.FillPlaceholders(*placeholder, 4);

    auto binding = device.createBinding(*atlas, slots, true);
    ASSERT_TRUE(binding.has_value());
    EXPECT_NE(*binding, INVALID_BINDING_HANDLE);

    auto record = device.getBinding(*binding);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->atlas, *atlas);
    EXPECT_TRUE(record->readWrite);
    EXPECT_EQ(record->slots.LiveCount(), 1u);
    EXPECT_EQ(record->slots.Arity(), 4u);
    EXPECT_EQ(device.getLiveBindingCount(), 1u);

    device.destroyBinding(*binding);
    EXPECT_FALSE(device.getBinding(*binding).has_value());
    EXPECT_EQ(device.getLiveBindingCount(), 0u);
}

TEST_F(HostStorageDeviceTest, BindingWithUnknownGroupFails) {
    auto atlas = device.createAtlas(TexelCoord(4));
    ASSERT_TRUE(atlas.has_value());

    GroupBindingSlots slots;
    slots.AddLive(1234);
    auto binding = device.createBinding(*atlas, slots, false);
    ASSERT_FALSE(binding.has_value());
    EXPECT_EQ(binding.error().code, StorageErrorCode::InvalidHandle);
}

TEST_F(HostStorageDeviceTest, GroupAllocationLimit) {
    device.setGroupAllocationLimit(2);
    EXPECT_TRUE(device.createGroup(TexelCoord(1)).has_value());

    auto refused = device.createGroup(TexelCoord(1));
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, StorageErrorCode::OutOfDeviceMemory);
    EXPECT_EQ(device.getGroupCount(), 2u);

    // Atlas and placeholder are not counted as groups
    EXPECT_TRUE(device.createAtlas(TexelCoord(2)).has_value());

    device.setGroupAllocationLimit(std::nullopt);
    EXPECT_TRUE(device.createGroup(TexelCoord(1)).has_value());
}

TEST_F(HostStorageDeviceTest, SimulatedOutOfMemory) {
    device.setSimulateOutOfMemory(true);
    auto refused = device.createAtlas(TexelCoord(2));
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, StorageErrorCode::OutOfHostMemory);
}

TEST_F(HostStorageDeviceTest, FlushCounts) {
    EXPECT_TRUE(device.flush().has_value());
    EXPECT_TRUE(device.flush().has_value());
    EXPECT_EQ(device.getFlushCount(), 2u);
}
