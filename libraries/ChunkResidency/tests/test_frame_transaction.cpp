#include <gtest/gtest.h>
#include "FrameTransaction.h"
#include "ContractViolation.h"

using namespace Cellvox::Residency;

TEST(FrameTransactionTest, StartsClean) {
    FrameTransaction transaction;
    EXPECT_EQ(transaction.getState(), TransactionState::Clean);
    EXPECT_FALSE(transaction.isDirty());
    EXPECT_NO_THROW(transaction.requireClean("read"));
    EXPECT_EQ(transaction.getCommitCount(), 0u);
}

TEST(FrameTransactionTest, DirtyBlocksReads) {
    FrameTransaction transaction;
    transaction.markDirty();
    transaction.markDirty();
    EXPECT_TRUE(transaction.isDirty());

    try {
        transaction.requireClean("ChunkResidencyManager::offsetOf");
        FAIL() << "Expected ContractViolation";
    } catch (const ContractViolation& violation) {
        EXPECT_EQ(violation.operation(), "ChunkResidencyManager::offsetOf");
    }

    transaction.markClean();
    transaction.recordCommit();
    EXPECT_NO_THROW(transaction.requireClean("read"));
    EXPECT_EQ(transaction.getCommitCount(), 1u);
}

TEST(FrameTransactionTest, StateNames) {
    EXPECT_STREQ(TransactionStateToString(TransactionState::Clean), "Clean");
    EXPECT_STREQ(TransactionStateToString(TransactionState::Dirty), "Dirty");
}
