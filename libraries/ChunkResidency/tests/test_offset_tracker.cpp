#include <gtest/gtest.h>
#include "OffsetTracker.h"
#include "ContractViolation.h"
#include <algorithm>
#include <random>
#include <set>

using namespace Cellvox::Residency;

namespace {

// Offsets of all live indices must be exactly [0, count)
void ExpectDense(const OffsetTracker& tracker, const std::vector<LogicalIndex>& live) {
    ASSERT_EQ(tracker.count(), live.size());
    std::set<PhysicalOffset> offsets;
    for (LogicalIndex index : live) {
        PhysicalOffset offset = tracker.offsetOf(index);
        EXPECT_EQ(tracker.indexAt(offset), index);
        offsets.insert(offset);
    }
    ASSERT_EQ(offsets.size(), live.size());
    if (!offsets.empty()) {
        EXPECT_EQ(*offsets.begin(), 0u);
        EXPECT_EQ(*offsets.rbegin(), live.size() - 1);
    }
}

} // namespace

TEST(OffsetTrackerTest, AllocateAppends) {
    OffsetTracker tracker;
    LogicalIndex a = tracker.allocate();
    LogicalIndex b = tracker.allocate();
    LogicalIndex c = tracker.allocate();

    EXPECT_EQ(tracker.offsetOf(a), 0u);
    EXPECT_EQ(tracker.offsetOf(b), 1u);
    EXPECT_EQ(tracker.offsetOf(c), 2u);
    EXPECT_EQ(tracker.count(), 3u);
}

TEST(OffsetTrackerTest, ReleaseLastShrinks) {
    OffsetTracker tracker;
    LogicalIndex a = tracker.allocate();
    LogicalIndex b = tracker.allocate();

    tracker.release(b);
    EXPECT_EQ(tracker.count(), 1u);
    EXPECT_EQ(tracker.offsetOf(a), 0u);
    EXPECT_FALSE(tracker.isTracked(b));
}

TEST(OffsetTrackerTest, ReleaseMiddleSwapsLastIntoHole) {
    OffsetTracker tracker;
    LogicalIndex a = tracker.allocate();
    LogicalIndex b = tracker.allocate();
    LogicalIndex c = tracker.allocate();
    LogicalIndex d = tracker.allocate();

    tracker.release(b);
    EXPECT_EQ(tracker.offsetOf(a), 0u);
    EXPECT_EQ(tracker.offsetOf(d), 1u);   // moved from 3
    EXPECT_EQ(tracker.offsetOf(c), 2u);   // untouched
    EXPECT_EQ(tracker.count(), 3u);
}

TEST(OffsetTrackerTest, IndicesAreNeverReused) {
    OffsetTracker tracker;
    LogicalIndex a = tracker.allocate();
    tracker.release(a);
    LogicalIndex b = tracker.allocate();

    EXPECT_NE(a, b);
    EXPECT_EQ(tracker.offsetOf(b), 0u);   // the offset is reused
    EXPECT_EQ(tracker.peekNextIndex(), b + 1);
}

TEST(OffsetTrackerTest, UntrackedIndexIsContractViolation) {
    OffsetTracker tracker;
    LogicalIndex a = tracker.allocate();
    tracker.release(a);

    EXPECT_THROW(tracker.release(a), ContractViolation);
    EXPECT_THROW((void)tracker.offsetOf(a), ContractViolation);
    EXPECT_THROW((void)tracker.offsetOf(12345), ContractViolation);
    EXPECT_THROW((void)tracker.indexAt(0), ContractViolation);
}

TEST(OffsetTrackerTest, RandomReleasesStayDense) {
    OffsetTracker tracker;
    std::mt19937 rng(7);
    std::vector<LogicalIndex> live;

    for (int step = 0; step < 2000; ++step) {
        const bool grow = live.empty() || (rng() % 3 != 0);
        if (grow) {
            live.push_back(tracker.allocate());
        } else {
            size_t pick = rng() % live.size();
            tracker.release(live[pick]);
            live.erase(live.begin() + static_cast<std::ptrdiff_t>(pick));
        }
        if (step % 100 == 0) {
            ExpectDense(tracker, live);
        }
    }
    ExpectDense(tracker, live);
}
