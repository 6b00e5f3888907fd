#include <gtest/gtest.h>
#include "upload/PartPlanner.hpp"

#include <stdexcept>

namespace mpupload {
namespace test {

namespace {
    constexpr uint64_t kMiB = 1024 * 1024;

    // Contiguous, covering [0, total), numbered 1..n, each range <= chunk
    void expectWellFormed(const PartPlan& plan, uint64_t total, uint64_t chunk) {
        ASSERT_FALSE(plan.empty());
        uint64_t expectedStart = 0;
        for (size_t i = 0; i < plan.size(); ++i) {
            EXPECT_EQ(plan[i].partNumber, static_cast<int>(i + 1));
            EXPECT_EQ(plan[i].byteStart, expectedStart);
            EXPECT_LE(plan[i].size(), chunk);
            expectedStart = plan[i].byteEnd;
        }
        EXPECT_EQ(expectedStart, total);
    }
}

TEST(PartPlannerTest, TwelveMillionBytesInFiveMiBChunks) {
    PartPlan plan = PartPlanner::plan(12000000, 5 * kMiB);

    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan[0].size(), 5242880u);
    EXPECT_EQ(plan[1].size(), 5242880u);
    EXPECT_EQ(plan[2].size(), 1514240u);
    expectWellFormed(plan, 12000000, 5 * kMiB);
}

TEST(PartPlannerTest, EmptySourceIsOneEmptyPart) {
    PartPlan plan = PartPlanner::plan(0, 5 * kMiB);

    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].partNumber, 1);
    EXPECT_EQ(plan[0].byteStart, 0u);
    EXPECT_EQ(plan[0].byteEnd, 0u);
}

TEST(PartPlannerTest, EvenlyDivisibleSizeHasFullLastPart) {
    PartPlan plan = PartPlanner::plan(10 * kMiB, 5 * kMiB);

    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan[1].size(), 5 * kMiB);
}

TEST(PartPlannerTest, SmallerThanChunkIsSinglePart) {
    PartPlan plan = PartPlanner::plan(kMiB, 5 * kMiB);

    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].byteEnd, kMiB);
}

TEST(PartPlannerTest, WellFormedAcrossSizesAndChunks) {
    const uint64_t chunks[] = {1, 2, 3, 7, 64, 1000};
    for (uint64_t chunk : chunks) {
        for (uint64_t total = 1; total <= 300; ++total) {
            SCOPED_TRACE("total=" + std::to_string(total) + " chunk=" + std::to_string(chunk));
            PartPlan plan = PartPlanner::plan(total, chunk);
            EXPECT_EQ(plan.size(), (total + chunk - 1) / chunk);
            expectWellFormed(plan, total, chunk);
        }
    }
}

TEST(PartPlannerTest, SameInputsGiveSamePlan) {
    EXPECT_EQ(PartPlanner::plan(11 * kMiB, 5 * kMiB), PartPlanner::plan(11 * kMiB, 5 * kMiB));
}

TEST(PartPlannerTest, ZeroChunkSizeIsRejected) {
    EXPECT_THROW(PartPlanner::plan(100, 0), std::invalid_argument);
}

TEST(PartPlannerTest, PartCountBeyondPartNumberRangeIsRejected) {
    EXPECT_THROW(PartPlanner::plan(3000000000ULL, 1), std::invalid_argument);
}

} // namespace test
} // namespace mpupload
