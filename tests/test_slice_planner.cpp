#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "chunking/slice_planner.hpp"

TEST(SlicePlanner, SlicesTileTheRegion) {
    std::vector<uint64_t> cuts = {1000, 5000, 5080};
    SlicePlan plan = plan_slices(cuts, 24, 9000);

    ASSERT_EQ(plan.size(), 4u);
    EXPECT_EQ(plan[0], SliceInfo(0, 24, 976));
    EXPECT_EQ(plan[1], SliceInfo(1, 1000, 4000));
    EXPECT_EQ(plan[2], SliceInfo(2, 5000, 80));
    EXPECT_EQ(plan[3], SliceInfo(3, 5080, 3920));

    uint64_t total = 0;
    for (size_t i = 0; i < plan.size(); ++i) {
        EXPECT_EQ(plan[i].slice_id, static_cast<int>(i));
        if (i > 0) EXPECT_EQ(plan[i].offset, plan[i - 1].end());
        total += plan[i].size;
    }
    EXPECT_EQ(total, 9000u - 24u);
    EXPECT_EQ(plan.back().end(), 9000u);
}

TEST(SlicePlanner, NoCutsGivesOneSlice) {
    SlicePlan plan = plan_slices({}, 24, 424);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0], SliceInfo(0, 24, 400));
}

TEST(SlicePlanner, HeaderOnlyCaptureGivesOneEmptySlice) {
    SlicePlan plan = plan_slices({}, 24, 24);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].size, 0u);
}

TEST(SlicePlanner, RejectsBadCuts) {
    EXPECT_THROW(plan_slices({500, 400}, 24, 1000), std::invalid_argument);   // out of order
    EXPECT_THROW(plan_slices({500, 500}, 24, 1000), std::invalid_argument);   // duplicate
    EXPECT_THROW(plan_slices({24}, 24, 1000), std::invalid_argument);         // on region start
    EXPECT_THROW(plan_slices({1000}, 24, 1000), std::invalid_argument);       // on region end
    EXPECT_THROW(plan_slices({}, 100, 24), std::invalid_argument);
}
