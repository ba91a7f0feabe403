#include <flex_layout/proportion_scaler.hpp>

#include <unit/fake_primitive.hpp>

#include <gtest/gtest.h>

using flex_layout::consumption_group_sizes;
using flex_layout::scale_factor;

TEST(ProportionScalerTest, NoGroupsScaleByOne) {
    EXPECT_EQ(scale_factor({}), 1);
    EXPECT_EQ(scale_factor({0, 0, 0}), 1);
}

TEST(ProportionScalerTest, LeastCommonMultipleOfGroupSizes) {
    EXPECT_EQ(scale_factor({1}), 1);
    EXPECT_EQ(scale_factor({2, 3}), 6);
    EXPECT_EQ(scale_factor({4, 6, 0}), 12);
    EXPECT_EQ(scale_factor({3, 0, 2, 4}), 12);
}

TEST(ProportionScalerTest, RepeatedPrimeCountsOnce) {
    EXPECT_EQ(scale_factor({5, 5}), 5);
    EXPECT_EQ(scale_factor({7, 7, 7}), 7);
    EXPECT_EQ(scale_factor({9, 3}), 9);
}

TEST(ProportionScalerTest, GroupSizesFollowEntries) {
    flex_layout::ItemRegistry registry;
    auto a = test_support::make_fake("a");
    auto b = test_support::make_fake("b");
    registry.add(a, 0, 1, false);
    registry.add(b, 0, 1, false);
    registry.add(test_support::make_fake("c"), 0, 1, false);
    ASSERT_TRUE(registry.set_consumers(a.get(), {1, 2}));
    ASSERT_TRUE(registry.set_consumers(b.get(), {0}));

    const auto sizes = consumption_group_sizes(registry.entries());
    EXPECT_EQ(sizes, std::vector<std::size_t>({2, 1, 0}));
    EXPECT_EQ(scale_factor(sizes), 2);
}
