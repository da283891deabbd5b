#include <gtest/gtest.h>
#include "gfuse/plot_utils/viewport.hpp"
#include <cmath>
#include <numbers>

using namespace gfuse;
using namespace gfuse::plot_utils;
using gfuse::distributions::Gaussian;

namespace {
double peak(double sigma) { return 1.0 / (sigma * std::sqrt(2.0 * std::numbers::pi)); }
} // namespace

TEST(AutoFit, EmptyYieldsNothing) {
    EXPECT_FALSE(auto_fit(std::vector<const Gaussian*>{}).has_value());
    graph::DistributionGraph g;
    EXPECT_FALSE(auto_fit(g).has_value());
}

TEST(AutoFit, MarginFromWidestNode) {
    Gaussian a(0, "a", -2.0, 0.5);
    Gaussian b(1, "b", 5.0, 2.0);
    const auto bounds = auto_fit({&a, &b});
    ASSERT_TRUE(bounds.has_value());
    // margin = 4 * 2 = 8
    EXPECT_DOUBLE_EQ(bounds->x_min, -10.0);
    EXPECT_DOUBLE_EQ(bounds->x_max, 13.0);
    EXPECT_DOUBLE_EQ(bounds->y_min, 0.0);
    EXPECT_NEAR(bounds->y_max, peak(2.0) * 1.1, 1e-12);
    // The narrow node pokes above the widest-node bound
    EXPECT_GT(a.peak(), bounds->y_max);
}

TEST(AutoFit, NarrowestNodePeakCoversEveryCurve) {
    Gaussian a(0, "a", -2.0, 0.5);
    Gaussian b(1, "b", 5.0, 2.0);
    const auto bounds = auto_fit({&a, &b}, PeakHeight::NarrowestNode);
    ASSERT_TRUE(bounds.has_value());
    EXPECT_DOUBLE_EQ(bounds->x_min, -10.0);
    EXPECT_DOUBLE_EQ(bounds->x_max, 13.0);
    EXPECT_NEAR(bounds->y_max, peak(0.5) * 1.1, 1e-12);
    EXPECT_GT(bounds->y_max, a.peak());
}

TEST(AutoFit, OverGraphIncludesProducts) {
    graph::DistributionGraph g;
    const auto a = g.add_leaf("a", -1.0, 1.0);
    const auto b = g.add_leaf("b", 1.0, 1.0);
    g.fuse({a, b});
    const auto bounds = auto_fit(g);
    ASSERT_TRUE(bounds.has_value());
    EXPECT_DOUBLE_EQ(bounds->x_min, -5.0);
    EXPECT_DOUBLE_EQ(bounds->x_max, 5.0);
}

TEST(DefaultBounds, StandardWindow) {
    const auto b = default_bounds();
    EXPECT_DOUBLE_EQ(b.x_min, -6.0);
    EXPECT_DOUBLE_EQ(b.x_max, 6.0);
    EXPECT_DOUBLE_EQ(b.y_min, 0.0);
    EXPECT_NEAR(b.y_max, peak(1.0) * 1.1, 1e-12);
}
