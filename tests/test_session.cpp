#include <gtest/gtest.h>
#include "gfuse/errors.hpp"
#include "gfuse/session.hpp"
#include <cmath>

using namespace gfuse;

TEST(Session, Defaults) {
    Session s;
    EXPECT_TRUE(s.graph().empty());
    EXPECT_EQ(s.graph().next_id(), 0u);
    EXPECT_TRUE(s.selection().empty());
    EXPECT_TRUE(s.display().show_shading);
    EXPECT_DOUBLE_EQ(s.display().shading_opacity, 0.3);
    EXPECT_TRUE(s.display().show_std_markers);
    EXPECT_FALSE(s.view().has_value());
    EXPECT_EQ(s.plot_range(), (std::pair<double, double>{-6.0, 6.0}));
}

TEST(Session, InitialDistribution) {
    Session s;
    s.ensure_initial_distribution();
    ASSERT_EQ(s.graph().size(), 1u);
    EXPECT_EQ(s.graph().at(0).name(), "Gaussian 1");

    s.ensure_initial_distribution();
    EXPECT_EQ(s.graph().size(), 1u);
}

TEST(Session, LeafEditsAreClamped) {
    Session s;
    const auto id = s.add_leaf("x", 25.0, 9.0);
    EXPECT_DOUBLE_EQ(s.graph().at(id).mean(), 10.0);
    EXPECT_DOUBLE_EQ(s.graph().at(id).std_dev(), 5.0);

    EXPECT_TRUE(s.set_mean(id, -11.0));
    EXPECT_TRUE(s.set_std_dev(id, 0.0));
    EXPECT_DOUBLE_EQ(s.graph().at(id).mean(), -10.0);
    EXPECT_DOUBLE_EQ(s.graph().at(id).std_dev(), 0.1);

    EXPECT_FALSE(s.set_mean(99, 1.0));
    EXPECT_FALSE(s.set_std_dev(99, 1.0));
}

TEST(Session, EditPropagatesToProducts) {
    Session s;
    const auto a = s.add_leaf("a", 0.0, 1.0);
    const auto b = s.add_leaf("b", 2.0, 1.0);
    s.select(a);
    s.select(b);
    const auto p = s.fuse_selection();
    EXPECT_TRUE(s.selection().empty());
    EXPECT_NEAR(s.graph().at(p).mean(), 1.0, 1e-12);

    s.select(p);
    s.select(a);
    const auto q = s.fuse_selection();

    ASSERT_TRUE(s.set_mean(b, 4.0));
    // p = N(2, 1/2); q = fuse(N(2, 1/2), N(0, 1)) = N(4/3, 1/3)
    EXPECT_NEAR(s.graph().at(p).mean(), 2.0, 1e-12);
    EXPECT_NEAR(s.graph().at(q).mean(), 4.0 / 3.0, 1e-12);
    EXPECT_NEAR(s.graph().at(q).variance(), 1.0 / 3.0, 1e-12);
}

TEST(Session, ProductsAreNotEditable) {
    Session s;
    const auto a = s.add_leaf();
    const auto b = s.add_leaf();
    s.select(a);
    s.select(b);
    const auto p = s.fuse_selection();
    const double mean = s.graph().at(p).mean();

    EXPECT_FALSE(s.set_mean(p, 3.0));
    EXPECT_FALSE(s.set_std_dev(p, 3.0));
    EXPECT_EQ(s.graph().at(p).mean(), mean);
}

TEST(Session, SelectionIsOrderedAndUnique) {
    Session s;
    s.select(2);
    s.select(0);
    s.select(2);
    EXPECT_EQ(s.selection(), (std::vector<distributions::NodeId>{2, 0}));

    s.toggle(2);
    EXPECT_EQ(s.selection(), (std::vector<distributions::NodeId>{0}));
    s.toggle(5);
    EXPECT_TRUE(s.is_selected(5));
    s.clear_selection();
    EXPECT_TRUE(s.selection().empty());
}

TEST(Session, FailedFusionKeepsSelection) {
    Session s;
    const auto a = s.add_leaf();
    s.select(a);
    s.select(40);
    EXPECT_THROW(s.fuse_selection(), InsufficientParents);
    EXPECT_EQ(s.selection().size(), 2u);
    EXPECT_EQ(s.graph().size(), 1u);
    EXPECT_EQ(s.graph().next_id(), 1u);
}

TEST(Session, RemoveDropsSelection) {
    Session s;
    const auto a = s.add_leaf();
    const auto b = s.add_leaf();
    s.select(a);
    s.select(b);
    EXPECT_TRUE(s.remove(a));
    EXPECT_EQ(s.selection(), (std::vector<distributions::NodeId>{b}));
    EXPECT_FALSE(s.remove(a));
}

TEST(Session, DeletedParentFreezesProduct) {
    Session s;
    const auto a = s.add_leaf("a", 0.0, 1.0);
    const auto b = s.add_leaf("b", 2.0, 1.0);
    s.select(a);
    s.select(b);
    const auto p = s.fuse_selection();

    ASSERT_TRUE(s.remove(a));
    ASSERT_TRUE(s.set_mean(b, 6.0));
    EXPECT_NEAR(s.graph().at(p).mean(), 1.0, 1e-12);
}

TEST(Session, ViewFitAndReset) {
    Session s;
    s.auto_fit_view();
    EXPECT_FALSE(s.view().has_value());

    s.add_leaf("a", -2.0, 0.5);
    s.add_leaf("b", 5.0, 2.0);
    s.auto_fit_view();
    ASSERT_TRUE(s.view().has_value());
    EXPECT_EQ(s.plot_range(), (std::pair<double, double>{-10.0, 13.0}));

    s.reset_view();
    EXPECT_EQ(s.plot_range(), (std::pair<double, double>{-6.0, 6.0}));
}

TEST(Session, SamplesOverPlotRange) {
    Session s;
    const auto id = s.add_leaf();
    const auto curve = s.curve(id, 300);
    ASSERT_EQ(curve.rows(), 300);
    EXPECT_DOUBLE_EQ(curve(0, 0), -6.0);
    EXPECT_DOUBLE_EQ(curve(299, 0), 6.0);

    const auto poly = s.shading(id, 300);
    EXPECT_EQ(poly.rows(), 302);
    EXPECT_THROW(s.curve(id, 1), InvalidSampleCount);
}

TEST(Session, SaveLoadRoundTrip) {
    Session s;
    const auto a = s.add_leaf("Parent1", 0.0, 1.0);
    const auto b = s.add_leaf("Parent2", 2.0, 1.0);
    s.select(a);
    s.select(b);
    s.fuse_selection();
    s.display().show_shading = false;
    s.display().shading_opacity = 0.7;
    s.display().show_std_markers = false;

    const std::string json = s.save();

    Session other;
    other.select(9);
    other.load(json);
    EXPECT_EQ(other.graph(), s.graph());
    EXPECT_EQ(other.display(), s.display());
    EXPECT_TRUE(other.selection().empty());
    EXPECT_EQ(other.graph().at(2).name(), "Product 3");
}

TEST(Session, FailedLoadLeavesStateUntouched) {
    Session s;
    s.add_leaf("keep", 1.0, 1.0);
    s.select(0);
    const auto graph_before = s.graph();

    EXPECT_THROW(s.load("{\"distributions\": 5}"), DecodeError);
    EXPECT_EQ(s.graph(), graph_before);
    EXPECT_EQ(s.selection().size(), 1u);
    EXPECT_TRUE(s.display().show_shading);
}

TEST(Session, SamplingUnknownIdThrows) {
    Session s;
    s.add_leaf();
    EXPECT_THROW((void)s.curve(99), UnknownId);
    EXPECT_THROW((void)s.shading(99), UnknownId);
    // UnknownId is still a std::out_of_range
    EXPECT_THROW((void)s.curve(99), std::out_of_range);
}
