/**
 * @file test_reference_point.cpp
 * @brief Unit tests for Core/ReferencePoint
 */

#include <gtest/gtest.h>
#include <GeoWarp/Core/ReferencePoint.h>
#include <GeoWarp/Core/Exception.h>

#include <cmath>
#include <limits>

using namespace Geo::Warp;

// =============================================================================
// ReferencePoint
// =============================================================================

TEST(ReferencePointTest, Accessors) {
    ReferencePoint p(10.0, 20.0, -5.0, 7.5);
    EXPECT_DOUBLE_EQ(p.SourceX(), 10.0);
    EXPECT_DOUBLE_EQ(p.SourceY(), 20.0);
    EXPECT_DOUBLE_EQ(p.TargetX(), -5.0);
    EXPECT_DOUBLE_EQ(p.TargetY(), 7.5);
    EXPECT_EQ(p.Source(), Point2d(10.0, 20.0));
    EXPECT_EQ(p.Target(), Point2d(-5.0, 7.5));
}

TEST(ReferencePointTest, RejectsNonFinite) {
    double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(ReferencePoint(NAN, 0.0, 0.0, 0.0), InvalidArgumentException);
    EXPECT_THROW(ReferencePoint(0.0, 0.0, inf, 0.0), InvalidArgumentException);
}

// =============================================================================
// ReferencePointSet
// =============================================================================

TEST(ReferencePointSetTest, AddAndAccess) {
    ReferencePointSet set;
    EXPECT_TRUE(set.Empty());

    set.Add(1.0, 2.0, 3.0, 4.0);
    set.Add(ReferencePoint({5.0, 6.0}, {7.0, 8.0}));

    ASSERT_EQ(set.Size(), 2u);
    EXPECT_EQ(set[1].Source(), Point2d(5.0, 6.0));
    EXPECT_EQ(set.At(0).Target(), Point2d(3.0, 4.0));
    EXPECT_THROW(set.At(2), OutOfRangeException);

    auto sources = set.SourcePoints();
    auto targets = set.TargetPoints();
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0], Point2d(1.0, 2.0));
    EXPECT_EQ(targets[1], Point2d(7.0, 8.0));

    set.Clear();
    EXPECT_TRUE(set.Empty());
}

TEST(ReferencePointSetTest, FromDatabaseOrderSwapsPairs) {
    // Rows are (dbX, dbZ, svgX, svgY): target first
    auto set = ReferencePointSet::FromDatabaseOrder({
        {100.0, 200.0, 1.0, 2.0},
        {-50.0, 25.0, 3.0, 4.0},
    });

    ASSERT_EQ(set.Size(), 2u);
    EXPECT_EQ(set[0].Source(), Point2d(1.0, 2.0));
    EXPECT_EQ(set[0].Target(), Point2d(100.0, 200.0));
    EXPECT_EQ(set[1].Source(), Point2d(3.0, 4.0));
    EXPECT_EQ(set[1].Target(), Point2d(-50.0, 25.0));
}

TEST(ReferencePointSetTest, FindBySource) {
    ReferencePointSet set;
    set.Add(0.0, 0.0, 10.0, 10.0);
    set.Add(5.0, 5.0, 20.0, 20.0);
    set.Add(5.0, 5.0, 30.0, 30.0);

    auto hit = set.FindBySource(5.0, 5.0, 1e-9);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, 1u);  // first occurrence

    EXPECT_FALSE(set.FindBySource(5.001, 5.0, 1e-9).has_value());
    EXPECT_TRUE(set.FindBySource(5.001, 5.0, 0.01).has_value());
    EXPECT_THROW(set.FindBySource(0.0, 0.0, -1.0), InvalidArgumentException);
}
