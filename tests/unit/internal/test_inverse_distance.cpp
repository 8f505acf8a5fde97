/**
 * @file test_inverse_distance.cpp
 * @brief Unit tests for Internal/InverseDistance
 */

#include <gtest/gtest.h>
#include <GeoWarp/Internal/InverseDistance.h>
#include <GeoWarp/Core/Exception.h>

#include <cmath>
#include <vector>

using namespace Geo::Warp;
using namespace Geo::Warp::Internal;

TEST(InverseDistanceTest, NoReferencesIsPlainAffine) {
    AffineMatrix m(2.0, 0.0, 0.0, 2.0, 5.0, -5.0);
    Point2d p = ApplyAffineWithIdw(m, {}, 3.0, 4.0);
    EXPECT_DOUBLE_EQ(p.x, 11.0);
    EXPECT_DOUBLE_EQ(p.y, 3.0);
}

TEST(InverseDistanceTest, SnapsNearReference) {
    std::vector<ReferencePoint> refs = {{10, 10, 99, 77}, {50, 50, 0, 0}};
    Point2d p = ApplyAffineWithIdw(AffineMatrix::Identity(), refs, 10.0005, 10.0);
    EXPECT_DOUBLE_EQ(p.x, 99.0);
    EXPECT_DOUBLE_EQ(p.y, 77.0);
}

TEST(InverseDistanceTest, UniformResidualShiftsEverything) {
    // Every reference is off by (+3, -1) from identity
    std::vector<ReferencePoint> refs = {
        {0, 0, 3, -1}, {100, 0, 103, -1}, {0, 100, 3, 99}, {100, 100, 103, 99},
    };
    Point2d p = ApplyAffineWithIdw(AffineMatrix::Identity(), refs, 37.0, 81.0);
    EXPECT_NEAR(p.x, 40.0, 1e-12);
    EXPECT_NEAR(p.y, 80.0, 1e-12);
}

TEST(InverseDistanceTest, CloserReferenceDominates) {
    std::vector<ReferencePoint> refs = {{0, 0, 10, 0}, {100, 0, 100, 0}};
    // Residuals: (10, 0) at origin, (0, 0) at (100, 0)
    Point2d nearOrigin = ApplyAffineWithIdw(AffineMatrix::Identity(), refs, 10.0, 0.0);
    Point2d nearFar = ApplyAffineWithIdw(AffineMatrix::Identity(), refs, 90.0, 0.0);

    // Weights 1/100 and 1/8100 -> correction 10 * 81 / 82
    EXPECT_NEAR(nearOrigin.x, 10.0 + 10.0 * 81.0 / 82.0, 1e-9);
    EXPECT_NEAR(nearFar.x, 90.0 + 10.0 / 82.0, 1e-9);
}

TEST(InverseDistanceTest, InvalidArguments) {
    EXPECT_THROW(ApplyAffineWithIdw(AffineMatrix::Identity(), {}, NAN, 0.0),
                 InvalidArgumentException);
    EXPECT_THROW(ApplyAffineWithIdw(AffineMatrix::Identity(), {}, 0.0, 0.0, 0.0),
                 InvalidArgumentException);
}
