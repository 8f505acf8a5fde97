/**
 * @file test_delaunay.cpp
 * @brief Unit tests for Internal/Delaunay
 */

#include <gtest/gtest.h>
#include <GeoWarp/Internal/Delaunay.h>
#include <GeoWarp/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <set>
#include <vector>

using namespace Geo::Warp;
using namespace Geo::Warp::Internal;

namespace {

double TotalArea(const std::vector<Triangle>& tris, const std::vector<Point2d>& pts) {
    double sum = 0.0;
    for (const auto& t : tris) {
        sum += TriangleArea(t, pts);
    }
    return sum;
}

/// Area of the convex hull (monotone chain)
double HullArea(std::vector<Point2d> pts) {
    std::sort(pts.begin(), pts.end(), [](const Point2d& a, const Point2d& b) {
        return a.x < b.x || (a.x == b.x && a.y < b.y);
    });
    std::vector<Point2d> hull(2 * pts.size());
    size_t k = 0;
    for (size_t i = 0; i < pts.size(); ++i) {
        while (k >= 2 && (hull[k - 1] - hull[k - 2]).Cross(pts[i] - hull[k - 2]) <= 0) --k;
        hull[k++] = pts[i];
    }
    for (size_t i = pts.size() - 1, t = k + 1; i > 0; --i) {
        while (k >= t && (hull[k - 1] - hull[k - 2]).Cross(pts[i - 1] - hull[k - 2]) <= 0) --k;
        hull[k++] = pts[i - 1];
    }
    hull.resize(k - 1);

    double area = 0.0;
    for (size_t i = 0; i < hull.size(); ++i) {
        area += hull[i].Cross(hull[(i + 1) % hull.size()]);
    }
    return 0.5 * std::abs(area);
}

void ExpectCounterClockwise(const std::vector<Triangle>& tris, const std::vector<Point2d>& pts) {
    for (const auto& t : tris) {
        EXPECT_GT(SignedTriangleArea(pts[t.v0], pts[t.v1], pts[t.v2]), 0.0);
    }
}

} // namespace

// =============================================================================
// Basic Cases
// =============================================================================

TEST(DelaunayTest, ThreePointsGiveOneTriangle) {
    std::vector<Point2d> pts = {{0, 0}, {0, 10}, {10, 0}};
    auto tris = Triangulate(pts);

    ASSERT_EQ(tris.size(), 1u);
    EXPECT_TRUE(tris[0].HasVertex(0));
    EXPECT_TRUE(tris[0].HasVertex(1));
    EXPECT_TRUE(tris[0].HasVertex(2));
    ExpectCounterClockwise(tris, pts);
}

TEST(DelaunayTest, SquareGivesTwoTriangles) {
    std::vector<Point2d> pts = {{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    auto tris = Triangulate(pts);

    ASSERT_EQ(tris.size(), 2u);
    EXPECT_NEAR(TotalArea(tris, pts), 100.0, 1e-9);
    ExpectCounterClockwise(tris, pts);
}

TEST(DelaunayTest, TooFewPoints) {
    EXPECT_TRUE(Triangulate(std::vector<Point2d>{}).empty());
    EXPECT_TRUE(Triangulate(std::vector<Point2d>{{0, 0}, {1, 1}}).empty());
}

TEST(DelaunayTest, CollinearGivesEmpty) {
    EXPECT_TRUE(Triangulate(std::vector<Point2d>{{0, 0}, {1, 1}, {2, 2}, {3, 3}}).empty());
    EXPECT_TRUE(Triangulate(std::vector<Point2d>{{0, 5}, {1, 5}, {7, 5}}).empty());
}

TEST(DelaunayTest, DuplicatesBelowThreeDistinct) {
    std::vector<Point2d> pts = {{0, 0}, {0, 0}, {5, 5}, {5, 5 + 1e-12}};
    EXPECT_TRUE(Triangulate(pts).empty());
}

TEST(DelaunayTest, DuplicatesReferenceFirstOccurrence) {
    std::vector<Point2d> pts = {{0, 0}, {10, 0}, {0, 0}, {0, 10}, {10, 0}};
    auto tris = Triangulate(pts);

    ASSERT_EQ(tris.size(), 1u);
    EXPECT_TRUE(tris[0].HasVertex(0));
    EXPECT_TRUE(tris[0].HasVertex(1));
    EXPECT_TRUE(tris[0].HasVertex(3));
}

TEST(DelaunayTest, NonFiniteThrows) {
    std::vector<Point2d> pts = {{0, 0}, {1, 0}, {NAN, 1}};
    EXPECT_THROW(Triangulate(pts), InvalidArgumentException);
}

// =============================================================================
// Properties
// =============================================================================

TEST(DelaunayTest, RandomPointsSatisfyEmptyCircumcircle) {
    std::mt19937 rng(12345);
    std::uniform_real_distribution<double> dist(0.0, 1000.0);

    for (int trial = 0; trial < 5; ++trial) {
        std::vector<Point2d> pts;
        for (int i = 0; i < 30; ++i) {
            pts.emplace_back(dist(rng), dist(rng));
        }

        auto tris = Triangulate(pts);

        ASSERT_FALSE(tris.empty());
        EXPECT_TRUE(IsDelaunay(tris, pts));
        ExpectCounterClockwise(tris, pts);
        EXPECT_NEAR(TotalArea(tris, pts), HullArea(pts), 1e-4 * HullArea(pts));
    }
}

TEST(DelaunayTest, GridWithCocircularPoints) {
    std::vector<Point2d> pts;
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            pts.emplace_back(x * 100.0, y * 100.0);
        }
    }

    auto tris = Triangulate(pts);

    EXPECT_EQ(tris.size(), 18u);
    EXPECT_TRUE(IsDelaunay(tris, pts));
    EXPECT_NEAR(TotalArea(tris, pts), 90000.0, 1e-6);
    for (const auto& t : tris) {
        EXPECT_GT(TriangleArea(t, pts), 0.0);
    }
}

TEST(DelaunayTest, IsDelaunayDetectsViolation) {
    // Flat quad: the long diagonal 0-2 violates, the short one 1-3 does not
    std::vector<Point2d> pts = {{0, 0}, {10, -1}, {20, 0}, {10, 1}};
    std::vector<Triangle> bad = {{0, 1, 2}, {0, 2, 3}};
    std::vector<Triangle> good = {{0, 1, 3}, {1, 2, 3}};

    EXPECT_FALSE(IsDelaunay(bad, pts));
    EXPECT_TRUE(IsDelaunay(good, pts));
}

// =============================================================================
// Helpers
// =============================================================================

TEST(DelaunayTest, DeduplicateReferencePointsKeepsFirst) {
    std::vector<ReferencePoint> refs = {
        {0, 0, 1, 1}, {5, 5, 2, 2}, {0, 0, 3, 3}, {5, 5 + 1e-10, 4, 4}, {9, 9, 5, 5},
    };

    auto unique = DeduplicateReferencePoints(refs);

    ASSERT_EQ(unique.size(), 3u);
    EXPECT_EQ(unique[0].Target(), Point2d(1, 1));
    EXPECT_EQ(unique[1].Target(), Point2d(2, 2));
    EXPECT_EQ(unique[2].Target(), Point2d(5, 5));
}

TEST(DelaunayTest, CircumcircleAndArea) {
    std::vector<Point2d> pts = {{0, 0}, {4, 0}, {0, 3}};
    Triangle t(0, 1, 2);

    EXPECT_DOUBLE_EQ(TriangleArea(t, pts), 6.0);
    EXPECT_NEAR(Circumcircle(t, pts).radius, 2.5, 1e-12);
    EXPECT_THROW(TriangleArea(Triangle(0, 1, 5), pts), OutOfRangeException);
}
