/**
 * @file test_affine_estimation.cpp
 * @brief Unit tests for Internal/AffineEstimation
 */

#include <gtest/gtest.h>
#include <GeoWarp/Internal/AffineEstimation.h>

#include <cmath>
#include <limits>
#include <random>
#include <vector>

using namespace Geo::Warp;
using namespace Geo::Warp::Internal;

class AffineEstimationTest : public ::testing::Test {
protected:
    /// References generated by a known affine map
    static std::vector<ReferencePoint> MakeReferences(const AffineMatrix& m,
                                                      const std::vector<Point2d>& src) {
        std::vector<ReferencePoint> refs;
        for (const auto& p : src) {
            refs.emplace_back(p, m.Transform(p));
        }
        return refs;
    }
};

// =============================================================================
// Degeneracy Tests
// =============================================================================

TEST_F(AffineEstimationTest, NormalizedSpread_ScaleInvariant) {
    std::vector<Point2d> square = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
    std::vector<Point2d> bigSquare = {{1000, 1000}, {5000, 1000}, {5000, 5000}, {1000, 5000}};

    EXPECT_NEAR(NormalizedSpread(square), 0.25, 1e-12);
    EXPECT_NEAR(NormalizedSpread(bigSquare), 0.25, 1e-12);
}

TEST_F(AffineEstimationTest, IsDegenerate_Collinear) {
    EXPECT_TRUE(IsDegenerateConfiguration({{0, 0}, {1, 1}, {2, 2}, {5, 5}}));
    EXPECT_TRUE(IsDegenerateConfiguration({{3, 3}, {3, 3}, {3, 3}}));
    EXPECT_TRUE(IsDegenerateConfiguration({{0, 0}, {1, 0}}));
    EXPECT_FALSE(IsDegenerateConfiguration({{0, 0}, {1, 0}, {0, 1}}));
}

// =============================================================================
// EstimateAffine Tests
// =============================================================================

TEST_F(AffineEstimationTest, EstimateAffine_Identity) {
    std::vector<Point2d> src = {{0, 0}, {10, 0}, {0, 10}, {10, 10}};

    auto result = EstimateAffine(src, src);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, AffineMatrix::Identity());
}

TEST_F(AffineEstimationTest, EstimateAffine_ExactForThreePoints) {
    AffineMatrix truth(0.5, -0.25, 0.1, 0.75, -120.0, 340.0);
    auto refs = MakeReferences(truth, {{100, 100}, {900, 150}, {400, 800}});

    auto result = EstimateAffine(refs);

    ASSERT_TRUE(result.has_value());
    for (const auto& r : refs) {
        Point2d t = result->Transform(r.Source());
        EXPECT_NEAR(t.x, r.TargetX(), 1e-9);
        EXPECT_NEAR(t.y, r.TargetY(), 1e-9);
    }
    EXPECT_NEAR(ComputeAffineError(refs, *result), 0.0, 1e-9);
}

TEST_F(AffineEstimationTest, EstimateAffine_RecoversCoefficientsFromMany) {
    AffineMatrix truth(1.2, 0.3, -0.4, 0.9, 15.0, -7.0);
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> dist(0.0, 2000.0);
    std::vector<Point2d> src;
    for (int i = 0; i < 40; ++i) {
        src.emplace_back(dist(rng), dist(rng));
    }

    auto result = EstimateAffine(MakeReferences(truth, src));

    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->A(), 1.2, 1e-9);
    EXPECT_NEAR(result->B(), 0.3, 1e-9);
    EXPECT_NEAR(result->C(), -0.4, 1e-9);
    EXPECT_NEAR(result->D(), 0.9, 1e-9);
    EXPECT_NEAR(result->E(), 15.0, 1e-6);
    EXPECT_NEAR(result->F(), -7.0, 1e-6);
}

TEST_F(AffineEstimationTest, EstimateAffine_LeastSquaresAveragesNoise) {
    // Symmetric +/- offsets cancel out
    std::vector<ReferencePoint> refs = {
        {0, 0, 1, 0}, {10, 0, 10, 1}, {0, 10, -1, 10}, {10, 10, 10, 9},
        {0, 0, -1, 0}, {10, 0, 10, -1}, {0, 10, 1, 10}, {10, 10, 10, 11},
    };

    auto result = EstimateAffine(refs);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, AffineMatrix::Identity());
    EXPECT_NEAR(ComputeAffineError(refs, *result), 1.0, 1e-9);
}

TEST_F(AffineEstimationTest, EstimateAffine_TooFewPoints) {
    EXPECT_FALSE(EstimateAffine(std::vector<ReferencePoint>{}).has_value());
    EXPECT_FALSE(EstimateAffine(std::vector<ReferencePoint>{{0, 0, 1, 1}, {1, 0, 2, 1}})
                     .has_value());
}

TEST_F(AffineEstimationTest, EstimateAffine_CollinearFails) {
    std::vector<ReferencePoint> refs = {{0, 0, 0, 0}, {1, 1, 2, 2}, {2, 2, 4, 4}, {3, 3, 6, 6}};
    EXPECT_FALSE(EstimateAffine(refs).has_value());
}

TEST_F(AffineEstimationTest, EstimateAffine_CoincidentSourcesFail) {
    std::vector<ReferencePoint> refs = {{5, 5, 0, 0}, {5, 5, 1, 1}, {5, 5, 2, 2}};
    EXPECT_FALSE(EstimateAffine(refs).has_value());
}

TEST_F(AffineEstimationTest, EstimateAffine_SizeMismatch) {
    EXPECT_FALSE(EstimateAffine({{0, 0}, {1, 0}, {0, 1}}, {{0, 0}, {1, 0}}).has_value());
}

// =============================================================================
// Error Analysis Tests
// =============================================================================

TEST_F(AffineEstimationTest, ComputeAffineError_EmptyIsMax) {
    EXPECT_EQ(ComputeAffineError({}, AffineMatrix::Identity()),
              std::numeric_limits<double>::max());
}

TEST_F(AffineEstimationTest, ComputeAffinePointErrors_PerPoint) {
    std::vector<ReferencePoint> refs = {{0, 0, 3, 4}, {1, 1, 1, 1}};
    auto errors = ComputeAffinePointErrors(refs, AffineMatrix::Identity());

    ASSERT_EQ(errors.size(), 2u);
    EXPECT_DOUBLE_EQ(errors[0], 5.0);
    EXPECT_DOUBLE_EQ(errors[1], 0.0);
    EXPECT_DOUBLE_EQ(ComputeAffineError(refs, AffineMatrix::Identity()), 2.5);
}
