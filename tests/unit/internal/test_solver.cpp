/**
 * @file test_solver.cpp
 * @brief Unit tests for Internal/Solver and Internal/Matrix
 */

#include <GeoWarp/Internal/Solver.h>
#include <GeoWarp/Internal/Matrix.h>
#include <GeoWarp/Core/Exception.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace Geo::Warp::Internal {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

/// Create a random matrix for testing
MatX RandomMatrix(int rows, int cols, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(-10.0, 10.0);
    MatX A(rows, cols);
    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            A(i, j) = dist(rng);
        }
    }
    return A;
}

/// Create a random vector
VecX RandomVector(int n, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(-10.0, 10.0);
    VecX v(n);
    for (int i = 0; i < n; ++i) {
        v[i] = dist(rng);
    }
    return v;
}

VecX Multiply(const MatX& A, const VecX& x) {
    VecX b(A.Rows());
    for (int i = 0; i < A.Rows(); ++i) {
        for (int j = 0; j < A.Cols(); ++j) {
            b[i] += A(i, j) * x[j];
        }
    }
    return b;
}

MatX Matrix3(double a, double b, double c,
             double d, double e, double f,
             double g, double h, double k) {
    MatX A(3, 3);
    A(0, 0) = a; A(0, 1) = b; A(0, 2) = c;
    A(1, 0) = d; A(1, 1) = e; A(1, 2) = f;
    A(2, 0) = g; A(2, 1) = h; A(2, 2) = k;
    return A;
}

class SolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng_.seed(42);
    }
    std::mt19937 rng_;
};

// =============================================================================
// Matrix Tests
// =============================================================================

TEST_F(SolverTest, Matrix_SwapRowsAndMaxAbs) {
    MatX A(2, 3);
    A(0, 0) = 1; A(0, 1) = -7; A(0, 2) = 3;
    A(1, 0) = 4; A(1, 1) = 5;  A(1, 2) = 6;

    A.SwapRows(0, 1);
    EXPECT_DOUBLE_EQ(A(0, 0), 4.0);
    EXPECT_DOUBLE_EQ(A(1, 1), -7.0);
    EXPECT_DOUBLE_EQ(A.MaxAbs(), 7.0);
    EXPECT_FALSE(A.IsSquare());
    EXPECT_TRUE(MatX().Empty());
}

TEST_F(SolverTest, Vector_Segment) {
    VecX v{1.0, 2.0, 3.0, 4.0};
    VecX s = v.Segment(1, 2);
    ASSERT_EQ(s.Size(), 2);
    EXPECT_DOUBLE_EQ(s[0], 2.0);
    EXPECT_DOUBLE_EQ(s[1], 3.0);
    EXPECT_THROW(v.Segment(3, 2), OutOfRangeException);
}

TEST_F(SolverTest, Vector_IsFinite) {
    VecX v{1.0, 2.0};
    EXPECT_TRUE(v.IsFinite());
    v[1] = NAN;
    EXPECT_FALSE(v.IsFinite());
}

// =============================================================================
// LU Decomposition Tests
// =============================================================================

TEST_F(SolverTest, LU_PackedFactorsReconstructPA) {
    MatX A = RandomMatrix(6, 6, rng_);
    LUResult lu = LU_Decompose(A);
    ASSERT_TRUE(lu.valid);

    for (int i = 0; i < 6; ++i) {
        for (int j = 0; j < 6; ++j) {
            // (LU)(i, j) with the unit diagonal of L implied
            double sum = 0.0;
            for (int k = 0; k <= std::min(i, j); ++k) {
                double l = (k == i) ? 1.0 : lu.LU(i, k);
                sum += l * lu.LU(k, j);
            }
            EXPECT_NEAR(sum, A(lu.P[i], j), 1e-10);
        }
    }
}

TEST_F(SolverTest, LU_ReportsSingularColumn) {
    // Second column is twice the first
    MatX A = Matrix3(1, 2, 0,
                     2, 4, 1,
                     3, 6, 5);

    LUResult lu = LU_Decompose(A);
    EXPECT_FALSE(lu.valid);
    EXPECT_EQ(lu.singularColumn, 1);
    EXPECT_THROW(SolveFromLU(lu, VecX{1, 2, 3}), InvalidArgumentException);
}

TEST_F(SolverTest, LU_NonSquare) {
    MatX A(2, 3);
    std::vector<int> P;
    EXPECT_THROW(LU_DecomposeInPlace(A, P), InvalidArgumentException);
    EXPECT_FALSE(LU_Decompose(A).valid);
}

// =============================================================================
// Linear System Tests
// =============================================================================

TEST_F(SolverTest, TrySolveLU_Simple) {
    // x + 2y + 3z = 14, 4x + 5y + 6z = 32, 7x + 8y + 10z = 53
    MatX A = Matrix3(1, 2, 3,
                     4, 5, 6,
                     7, 8, 10);

    auto x = TrySolveLU(A, VecX{14, 32, 53});

    ASSERT_TRUE(x.has_value());
    EXPECT_NEAR((*x)[0], 1.0, 1e-10);
    EXPECT_NEAR((*x)[1], 2.0, 1e-10);
    EXPECT_NEAR((*x)[2], 3.0, 1e-10);
}

TEST_F(SolverTest, TrySolveLU_Random) {
    for (int trial = 0; trial < 10; ++trial) {
        MatX A = RandomMatrix(8, 8, rng_);
        VecX xTrue = RandomVector(8, rng_);

        auto x = TrySolveLU(A, Multiply(A, xTrue));
        ASSERT_TRUE(x.has_value());
        for (int i = 0; i < 8; ++i) {
            EXPECT_NEAR((*x)[i], xTrue[i], 1e-8);
        }
    }
}

TEST_F(SolverTest, TrySolveLU_SingularReturnsNullopt) {
    MatX A(2, 2);
    A(0, 0) = 1; A(0, 1) = 2;
    A(1, 0) = 2; A(1, 1) = 4;

    EXPECT_FALSE(TrySolveLU(A, VecX{3, 6}).has_value());
    EXPECT_FALSE(TrySolveLU(MatX(), VecX()).has_value());
}

TEST_F(SolverTest, TrySolveLU_ThresholdIsRelative) {
    // Well conditioned but with huge entries: must not be treated as singular
    MatX A(2, 2);
    A(0, 0) = 1e9; A(0, 1) = 0;
    A(1, 0) = 0;   A(1, 1) = 2e9;

    auto x = TrySolveLU(A, VecX{1e9, 4e9});
    ASSERT_TRUE(x.has_value());
    EXPECT_NEAR((*x)[0], 1.0, 1e-12);
    EXPECT_NEAR((*x)[1], 2.0, 1e-12);

    // Tiny pivot relative to the largest entry
    MatX B(2, 2);
    B(0, 0) = 1e6; B(0, 1) = 1e6;
    B(1, 0) = 1e6; B(1, 1) = 1e6 + 1e-8;
    EXPECT_FALSE(TrySolveLU(B, VecX{1, 1}).has_value());
}

TEST_F(SolverTest, TrySolveLU_MultipleRightHandSides) {
    MatX A = RandomMatrix(5, 5, rng_);
    VecX x1 = RandomVector(5, rng_);
    VecX x2 = RandomVector(5, rng_);

    auto sol = TrySolveLU(A, std::vector<VecX>{Multiply(A, x1), Multiply(A, x2)});
    ASSERT_TRUE(sol.has_value());
    ASSERT_EQ(sol->size(), 2u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_NEAR((*sol)[0][i], x1[i], 1e-9);
        EXPECT_NEAR((*sol)[1][i], x2[i], 1e-9);
    }
}

TEST_F(SolverTest, TrySolveLU_DimensionMismatchThrows) {
    MatX A = Matrix3(1, 0, 0,
                     0, 1, 0,
                     0, 0, 1);
    EXPECT_THROW(TrySolveLU(A, VecX{1, 2}), InvalidArgumentException);
}

} // namespace
} // namespace Geo::Warp::Internal
