#pragma once

/**
 * @file Solver.h
 * @brief Dense linear solver for GeoWarp
 *
 * LU decomposition with partial pivoting, stored packed in one matrix, and
 * checked solves that report singular systems as empty results.
 *
 * Used by:
 * - AffineEstimation.h (3x3 normal equations)
 * - ThinPlateSpline.h ((N+3)x(N+3) kernel system, two right-hand sides)
 */

#include <GeoWarp/Internal/Matrix.h>

#include <optional>
#include <vector>

namespace Geo::Warp::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Default pivot tolerance for singularity detection
constexpr double SOLVER_SINGULAR_THRESHOLD = 1e-12;

// =============================================================================
// LU Decomposition
// =============================================================================

/**
 * @brief Packed LU decomposition, PA = LU
 *
 * Entries below the diagonal of LU hold L (unit diagonal implied), the rest
 * hold U. Row i of LU corresponds to row P[i] of A.
 */
struct LUResult {
    MatX LU;
    std::vector<int> P;
    bool valid = false;
    int singularColumn = -1;   ///< Column where pivoting failed (if !valid)
};

/**
 * @brief In-place LU decomposition with partial pivoting
 *
 * @param A Square matrix, overwritten with the packed factors
 * @param P Output row permutation
 * @param threshold Pivots with magnitude not above this are treated as zero
 * @param singularColumn Optional output: column where pivoting failed
 * @return false if A is singular
 *
 * @throws InvalidArgumentException if A is not square
 */
bool LU_DecomposeInPlace(MatX& A, std::vector<int>& P,
                         double threshold = SOLVER_SINGULAR_THRESHOLD,
                         int* singularColumn = nullptr);

/**
 * @brief LU decomposition with partial pivoting
 * @return LUResult, valid == false for non-square or singular input
 *
 * Complexity: O(n^3)
 */
LUResult LU_Decompose(const MatX& A, double threshold = SOLVER_SINGULAR_THRESHOLD);

// =============================================================================
// Linear System Solvers
// =============================================================================

/**
 * @brief Forward and back substitution with a valid decomposition
 * @throws InvalidArgumentException if lu is not valid or b has the wrong size
 */
VecX SolveFromLU(const LUResult& lu, const VecX& b);

/**
 * @brief Solve Ax = b, reporting failure as an empty result
 *
 * The pivot tolerance is relativeThreshold * max(1, max|A_ij|).
 *
 * @return Solution, or nullopt if A is singular or the solution is not finite
 */
std::optional<VecX> TrySolveLU(const MatX& A, const VecX& b,
                               double relativeThreshold = SOLVER_SINGULAR_THRESHOLD);

/**
 * @brief Solve AX = B for several right-hand sides sharing one factorization
 * @param rhs Right-hand sides, each of size A.Rows()
 * @return Solutions in the same order, or nullopt on failure
 */
std::optional<std::vector<VecX>> TrySolveLU(const MatX& A, const std::vector<VecX>& rhs,
                                            double relativeThreshold = SOLVER_SINGULAR_THRESHOLD);

} // namespace Geo::Warp::Internal
