#pragma once

/**
 * @file AffineEstimation.h
 * @brief Least-squares affine fit from reference point correspondences
 *
 * This module provides:
 * - Degeneracy test shared by the affine and thin-plate-spline fits
 * - Affine estimation (exact for 3 points, least squares for more)
 * - Residual statistics for an affine map
 */

#include <GeoWarp/Core/AffineMatrix.h>
#include <GeoWarp/Core/Constants.h>
#include <GeoWarp/Core/ReferencePoint.h>
#include <GeoWarp/Core/Types.h>

#include <optional>
#include <vector>

namespace Geo::Warp::Internal {

// =============================================================================
// Degeneracy
// =============================================================================

/**
 * @brief Normalized spread of a point cloud
 *
 * det(C) / trace(C)^2 for the centered covariance C of the points. Equals 0
 * for collinear (or coincident) points and 0.25 for an isotropic cloud,
 * independent of translation and scale.
 *
 * @return Normalized determinant in [0, 0.25], 0 for fewer than 2 distinct points
 */
double NormalizedSpread(const std::vector<Point2d>& points);

/**
 * @brief True if the points cannot support an affine fit
 *
 * Fewer than 3 points, or NormalizedSpread() below tolerance.
 */
bool IsDegenerateConfiguration(const std::vector<Point2d>& points,
                               double tolerance = DEGENERATE_TOLERANCE);

// =============================================================================
// Estimation
// =============================================================================

/**
 * @brief Estimate affine transform from point correspondences (least squares)
 *
 * Solves the 3x3 normal equations for the X and Y rows on centered source
 * coordinates, then restores the translation terms.
 *
 * @param srcPoints Source points
 * @param dstPoints Destination points
 * @return Estimated transform, or nullopt for fewer than 3 pairs, mismatched
 *         sizes, or collinear sources
 */
std::optional<AffineMatrix> EstimateAffine(const std::vector<Point2d>& srcPoints,
                                           const std::vector<Point2d>& dstPoints);

/**
 * @brief Estimate affine transform from reference points
 */
std::optional<AffineMatrix> EstimateAffine(const std::vector<ReferencePoint>& points);

// =============================================================================
// Error Analysis
// =============================================================================

/**
 * @brief Mean Euclidean residual |affine(source) - target|
 * @return Mean error, or max double for an empty set
 */
double ComputeAffineError(const std::vector<ReferencePoint>& points,
                          const AffineMatrix& affine);

/**
 * @brief Per-point Euclidean residuals, in input order
 */
std::vector<double> ComputeAffinePointErrors(const std::vector<ReferencePoint>& points,
                                             const AffineMatrix& affine);

} // namespace Geo::Warp::Internal
