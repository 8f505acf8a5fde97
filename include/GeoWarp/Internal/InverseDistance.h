#pragma once

/**
 * @file InverseDistance.h
 * @brief Affine prediction corrected by inverse-distance-weighted residuals
 */

#include <GeoWarp/Core/AffineMatrix.h>
#include <GeoWarp/Core/ReferencePoint.h>
#include <GeoWarp/Core/Types.h>

#include <vector>

namespace Geo::Warp::Internal {

/// Queries this close (source space) to a reference return its target
constexpr double IDW_SNAP_DISTANCE = 0.001;

/**
 * @brief affine(p) + sum_i w_i * r_i / sum_i w_i
 *
 * r_i = target_i - affine(source_i), w_i = 1 / d_i^power with d_i the
 * source-space distance from the query to reference i.
 *
 * @param affine Base transform
 * @param references Calibration references (may be empty)
 * @param x Query X
 * @param y Query Y
 * @param power Distance exponent (> 0)
 * @return Corrected target coordinate
 */
Point2d ApplyAffineWithIdw(const AffineMatrix& affine,
                           const std::vector<ReferencePoint>& references,
                           double x, double y, double power = 2.0);

} // namespace Geo::Warp::Internal
