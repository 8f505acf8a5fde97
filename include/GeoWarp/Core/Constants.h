#pragma once

/**
 * @file Constants.h
 * @brief Numerical constants shared across GeoWarp
 */

namespace Geo::Warp {

/// General floating-point epsilon
constexpr double EPSILON = 1e-10;

/// Two source coordinates closer than this are the same point
constexpr double POINT_MERGE_TOLERANCE = 1e-9;

/// Normalized determinant below this marks collinear / degenerate geometry
constexpr double DEGENERATE_TOLERANCE = 1e-9;

/// Minimum number of reference pairs for any transform
constexpr int MIN_REFERENCE_POINTS = 3;

} // namespace Geo::Warp
