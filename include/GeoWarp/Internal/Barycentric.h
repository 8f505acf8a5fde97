#pragma once

/**
 * @file Barycentric.h
 * @brief Piecewise-linear interpolation over a triangulation
 *
 * Weights for a query p in triangle (a, b, c) satisfy
 *   p = w0*a + w1*b + w2*c,  w0 + w1 + w2 = 1
 * and are applied to the matching target vertices.
 */

#include <GeoWarp/Core/ReferencePoint.h>
#include <GeoWarp/Core/Types.h>
#include <GeoWarp/Internal/Delaunay.h>
#include <GeoWarp/Internal/Matrix.h>

#include <optional>
#include <vector>

namespace Geo::Warp::Internal {

/// A weight >= -BARYCENTRIC_TOLERANCE counts as non-negative for containment
constexpr double BARYCENTRIC_TOLERANCE = 1e-9;

/**
 * @brief Result of an interpolation query
 */
struct InterpolationResult {
    Point2d point;              ///< Interpolated target coordinate
    int triangleIndex = -1;     ///< Triangle used (-1 if none)
    Vec3 weights;               ///< Barycentric weights in that triangle
    bool inside = false;        ///< Query lies inside the triangulation
    bool valid = false;         ///< False for an empty triangulation
};

/**
 * @brief Barycentric weights of p with respect to (a, b, c)
 * @return Weights (w0, w1, w2), or nullopt for a degenerate triangle
 */
std::optional<Vec3> ComputeBarycentric(const Point2d& p, const Point2d& a,
                                       const Point2d& b, const Point2d& c);

/**
 * @brief First triangle containing p (all weights >= -BARYCENTRIC_TOLERANCE)
 * @return Triangle index, or -1
 */
int LocateTriangle(const Point2d& p, const std::vector<Triangle>& triangles,
                   const std::vector<Point2d>& vertices);

/**
 * @brief Triangle whose centroid is closest to p
 *
 * Ties resolve to the lowest index.
 * @return Triangle index, or -1 for no triangles
 */
int NearestTriangleByCentroid(const Point2d& p, const std::vector<Triangle>& triangles,
                              const std::vector<Point2d>& vertices);

/**
 * @brief Interpolate with full diagnostics
 *
 * Uses the containing triangle; outside the hull extrapolates linearly in
 * the triangle nearest by centroid (weights may be negative).
 *
 * @param query Source-space query
 * @param triangles Triangulation of sources
 * @param sources Source vertices
 * @param targets Target vertices, parallel to sources
 */
InterpolationResult InterpolateDetailed(const Point2d& query,
                                        const std::vector<Triangle>& triangles,
                                        const std::vector<Point2d>& sources,
                                        const std::vector<Point2d>& targets);

/**
 * @brief Interpolate the target coordinate for (queryX, queryY)
 * @return Target coordinate, or nullopt for an empty triangulation
 */
std::optional<Point2d> Interpolate(double queryX, double queryY,
                                   const std::vector<Triangle>& triangles,
                                   const std::vector<ReferencePoint>& points);

} // namespace Geo::Warp::Internal
