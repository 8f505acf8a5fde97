#pragma once

/**
 * @file Delaunay.h
 * @brief Delaunay triangulation of reference source points (Bowyer-Watson)
 *
 * Triangle vertex indices refer to the caller's point list. Points that
 * coincide with an earlier point (within POINT_MERGE_TOLERANCE) are skipped,
 * so only the first occurrence of a location is ever referenced.
 *
 * Guarantees:
 * - No triangle has zero area
 * - Every triangle is counter-clockwise in source space
 * - No input point lies strictly inside any triangle's circumcircle
 * - The union of the triangles covers the convex hull of the input
 */

#include <GeoWarp/Core/Constants.h>
#include <GeoWarp/Core/ReferencePoint.h>
#include <GeoWarp/Core/Types.h>

#include <cmath>
#include <vector>

namespace Geo::Warp::Internal {

// =============================================================================
// Triangle
// =============================================================================

/**
 * @brief Three vertex indices, counter-clockwise
 */
struct Triangle {
    int v0 = -1;
    int v1 = -1;
    int v2 = -1;

    Triangle() = default;
    Triangle(int a, int b, int c) : v0(a), v1(b), v2(c) {}

    int operator[](int i) const { return i == 0 ? v0 : (i == 1 ? v1 : v2); }

    bool HasVertex(int index) const { return v0 == index || v1 == index || v2 == index; }

    bool operator==(const Triangle& other) const {
        return v0 == other.v0 && v1 == other.v1 && v2 == other.v2;
    }
};

// =============================================================================
// Geometry Helpers
// =============================================================================

/// Signed area, positive for counter-clockwise (a, b, c)
inline double SignedTriangleArea(const Point2d& a, const Point2d& b, const Point2d& c) {
    return 0.5 * (b - a).Cross(c - a);
}

/// Unsigned triangle area
inline double TriangleArea(const Point2d& a, const Point2d& b, const Point2d& c) {
    return std::abs(SignedTriangleArea(a, b, c));
}

/// Area of a triangle given by indices into vertices
double TriangleArea(const Triangle& tri, const std::vector<Point2d>& vertices);

/// Circumcircle of a triangle given by indices into vertices
Circle2d Circumcircle(const Triangle& tri, const std::vector<Point2d>& vertices);

// =============================================================================
// Deduplication
// =============================================================================

/**
 * @brief Indices of the first occurrence of each distinct location
 * @param points Input points
 * @param tolerance Points closer than this (Euclidean) are merged
 * @return Indices into points, ascending
 */
std::vector<int> UniquePointIndices(const std::vector<Point2d>& points,
                                    double tolerance = POINT_MERGE_TOLERANCE);

/**
 * @brief Drop references whose source repeats an earlier one
 *
 * Keeps the first occurrence, preserving order.
 */
std::vector<ReferencePoint> DeduplicateReferencePoints(
    const std::vector<ReferencePoint>& points,
    double tolerance = POINT_MERGE_TOLERANCE);

// =============================================================================
// Triangulation
// =============================================================================

/**
 * @brief Delaunay triangulation of a point set
 *
 * @param points Source-space points (may contain duplicates)
 * @return Triangles indexing into points; empty for fewer than 3 distinct
 *         points or when all distinct points are collinear
 */
std::vector<Triangle> Triangulate(const std::vector<Point2d>& points);

/// Triangulate the source coordinates of reference points
std::vector<Triangle> Triangulate(const std::vector<ReferencePoint>& points);

/**
 * @brief Check the empty-circumcircle property
 *
 * @param triangles Triangles to check
 * @param vertices Vertex list the triangles index into
 * @param relTolerance Relative tolerance on the squared circumradius
 * @return true if no vertex lies strictly inside any circumcircle
 */
bool IsDelaunay(const std::vector<Triangle>& triangles,
                const std::vector<Point2d>& vertices,
                double relTolerance = 1e-9);

} // namespace Geo::Warp::Internal
