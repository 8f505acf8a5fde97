/**
 * @file Types.cpp
 * @brief Bounding rectangles and circumcircles
 */

#include <GeoWarp/Core/Types.h>
#include <GeoWarp/Core/Constants.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Geo::Warp {

// =============================================================================
// Rect2d Implementation
// =============================================================================

Rect2d Rect2d::Bounding(const std::vector<Point2d>& points) {
    if (points.empty()) {
        return Rect2d();
    }

    double minX = points[0].x, maxX = points[0].x;
    double minY = points[0].y, maxY = points[0].y;
    for (const auto& p : points) {
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }
    return Rect2d(minX, minY, maxX - minX, maxY - minY);
}

// =============================================================================
// Circle2d Implementation
// =============================================================================

bool Circle2d::ContainsStrict(const Point2d& p, double relTolerance) const {
    // Degenerate circumcircle (collinear triangle) behaves like a half-plane
    // covering everything: treat as containing.
    if (!std::isfinite(radius)) {
        return true;
    }
    double r2 = radius * radius;
    return (p - center).NormSquared() < r2 * (1.0 - relTolerance);
}

Circle2d Circle2d::Circumscribed(const Point2d& a, const Point2d& b, const Point2d& c) {
    // Solve relative to a for precision
    Point2d ab = b - a;
    Point2d ac = c - a;
    double d = 2.0 * ab.Cross(ac);

    double scale = std::max({ab.NormSquared(), ac.NormSquared(), (c - b).NormSquared()});
    if (std::abs(d) <= EPSILON * scale) {
        Point2d centroid((a.x + b.x + c.x) / 3.0, (a.y + b.y + c.y) / 3.0);
        return Circle2d(centroid, std::numeric_limits<double>::infinity());
    }

    double ab2 = ab.NormSquared();
    double ac2 = ac.NormSquared();
    Point2d offset((ac.y * ab2 - ab.y * ac2) / d,
                   (ab.x * ac2 - ac.x * ab2) / d);
    return Circle2d(a + offset, offset.Norm());
}

} // namespace Geo::Warp
