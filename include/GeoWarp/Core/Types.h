#pragma once

/**
 * @file Types.h
 * @brief Core geometric types for GeoWarp
 */

#include <GeoWarp/Core/Export.h>

#include <cmath>
#include <vector>

namespace Geo::Warp {

// =============================================================================
// 2D Point Type
// =============================================================================

/**
 * @brief 2D point with double precision
 */
struct GEOWARP_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    /// Vector addition
    Point2d operator+(const Point2d& other) const {
        return {x + other.x, y + other.y};
    }

    /// Vector subtraction
    Point2d operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    /// Scalar multiplication
    Point2d operator*(double s) const {
        return {x * s, y * s};
    }

    bool operator==(const Point2d& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point2d& other) const {
        return !(*this == other);
    }

    /// Euclidean norm
    double Norm() const {
        return std::sqrt(x * x + y * y);
    }

    /// Squared Euclidean norm
    double NormSquared() const {
        return x * x + y * y;
    }

    /// Dot product
    double Dot(const Point2d& other) const {
        return x * other.x + y * other.y;
    }

    /// Cross product (2D: returns scalar)
    double Cross(const Point2d& other) const {
        return x * other.y - y * other.x;
    }

    /// Distance to another point
    double DistanceTo(const Point2d& other) const {
        return (*this - other).Norm();
    }
};

// =============================================================================
// Rectangle Type
// =============================================================================

/**
 * @brief Axis-aligned rectangle with double precision
 */
struct GEOWARP_API Rect2d {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    Rect2d() = default;
    Rect2d(double x_, double y_, double w, double h)
        : x(x_), y(y_), width(w), height(h) {}

    double Area() const { return width * height; }
    Point2d Center() const { return {x + width / 2.0, y + height / 2.0}; }
    bool IsValid() const {
        return std::isfinite(x) && std::isfinite(y) &&
               std::isfinite(width) && std::isfinite(height) &&
               width >= 0.0 && height >= 0.0;
    }

    /// Inclusive containment test
    bool Contains(const Point2d& p) const {
        return p.x >= x && p.x <= x + width && p.y >= y && p.y <= y + height;
    }

    /// Smallest rectangle enclosing all points (empty rect for no points)
    static Rect2d Bounding(const std::vector<Point2d>& points);
};

// =============================================================================
// Circle Type
// =============================================================================

/**
 * @brief Circle in 2D, used for circumcircles
 */
struct GEOWARP_API Circle2d {
    Point2d center;
    double radius = 0.0;

    Circle2d() = default;
    Circle2d(const Point2d& c, double r) : center(c), radius(r) {}

    bool IsValid() const { return center.IsValid() && std::isfinite(radius) && radius >= 0.0; }

    /// Strict interior test with a relative tolerance on the squared radius
    bool ContainsStrict(const Point2d& p, double relTolerance = 1e-12) const;

    /**
     * @brief Circle through three points
     * @return Circle with infinite radius if the points are collinear
     */
    static Circle2d Circumscribed(const Point2d& a, const Point2d& b, const Point2d& c);
};

} // namespace Geo::Warp
