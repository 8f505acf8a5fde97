#pragma once

/**
 * @file AffineMatrix.h
 * @brief 2D affine map between source (SVG) and target (world) space
 *
 * Six coefficients (a, b, c, d, e, f):
 *   targetX = a*x + b*y + e
 *   targetY = c*x + d*y + f
 *
 * Equivalent homogeneous form:
 * | a  b  e |
 * | c  d  f |
 * | 0  0  1 |
 */

#include <GeoWarp/Core/Types.h>
#include <GeoWarp/Core/Export.h>

#include <array>
#include <string>
#include <vector>

namespace Geo::Warp {

/**
 * @brief 2D affine transformation
 */
class GEOWARP_API AffineMatrix {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (identity)
    AffineMatrix();

    /// Construct from coefficients in (a, b, c, d, e, f) order
    AffineMatrix(double a, double b, double c, double d, double e, double f);

    /// Construct from array in (a, b, c, d, e, f) order
    explicit AffineMatrix(const double (&coefficients)[6]);

    // =========================================================================
    // Static Factory Methods
    // =========================================================================

    static AffineMatrix Identity();
    static AffineMatrix Translation(double tx, double ty);
    static AffineMatrix Scaling(double sx, double sy);

    /// Rotation around origin (radians, counter-clockwise)
    static AffineMatrix Rotation(double angle);

    // =========================================================================
    // Coefficients
    // =========================================================================

    double A() const { return c_[0]; }
    double B() const { return c_[1]; }
    double C() const { return c_[2]; }
    double D() const { return c_[3]; }
    double E() const { return c_[4]; }
    double F() const { return c_[5]; }

    /// Coefficients in (a, b, c, d, e, f) order
    void GetCoefficients(double (&coefficients)[6]) const;

    /// True if all six coefficients are finite
    bool IsFinite() const;

    // =========================================================================
    // Matrix Operations
    // =========================================================================

    /// Composition: (this * other)(p) = this(other(p))
    AffineMatrix operator*(const AffineMatrix& other) const;

    bool operator==(const AffineMatrix& other) const;
    bool operator!=(const AffineMatrix& other) const;

    /// Determinant of the linear part (a*d - b*c)
    double Determinant() const;

    bool IsInvertible() const;

    /// Inverse (identity if not invertible)
    AffineMatrix Inverse() const;

    // =========================================================================
    // Point Transformation
    // =========================================================================

    Point2d Transform(const Point2d& p) const;
    Point2d Transform(double x, double y) const;

    Point2d operator*(const Point2d& p) const { return Transform(p); }

    std::vector<Point2d> Transform(const std::vector<Point2d>& points) const;

    /// "[a, b, c, d, e, f]" with 4 decimals
    std::string ToString() const;

private:
    // Storage: [a, b, c, d, e, f]
    std::array<double, 6> c_;
};

/// Name used by the transform engine for estimated affine maps
using AffineParameters = AffineMatrix;

} // namespace Geo::Warp
