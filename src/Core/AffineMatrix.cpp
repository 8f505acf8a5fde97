/**
 * @file AffineMatrix.cpp
 * @brief 2D affine matrix operations and factories
 */

#include <GeoWarp/Core/AffineMatrix.h>
#include <GeoWarp/Core/Constants.h>

#include <cmath>
#include <cstdio>

namespace Geo::Warp {

// =============================================================================
// Constructors
// =============================================================================

AffineMatrix::AffineMatrix() : c_{1.0, 0.0, 0.0, 1.0, 0.0, 0.0} {}

AffineMatrix::AffineMatrix(double a, double b, double c, double d, double e, double f)
    : c_{a, b, c, d, e, f} {}

AffineMatrix::AffineMatrix(const double (&coefficients)[6])
    : c_{coefficients[0], coefficients[1], coefficients[2],
         coefficients[3], coefficients[4], coefficients[5]} {}

// =============================================================================
// Static Factory Methods
// =============================================================================

AffineMatrix AffineMatrix::Identity() {
    return AffineMatrix();
}

AffineMatrix AffineMatrix::Translation(double tx, double ty) {
    return AffineMatrix(1.0, 0.0, 0.0, 1.0, tx, ty);
}

AffineMatrix AffineMatrix::Scaling(double sx, double sy) {
    return AffineMatrix(sx, 0.0, 0.0, sy, 0.0, 0.0);
}

AffineMatrix AffineMatrix::Rotation(double angle) {
    double c = std::cos(angle);
    double s = std::sin(angle);
    return AffineMatrix(c, -s, s, c, 0.0, 0.0);
}

// =============================================================================
// Coefficients
// =============================================================================

void AffineMatrix::GetCoefficients(double (&coefficients)[6]) const {
    for (int i = 0; i < 6; ++i) {
        coefficients[i] = c_[i];
    }
}

bool AffineMatrix::IsFinite() const {
    for (double v : c_) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

// =============================================================================
// Matrix Operations
// =============================================================================

AffineMatrix AffineMatrix::operator*(const AffineMatrix& o) const {
    // | a b e |   | a' b' e' |
    // | c d f | * | c' d' f' |
    // | 0 0 1 |   | 0  0  1  |
    return AffineMatrix(
        c_[0] * o.c_[0] + c_[1] * o.c_[2],
        c_[0] * o.c_[1] + c_[1] * o.c_[3],
        c_[2] * o.c_[0] + c_[3] * o.c_[2],
        c_[2] * o.c_[1] + c_[3] * o.c_[3],
        c_[0] * o.c_[4] + c_[1] * o.c_[5] + c_[4],
        c_[2] * o.c_[4] + c_[3] * o.c_[5] + c_[5]);
}

bool AffineMatrix::operator==(const AffineMatrix& other) const {
    for (int i = 0; i < 6; ++i) {
        if (std::abs(c_[i] - other.c_[i]) > EPSILON) return false;
    }
    return true;
}

bool AffineMatrix::operator!=(const AffineMatrix& other) const {
    return !(*this == other);
}

double AffineMatrix::Determinant() const {
    return c_[0] * c_[3] - c_[1] * c_[2];
}

bool AffineMatrix::IsInvertible() const {
    return std::abs(Determinant()) > EPSILON;
}

AffineMatrix AffineMatrix::Inverse() const {
    double det = Determinant();
    if (std::abs(det) < EPSILON) {
        return Identity();
    }

    double invDet = 1.0 / det;
    double a = c_[3] * invDet;
    double b = -c_[1] * invDet;
    double c = -c_[2] * invDet;
    double d = c_[0] * invDet;
    double e = -(a * c_[4] + b * c_[5]);
    double f = -(c * c_[4] + d * c_[5]);
    return AffineMatrix(a, b, c, d, e, f);
}

// =============================================================================
// Point Transformation
// =============================================================================

Point2d AffineMatrix::Transform(const Point2d& p) const {
    return Transform(p.x, p.y);
}

Point2d AffineMatrix::Transform(double x, double y) const {
    return {c_[0] * x + c_[1] * y + c_[4],
            c_[2] * x + c_[3] * y + c_[5]};
}

std::vector<Point2d> AffineMatrix::Transform(const std::vector<Point2d>& points) const {
    std::vector<Point2d> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.push_back(Transform(p));
    }
    return result;
}

std::string AffineMatrix::ToString() const {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "[%.4f, %.4f, %.4f, %.4f, %.4f, %.4f]",
                  c_[0], c_[1], c_[2], c_[3], c_[4], c_[5]);
    return buf;
}

} // namespace Geo::Warp
