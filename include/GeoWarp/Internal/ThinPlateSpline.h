#pragma once

/**
 * @file ThinPlateSpline.h
 * @brief Thin-plate spline warp fitted to reference points
 *
 * Model:
 *   f(p) = a0 + a1*x + a2*y + sum_i w_i * U(|p - p_i|),  U(r) = r^2 ln r
 *
 * Fitting solves the (N+3)x(N+3) system
 *   [ K + lambda*I  P ] [w]   [t]
 *   [ P^T           0 ] [a] = [0]
 * once for target X and once for target Y, with P = [1 x y].
 *
 * The system is assembled in normalized source coordinates
 *   p' = (p - Center()) / Scale()
 * with Center() the centroid of the sources and Scale() their larger bounding
 * box side, so its conditioning does not depend on the map's pixel extent.
 * lambda is divided by Scale()^2 there, which gives the same spline as
 * solving in source units.
 */

#include <GeoWarp/Core/ReferencePoint.h>
#include <GeoWarp/Core/Types.h>
#include <GeoWarp/Internal/Matrix.h>

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace Geo::Warp::Internal {

/// Radial basis U(r) = r^2 ln r, with U(0) = 0
double ThinPlateKernel(double r);

/**
 * @brief Fitted thin-plate spline
 *
 * Immutable once fitted; refit when the reference set changes.
 */
class ThinPlateSplineModel {
public:
    /**
     * @brief Fit a spline through reference points
     *
     * @param points Reference points (N >= 3, not all collinear, no repeated sources)
     * @param lambda Regularization; negative values are clamped to 0.
     *               With lambda = 0 every reference is reproduced exactly.
     * @return Model, or nullopt if the system is singular or the fit is not finite
     */
    static std::optional<ThinPlateSplineModel> Fit(const std::vector<ReferencePoint>& points,
                                                   double lambda = 0.0);

    /**
     * @brief Fit from (dbX, dbZ, svgX, svgY) rows
     */
    static std::optional<ThinPlateSplineModel> CreateFromDatabaseOrder(
        const std::vector<ReferencePointSet::DatabaseTuple>& rows, double lambda = 0.0);

    /// Evaluate the spline at a source-space point
    Point2d Transform(double x, double y) const;
    Point2d Transform(const Point2d& p) const { return Transform(p.x, p.y); }

    std::vector<Point2d> TransformBatch(const std::vector<Point2d>& points) const;

    /// Mean |f(source) - target| over the references (computed at fit time)
    double MeanError() const { return meanError_; }
    /// Max |f(source) - target| over the references (computed at fit time)
    double MaxError() const { return maxError_; }

    int ReferencePointCount() const { return static_cast<int>(points_.size()); }
    double Lambda() const { return lambda_; }

    const std::vector<ReferencePoint>& ReferencePoints() const { return points_; }

    /// Kernel weights w_i in source units
    VecX WeightsX() const { return SourceWeights(weightsX_); }
    VecX WeightsY() const { return SourceWeights(weightsY_); }
    /// (a0, a1, a2) of the X component in source units
    Vec3 AffineX() const { return SourceAffine(affineX_, weightsX_); }
    /// (a0, a1, a2) of the Y component in source units
    Vec3 AffineY() const { return SourceAffine(affineY_, weightsY_); }

    /// Centroid subtracted from sources before fitting
    const Point2d& Center() const { return center_; }
    /// Divisor applied to centred sources before fitting
    double Scale() const { return scale_; }

    /// Multi-line summary: point count, lambda, errors and affine terms
    std::string DebugString() const;

private:
    ThinPlateSplineModel() = default;

    Point2d Normalize(const Point2d& p) const { return (p - center_) * (1.0 / scale_); }
    VecX SourceWeights(const VecX& w) const;
    Vec3 SourceAffine(const Vec3& a, const VecX& w) const;

    std::vector<ReferencePoint> points_;
    std::vector<Point2d> nodes_;    ///< Normalized sources
    Point2d center_;
    double scale_ = 1.0;
    // Coefficients of the normalized system
    VecX weightsX_;
    VecX weightsY_;
    Vec3 affineX_;
    Vec3 affineY_;
    double lambda_ = 0.0;
    double meanError_ = 0.0;
    double maxError_ = 0.0;
};

} // namespace Geo::Warp::Internal
