#pragma once

/**
 * @file CoordinateTransform.h
 * @brief Source-to-target coordinate transform built from reference points
 *
 * Construction order:
 * 1. Thin-plate spline through all references (unless disabled)
 * 2. Otherwise, least-squares affine plus a Delaunay triangulation of the
 *    sources: barycentric interpolation inside the hull, the configured
 *    extrapolation outside
 *
 * On every path a query matching a reference source within
 * TransformParams::snapTolerance returns that reference's target exactly.
 *
 * Example:
 * @code
 * ReferencePointSet refs;
 * refs.Add(120.0, 80.0, -15.2, 33.0);
 * ...
 * TransformError err;
 * auto transform = CoordinateTransform::Create(refs, TransformParams::Default(), &err);
 * if (!transform) {
 *     std::cerr << TransformErrorMessage(err) << "\n";
 * } else {
 *     Point2d world = transform->Transform(200.0, 150.0);
 * }
 * @endcode
 */

#include <GeoWarp/Core/AffineMatrix.h>
#include <GeoWarp/Core/Export.h>
#include <GeoWarp/Core/ReferencePoint.h>
#include <GeoWarp/Core/Types.h>
#include <GeoWarp/Internal/Delaunay.h>
#include <GeoWarp/Internal/ThinPlateSpline.h>
#include <GeoWarp/Transform/TransformParams.h>

#include <optional>
#include <string>
#include <vector>

namespace Geo::Warp {

/**
 * @brief Active interpolation method
 */
enum class TransformMethod {
    ThinPlateSpline,
    AffineTriangulation
};

/**
 * @brief Why a transform could not be built
 */
enum class TransformError {
    None,
    InsufficientReferencePoints,    ///< Fewer than 3 references
    DegenerateGeometry              ///< Sources collinear or coincident
};

/// Display name of a method
GEOWARP_API const char* TransformMethodName(TransformMethod method);

/// User-facing message, e.g. "could not compute transform: ..."
GEOWARP_API std::string TransformErrorMessage(TransformError error);

/**
 * @brief Immutable coordinate transform
 *
 * Rebuild with Create() whenever the reference set changes.
 */
class GEOWARP_API CoordinateTransform {
public:
    /**
     * @brief Build a transform from reference points
     *
     * @param references Matched source/target pairs
     * @param params Construction parameters
     * @param error [out] Failure reason (optional); None on success
     * @return Transform, or nullopt if neither the spline nor the affine fit succeeds
     * @throws InvalidArgumentException if params.snapTolerance is negative
     */
    static std::optional<CoordinateTransform> Create(
        const ReferencePointSet& references,
        const TransformParams& params = TransformParams::Default(),
        TransformError* error = nullptr);

    /**
     * @brief Map a source coordinate to target space
     * @throws InvalidArgumentException for non-finite input
     */
    Point2d Transform(double x, double y) const;
    Point2d Transform(const Point2d& p) const { return Transform(p.x, p.y); }

    std::vector<Point2d> TransformBatch(const std::vector<Point2d>& points) const;

    TransformMethod Method() const { return method_; }

    /// Mean residual of the active model over the references
    double MeanError() const { return meanError_; }
    /// Max residual of the active model over the references
    double MaxError() const { return maxError_; }

    int ReferencePointCount() const { return static_cast<int>(references_.Size()); }

    const ReferencePointSet& References() const { return references_; }

    /// Least-squares affine (affine/triangulation path only)
    const std::optional<AffineMatrix>& Affine() const { return affine_; }

    /// Triangulation of the sources (affine/triangulation path only)
    const std::vector<Internal::Triangle>& Triangles() const { return triangles_; }

    /// Spline model (spline path only)
    const std::optional<Internal::ThinPlateSplineModel>& Spline() const { return spline_; }

    const TransformParams& Params() const { return params_; }

    /**
     * @brief Per-reference residuals of the active model, without snapping
     */
    std::vector<double> ComputeResiduals() const;

    /// One-line summary of method and errors
    std::string Describe() const;

private:
    CoordinateTransform() = default;

    Point2d EvaluateModel(const Point2d& p) const;
    void ComputeErrorStatistics();

    TransformParams params_;
    TransformMethod method_ = TransformMethod::ThinPlateSpline;
    ReferencePointSet references_;
    std::vector<Point2d> sources_;
    std::vector<Point2d> targets_;

    std::optional<Internal::ThinPlateSplineModel> spline_;
    std::optional<AffineMatrix> affine_;
    std::vector<Internal::Triangle> triangles_;

    double meanError_ = 0.0;
    double maxError_ = 0.0;
};

} // namespace Geo::Warp
