#pragma once

/**
 * @file TransformParams.h
 * @brief Configuration for CoordinateTransform::Create
 */

#include <GeoWarp/Core/Constants.h>
#include <GeoWarp/Core/Export.h>

namespace Geo::Warp {

/**
 * @brief How the affine/triangulation path maps queries outside the hull
 */
enum class Extrapolation {
    Affine,             ///< Plain least-squares affine map
    NearestTriangle     ///< Linear extension of the triangle nearest by centroid
};

/**
 * @brief Transform construction parameters
 */
struct GEOWARP_API TransformParams {
    bool useThinPlateSpline = true;                 ///< Try the spline before the affine fallback
    double lambda = 0.0;                            ///< Spline regularization (negative clamps to 0)
    double snapTolerance = POINT_MERGE_TOLERANCE;   ///< Exact-source snapping radius (>= 0)
    Extrapolation extrapolation = Extrapolation::Affine;

    TransformParams& SetLambda(double l) { lambda = l; return *this; }
    TransformParams& SetSnapTolerance(double t) { snapTolerance = t; return *this; }
    TransformParams& SetExtrapolation(Extrapolation e) { extrapolation = e; return *this; }

    static TransformParams Default() { return TransformParams(); }

    /// Spline that trades exactness at the references for smoothness
    static TransformParams Smoothed(double lambda) {
        TransformParams p;
        p.lambda = lambda;
        return p;
    }

    /// Skip the spline; affine fit with triangulated interpolation
    static TransformParams AffineOnly() {
        TransformParams p;
        p.useThinPlateSpline = false;
        return p;
    }
};

} // namespace Geo::Warp
