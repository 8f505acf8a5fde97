/**
 * @file InverseDistance.cpp
 * @brief Affine map with inverse-distance residual correction
 */

#include <GeoWarp/Internal/InverseDistance.h>
#include <GeoWarp/Core/Validate.h>

#include <cmath>

namespace Geo::Warp::Internal {

Point2d ApplyAffineWithIdw(const AffineMatrix& affine,
                           const std::vector<ReferencePoint>& references,
                           double x, double y, double power) {
    Validate::RequireFinite(x, "x", "ApplyAffineWithIdw");
    Validate::RequireFinite(y, "y", "ApplyAffineWithIdw");
    Validate::RequirePositive(power, "power", "ApplyAffineWithIdw");

    Point2d query(x, y);
    Point2d base = affine.Transform(query);
    if (references.empty()) {
        return base;
    }

    Point2d weighted;
    double weightSum = 0.0;
    for (const auto& ref : references) {
        double d = query.DistanceTo(ref.Source());
        if (d < IDW_SNAP_DISTANCE) {
            return ref.Target();
        }
        double w = 1.0 / std::pow(d, power);
        weighted = weighted + (ref.Target() - affine.Transform(ref.Source())) * w;
        weightSum += w;
    }

    return base + weighted * (1.0 / weightSum);
}

} // namespace Geo::Warp::Internal
