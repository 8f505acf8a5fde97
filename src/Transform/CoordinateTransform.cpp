/**
 * @file CoordinateTransform.cpp
 * @brief Coordinate transform selection and queries
 */

#include <GeoWarp/Transform/CoordinateTransform.h>
#include <GeoWarp/Internal/AffineEstimation.h>
#include <GeoWarp/Internal/Barycentric.h>
#include <GeoWarp/Core/Log.h>
#include <GeoWarp/Core/Validate.h>

#include <algorithm>
#include <cstdio>

namespace Geo::Warp {

const char* TransformMethodName(TransformMethod method) {
    switch (method) {
        case TransformMethod::ThinPlateSpline:      return "Thin-plate spline";
        case TransformMethod::AffineTriangulation:  return "Affine + triangulation";
    }
    return "Unknown";
}

std::string TransformErrorMessage(TransformError error) {
    switch (error) {
        case TransformError::None:
            return "";
        case TransformError::InsufficientReferencePoints:
            return "could not compute transform: at least 3 reference points are required";
        case TransformError::DegenerateGeometry:
            return "could not compute transform: reference points are collinear or coincident";
    }
    return "could not compute transform";
}

std::optional<CoordinateTransform> CoordinateTransform::Create(
    const ReferencePointSet& references, const TransformParams& params, TransformError* error) {
    Validate::RequireNonNegative(params.snapTolerance, "snapTolerance", "CoordinateTransform::Create");

    if (error) {
        *error = TransformError::None;
    }

    CoordinateTransform transform;
    transform.params_ = params;
    transform.references_ = references;
    transform.sources_ = references.SourcePoints();
    transform.targets_ = references.TargetPoints();

    if (params.useThinPlateSpline) {
        transform.spline_ = Internal::ThinPlateSplineModel::Fit(references.Points(), params.lambda);
        if (transform.spline_) {
            transform.method_ = TransformMethod::ThinPlateSpline;
            transform.ComputeErrorStatistics();
            return transform;
        }
        Log::Get()->debug("CoordinateTransform: spline fit failed, falling back to affine");
    }

    transform.affine_ = Internal::EstimateAffine(references.Points());
    if (!transform.affine_) {
        if (error) {
            *error = references.Size() < static_cast<size_t>(MIN_REFERENCE_POINTS)
                         ? TransformError::InsufficientReferencePoints
                         : TransformError::DegenerateGeometry;
        }
        Log::Get()->debug("CoordinateTransform: no transform for {} reference points",
                          references.Size());
        return std::nullopt;
    }

    transform.method_ = TransformMethod::AffineTriangulation;
    transform.triangles_ = Internal::Triangulate(transform.sources_);
    transform.ComputeErrorStatistics();

    Log::Get()->debug("CoordinateTransform: affine {} with {} triangles",
                      transform.affine_->ToString(), transform.triangles_.size());
    return transform;
}

Point2d CoordinateTransform::EvaluateModel(const Point2d& p) const {
    if (method_ == TransformMethod::ThinPlateSpline) {
        return spline_->Transform(p);
    }

    if (!triangles_.empty()) {
        if (Internal::LocateTriangle(p, triangles_, sources_) >= 0 ||
            params_.extrapolation == Extrapolation::NearestTriangle) {
            Internal::InterpolationResult r =
                Internal::InterpolateDetailed(p, triangles_, sources_, targets_);
            if (r.valid) {
                return r.point;
            }
        }
    }
    return affine_->Transform(p);
}

Point2d CoordinateTransform::Transform(double x, double y) const {
    Validate::RequireFinite(x, "x", "CoordinateTransform::Transform");
    Validate::RequireFinite(y, "y", "CoordinateTransform::Transform");

    if (auto hit = references_.FindBySource(x, y, params_.snapTolerance)) {
        return references_[*hit].Target();
    }
    return EvaluateModel({x, y});
}

std::vector<Point2d> CoordinateTransform::TransformBatch(const std::vector<Point2d>& points) const {
    std::vector<Point2d> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.push_back(Transform(p));
    }
    return result;
}

std::vector<double> CoordinateTransform::ComputeResiduals() const {
    std::vector<double> residuals;
    residuals.reserve(references_.Size());
    for (const auto& ref : references_) {
        residuals.push_back(EvaluateModel(ref.Source()).DistanceTo(ref.Target()));
    }
    return residuals;
}

void CoordinateTransform::ComputeErrorStatistics() {
    std::vector<double> residuals = ComputeResiduals();
    double sum = 0.0;
    double maxErr = 0.0;
    for (double r : residuals) {
        sum += r;
        maxErr = std::max(maxErr, r);
    }
    meanError_ = residuals.empty() ? 0.0 : sum / static_cast<double>(residuals.size());
    maxError_ = maxErr;
}

std::string CoordinateTransform::Describe() const {
    char buf[256];
    if (method_ == TransformMethod::ThinPlateSpline) {
        std::snprintf(buf, sizeof(buf),
                      "%s: %d reference points, lambda=%.2e, mean error=%.4f, max error=%.4f",
                      TransformMethodName(method_), ReferencePointCount(), spline_->Lambda(),
                      meanError_, maxError_);
    } else {
        std::snprintf(buf, sizeof(buf),
                      "%s: %d reference points, %zu triangles, mean error=%.4f, max error=%.4f",
                      TransformMethodName(method_), ReferencePointCount(), triangles_.size(),
                      meanError_, maxError_);
    }
    return buf;
}

} // namespace Geo::Warp
