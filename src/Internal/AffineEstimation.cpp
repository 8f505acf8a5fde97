/**
 * @file AffineEstimation.cpp
 * @brief Least-squares affine estimation and degeneracy checks
 */

#include <GeoWarp/Internal/AffineEstimation.h>
#include <GeoWarp/Internal/Matrix.h>
#include <GeoWarp/Internal/Solver.h>
#include <GeoWarp/Core/Log.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Geo::Warp::Internal {

namespace {

Point2d Centroid(const std::vector<Point2d>& points) {
    double sx = 0.0, sy = 0.0;
    for (const auto& p : points) {
        sx += p.x;
        sy += p.y;
    }
    double n = static_cast<double>(points.size());
    return {sx / n, sy / n};
}

} // anonymous namespace

// =============================================================================
// Degeneracy
// =============================================================================

double NormalizedSpread(const std::vector<Point2d>& points) {
    if (points.size() < 2) {
        return 0.0;
    }

    Point2d c = Centroid(points);
    double sxx = 0.0, syy = 0.0, sxy = 0.0;
    for (const auto& p : points) {
        double dx = p.x - c.x;
        double dy = p.y - c.y;
        sxx += dx * dx;
        syy += dy * dy;
        sxy += dx * dy;
    }

    double trace = sxx + syy;
    if (trace <= 0.0 || !std::isfinite(trace)) {
        return 0.0;
    }
    double det = sxx * syy - sxy * sxy;
    return std::max(0.0, det / (trace * trace));
}

bool IsDegenerateConfiguration(const std::vector<Point2d>& points, double tolerance) {
    if (points.size() < static_cast<size_t>(MIN_REFERENCE_POINTS)) {
        return true;
    }
    return NormalizedSpread(points) < tolerance;
}

// =============================================================================
// Estimation
// =============================================================================

std::optional<AffineMatrix> EstimateAffine(const std::vector<Point2d>& srcPoints,
                                           const std::vector<Point2d>& dstPoints) {
    if (srcPoints.size() < static_cast<size_t>(MIN_REFERENCE_POINTS) ||
        srcPoints.size() != dstPoints.size()) {
        return std::nullopt;
    }

    if (IsDegenerateConfiguration(srcPoints)) {
        Log::Get()->debug("EstimateAffine: degenerate source configuration ({} points)",
                          srcPoints.size());
        return std::nullopt;
    }

    // Rows of the design matrix: [x - cx, y - cy, 1]
    // Normal equations: (A^T A) [a b e']^T = A^T tx, (A^T A) [c d f']^T = A^T ty
    Point2d c = Centroid(srcPoints);

    MatX AtA(3, 3);
    VecX AtbX(3);
    VecX AtbY(3);

    for (size_t i = 0; i < srcPoints.size(); ++i) {
        double r[3] = {srcPoints[i].x - c.x, srcPoints[i].y - c.y, 1.0};
        for (int j = 0; j < 3; ++j) {
            for (int k = 0; k < 3; ++k) {
                AtA(j, k) += r[j] * r[k];
            }
            AtbX[j] += r[j] * dstPoints[i].x;
            AtbY[j] += r[j] * dstPoints[i].y;
        }
    }

    auto solution = TrySolveLU(AtA, std::vector<VecX>{AtbX, AtbY});
    if (!solution) {
        return std::nullopt;
    }

    const VecX& rowX = (*solution)[0];
    const VecX& rowY = (*solution)[1];

    // Undo centering: t = a*(x - cx) + b*(y - cy) + e'
    double a = rowX[0], b = rowX[1];
    double cc = rowY[0], d = rowY[1];
    double e = rowX[2] - a * c.x - b * c.y;
    double f = rowY[2] - cc * c.x - d * c.y;

    AffineMatrix affine(a, b, cc, d, e, f);
    if (!affine.IsFinite()) {
        return std::nullopt;
    }
    return affine;
}

std::optional<AffineMatrix> EstimateAffine(const std::vector<ReferencePoint>& points) {
    std::vector<Point2d> src;
    std::vector<Point2d> dst;
    src.reserve(points.size());
    dst.reserve(points.size());
    for (const auto& p : points) {
        src.push_back(p.Source());
        dst.push_back(p.Target());
    }
    return EstimateAffine(src, dst);
}

// =============================================================================
// Error Analysis
// =============================================================================

double ComputeAffineError(const std::vector<ReferencePoint>& points,
                          const AffineMatrix& affine) {
    if (points.empty()) {
        return std::numeric_limits<double>::max();
    }

    double sum = 0.0;
    for (const auto& p : points) {
        sum += affine.Transform(p.Source()).DistanceTo(p.Target());
    }
    return sum / static_cast<double>(points.size());
}

std::vector<double> ComputeAffinePointErrors(const std::vector<ReferencePoint>& points,
                                             const AffineMatrix& affine) {
    std::vector<double> errors;
    errors.reserve(points.size());
    for (const auto& p : points) {
        errors.push_back(affine.Transform(p.Source()).DistanceTo(p.Target()));
    }
    return errors;
}

} // namespace Geo::Warp::Internal
