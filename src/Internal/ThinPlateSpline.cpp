/**
 * @file ThinPlateSpline.cpp
 * @brief Thin-plate spline fitting and evaluation
 */

#include <GeoWarp/Internal/ThinPlateSpline.h>
#include <GeoWarp/Internal/AffineEstimation.h>
#include <GeoWarp/Internal/Solver.h>
#include <GeoWarp/Core/Constants.h>
#include <GeoWarp/Core/Log.h>

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace Geo::Warp::Internal {

double ThinPlateKernel(double r) {
    if (r <= 0.0) {
        return 0.0;
    }
    return r * r * std::log(r);
}

std::optional<ThinPlateSplineModel> ThinPlateSplineModel::Fit(
    const std::vector<ReferencePoint>& points, double lambda) {
    const int n = static_cast<int>(points.size());
    if (n < MIN_REFERENCE_POINTS) {
        Log::Get()->debug("TPS: {} reference points, need at least {}", n, MIN_REFERENCE_POINTS);
        return std::nullopt;
    }

    lambda = std::max(0.0, lambda);

    std::vector<Point2d> sources;
    sources.reserve(points.size());
    for (const auto& p : points) {
        sources.push_back(p.Source());
    }

    // Collinear sources leave the polynomial block rank-deficient
    if (IsDegenerateConfiguration(sources)) {
        Log::Get()->debug("TPS: degenerate source configuration");
        return std::nullopt;
    }

    Point2d center;
    for (const auto& p : sources) {
        center = center + p;
    }
    center = center * (1.0 / n);
    Rect2d box = Rect2d::Bounding(sources);

    ThinPlateSplineModel model;
    model.points_ = points;
    model.lambda_ = lambda;
    model.center_ = center;
    model.scale_ = std::max(box.width, box.height);
    model.nodes_.reserve(sources.size());
    for (const auto& p : sources) {
        model.nodes_.push_back(model.Normalize(p));
    }
    const std::vector<Point2d>& nodes = model.nodes_;
    const double scaledLambda = lambda / (model.scale_ * model.scale_);

    const int size = n + 3;
    MatX L(size, size);
    VecX bx(size);
    VecX by(size);

    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            double u = ThinPlateKernel(nodes[i].DistanceTo(nodes[j]));
            L(i, j) = u;
            L(j, i) = u;
        }
        L(i, i) = scaledLambda;

        L(i, n) = 1.0;
        L(i, n + 1) = nodes[i].x;
        L(i, n + 2) = nodes[i].y;
        L(n, i) = 1.0;
        L(n + 1, i) = nodes[i].x;
        L(n + 2, i) = nodes[i].y;

        bx[i] = points[i].TargetX();
        by[i] = points[i].TargetY();
    }

    auto solution = TrySolveLU(L, std::vector<VecX>{bx, by});
    if (!solution) {
        Log::Get()->debug("TPS: kernel system for {} points is singular", n);
        return std::nullopt;
    }

    const VecX& sx = (*solution)[0];
    const VecX& sy = (*solution)[1];

    model.weightsX_ = sx.Segment(0, n);
    model.weightsY_ = sy.Segment(0, n);
    model.affineX_ = Vec3{sx[n], sx[n + 1], sx[n + 2]};
    model.affineY_ = Vec3{sy[n], sy[n + 1], sy[n + 2]};

    double sum = 0.0;
    double maxErr = 0.0;
    for (const auto& p : points) {
        double err = model.Transform(p.Source()).DistanceTo(p.Target());
        sum += err;
        maxErr = std::max(maxErr, err);
    }
    model.meanError_ = sum / n;
    model.maxError_ = maxErr;

    if (!std::isfinite(model.meanError_)) {
        Log::Get()->debug("TPS: non-finite residuals");
        return std::nullopt;
    }

    Log::Get()->debug("TPS: fitted {} points, mean error={:.4f}, max error={:.4f}",
                      n, model.meanError_, model.maxError_);
    return model;
}

std::optional<ThinPlateSplineModel> ThinPlateSplineModel::CreateFromDatabaseOrder(
    const std::vector<ReferencePointSet::DatabaseTuple>& rows, double lambda) {
    return Fit(ReferencePointSet::FromDatabaseOrder(rows).Points(), lambda);
}

Point2d ThinPlateSplineModel::Transform(double x, double y) const {
    Point2d q = Normalize({x, y});
    double tx = affineX_[0] + affineX_[1] * q.x + affineX_[2] * q.y;
    double ty = affineY_[0] + affineY_[1] * q.x + affineY_[2] * q.y;

    for (int i = 0; i < static_cast<int>(nodes_.size()); ++i) {
        double u = ThinPlateKernel(q.DistanceTo(nodes_[i]));
        tx += weightsX_[i] * u;
        ty += weightsY_[i] * u;
    }
    return {tx, ty};
}

// U(r / s) = U(r) / s^2 - ln(s) r^2 / s^2, and the side conditions reduce
// sum_i w_i |q' - p'_i|^2 to the constant sum_i w_i |p'_i|^2
VecX ThinPlateSplineModel::SourceWeights(const VecX& w) const {
    VecX result(w.Size());
    for (int i = 0; i < w.Size(); ++i) {
        result[i] = w[i] / (scale_ * scale_);
    }
    return result;
}

Vec3 ThinPlateSplineModel::SourceAffine(const Vec3& a, const VecX& w) const {
    double moment = 0.0;
    for (int i = 0; i < w.Size(); ++i) {
        moment += w[i] * (nodes_[i].x * nodes_[i].x + nodes_[i].y * nodes_[i].y);
    }
    double a1 = a[1] / scale_;
    double a2 = a[2] / scale_;
    double a0 = a[0] - a1 * center_.x - a2 * center_.y - std::log(scale_) * moment;
    return Vec3{a0, a1, a2};
}

std::vector<Point2d> ThinPlateSplineModel::TransformBatch(const std::vector<Point2d>& points) const {
    std::vector<Point2d> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.push_back(Transform(p));
    }
    return result;
}

std::string ThinPlateSplineModel::DebugString() const {
    Vec3 ax = AffineX();
    Vec3 ay = AffineY();
    char buf[512];
    std::snprintf(buf, sizeof(buf),
                  "TPS Transform:\n"
                  "  Reference Points: %d\n"
                  "  Lambda: %.2e\n"
                  "  Mean Error: %.4f\n"
                  "  Max Error: %.4f\n"
                  "  Affine X: [%.4f, %.4f, %.4f]\n"
                  "  Affine Y: [%.4f, %.4f, %.4f]",
                  ReferencePointCount(), lambda_, meanError_, maxError_,
                  ax[0], ax[1], ax[2], ay[0], ay[1], ay[2]);
    return buf;
}

} // namespace Geo::Warp::Internal
