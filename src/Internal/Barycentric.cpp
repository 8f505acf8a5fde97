/**
 * @file Barycentric.cpp
 * @brief Barycentric interpolation over a triangulation
 */

#include <GeoWarp/Internal/Barycentric.h>
#include <GeoWarp/Core/Constants.h>
#include <GeoWarp/Core/Exception.h>
#include <GeoWarp/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Geo::Warp::Internal {

namespace {

void RequireValidTriangles(const std::vector<Triangle>& triangles, size_t vertexCount,
                           const char* funcName) {
    for (const auto& t : triangles) {
        for (int k = 0; k < 3; ++k) {
            if (t[k] < 0 || static_cast<size_t>(t[k]) >= vertexCount) {
                throw OutOfRangeException(std::string(funcName) +
                                          ": triangle vertex index out of range");
            }
        }
    }
}

Point2d Centroid(const Triangle& t, const std::vector<Point2d>& v) {
    return (v[t.v0] + v[t.v1] + v[t.v2]) * (1.0 / 3.0);
}

} // anonymous namespace

std::optional<Vec3> ComputeBarycentric(const Point2d& p, const Point2d& a,
                                       const Point2d& b, const Point2d& c) {
    Point2d ab = b - a;
    Point2d ac = c - a;
    double den = ab.Cross(ac);

    double scale = std::max({ab.NormSquared(), ac.NormSquared(), (c - b).NormSquared()});
    if (!(std::abs(den) > EPSILON * scale)) {
        return std::nullopt;
    }

    Point2d ap = p - a;
    double w1 = ap.Cross(ac) / den;
    double w2 = ab.Cross(ap) / den;
    return Vec3{1.0 - w1 - w2, w1, w2};
}

int LocateTriangle(const Point2d& p, const std::vector<Triangle>& triangles,
                   const std::vector<Point2d>& vertices) {
    RequireValidTriangles(triangles, vertices.size(), "LocateTriangle");

    for (size_t i = 0; i < triangles.size(); ++i) {
        const Triangle& t = triangles[i];
        auto w = ComputeBarycentric(p, vertices[t.v0], vertices[t.v1], vertices[t.v2]);
        if (w && w->Min() >= -BARYCENTRIC_TOLERANCE) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int NearestTriangleByCentroid(const Point2d& p, const std::vector<Triangle>& triangles,
                              const std::vector<Point2d>& vertices) {
    RequireValidTriangles(triangles, vertices.size(), "NearestTriangleByCentroid");

    int best = -1;
    double bestDist = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < triangles.size(); ++i) {
        double d = (Centroid(triangles[i], vertices) - p).NormSquared();
        if (d < bestDist) {
            bestDist = d;
            best = static_cast<int>(i);
        }
    }
    return best;
}

InterpolationResult InterpolateDetailed(const Point2d& query,
                                        const std::vector<Triangle>& triangles,
                                        const std::vector<Point2d>& sources,
                                        const std::vector<Point2d>& targets) {
    if (sources.size() != targets.size()) {
        throw InvalidArgumentException("InterpolateDetailed: sources and targets differ in size");
    }
    Validate::RequirePointValid(query, "query", "InterpolateDetailed");

    InterpolationResult result;
    if (triangles.empty()) {
        return result;
    }

    int idx = LocateTriangle(query, triangles, sources);
    result.inside = idx >= 0;
    if (idx < 0) {
        idx = NearestTriangleByCentroid(query, triangles, sources);
    }

    const Triangle& t = triangles[idx];
    auto w = ComputeBarycentric(query, sources[t.v0], sources[t.v1], sources[t.v2]);
    if (!w) {
        return result;
    }

    const Vec3& wt = *w;
    result.point = targets[t.v0] * wt[0] + targets[t.v1] * wt[1] + targets[t.v2] * wt[2];
    result.triangleIndex = idx;
    result.weights = wt;
    result.valid = true;
    return result;
}

std::optional<Point2d> Interpolate(double queryX, double queryY,
                                   const std::vector<Triangle>& triangles,
                                   const std::vector<ReferencePoint>& points) {
    std::vector<Point2d> sources;
    std::vector<Point2d> targets;
    sources.reserve(points.size());
    targets.reserve(points.size());
    for (const auto& p : points) {
        sources.push_back(p.Source());
        targets.push_back(p.Target());
    }

    InterpolationResult r = InterpolateDetailed({queryX, queryY}, triangles, sources, targets);
    if (!r.valid) {
        return std::nullopt;
    }
    return r.point;
}

} // namespace Geo::Warp::Internal
