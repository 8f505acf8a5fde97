/**
 * @file Delaunay.cpp
 * @brief Bowyer-Watson triangulation with a super-triangle
 */

#include <GeoWarp/Internal/Delaunay.h>
#include <GeoWarp/Internal/AffineEstimation.h>
#include <GeoWarp/Core/Exception.h>
#include <GeoWarp/Core/Log.h>
#include <GeoWarp/Core/Validate.h>

#include <algorithm>
#include <map>
#include <string>
#include <utility>

namespace Geo::Warp::Internal {

namespace {

// Super-triangle vertices sit this many bounding-box extents away from the data
constexpr double SUPER_TRIANGLE_SCALE = 1000.0;

struct WorkTriangle {
    int v[3];
    Circle2d circle;
};

struct Edge {
    int a;
    int b;
};

WorkTriangle MakeWorkTriangle(int a, int b, int c, const std::vector<Point2d>& verts) {
    if (SignedTriangleArea(verts[a], verts[b], verts[c]) < 0.0) {
        std::swap(b, c);
    }
    WorkTriangle t;
    t.v[0] = a;
    t.v[1] = b;
    t.v[2] = c;
    t.circle = Circle2d::Circumscribed(verts[a], verts[b], verts[c]);
    return t;
}

std::pair<int, int> EdgeKey(int a, int b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

void RequireTriangleIndices(const Triangle& tri, size_t count, const char* funcName) {
    for (int k = 0; k < 3; ++k) {
        if (tri[k] < 0 || static_cast<size_t>(tri[k]) >= count) {
            throw OutOfRangeException(std::string(funcName) + ": vertex index out of range");
        }
    }
}

} // anonymous namespace

// =============================================================================
// Geometry Helpers
// =============================================================================

double TriangleArea(const Triangle& tri, const std::vector<Point2d>& vertices) {
    RequireTriangleIndices(tri, vertices.size(), "TriangleArea");
    return TriangleArea(vertices[tri.v0], vertices[tri.v1], vertices[tri.v2]);
}

Circle2d Circumcircle(const Triangle& tri, const std::vector<Point2d>& vertices) {
    RequireTriangleIndices(tri, vertices.size(), "Circumcircle");
    return Circle2d::Circumscribed(vertices[tri.v0], vertices[tri.v1], vertices[tri.v2]);
}

// =============================================================================
// Deduplication
// =============================================================================

std::vector<int> UniquePointIndices(const std::vector<Point2d>& points, double tolerance) {
    Validate::RequireNonNegative(tolerance, "tolerance", "UniquePointIndices");

    std::vector<int> kept;
    kept.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        bool duplicate = false;
        for (int k : kept) {
            if (points[i].DistanceTo(points[k]) <= tolerance) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            kept.push_back(static_cast<int>(i));
        }
    }
    return kept;
}

std::vector<ReferencePoint> DeduplicateReferencePoints(const std::vector<ReferencePoint>& points,
                                                       double tolerance) {
    std::vector<Point2d> sources;
    sources.reserve(points.size());
    for (const auto& p : points) {
        sources.push_back(p.Source());
    }

    std::vector<ReferencePoint> result;
    for (int idx : UniquePointIndices(sources, tolerance)) {
        result.push_back(points[idx]);
    }
    return result;
}

// =============================================================================
// Triangulation
// =============================================================================

std::vector<Triangle> Triangulate(const std::vector<Point2d>& points) {
    for (const auto& p : points) {
        Validate::RequirePointValid(p, "points", "Triangulate");
    }

    std::vector<int> kept = UniquePointIndices(points);
    if (kept.size() < 3) {
        return {};
    }

    // Working vertex list: distinct points first, then the super-triangle
    std::vector<Point2d> verts;
    verts.reserve(kept.size() + 3);
    for (int idx : kept) {
        verts.push_back(points[idx]);
    }

    if (IsDegenerateConfiguration(verts)) {
        Log::Get()->debug("Triangulate: {} distinct points are collinear", verts.size());
        return {};
    }

    const int n = static_cast<int>(verts.size());
    Rect2d box = Rect2d::Bounding(verts);
    double extent = std::max(box.width, box.height);
    Point2d mid = box.Center();
    double s = SUPER_TRIANGLE_SCALE * extent;

    verts.emplace_back(mid.x - 2.0 * s, mid.y - s);
    verts.emplace_back(mid.x + 2.0 * s, mid.y - s);
    verts.emplace_back(mid.x, mid.y + 2.0 * s);

    std::vector<WorkTriangle> work;
    work.push_back(MakeWorkTriangle(n, n + 1, n + 2, verts));

    for (int i = 0; i < n; ++i) {
        const Point2d& p = verts[i];

        // Cavity: triangles whose circumcircle strictly contains p
        std::vector<WorkTriangle> keep;
        std::vector<Edge> edges;
        std::map<std::pair<int, int>, int> edgeCount;
        keep.reserve(work.size());

        for (const auto& t : work) {
            if (t.circle.ContainsStrict(p)) {
                for (int e = 0; e < 3; ++e) {
                    int a = t.v[e];
                    int b = t.v[(e + 1) % 3];
                    edges.push_back({a, b});
                    ++edgeCount[EdgeKey(a, b)];
                }
            } else {
                keep.push_back(t);
            }
        }

        // Re-triangulate the cavity boundary to p
        for (const auto& e : edges) {
            if (edgeCount[EdgeKey(e.a, e.b)] != 1) {
                continue;
            }
            if (TriangleArea(verts[e.a], verts[e.b], p) <= 0.0) {
                continue;
            }
            keep.push_back(MakeWorkTriangle(e.a, e.b, i, verts));
        }

        work = std::move(keep);
    }

    // Drop everything touching the super-triangle and map back to input indices
    double areaFloor = EPSILON * extent * extent;
    std::vector<Triangle> result;
    for (const auto& t : work) {
        if (t.v[0] >= n || t.v[1] >= n || t.v[2] >= n) {
            continue;
        }
        if (SignedTriangleArea(verts[t.v[0]], verts[t.v[1]], verts[t.v[2]]) <= areaFloor) {
            continue;
        }
        result.emplace_back(kept[t.v[0]], kept[t.v[1]], kept[t.v[2]]);
    }

    Log::Get()->debug("Triangulate: {} points ({} distinct) -> {} triangles",
                      points.size(), n, result.size());
    return result;
}

std::vector<Triangle> Triangulate(const std::vector<ReferencePoint>& points) {
    std::vector<Point2d> sources;
    sources.reserve(points.size());
    for (const auto& p : points) {
        sources.push_back(p.Source());
    }
    return Triangulate(sources);
}

bool IsDelaunay(const std::vector<Triangle>& triangles,
                const std::vector<Point2d>& vertices,
                double relTolerance) {
    for (const auto& tri : triangles) {
        Circle2d circle = Circumcircle(tri, vertices);
        if (!std::isfinite(circle.radius)) {
            return false;
        }
        for (size_t i = 0; i < vertices.size(); ++i) {
            if (tri.HasVertex(static_cast<int>(i))) {
                continue;
            }
            if (circle.ContainsStrict(vertices[i], relTolerance)) {
                return false;
            }
        }
    }
    return true;
}

} // namespace Geo::Warp::Internal
