/**
 * @file ReferencePoint.cpp
 * @brief Reference point set construction and lookup
 */

#include <GeoWarp/Core/ReferencePoint.h>
#include <GeoWarp/Core/Validate.h>

#include <utility>

namespace Geo::Warp {

// =============================================================================
// ReferencePoint
// =============================================================================

ReferencePoint::ReferencePoint(double sourceX, double sourceY, double targetX, double targetY)
    : ReferencePoint(Point2d(sourceX, sourceY), Point2d(targetX, targetY)) {}

ReferencePoint::ReferencePoint(const Point2d& source, const Point2d& target)
    : source_(source), target_(target) {
    Validate::RequirePointValid(source, "source", "ReferencePoint");
    Validate::RequirePointValid(target, "target", "ReferencePoint");
}

// =============================================================================
// ReferencePointSet
// =============================================================================

ReferencePointSet::ReferencePointSet(std::vector<ReferencePoint> points)
    : points_(std::move(points)) {}

ReferencePointSet ReferencePointSet::FromDatabaseOrder(const std::vector<DatabaseTuple>& rows) {
    ReferencePointSet set;
    set.points_.reserve(rows.size());
    for (const auto& [dbX, dbZ, svgX, svgY] : rows) {
        set.points_.emplace_back(svgX, svgY, dbX, dbZ);
    }
    return set;
}

void ReferencePointSet::Add(const ReferencePoint& point) {
    points_.push_back(point);
}

void ReferencePointSet::Add(double sourceX, double sourceY, double targetX, double targetY) {
    points_.emplace_back(sourceX, sourceY, targetX, targetY);
}

void ReferencePointSet::Clear() {
    points_.clear();
}

const ReferencePoint& ReferencePointSet::At(size_t index) const {
    Validate::RequireIndex(index, points_.size(), "ReferencePointSet::At");
    return points_[index];
}

std::vector<Point2d> ReferencePointSet::SourcePoints() const {
    std::vector<Point2d> result;
    result.reserve(points_.size());
    for (const auto& p : points_) {
        result.push_back(p.Source());
    }
    return result;
}

std::vector<Point2d> ReferencePointSet::TargetPoints() const {
    std::vector<Point2d> result;
    result.reserve(points_.size());
    for (const auto& p : points_) {
        result.push_back(p.Target());
    }
    return result;
}

std::optional<size_t> ReferencePointSet::FindBySource(double x, double y, double tolerance) const {
    Validate::RequireNonNegative(tolerance, "tolerance", "ReferencePointSet::FindBySource");
    Point2d query(x, y);
    for (size_t i = 0; i < points_.size(); ++i) {
        if (points_[i].Source().DistanceTo(query) <= tolerance) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace Geo::Warp
