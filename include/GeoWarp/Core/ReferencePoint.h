#pragma once

/**
 * @file ReferencePoint.h
 * @brief Matched (source, target) coordinate pairs
 *
 * A ReferencePoint pairs a marker position in source space (SVG pixels of
 * the external map) with the position of the same marker in target space
 * (game world X/Z from the local database).
 */

#include <GeoWarp/Core/Types.h>
#include <GeoWarp/Core/Export.h>

#include <cstddef>
#include <optional>
#include <tuple>
#include <vector>

namespace Geo::Warp {

// =============================================================================
// ReferencePoint
// =============================================================================

/**
 * @brief Immutable source -> target correspondence
 */
class GEOWARP_API ReferencePoint {
public:
    /**
     * @throws InvalidArgumentException if any coordinate is not finite
     */
    ReferencePoint(double sourceX, double sourceY, double targetX, double targetY);

    /**
     * @throws InvalidArgumentException if either point is not finite
     */
    ReferencePoint(const Point2d& source, const Point2d& target);

    double SourceX() const { return source_.x; }
    double SourceY() const { return source_.y; }
    double TargetX() const { return target_.x; }
    double TargetY() const { return target_.y; }

    const Point2d& Source() const { return source_; }
    const Point2d& Target() const { return target_; }

    bool operator==(const ReferencePoint& other) const {
        return source_ == other.source_ && target_ == other.target_;
    }

private:
    Point2d source_;
    Point2d target_;
};

// =============================================================================
// ReferencePointSet
// =============================================================================

/**
 * @brief Ordered list of reference points owned by the calling workflow
 *
 * Transforms built from a set are snapshots: changing the set requires
 * building a new transform.
 */
class GEOWARP_API ReferencePointSet {
public:
    /// Database rows store the target first: (dbX, dbZ, svgX, svgY)
    using DatabaseTuple = std::tuple<double, double, double, double>;

    ReferencePointSet() = default;
    explicit ReferencePointSet(std::vector<ReferencePoint> points);

    /**
     * @brief Build from (dbX, dbZ, svgX, svgY) rows
     * @throws InvalidArgumentException if any coordinate is not finite
     */
    static ReferencePointSet FromDatabaseOrder(const std::vector<DatabaseTuple>& rows);

    void Add(const ReferencePoint& point);
    void Add(double sourceX, double sourceY, double targetX, double targetY);
    void Clear();

    size_t Size() const { return points_.size(); }
    bool Empty() const { return points_.empty(); }

    /// Indexed access
    /// @throws OutOfRangeException if index >= Size()
    const ReferencePoint& At(size_t index) const;
    const ReferencePoint& operator[](size_t index) const { return points_[index]; }

    std::vector<ReferencePoint>::const_iterator begin() const { return points_.begin(); }
    std::vector<ReferencePoint>::const_iterator end() const { return points_.end(); }

    const std::vector<ReferencePoint>& Points() const { return points_; }

    std::vector<Point2d> SourcePoints() const;
    std::vector<Point2d> TargetPoints() const;

    /**
     * @brief First reference whose source equals (x, y) within tolerance
     * @return Index into the set, or nullopt
     */
    std::optional<size_t> FindBySource(double x, double y, double tolerance) const;

private:
    std::vector<ReferencePoint> points_;
};

} // namespace Geo::Warp
