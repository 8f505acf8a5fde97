#pragma once

/**
 * @file MarkerMatching.h
 * @brief Pairing external map markers with curated database markers
 *
 * Matches supply the reference points for CoordinateTransform: the external
 * marker's map position is the source, the database marker's world X/Z is
 * the target.
 *
 * Matching runs in two stages per marker type:
 * 1. Unique matches: a database marker whose name has exactly one similar
 *    external marker (or one clearly better than the rest)
 * 2. Remaining markers: greedy pairing by distance under a provisional
 *    affine transform built from the unique matches, or by name similarity
 *    when there are too few unique matches
 */

#include <GeoWarp/Core/Export.h>
#include <GeoWarp/Core/ReferencePoint.h>
#include <GeoWarp/Core/Types.h>
#include <GeoWarp/Transform/CoordinateTransform.h>

#include <optional>
#include <string>
#include <vector>

namespace Geo::Warp {

// =============================================================================
// Marker Types
// =============================================================================

/**
 * @brief Curated marker from the local database (target space)
 */
struct GEOWARP_API DbMarker {
    std::string id;
    std::string name;
    std::string markerType;
    double x = 0.0;             ///< World X
    double z = 0.0;             ///< World Z
    std::string floorId;

    Point2d Position() const { return {x, z}; }
};

/**
 * @brief Marker from the external map API (source space)
 */
struct GEOWARP_API ApiMarker {
    std::string uid;
    std::string name;
    std::optional<std::string> markerType;  ///< Unset if the category has no local equivalent
    std::optional<Point2d> position;        ///< Map pixel position, unset if missing
    std::optional<int> level;               ///< Floor level reported by the API
};

/**
 * @brief One database/API pairing, by index into the caller's marker lists
 */
struct GEOWARP_API MatchResult {
    size_t dbIndex = 0;
    size_t apiIndex = 0;
    double nameSimilarity = 0.0;    ///< NameSimilarity of the two names
    double distanceError = 0.0;     ///< World distance under the provisional transform
    bool isReferencePoint = false;  ///< Used as a reference point for the transform
    bool isManualMatch = false;
};

/**
 * @brief Floor layer of a map
 */
struct GEOWARP_API FloorConfig {
    std::string layerId;
    std::string displayName;
    int order = 0;                  ///< 0 = main floor, negative = below ground
    bool isDefault = false;
};

/**
 * @brief API marker placed in world space
 */
struct GEOWARP_API PlacedMarker {
    size_t apiIndex = 0;
    Point2d world;
    std::optional<std::string> floorId;
    bool matched = false;           ///< Snapped to its matched database marker
    double distanceError = 0.0;     ///< 0 for matched markers
};

/**
 * @brief Matching thresholds
 */
struct GEOWARP_API MatchParams {
    double uniqueThreshold = 0.5;       ///< Candidate similarity for stage 1
    double strongThreshold = 0.9;       ///< Best candidate similarity to win among several
    double strongMargin = 0.2;          ///< Required lead of the best over the second
    double candidateThreshold = 0.3;    ///< Candidate similarity for stage 2
    int minReferenceCount = 3;          ///< Unique matches needed for the provisional transform

    static MatchParams Default() { return MatchParams(); }
};

// =============================================================================
// Name Similarity
// =============================================================================

/// Lower-case and strip space, '-', '_', '\'' and '"'
GEOWARP_API std::string NormalizeName(const std::string& name);

/// Edit distance (insert, delete, substitute) over bytes
GEOWARP_API int LevenshteinDistance(const std::string& s1, const std::string& s2);

/**
 * @brief Similarity of two marker names in [0, 1]
 *
 * 0 if either is empty; 1 if equal after normalization; 0.8 if one contains
 * the other; otherwise 1 - distance / max length.
 */
GEOWARP_API double NameSimilarity(const std::string& name1, const std::string& name2);

// =============================================================================
// Matching
// =============================================================================

/**
 * @brief Pair database markers with API markers
 *
 * API markers without a position or marker type are never matched. Each
 * marker appears in at most one result. Results list the unique matches
 * first, then the remaining pairs grouped by marker type.
 */
GEOWARP_API std::vector<MatchResult> AutoMatch(const std::vector<DbMarker>& dbMarkers,
                                               const std::vector<ApiMarker>& apiMarkers,
                                               const MatchParams& params = MatchParams::Default());

/**
 * @brief Reference points from matches flagged isReferencePoint
 *
 * Source = API position, target = database (x, z). Matches whose API
 * marker has no position are skipped.
 * @throws OutOfRangeException if a match index is out of range
 */
GEOWARP_API ReferencePointSet ToReferencePoints(const std::vector<MatchResult>& matches,
                                                const std::vector<DbMarker>& dbMarkers,
                                                const std::vector<ApiMarker>& apiMarkers);

/**
 * @brief Place every positioned API marker in world space
 *
 * Matched markers take their database marker's position and floor exactly;
 * the rest go through the transform and get a floor from MapLevelToFloorId.
 * @throws OutOfRangeException if a match index is out of range
 */
GEOWARP_API std::vector<PlacedMarker> ApplyTransform(const CoordinateTransform& transform,
                                                     const std::vector<ApiMarker>& apiMarkers,
                                                     const std::vector<DbMarker>& dbMarkers,
                                                     const std::vector<MatchResult>& matches,
                                                     const std::vector<FloorConfig>& floors);

/**
 * @brief Floor layer for an API level
 *
 * - no floors: none
 * - no level: default floor, else "main"
 * - level <= 0: first floor with order < 0, else the lowest floor
 * - level 1: floor with order 0, else "main"
 * - level n: floor with order n - 1, else the highest floor
 */
GEOWARP_API std::optional<std::string> MapLevelToFloorId(std::optional<int> level,
                                                         const std::vector<FloorConfig>& floors);

} // namespace Geo::Warp
