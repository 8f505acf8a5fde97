/**
 * @file MarkerMatching.cpp
 * @brief Marker name matching and placement
 */

#include <GeoWarp/Matching/MarkerMatching.h>
#include <GeoWarp/Internal/AffineEstimation.h>
#include <GeoWarp/Core/Exception.h>
#include <GeoWarp/Core/Log.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace Geo::Warp {

namespace {

struct Candidate {
    size_t db;
    size_t api;
    double similarity;
    double distance = 0.0;
};

/// Distinct marker types in order of first appearance
std::vector<std::string> MarkerTypeOrder(const std::vector<DbMarker>& dbMarkers,
                                         const std::vector<size_t>& indices) {
    std::vector<std::string> types;
    for (size_t i : indices) {
        const std::string& t = dbMarkers[i].markerType;
        if (std::find(types.begin(), types.end(), t) == types.end()) {
            types.push_back(t);
        }
    }
    return types;
}

bool IsMatchable(const ApiMarker& marker) {
    return marker.position.has_value() && marker.markerType.has_value();
}

void RequireMatchIndices(const MatchResult& m, size_t dbCount, size_t apiCount,
                         const char* funcName) {
    if (m.dbIndex >= dbCount || m.apiIndex >= apiCount) {
        throw OutOfRangeException(std::string(funcName) + ": match index out of range");
    }
}

/// Stage 1: one clearly best API candidate per database marker
std::vector<MatchResult> FindUniqueMatches(const std::vector<DbMarker>& dbMarkers,
                                           const std::vector<ApiMarker>& apiMarkers,
                                           const MatchParams& params) {
    std::vector<MatchResult> results;
    std::set<size_t> usedApi;

    std::vector<size_t> allDb(dbMarkers.size());
    for (size_t i = 0; i < allDb.size(); ++i) allDb[i] = i;

    for (const auto& type : MarkerTypeOrder(dbMarkers, allDb)) {
        for (size_t db = 0; db < dbMarkers.size(); ++db) {
            if (dbMarkers[db].markerType != type) continue;

            std::vector<Candidate> similar;
            for (size_t api = 0; api < apiMarkers.size(); ++api) {
                const ApiMarker& a = apiMarkers[api];
                if (!IsMatchable(a) || *a.markerType != type || usedApi.count(api)) continue;

                double s = NameSimilarity(dbMarkers[db].name, a.name);
                if (s > params.uniqueThreshold) {
                    similar.push_back({db, api, s});
                }
            }

            std::stable_sort(similar.begin(), similar.end(),
                             [](const Candidate& l, const Candidate& r) {
                                 return l.similarity > r.similarity;
                             });

            bool accept = similar.size() == 1 ||
                          (similar.size() > 1 &&
                           similar[0].similarity > params.strongThreshold &&
                           similar[0].similarity - similar[1].similarity > params.strongMargin);
            if (!accept) continue;

            MatchResult m;
            m.dbIndex = db;
            m.apiIndex = similar[0].api;
            m.nameSimilarity = similar[0].similarity;
            results.push_back(m);
            usedApi.insert(similar[0].api);
        }
    }
    return results;
}

} // anonymous namespace

// =============================================================================
// Name Similarity
// =============================================================================

std::string NormalizeName(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char ch : name) {
        if (ch == ' ' || ch == '-' || ch == '_' || ch == '\'' || ch == '"') {
            continue;
        }
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return result;
}

int LevenshteinDistance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.size();
    const size_t n = s2.size();

    // Two-row dynamic programming table
    std::vector<int> prev(n + 1);
    std::vector<int> curr(n + 1);
    for (size_t j = 0; j <= n; ++j) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= m; ++i) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= n; ++j) {
            int cost = s1[i - 1] == s2[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[n];
}

double NameSimilarity(const std::string& name1, const std::string& name2) {
    if (name1.empty() || name2.empty()) {
        return 0.0;
    }

    std::string n1 = NormalizeName(name1);
    std::string n2 = NormalizeName(name2);

    if (n1 == n2) {
        return 1.0;
    }
    if (n1.find(n2) != std::string::npos || n2.find(n1) != std::string::npos) {
        return 0.8;
    }

    int distance = LevenshteinDistance(n1, n2);
    size_t maxLen = std::max(n1.size(), n2.size());
    return 1.0 - static_cast<double>(distance) / static_cast<double>(maxLen);
}

// =============================================================================
// Matching
// =============================================================================

std::vector<MatchResult> AutoMatch(const std::vector<DbMarker>& dbMarkers,
                                   const std::vector<ApiMarker>& apiMarkers,
                                   const MatchParams& params) {
    std::vector<MatchResult> results = FindUniqueMatches(dbMarkers, apiMarkers, params);

    std::set<size_t> usedDb;
    std::set<size_t> usedApi;
    for (const auto& m : results) {
        usedDb.insert(m.dbIndex);
        usedApi.insert(m.apiIndex);
    }

    // Provisional transform from the unique matches
    std::optional<AffineMatrix> provisional;
    if (static_cast<int>(results.size()) >= params.minReferenceCount) {
        std::vector<ReferencePoint> refs;
        for (const auto& m : results) {
            refs.emplace_back(*apiMarkers[m.apiIndex].position, dbMarkers[m.dbIndex].Position());
        }
        provisional = Internal::EstimateAffine(refs);
    }

    Log::Get()->debug("AutoMatch: {} unique matches, provisional transform {}",
                      results.size(), provisional ? "available" : "unavailable");

    std::vector<size_t> remainingDb;
    for (size_t i = 0; i < dbMarkers.size(); ++i) {
        if (!usedDb.count(i)) remainingDb.push_back(i);
    }

    for (const auto& type : MarkerTypeOrder(dbMarkers, remainingDb)) {
        std::vector<Candidate> pairs;
        for (size_t db : remainingDb) {
            if (dbMarkers[db].markerType != type) continue;
            for (size_t api = 0; api < apiMarkers.size(); ++api) {
                const ApiMarker& a = apiMarkers[api];
                if (!IsMatchable(a) || *a.markerType != type || usedApi.count(api)) continue;

                double s = NameSimilarity(dbMarkers[db].name, a.name);
                if (s > params.candidateThreshold) {
                    pairs.push_back({db, api, s});
                }
            }
        }

        if (pairs.empty()) continue;

        if (provisional) {
            for (auto& p : pairs) {
                p.distance = provisional->Transform(*apiMarkers[p.api].position)
                                 .DistanceTo(dbMarkers[p.db].Position());
            }
            std::stable_sort(pairs.begin(), pairs.end(),
                             [](const Candidate& l, const Candidate& r) {
                                 return l.distance < r.distance;
                             });
        } else {
            std::stable_sort(pairs.begin(), pairs.end(),
                             [](const Candidate& l, const Candidate& r) {
                                 return l.similarity > r.similarity;
                             });
        }

        for (const auto& p : pairs) {
            if (usedDb.count(p.db) || usedApi.count(p.api)) continue;

            MatchResult m;
            m.dbIndex = p.db;
            m.apiIndex = p.api;
            m.nameSimilarity = p.similarity;
            m.distanceError = p.distance;
            results.push_back(m);
            usedDb.insert(p.db);
            usedApi.insert(p.api);
        }
    }

    Log::Get()->debug("AutoMatch: {} matches from {} database and {} API markers",
                      results.size(), dbMarkers.size(), apiMarkers.size());
    return results;
}

ReferencePointSet ToReferencePoints(const std::vector<MatchResult>& matches,
                                    const std::vector<DbMarker>& dbMarkers,
                                    const std::vector<ApiMarker>& apiMarkers) {
    ReferencePointSet refs;
    for (const auto& m : matches) {
        RequireMatchIndices(m, dbMarkers.size(), apiMarkers.size(), "ToReferencePoints");
        const ApiMarker& api = apiMarkers[m.apiIndex];
        if (!m.isReferencePoint || !api.position) continue;
        refs.Add(ReferencePoint(*api.position, dbMarkers[m.dbIndex].Position()));
    }
    return refs;
}

std::vector<PlacedMarker> ApplyTransform(const CoordinateTransform& transform,
                                         const std::vector<ApiMarker>& apiMarkers,
                                         const std::vector<DbMarker>& dbMarkers,
                                         const std::vector<MatchResult>& matches,
                                         const std::vector<FloorConfig>& floors) {
    std::vector<const MatchResult*> matchByApi(apiMarkers.size(), nullptr);
    for (const auto& m : matches) {
        RequireMatchIndices(m, dbMarkers.size(), apiMarkers.size(), "ApplyTransform");
        if (!matchByApi[m.apiIndex]) {
            matchByApi[m.apiIndex] = &m;
        }
    }

    std::vector<PlacedMarker> placed;
    for (size_t i = 0; i < apiMarkers.size(); ++i) {
        const ApiMarker& api = apiMarkers[i];
        if (!api.position) continue;

        PlacedMarker p;
        p.apiIndex = i;
        if (const MatchResult* m = matchByApi[i]) {
            const DbMarker& db = dbMarkers[m->dbIndex];
            p.world = db.Position();
            p.floorId = db.floorId;
            p.matched = true;
        } else {
            p.world = transform.Transform(*api.position);
            p.floorId = MapLevelToFloorId(api.level, floors);
        }
        placed.push_back(std::move(p));
    }
    return placed;
}

std::optional<std::string> MapLevelToFloorId(std::optional<int> level,
                                             const std::vector<FloorConfig>& floors) {
    if (floors.empty()) {
        return std::nullopt;
    }

    if (!level) {
        for (const auto& f : floors) {
            if (f.isDefault) return f.layerId;
        }
        return std::string("main");
    }

    std::vector<FloorConfig> sorted = floors;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const FloorConfig& l, const FloorConfig& r) { return l.order < r.order; });

    int lv = *level;
    if (lv <= 0) {
        for (const auto& f : sorted) {
            if (f.order < 0) return f.layerId;
        }
        return sorted.front().layerId;
    }
    if (lv == 1) {
        for (const auto& f : sorted) {
            if (f.order == 0) return f.layerId;
        }
        return std::string("main");
    }
    for (const auto& f : sorted) {
        if (f.order == lv - 1) return f.layerId;
    }
    return sorted.back().layerId;
}

} // namespace Geo::Warp
