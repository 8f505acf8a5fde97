/**
 * @file map_transfer_demo.cpp
 * @brief Transfer markers from an external map image into world coordinates
 *
 * Demonstrates:
 * - AutoMatch between curated database markers and external API markers
 * - Building a CoordinateTransform from the matched reference points
 * - Placing unmatched API markers in world space with floor assignment
 *
 * The external map is synthetic: map pixels relate to world X/Z by a scale,
 * a rotation and a mild barrel distortion.
 *
 * Usage: map_transfer_demo [--debug] [--affine]
 */

#include <GeoWarp/GeoWarp.h>

#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace Geo::Warp;

namespace {

/// World X/Z of a map pixel
Point2d MapToWorld(const Point2d& px) {
    const double cx = 512.0;
    const double cy = 512.0;
    double dx = px.x - cx;
    double dy = px.y - cy;
    double k = 1.0 + 2e-7 * (dx * dx + dy * dy);
    double angle = 0.15;
    double rx = k * (dx * std::cos(angle) - dy * std::sin(angle));
    double ry = k * (dx * std::sin(angle) + dy * std::cos(angle));
    return {0.8 * rx + 35.0, -0.8 * ry - 120.0};
}

struct DemoMarker {
    const char* name;
    const char* type;
    double px;
    double py;
    int level;
};

const DemoMarker DEMO_MARKERS[] = {
    {"Old Gas Station", "Extraction", 120, 140, 1},
    {"Dorms V-Ex", "Extraction", 880, 160, 1},
    {"Crossroads", "Extraction", 150, 900, 1},
    {"Railway Exfil", "Extraction", 900, 880, 1},
    {"Big Red", "Extraction", 520, 470, 1},
    {"Weapon Box", "Container", 300, 300, 1},
    {"Weapon Box", "Container", 700, 320, 2},
    {"Weapon Box", "Container", 420, 760, 0},
    {"Medical Supply", "Container", 610, 610, 2},
};

} // namespace

int main(int argc, char* argv[]) {
    bool affineOnly = false;
    auto level = spdlog::level::info;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--debug") == 0) {
            level = spdlog::level::debug;
        } else if (std::strcmp(argv[i], "--affine") == 0) {
            affineOnly = true;
        } else {
            std::cerr << "Usage: " << argv[0] << " [--debug] [--affine]" << std::endl;
            return 1;
        }
    }
    Log::Init(level);

    std::cout << "=== Map Transfer Demo (GeoWarp " << GetVersion() << ") ===" << std::endl;

    // Database knows every marker in world space; the API lists the same
    // markers (plus one new one) in map pixels with slightly different names
    std::vector<DbMarker> dbMarkers;
    std::vector<ApiMarker> apiMarkers;
    int n = 0;
    for (const auto& d : DEMO_MARKERS) {
        Point2d world = MapToWorld({d.px, d.py});
        DbMarker db;
        db.id = "db-" + std::to_string(n);
        db.name = d.name;
        db.markerType = d.type;
        db.x = world.x;
        db.z = world.y;
        db.floorId = d.level == 2 ? "second" : (d.level == 0 ? "basement" : "ground");
        dbMarkers.push_back(db);

        ApiMarker api;
        api.uid = "api-" + std::to_string(n);
        api.name = std::string(d.name) + (n % 2 == 0 ? "" : " ");
        api.markerType = std::string(d.type);
        api.position = Point2d(d.px + 0.6, d.py - 0.4);
        api.level = d.level;
        apiMarkers.push_back(api);
        ++n;
    }

    ApiMarker fresh;
    fresh.uid = "api-new";
    fresh.name = "Hidden Stash";
    fresh.markerType = std::string("Stash");
    fresh.position = Point2d(460, 260);
    fresh.level = 2;
    apiMarkers.push_back(fresh);

    std::vector<MatchResult> matches = AutoMatch(dbMarkers, apiMarkers);
    std::cout << "Matched " << matches.size() << " of " << apiMarkers.size()
              << " API markers" << std::endl;

    // Extraction points become reference points
    for (auto& m : matches) {
        m.isReferencePoint = dbMarkers[m.dbIndex].markerType == "Extraction";
    }

    ReferencePointSet refs = ToReferencePoints(matches, dbMarkers, apiMarkers);
    TransformParams params = affineOnly ? TransformParams::AffineOnly() : TransformParams::Default();

    TransformError error = TransformError::None;
    auto transform = CoordinateTransform::Create(refs, params, &error);
    if (!transform) {
        std::cerr << TransformErrorMessage(error) << std::endl;
        return 1;
    }
    std::cout << transform->Describe() << std::endl;

    std::vector<FloorConfig> floors = {
        {"basement", "Basement", -1, false},
        {"ground", "Ground Floor", 0, true},
        {"second", "Second Floor", 1, false},
    };

    std::cout << std::fixed << std::setprecision(2);
    for (const auto& p : ApplyTransform(*transform, apiMarkers, dbMarkers, matches, floors)) {
        const ApiMarker& api = apiMarkers[p.apiIndex];
        Point2d truth = MapToWorld(*api.position);
        std::cout << "  " << std::left << std::setw(18) << api.name
                  << " (" << std::setw(8) << p.world.x << ", " << std::setw(8) << p.world.y << ")"
                  << " floor=" << p.floorId.value_or("-")
                  << (p.matched ? " [matched]" : "")
                  << " error=" << p.world.DistanceTo(truth) << std::endl;
    }

    return 0;
}
