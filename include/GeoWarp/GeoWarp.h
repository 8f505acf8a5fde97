#pragma once

/**
 * @file GeoWarp.h
 * @brief Main header file for GeoWarp library
 *
 * GeoWarp maps marker coordinates between two 2D spaces from a set of
 * matched reference points, using a thin-plate spline with an
 * affine/triangulation fallback, and pairs external markers with curated
 * ones to produce those reference points.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <GeoWarp/GeoWarpConfig.h>
#include <GeoWarp/Core/Export.h>

// Core types and utilities
#include <GeoWarp/Core/Types.h>
#include <GeoWarp/Core/Constants.h>
#include <GeoWarp/Core/Exception.h>
#include <GeoWarp/Core/Log.h>

// Core data structures
#include <GeoWarp/Core/AffineMatrix.h>
#include <GeoWarp/Core/ReferencePoint.h>

// Feature modules
#include <GeoWarp/Transform/TransformParams.h>
#include <GeoWarp/Transform/CoordinateTransform.h>
#include <GeoWarp/Matching/MarkerMatching.h>

namespace Geo::Warp {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return GEOWARP_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = GEOWARP_VERSION_MAJOR;
    minor = GEOWARP_VERSION_MINOR;
    patch = GEOWARP_VERSION_PATCH;
}

} // namespace Geo::Warp
