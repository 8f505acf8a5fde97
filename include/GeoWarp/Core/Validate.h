#pragma once

/**
 * @file Validate.h
 * @brief Argument validation helpers for GeoWarp
 *
 * Invalid arguments throw InvalidArgumentException with a message of the
 * form "FuncName: param must be ..., got value".
 */

#include <GeoWarp/Core/Exception.h>
#include <GeoWarp/Core/Types.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace Geo::Warp::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Scalar Validation
// =============================================================================

/**
 * @brief Validate value is finite (not NaN, not Inf)
 */
inline void RequireFinite(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is positive (> 0)
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (value <= T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (value < T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

// =============================================================================
// Geometry Validation
// =============================================================================

/**
 * @brief Validate point has finite coordinates
 */
inline void RequirePointValid(const Point2d& point, const char* paramName, const char* funcName) {
    if (!point.IsValid()) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " is invalid (" +
            Detail::FormatValue(point.x) + ", " + Detail::FormatValue(point.y) + ")");
    }
}

/**
 * @brief Validate index lies in [0, size)
 */
inline void RequireIndex(size_t index, size_t size, const char* funcName) {
    if (index >= size) {
        throw OutOfRangeException(
            std::string(funcName) + ": index " + Detail::FormatValue(index) +
            " >= size " + Detail::FormatValue(size));
    }
}

} // namespace Geo::Warp::Validate
