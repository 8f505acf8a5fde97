#pragma once

#include <GeoWarp/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for GeoWarp
 *
 * Exceptions signal API misuse only. Numerical failures (too few points,
 * collinear geometry, singular systems) are reported as empty results.
 */

#include <stdexcept>
#include <string>

namespace Geo::Warp {

/**
 * @brief Base exception class for GeoWarp
 */
class GEOWARP_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class GEOWARP_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Out of range exception
 */
class GEOWARP_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

} // namespace Geo::Warp
