#pragma once

/**
 * @file Log.h
 * @brief Library logger ("geowarp") backed by spdlog
 *
 * Engine code logs diagnostics at debug level. Applications that want to
 * see them call Log::Init(spdlog::level::debug) once at startup, or route
 * the "geowarp" logger into their own sinks via Log::Attach().
 */

#include <GeoWarp/Core/Export.h>

#include <spdlog/spdlog.h>

#include <memory>

namespace Geo::Warp::Log {

/// Logger name registered with spdlog
constexpr const char* LOGGER_NAME = "geowarp";

/**
 * @brief Create (or reconfigure) the stderr logger
 * @param level Minimum level emitted
 */
GEOWARP_API void Init(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Use an application-provided logger instead of the default one
 * @param logger Logger to use; nullptr restores the default
 */
GEOWARP_API void Attach(std::shared_ptr<spdlog::logger> logger);

/// Change the minimum level of the current logger
GEOWARP_API void SetLevel(spdlog::level::level_enum level);

/// Current logger, created on first use (warn level, stderr)
GEOWARP_API std::shared_ptr<spdlog::logger> Get();

} // namespace Geo::Warp::Log
