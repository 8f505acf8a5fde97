/**
 * @file Log.cpp
 * @brief Library logger setup
 */

#include <GeoWarp/Core/Log.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>

namespace Geo::Warp::Log {

namespace {

constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e][%n][%l] %v";

std::mutex& LoggerMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& CurrentLogger() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

std::shared_ptr<spdlog::logger> MakeDefaultLogger(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(level);
    return logger;
}

} // anonymous namespace

void Init(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(LoggerMutex());
    CurrentLogger() = MakeDefaultLogger(level);
    CurrentLogger()->debug("Logging started");
}

void Attach(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(LoggerMutex());
    CurrentLogger() = logger ? std::move(logger) : MakeDefaultLogger(spdlog::level::warn);
}

void SetLevel(spdlog::level::level_enum level) {
    Get()->set_level(level);
}

std::shared_ptr<spdlog::logger> Get() {
    std::lock_guard<std::mutex> lock(LoggerMutex());
    if (!CurrentLogger()) {
        CurrentLogger() = MakeDefaultLogger(spdlog::level::warn);
    }
    return CurrentLogger();
}

} // namespace Geo::Warp::Log
