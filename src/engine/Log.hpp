#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace ghostwatch {

class Log {
public:
    /// Create the ENGINE and SCENE loggers. Both share a colored console
    /// sink and, when `logFile` is non-empty, a truncating file sink.
    static void init(const std::string& logFile = "", const std::string& level = "info");
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& getEngineLogger();
    static std::shared_ptr<spdlog::logger>& getSceneLogger();

    /// Map a level name ("trace" .. "critical") to spdlog. Unknown names
    /// fall back to info.
    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_sceneLogger;
};

} // namespace ghostwatch

// Host logging macros
#define LOG_TRACE(...)    ::ghostwatch::Log::getEngineLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::ghostwatch::Log::getEngineLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::ghostwatch::Log::getEngineLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::ghostwatch::Log::getEngineLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::ghostwatch::Log::getEngineLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::ghostwatch::Log::getEngineLogger()->critical(__VA_ARGS__)

// Simulation logging macros
#define SCENE_LOG_TRACE(...)    ::ghostwatch::Log::getSceneLogger()->trace(__VA_ARGS__)
#define SCENE_LOG_DEBUG(...)    ::ghostwatch::Log::getSceneLogger()->debug(__VA_ARGS__)
#define SCENE_LOG_INFO(...)     ::ghostwatch::Log::getSceneLogger()->info(__VA_ARGS__)
#define SCENE_LOG_WARN(...)     ::ghostwatch::Log::getSceneLogger()->warn(__VA_ARGS__)
#define SCENE_LOG_ERROR(...)    ::ghostwatch::Log::getSceneLogger()->error(__VA_ARGS__)
#define SCENE_LOG_CRITICAL(...) ::ghostwatch::Log::getSceneLogger()->critical(__VA_ARGS__)
