#include "engine/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <vector>

namespace ghostwatch {

std::shared_ptr<spdlog::logger> Log::s_engineLogger;
std::shared_ptr<spdlog::logger> Log::s_sceneLogger;

namespace {

// Loggers used before init() (e.g. from unit tests) discard everything.
std::shared_ptr<spdlog::logger> makeSilentLogger(const std::string& name) {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Replace any loggers left over from a previous init
    spdlog::drop("ENGINE");
    spdlog::drop("SCENE");

    s_engineLogger = std::make_shared<spdlog::logger>("ENGINE", sinks.begin(), sinks.end());
    s_sceneLogger = std::make_shared<spdlog::logger>("SCENE", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_engineLogger->set_level(spdLevel);
    s_sceneLogger->set_level(spdLevel);

    spdlog::register_logger(s_engineLogger);
    spdlog::register_logger(s_sceneLogger);
}

void Log::shutdown() {
    if (s_engineLogger) s_engineLogger->flush();
    if (s_sceneLogger) s_sceneLogger->flush();
    spdlog::shutdown();
    s_engineLogger.reset();
    s_sceneLogger.reset();
}

spdlog::level::level_enum Log::parseLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger>& Log::getEngineLogger() {
    if (!s_engineLogger) s_engineLogger = makeSilentLogger("ENGINE");
    return s_engineLogger;
}

std::shared_ptr<spdlog::logger>& Log::getSceneLogger() {
    if (!s_sceneLogger) s_sceneLogger = makeSilentLogger("SCENE");
    return s_sceneLogger;
}

} // namespace ghostwatch
