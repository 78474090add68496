#pragma once

#include "engine/Config.hpp"
#include "engine/Window.hpp"
#include "engine/Input.hpp"
#include "engine/Time.hpp"
#include "engine/Random.hpp"
#include "engine/FrameScheduler.hpp"
#include "rendering/IRenderer.hpp"
#include "scene/Scene.hpp"
#include "scene/Application.hpp"

#include <string>
#include <memory>
#include <atomic>

namespace ghostwatch {

/// Version string shown in the startup log.
inline constexpr const char* kVersion = "1.0.0";

/// Raylib host: loads configuration, opens the window and wires the
/// scene to the window, input and renderer.
class Engine {
public:
    bool init(const std::string& configPath = "config.json");
    void run();
    void shutdown();

    /// Stop after the current frame.
    void requestShutdown();

private:
    /// Host work done at the start of every frame, before scene events.
    void beginFrame(uint64_t frame);

    Config m_config;
    Window m_window;
    Input  m_input;
    Time   m_time;
    Random m_random;

    std::unique_ptr<IRenderer> m_renderer;
    std::unique_ptr<FrameScheduler> m_scheduler;
    std::unique_ptr<Scene> m_scene;
    std::unique_ptr<Application> m_application;

    bool m_initialized = false;

    static constexpr uint64_t STATS_INTERVAL_FRAMES = 300;

    // SIGINT / SIGTERM land here; the frame loop polls it
    static std::atomic<bool> s_signalReceived;
    static void signalHandler(int signum);
};

} // namespace ghostwatch
