#include "engine/Engine.hpp"
#include "engine/Log.hpp"
#include "rendering/RaylibRenderer.hpp"
#include "scene/GhostTuning.hpp"

#include <csignal>

namespace ghostwatch {

std::atomic<bool> Engine::s_signalReceived{false};

void Engine::signalHandler(int signum) {
    // Signal-safe: only set an atomic flag. Logging and cleanup
    // happen in the frame loop when it checks this flag.
    (void)signum;
    s_signalReceived.store(true, std::memory_order_relaxed);
}

void Engine::requestShutdown() {
    if (m_scheduler) {
        m_scheduler->requestStop();
    }
}

bool Engine::init(const std::string& configPath) {
    if (!m_config.loadFromFile(configPath)) {
        Log::init("", "info");
        LOG_WARN("Could not load config from '{}', using defaults", configPath);
    } else {
        Log::init(
            m_config.getString("logging.file", ""),
            m_config.getString("logging.level", "info")
        );
        LOG_INFO("Configuration loaded from '{}'", configPath);
    }

    // config.local.json holds per-device overrides (display size, vsync)
    std::string localPath = Config::localOverlayPath(configPath);
    if (m_config.mergeFromFile(localPath)) {
        LOG_INFO("Per-device config merged from '{}'", localPath);
    }

    LOG_INFO("Ghostwatch v{} starting...", kVersion);

    WindowConfig winCfg;
    winCfg.width      = m_config.getInt("window.width", winCfg.width);
    winCfg.height     = m_config.getInt("window.height", winCfg.height);
    winCfg.title      = m_config.getString("window.title", winCfg.title);
    winCfg.fullscreen = m_config.getBool("window.fullscreen", winCfg.fullscreen);
    winCfg.vsync      = m_config.getBool("window.vsync", winCfg.vsync);

    if (!m_window.init(winCfg)) {
        LOG_CRITICAL("Failed to create window");
        return false;
    }

    int width = m_window.getWidth();
    int height = m_window.getHeight();
    LOG_INFO("Window created: {}x{} ({}, {} Hz monitor)",
             width, height,
             winCfg.fullscreen ? "fullscreen" : "windowed",
             m_window.getRefreshRate());

    m_time.setTargetFPS(m_config.getInt("window.target_fps", 60));

    SceneSettings settings = loadSceneSettings(m_config);

    m_renderer = std::make_unique<RaylibRenderer>(settings.palette.background);
    if (!m_renderer->init(width, height)) {
        LOG_CRITICAL("Failed to initialize renderer");
        return false;
    }

    if (settings.seed) {
        m_random.seed(*settings.seed);
        LOG_INFO("Scene RNG seeded with {}", *settings.seed);
    }

    m_scene = std::make_unique<Scene>(width, height, settings, m_random);
    m_scheduler = std::make_unique<FrameScheduler>(m_window, m_time);
    m_application = std::make_unique<Application>(
        *m_scene, *m_renderer, m_window, m_input, *m_scheduler);
    m_application->setPreFrameCallback([this](uint64_t frame) { beginFrame(frame); });

    std::signal(SIGTERM, signalHandler);
    std::signal(SIGINT, signalHandler);

    m_initialized = true;
    LOG_INFO("Engine initialized");
    return true;
}

void Engine::beginFrame(uint64_t frame) {
    if (s_signalReceived.load(std::memory_order_relaxed)) {
        LOG_INFO("Termination signal received, stopping after this frame");
        s_signalReceived.store(false, std::memory_order_relaxed);
        requestShutdown();
    }

    m_input.update();

    if (m_input.isKeyPressed(Key::F11)) {
        m_window.toggleFullscreen();
        LOG_INFO("Fullscreen {}", m_window.isFullscreen() ? "on" : "off");
    }

    if (frame > 0 && frame % STATS_INTERVAL_FRAMES == 0) {
        LOG_DEBUG("Frame {}: {:.1f} fps, {} ghosts", frame, m_time.fps(),
                  m_scene->getGhosts().size());
    }
}

void Engine::run() {
    if (!m_initialized) {
        LOG_ERROR("Engine::run called before a successful init");
        return;
    }
    m_application->run();
}

void Engine::shutdown() {
    LOG_INFO("Shutting down...");

    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGINT, SIG_DFL);

    m_application.reset();
    m_scheduler.reset();
    m_scene.reset();

    if (m_renderer) {
        m_renderer->shutdown();
        m_renderer.reset();
    }

    m_window.shutdown();
    m_initialized = false;
    Log::shutdown();
}

} // namespace ghostwatch
