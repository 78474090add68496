#include "engine/Window.hpp"
#include "engine/Log.hpp"

#include <raylib.h>

namespace ghostwatch {

Window::~Window() {
    shutdown();
}

bool Window::init(const WindowConfig& config) {
    unsigned int flags = FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT;
    if (config.vsync) {
        flags |= FLAG_VSYNC_HINT;
    }
    if (config.fullscreen) {
        flags |= FLAG_BORDERLESS_WINDOWED_MODE;
    }

    SetConfigFlags(flags);
    SetTraceLogLevel(LOG_WARNING);

    InitWindow(config.width, config.height, config.title.c_str());

    if (!IsWindowReady()) {
        return false;
    }

    m_fullscreen = config.fullscreen;
    m_lastWidth = GetScreenWidth();
    m_lastHeight = GetScreenHeight();
    m_initialized = true;
    return true;
}

void Window::shutdown() {
    if (m_initialized) {
        CloseWindow();
        m_initialized = false;
    }
}

bool Window::shouldClose() const {
    return WindowShouldClose();
}

int Window::getWidth() const {
    return GetScreenWidth();
}

int Window::getHeight() const {
    return GetScreenHeight();
}

bool Window::pollSizeChanged() {
    int w = getWidth();
    int h = getHeight();
    if (w != m_lastWidth || h != m_lastHeight) {
        LOG_DEBUG("Window resized: {}x{} -> {}x{}", m_lastWidth, m_lastHeight, w, h);
        m_lastWidth = w;
        m_lastHeight = h;
        return true;
    }
    return false;
}

void Window::toggleFullscreen() {
    ToggleBorderlessWindowed();
    m_fullscreen = !m_fullscreen;
}

int Window::getRefreshRate() const {
    return GetMonitorRefreshRate(GetCurrentMonitor());
}

} // namespace ghostwatch
