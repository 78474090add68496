#pragma once

#include "engine/IViewport.hpp"

#include <string>

namespace ghostwatch {

struct WindowConfig {
    int         width      = 1280;
    int         height     = 720;
    std::string title      = "Ghostwatch";
    bool        fullscreen = false;
    bool        vsync      = true;
};

/// Raylib window. Resizable; its client area is the scene viewport.
class Window : public IViewport {
public:
    ~Window() override;

    bool init(const WindowConfig& config);
    void shutdown();

    bool shouldClose() const;

    int  getWidth() const override;
    int  getHeight() const override;
    bool pollSizeChanged() override;

    void toggleFullscreen();
    bool isFullscreen() const { return m_fullscreen; }

    /// Get the monitor refresh rate in Hz
    int getRefreshRate() const;

private:
    bool m_initialized = false;
    bool m_fullscreen = false;
    int  m_lastWidth = 0;
    int  m_lastHeight = 0;
};

} // namespace ghostwatch
