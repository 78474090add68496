#pragma once

#include "rendering/IRenderer.hpp"

namespace ghostwatch {

/// Raylib implementation of the IRenderer interface
class RaylibRenderer : public IRenderer {
public:
    explicit RaylibRenderer(Color background = Color::Midnight())
        : m_background(background) {}
    ~RaylibRenderer() override;

    // IRenderer interface implementation
    bool init(int screenWidth, int screenHeight) override;
    void shutdown() override;

    void beginFrame() override;
    void endFrame() override;

    void clear(int width, int height) override;
    void drawCircle(Vec2 center, float radius, const Color& color) override;

    int getScreenWidth() const override { return m_screenWidth; }
    int getScreenHeight() const override { return m_screenHeight; }
    void setScreenSize(int width, int height) override;

private:
    int m_screenWidth = 0;
    int m_screenHeight = 0;
    bool m_initialized = false;
    Color m_background;
};

} // namespace ghostwatch
