#include "rendering/RaylibRenderer.hpp"
#include "engine/Log.hpp"

#include <raylib.h>

namespace ghostwatch {

// Helper to convert our Color to Raylib Color
static ::Color toRaylibColor(const Color& c) {
    return {c.r, c.g, c.b, c.a};
}

// Helper to convert our Vec2 to Raylib Vector2
static Vector2 toRaylibVec2(const Vec2& v) {
    return {v.x, v.y};
}

RaylibRenderer::~RaylibRenderer() {
    if (m_initialized) {
        shutdown();
    }
}

bool RaylibRenderer::init(int screenWidth, int screenHeight) {
    if (!IsWindowReady()) {
        LOG_ERROR("RaylibRenderer: No window to render into");
        return false;
    }

    m_screenWidth = screenWidth;
    m_screenHeight = screenHeight;
    m_initialized = true;

    LOG_INFO("RaylibRenderer: Initialized ({}x{})", screenWidth, screenHeight);
    return true;
}

void RaylibRenderer::shutdown() {
    m_initialized = false;
    LOG_INFO("RaylibRenderer: Shut down");
}

void RaylibRenderer::beginFrame() {
    BeginDrawing();
}

void RaylibRenderer::endFrame() {
    EndDrawing();
}

void RaylibRenderer::clear(int width, int height) {
    // Raylib only clears the whole backbuffer, which always contains the area.
    (void)width;
    (void)height;
    ClearBackground(toRaylibColor(m_background));
}

void RaylibRenderer::drawCircle(Vec2 center, float radius, const Color& color) {
    DrawCircleV(toRaylibVec2(center), radius, toRaylibColor(color));
}

void RaylibRenderer::setScreenSize(int width, int height) {
    m_screenWidth = width;
    m_screenHeight = height;
}

} // namespace ghostwatch
