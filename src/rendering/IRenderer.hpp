#pragma once

#include "engine/Vec2.hpp"

#include <cstdint>

namespace ghostwatch {

// Math constants
constexpr float PI = 3.14159265358979323846f;
constexpr float TWO_PI = 2.0f * PI;

/// Color representation with RGBA components
struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
        : r(r), g(g), b(b), a(a) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    static constexpr Color White()    { return {255, 255, 255, 255}; }
    static constexpr Color Black()    { return {0, 0, 0, 255}; }
    static constexpr Color Midnight() { return {17, 17, 17, 255}; }
};

/// Drawing surface the scene renders into.
/// The scene only ever clears and fills circles; everything else
/// (window, swap chain, pixel formats) stays behind this interface.
class IRenderer {
public:
    virtual ~IRenderer() = default;

    /// Initialize the renderer (called after window creation)
    virtual bool init(int screenWidth, int screenHeight) = 0;

    /// Shutdown and release resources
    virtual void shutdown() = 0;

    /// Begin a new frame
    virtual void beginFrame() = 0;

    /// End the current frame and present
    virtual void endFrame() = 0;

    /// Clear the area (0, 0, width, height) to the background color
    virtual void clear(int width, int height) = 0;

    /// Draw a filled circle
    virtual void drawCircle(Vec2 center, float radius, const Color& color) = 0;

    virtual int getScreenWidth() const = 0;
    virtual int getScreenHeight() const = 0;

    /// Update screen dimensions (e.g., after window resize)
    virtual void setScreenSize(int width, int height) = 0;
};

} // namespace ghostwatch
