#pragma once

#include <cstdint>

namespace ghostwatch {

/// Frame statistics for diagnostics. Motion in the scene is per frame,
/// so nothing in the simulation reads these values.
class Time {
public:
    /// Call once per frame with the raw frame time in seconds.
    void update(double rawDeltaTime);

    /// Number of frames since Time was created.
    uint64_t frameCount() const { return m_frameCount; }

    /// Approximate frames per second, averaged over 60 frames.
    double fps() const { return m_fps; }

    /// Set a target frame rate (0 = uncapped / vsync only).
    /// Note: calls Raylib's SetTargetFPS(), which requires an initialized
    /// Raylib window.  Do not call from unit tests without a window context.
    void setTargetFPS(int fps);

private:
    uint64_t m_frameCount = 0;
    double   m_fps        = 0.0;

    double m_fpsAccumulator = 0.0;
    int    m_fpsSamples     = 0;
};

} // namespace ghostwatch
