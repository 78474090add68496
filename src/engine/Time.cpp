#include "engine/Time.hpp"

#include <algorithm>
#include <raylib.h>

namespace ghostwatch {

void Time::update(double rawDeltaTime) {
    m_frameCount++;

    m_fpsAccumulator += std::max(rawDeltaTime, 0.0);
    m_fpsSamples++;
    if (m_fpsSamples >= 60) {
        m_fps = m_fpsAccumulator > 0.0
            ? static_cast<double>(m_fpsSamples) / m_fpsAccumulator
            : 0.0;
        m_fpsAccumulator = 0.0;
        m_fpsSamples = 0;
    }
}

void Time::setTargetFPS(int fps) {
    SetTargetFPS(std::max(fps, 0));
}

} // namespace ghostwatch
