#include "engine/FrameScheduler.hpp"
#include "engine/Window.hpp"

#include <raylib.h>

namespace ghostwatch {

bool FrameScheduler::nextFrame() {
    if (stopRequested() || m_window.shouldClose()) {
        return false;
    }
    m_time.update(static_cast<double>(GetFrameTime()));
    return true;
}

} // namespace ghostwatch
