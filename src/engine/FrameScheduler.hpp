#pragma once

#include "engine/IFrameScheduler.hpp"
#include "engine/Time.hpp"

#include <atomic>

namespace ghostwatch {

class Window;

/// Raylib frame pacing. The wait for vsync or the target FPS happens in
/// EndDrawing(), so nextFrame() only samples the frame time and decides
/// whether the loop continues.
class FrameScheduler : public IFrameScheduler {
public:
    FrameScheduler(Window& window, Time& time) : m_window(window), m_time(time) {}

    bool nextFrame() override;
    void requestStop() override { m_stopRequested.store(true, std::memory_order_relaxed); }

    bool stopRequested() const { return m_stopRequested.load(std::memory_order_relaxed); }

private:
    Window& m_window;
    Time& m_time;
    std::atomic<bool> m_stopRequested{false};
};

} // namespace ghostwatch
