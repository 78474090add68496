#pragma once

#include "scene/SceneEvent.hpp"

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace ghostwatch {

class Scene;
class IRenderer;
class IViewport;
class IPointerSource;
class IFrameScheduler;

/// Drives a Scene from host notifications, one tick per display frame.
///
/// Each frame the pending resize and pointer notifications are turned into
/// SceneEvents and applied before the scene updates, so a resize always
/// replaces the ghosts before the tick that follows it. No delta time is
/// involved: every tick advances the motion by one fixed step.
class Application {
public:
    using FrameCallback = std::function<void(uint64_t frame)>;

    Application(Scene& scene, IRenderer& renderer, IViewport& viewport,
                IPointerSource& pointer, IFrameScheduler& scheduler);

    /// Queue an event for the next frame (after those already queued).
    void queue(const SceneEvent& event);

    /// Poll the viewport and pointer source, then apply everything queued.
    void pumpEvents();

    /// One frame: pump events, then update and render the scene.
    void frame();

    /// Run frames until the scheduler stops granting them.
    /// Returns the number of frames run.
    uint64_t run();

    /// Called at the start of every frame, before events are pumped.
    void setPreFrameCallback(FrameCallback callback) { m_preFrame = std::move(callback); }

    uint64_t getFrameCount() const { return m_frameCount; }
    size_t getPendingEventCount() const { return m_pending.size(); }

private:
    Scene& m_scene;
    IRenderer& m_renderer;
    IViewport& m_viewport;
    IPointerSource& m_pointer;
    IFrameScheduler& m_scheduler;

    std::vector<SceneEvent> m_pending;
    FrameCallback m_preFrame;
    uint64_t m_frameCount = 0;
};

} // namespace ghostwatch
