#include "scene/Application.hpp"
#include "scene/Scene.hpp"
#include "engine/IFrameScheduler.hpp"
#include "engine/IPointerSource.hpp"
#include "engine/IViewport.hpp"
#include "engine/Log.hpp"
#include "rendering/IRenderer.hpp"

namespace ghostwatch {

Application::Application(Scene& scene, IRenderer& renderer, IViewport& viewport,
                         IPointerSource& pointer, IFrameScheduler& scheduler)
    : m_scene(scene)
    , m_renderer(renderer)
    , m_viewport(viewport)
    , m_pointer(pointer)
    , m_scheduler(scheduler) {}

void Application::queue(const SceneEvent& event) {
    m_pending.push_back(event);
}

void Application::pumpEvents() {
    if (m_viewport.pollSizeChanged()) {
        queue(Resized{m_viewport.getWidth(), m_viewport.getHeight()});
    }
    if (auto moved = m_pointer.pollPointerMoved()) {
        queue(PointerMoved{moved->x, moved->y});
    }

    for (const auto& event : m_pending) {
        if (const auto* resized = std::get_if<Resized>(&event)) {
            m_renderer.setScreenSize(resized->width, resized->height);
        }
        m_scene.apply(event);
    }
    m_pending.clear();
}

void Application::frame() {
    if (m_preFrame) {
        m_preFrame(m_frameCount);
    }

    pumpEvents();

    m_renderer.beginFrame();
    m_scene.tick(m_renderer);
    m_renderer.endFrame();

    m_frameCount++;
}

uint64_t Application::run() {
    LOG_INFO("Entering main loop");

    uint64_t start = m_frameCount;
    while (m_scheduler.nextFrame()) {
        frame();
    }

    LOG_INFO("Main loop exited after {} frames", m_frameCount - start);
    return m_frameCount - start;
}

} // namespace ghostwatch
