#include "scene/Scene.hpp"
#include "engine/Log.hpp"
#include "engine/Random.hpp"

#include <algorithm>
#include <cmath>

namespace ghostwatch {

Scene::Scene(int width, int height, const SceneSettings& settings, Random& rng)
    : m_settings(settings)
    , m_rng(&rng)
    , m_width(width)
    , m_height(height)
    , m_pointer(static_cast<float>(width) / 2.0f, static_cast<float>(height) / 2.0f) {
    spawnGhosts();
}

int Scene::ghostCountFor(int width, int height, float density) {
    double count = std::floor((static_cast<double>(width) + height) / density + 0.5);
    if (!(count > 0.0)) {
        return 0;
    }
    return count < kMaxGhosts ? static_cast<int>(count) : kMaxGhosts;
}

void Scene::resize(int width, int height) {
    m_width = width;
    m_height = height;
    spawnGhosts();
}

void Scene::setPointer(float x, float y) {
    m_pointer = {x, y};
}

void Scene::apply(const SceneEvent& event) {
    if (const auto* moved = std::get_if<PointerMoved>(&event)) {
        setPointer(moved->x, moved->y);
    } else if (const auto* resized = std::get_if<Resized>(&event)) {
        resize(resized->width, resized->height);
    }
}

void Scene::spawnGhosts() {
    if (m_width < 0 || m_height < 0) {
        SCENE_LOG_WARN("Negative viewport {}x{}, spawning inside the non-negative part",
                       m_width, m_height);
    }

    int count = ghostCountFor(m_width, m_height, m_settings.ghostDensity);
    if (count == kMaxGhosts) {
        SCENE_LOG_WARN("Ghost count capped at {} (density {})", kMaxGhosts,
                       m_settings.ghostDensity);
    }
    int maxX = std::max(m_width, 0);
    int maxY = std::max(m_height, 0);

    m_ghosts.clear();
    m_ghosts.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        Vec2 spawn(static_cast<float>(m_rng->uniformInt(0, maxX)),
                   static_cast<float>(m_rng->uniformInt(0, maxY)));
        m_ghosts.emplace_back(spawn, m_settings.ghost, *m_rng);
    }

    SCENE_LOG_INFO("Spawned {} ghosts for a {}x{} viewport", count, m_width, m_height);
}

void Scene::update() {
    for (auto& ghost : m_ghosts) {
        ghost.update(m_pointer);
    }
}

void Scene::render(IRenderer& renderer) const {
    renderer.clear(m_width, m_height);
    for (const auto& ghost : m_ghosts) {
        ghost.render(renderer, m_settings.palette);
    }
}

void Scene::tick(IRenderer& renderer) {
    update();
    render(renderer);
}

} // namespace ghostwatch
