#pragma once

#include "scene/Ghost.hpp"
#include "scene/GhostTuning.hpp"
#include "scene/SceneEvent.hpp"

#include <vector>

namespace ghostwatch {

class Random;

/// The set of ghosts filling the viewport, plus the pointer they watch.
///
/// The ghost count follows the viewport: round((width + height) / density).
/// Every resize throws the current ghosts away and spawns a fresh set at
/// random positions inside the new bounds.
class Scene {
public:
    /// Spawn the initial ghosts for a `width` x `height` viewport and aim
    /// every eye at its centre. `rng` must outlive the scene.
    Scene(int width, int height, const SceneSettings& settings, Random& rng);

    void resize(int width, int height);
    void setPointer(float x, float y);
    void apply(const SceneEvent& event);

    /// Advance every ghost one frame, in list order.
    void update();

    /// Clear the viewport, then draw every ghost in list order.
    void render(IRenderer& renderer) const;

    /// update() followed by render().
    void tick(IRenderer& renderer);

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }
    const Vec2& getPointer() const { return m_pointer; }
    const std::vector<Ghost>& getGhosts() const { return m_ghosts; }

    /// Upper bound on the ghosts in one scene, whatever the density.
    static constexpr int kMaxGhosts = 10000;

    /// Ghost count for a viewport; rounds halves up and stays within
    /// [0, kMaxGhosts].
    static int ghostCountFor(int width, int height, float density = 200.0f);

private:
    void spawnGhosts();

    SceneSettings m_settings;
    Random* m_rng;

    int m_width = 0;
    int m_height = 0;
    Vec2 m_pointer;
    std::vector<Ghost> m_ghosts;
};

} // namespace ghostwatch
