#include "scene/GhostTuning.hpp"
#include "engine/Config.hpp"
#include "engine/Log.hpp"

namespace ghostwatch {

SceneSettings loadSceneSettings(const Config& config) {
    SceneSettings s;

    GhostTuning& g = s.ghost;
    g.radius         = config.getFloat("ghost.radius", g.radius);
    g.eyeDistance    = config.getFloat("ghost.eye_distance", g.eyeDistance);
    g.bounceDistance = config.getFloat("ghost.bounce_distance", g.bounceDistance);
    g.bounceSpeed    = config.getFloat("ghost.bounce_speed", g.bounceSpeed);
    g.rerollChance   = config.getFloat("ghost.reroll_chance", g.rerollChance);
    g.eyeMoveRadius  = config.getFloat("eye.move_radius", g.eyeMoveRadius);
    g.eyeSizeRadius  = config.getFloat("eye.size_radius", g.eyeSizeRadius);

    s.palette.body       = config.getColor("ghost.color", s.palette.body);
    s.palette.iris       = config.getColor("eye.color", s.palette.iris);
    s.palette.background = config.getColor("scene.background", s.palette.background);

    float density = config.getFloat("scene.ghost_density", s.ghostDensity);
    if (density >= kMinGhostDensity) {
        s.ghostDensity = density;
    } else if (density > 0.0f) {
        LOG_WARN("Config: scene.ghost_density {} is below {}, clamping", density, kMinGhostDensity);
        s.ghostDensity = kMinGhostDensity;
    } else {
        LOG_WARN("Config: scene.ghost_density must be positive (got {}), keeping {}",
                 density, s.ghostDensity);
    }

    if (config.hasKey("scene.seed")) {
        int64_t seed = config.getInt64("scene.seed", -1);
        if (seed >= 0 && seed <= static_cast<int64_t>(UINT32_MAX)) {
            s.seed = static_cast<uint32_t>(seed);
        } else {
            LOG_WARN("Config: scene.seed must be an integer in [0, {}], ignoring", UINT32_MAX);
        }
    }

    return s;
}

} // namespace ghostwatch
