#pragma once

#include "rendering/IRenderer.hpp"

#include <optional>
#include <cstdint>

namespace ghostwatch {

class Config;

/// Shape and motion constants shared by every ghost.
struct GhostTuning {
    float radius          = 50.0f;   ///< Body radius
    float eyeDistance     = 10.0f;   ///< Horizontal eye offset from the body centre
    float eyeRaise        = 10.0f;   ///< Eyes sit this far above the body centre
    float eyeMoveRadius   = 20.0f;   ///< Iris distance from the eye anchor
    float eyeSizeRadius   = 5.0f;    ///< Iris radius
    float handRadius      = 10.0f;
    float handInset       = 5.0f;    ///< Hands sit at radius - inset from the centre
    float handDrop        = 10.0f;   ///< Hands sit this far below the hand anchor
    float bounceDistance  = 0.5f;
    float bounceSpeed     = 0.05f;   ///< Phase advance per frame
    float handPhaseLag    = 10.0f;   ///< Hand bounce phase offset from the body
    float rerollChance    = 0.01f;   ///< Per-frame velocity re-roll probability
    float minSpeed        = 1.0f;
    float maxSpeed        = 3.0f;
    int   maxInitialPhase = 100;
};

struct ScenePalette {
    Color body       = Color::White();
    Color iris       = Color::Black();
    Color background = Color::Midnight();
};

/// Smallest accepted scene.ghost_density; denser settings are clamped up.
inline constexpr float kMinGhostDensity = 1.0f;

struct SceneSettings {
    GhostTuning  ghost;
    ScenePalette palette;
    float ghostDensity = 200.0f;          ///< Viewport (width + height) per ghost
    std::optional<uint32_t> seed;         ///< Unset = nondeterministic
};

/// Read the "scene", "ghost" and "eye" sections. Missing keys keep
/// the defaults above.
SceneSettings loadSceneSettings(const Config& config);

} // namespace ghostwatch
