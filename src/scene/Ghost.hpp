#pragma once

#include "scene/Eye.hpp"
#include "scene/GhostTuning.hpp"

#include <array>
#include <cstdint>

namespace ghostwatch {

class Random;

/// One ghost: a bobbing body with two hands and two eyes that follow
/// the pointer.
///
/// The body and the eye anchors move by the same per-frame bounce delta;
/// the hands bounce on their own anchor, out of phase with the body.
/// Velocity is re-rolled now and then but is not integrated into the
/// position, so ghosts bob in place.
class Ghost {
public:
    /// Place a ghost at `spawn`. The eyes are derived from the same point.
    /// `rng` must outlive the ghost.
    Ghost(Vec2 spawn, const GhostTuning& tuning, Random& rng);

    /// Advance one frame towards `pointer`.
    void update(const Vec2& pointer);

    /// Body, left hand, right hand, then both irises.
    void render(IRenderer& renderer, const ScenePalette& palette) const;

    const Vec2& getPosition() const { return m_position; }
    const Vec2& getHandPosition() const { return m_handPosition; }
    const Vec2& getVelocity() const { return m_velocity; }
    double getBodyBounceAngle() const { return m_bodyBounceAngle; }
    float getFacingAngle() const { return m_facingAngle; }
    const std::array<Eye, 2>& getEyes() const { return m_eyes; }

    /// Number of velocity re-rolls since construction.
    uint64_t getVelocityRerolls() const { return m_velocityRerolls; }

private:
    void rerollVelocity();

    GhostTuning m_tuning;
    Random* m_rng;

    Vec2 m_position;
    Vec2 m_handPosition;
    Vec2 m_velocity;
    std::array<Eye, 2> m_eyes;

    double m_bodyBounceAngle = 0.0;  ///< Never wrapped; only read through sin()
    float m_facingAngle = 0.0f;
    uint64_t m_velocityRerolls = 0;
};

} // namespace ghostwatch
