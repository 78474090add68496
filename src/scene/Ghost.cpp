#include "scene/Ghost.hpp"
#include "engine/Random.hpp"

#include <cmath>

namespace ghostwatch {

Ghost::Ghost(Vec2 spawn, const GhostTuning& tuning, Random& rng)
    : m_tuning(tuning)
    , m_rng(&rng)
    , m_position(spawn)
    , m_handPosition(spawn)
    , m_eyes{{
          Eye(spawn.x - tuning.eyeDistance, spawn.y - tuning.eyeRaise,
              tuning.eyeMoveRadius, tuning.eyeSizeRadius),
          Eye(spawn.x + tuning.eyeDistance, spawn.y - tuning.eyeRaise,
              tuning.eyeMoveRadius, tuning.eyeSizeRadius),
      }} {
    m_bodyBounceAngle = m_rng->uniformInt(0, m_tuning.maxInitialPhase);

    // setLength on a zero vector points it along +x; setAngle then turns it.
    m_velocity.setLength(m_rng->uniform(m_tuning.minSpeed, m_tuning.maxSpeed));
    m_velocity.setAngle(m_rng->uniform(0.0f, TWO_PI));
}

void Ghost::rerollVelocity() {
    m_velocity.setLength(m_rng->uniform(m_tuning.minSpeed, m_tuning.maxSpeed));
    m_velocity.setAngle(m_rng->uniform(0.0f, TWO_PI));
    m_velocityRerolls++;
}

void Ghost::update(const Vec2& pointer) {
    if (m_rng->chance(m_tuning.rerollChance)) {
        rerollVelocity();
    }

    // TODO: integrate m_velocity into m_position once drifting ghosts are
    // wanted; for now they only bob in place.

    float bodySin = static_cast<float>(std::sin(m_bodyBounceAngle));
    float handSin = static_cast<float>(std::sin(m_bodyBounceAngle + m_tuning.handPhaseLag));
    Vec2 bodyBounce(0.0f, bodySin * m_tuning.bounceDistance);
    Vec2 handBounce(0.0f, handSin * m_tuning.bounceDistance / 2.0f);
    m_position += bodyBounce;
    m_handPosition -= handBounce;

    // One angle for both eyes, measured from the body after the bounce
    m_facingAngle = (pointer - m_position).angle();

    for (auto& eye : m_eyes) {
        eye.update(bodyBounce, m_facingAngle);
    }

    m_bodyBounceAngle += m_tuning.bounceSpeed;
}

void Ghost::render(IRenderer& renderer, const ScenePalette& palette) const {
    renderer.drawCircle(m_position, m_tuning.radius, palette.body);

    float handReach = m_tuning.radius - m_tuning.handInset;
    renderer.drawCircle({m_handPosition.x - handReach, m_handPosition.y + m_tuning.handDrop},
                        m_tuning.handRadius, palette.body);
    renderer.drawCircle({m_handPosition.x + handReach, m_handPosition.y + m_tuning.handDrop},
                        m_tuning.handRadius, palette.body);

    for (const auto& eye : m_eyes) {
        eye.render(renderer, palette.iris);
    }
}

} // namespace ghostwatch
