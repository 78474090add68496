#pragma once

#include "rendering/IRenderer.hpp"

namespace ghostwatch {

/// A ghost's eye: a fixed-size iris orbiting its anchor at a fixed radius,
/// always on the side facing the pointer.
class Eye {
public:
    Eye(float x, float y, float moveRadius = 20.0f, float sizeRadius = 5.0f);

    /// Advance the anchor by the owner's bounce delta, then place the
    /// iris `moveRadius` away from it along `facingAngle`.
    void update(const Vec2& bounceDelta, float facingAngle);

    void render(IRenderer& renderer, const Color& color) const;

    const Vec2& getPosition() const { return m_position; }
    const Vec2& getIrisPosition() const { return m_irisPosition; }
    float getMoveRadius() const { return m_moveRadius; }
    float getSizeRadius() const { return m_sizeRadius; }

private:
    Vec2 m_position;
    Vec2 m_irisPosition;
    float m_moveRadius;
    float m_sizeRadius;
};

} // namespace ghostwatch
