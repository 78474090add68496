#include "scene/Eye.hpp"

namespace ghostwatch {

Eye::Eye(float x, float y, float moveRadius, float sizeRadius)
    : m_position(x, y)
    , m_irisPosition(x, y)
    , m_moveRadius(moveRadius)
    , m_sizeRadius(sizeRadius) {}

void Eye::update(const Vec2& bounceDelta, float facingAngle) {
    m_position += bounceDelta;
    m_irisPosition = m_position + Vec2::fromPolar(facingAngle, m_moveRadius);
}

void Eye::render(IRenderer& renderer, const Color& color) const {
    renderer.drawCircle(m_irisPosition, m_sizeRadius, color);
}

} // namespace ghostwatch
