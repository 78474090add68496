#include "engine/Input.hpp"

#include <raylib.h>

namespace ghostwatch {

void Input::update() {
    Vec2 sample;
    if (GetTouchPointCount() > 0) {
        // Only the first touch steers the eyes
        Vector2 touch = GetTouchPosition(0);
        sample = {touch.x, touch.y};
    } else {
        Vector2 mouse = GetMousePosition();
        sample = {mouse.x, mouse.y};
    }

    // Raylib reports a cursor position before any motion happens; the
    // scene keeps looking at the viewport centre until the pointer moves.
    if (!m_hasSample) {
        m_pointer = sample;
        m_hasSample = true;
        return;
    }

    if (sample != m_pointer) {
        m_pointer = sample;
        m_moved = true;
    }
}

std::optional<Vec2> Input::pollPointerMoved() {
    if (!m_moved) {
        return std::nullopt;
    }
    m_moved = false;
    return m_pointer;
}

bool Input::isKeyPressed(Key key) const {
    return IsKeyPressed(static_cast<int>(key));
}

} // namespace ghostwatch
