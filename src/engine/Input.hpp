#pragma once

#include "engine/IPointerSource.hpp"

namespace ghostwatch {

/// Engine-defined key codes the host reacts to.
/// Maps 1:1 with Raylib key codes for the current backend.
enum class Key : int {
    F11 = 300,
};

/// Thin abstraction over Raylib mouse, touch and keyboard input.
class Input : public IPointerSource {
public:
    /// Sample the backend once per frame, before the scene pulls events.
    void update();

    std::optional<Vec2> pollPointerMoved() override;

    bool isKeyPressed(Key key) const;

    Vec2 getPointer() const { return m_pointer; }

private:
    Vec2 m_pointer;
    bool m_hasSample = false;
    bool m_moved = false;
};

} // namespace ghostwatch
