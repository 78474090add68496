#pragma once

#include <variant>

namespace ghostwatch {

/// Pointer moved to an absolute viewport position.
struct PointerMoved {
    float x = 0.0f;
    float y = 0.0f;
};

/// Viewport changed size.
struct Resized {
    int width = 0;
    int height = 0;
};

/// Host notification applied to the scene between frames.
using SceneEvent = std::variant<PointerMoved, Resized>;

} // namespace ghostwatch
