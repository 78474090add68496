#pragma once

#include "engine/Vec2.hpp"

#include <optional>

namespace ghostwatch {

/// Absolute pointer position from mouse motion or the first touch point.
class IPointerSource {
public:
    virtual ~IPointerSource() = default;

    /// The latest pointer position if it moved since the previous call.
    virtual std::optional<Vec2> pollPointerMoved() = 0;
};

} // namespace ghostwatch
