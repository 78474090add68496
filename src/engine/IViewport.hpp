#pragma once

namespace ghostwatch {

/// Reports the size of the drawable area and whether it changed.
class IViewport {
public:
    virtual ~IViewport() = default;

    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;

    /// True once per size change since the previous call.
    virtual bool pollSizeChanged() = 0;
};

} // namespace ghostwatch
