#pragma once

namespace ghostwatch {

/// Grants frames to the loop at the display rate.
class IFrameScheduler {
public:
    virtual ~IFrameScheduler() = default;

    /// Called once before every frame. Returns false once the host wants
    /// the loop to stop (window closed, termination requested).
    virtual bool nextFrame() = 0;

    /// Ask the scheduler to stop granting frames.
    virtual void requestStop() = 0;
};

} // namespace ghostwatch
