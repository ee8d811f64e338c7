#pragma once

#include "flowcanvas/core/Types.h"

#include <chrono>
#include <optional>

namespace flowcanvas {

/// Coalesces a burst of wheel-zoom input into one settled zoom
///
/// Every push() replaces the pending target and restarts the quiet period.
/// poll() hands out the target once no input arrived for the delay.
class ZoomDebouncer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /// Settled zoom request
    struct Request {
        float targetScale = 1.0f;
        Point focal;                ///< World point kept fixed by the zoom
    };

    explicit ZoomDebouncer(std::chrono::milliseconds delay = std::chrono::milliseconds(50));

    /// Record new input at time now
    void push(float targetScale, const Point& focal, TimePoint now);

    /// Settled request when the quiet period has passed, consuming it
    std::optional<Request> poll(TimePoint now);

    /// Pending request regardless of timing, consuming it
    std::optional<Request> takePending();

    /// Drop the pending request
    void cancel();

    bool hasPending() const { return pending_.has_value(); }
    const std::optional<Request>& pending() const { return pending_; }

    std::chrono::milliseconds delay() const { return delay_; }
    void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }

private:
    std::chrono::milliseconds delay_;
    std::optional<Request> pending_;
    TimePoint lastInput_{};
};

}  // namespace flowcanvas
