#pragma once

#include "flowcanvas/canvas/CanvasEvent.h"
#include "flowcanvas/persistence/IEventStore.h"

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flowcanvas {

/// Buffers events on their way to an IEventStore
///
/// Batchable (medium and low priority) events wait until the batch window
/// has elapsed since the first buffered event. A high-priority event flushes
/// the whole buffer at once. Each flush persists events in a stable sort by
/// priority, so events of equal priority keep their dispatch order. Readers
/// restore full dispatch order from CanvasEvent::sequence.
///
/// When the store throws, the events not yet persisted go back to the front
/// of the buffer in the order they were being flushed, ahead of anything
/// enqueued later, and the error flag is raised until a flush succeeds.
///
/// Time is passed in explicitly; the batcher never reads a clock.
class EventBatcher {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /// Outcome of a flush attempt
    struct FlushResult {
        bool success = true;
        std::string reason;                 ///< Store error message on failure
        std::vector<CanvasEvent> persisted; ///< Stored events, ids assigned
        size_t requeued = 0;
    };

    explicit EventBatcher(std::shared_ptr<IEventStore> store,
                          std::chrono::milliseconds window = std::chrono::milliseconds(500));

    /// Queue an event; flushes immediately when it is high priority
    FlushResult enqueue(CanvasEvent event, TimePoint now);

    /// Flush when the batch window has elapsed
    FlushResult tick(TimePoint now);

    /// Flush everything that is buffered
    FlushResult flush(TimePoint now);

    /// Time at which the buffered events become due, if any are buffered
    std::optional<TimePoint> deadline() const;

    size_t pendingCount() const { return pending_.size(); }
    std::vector<CanvasEvent> pending() const { return {pending_.begin(), pending_.end()}; }

    bool hasError() const { return !lastError_.empty(); }
    const std::string& lastError() const { return lastError_; }

    std::chrono::milliseconds window() const { return window_; }
    void setWindow(std::chrono::milliseconds window) { window_ = window; }

private:
    std::shared_ptr<IEventStore> store_;
    std::chrono::milliseconds window_;
    std::deque<CanvasEvent> pending_;
    std::optional<TimePoint> windowStart_;
    std::string lastError_;
};

}  // namespace flowcanvas
