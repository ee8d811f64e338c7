#pragma once

#include "flowcanvas/canvas/CanvasEvent.h"
#include "flowcanvas/canvas/CanvasReducer.h"

#include <vector>

namespace flowcanvas {

/// Ordered event history with a movable cursor for undo/redo
///
/// Canvas state is always fold(events[0..currentIndex]); it is never
/// mutated directly. Appending while the cursor is behind the tip drops
/// the redo tail first.
///
/// Example:
/// @code
/// EventLog log;
/// log.append(makeEvent(AddNodePayload{"n1", NodeType::Document, {0, 0}}, now));
/// log.undo();                 // currentIndex == -1
/// log.redo();                 // currentIndex == 0
/// CanvasState state = log.currentState();
/// @endcode
class EventLog {
public:
    /// Result of a cursor move
    struct MoveResult {
        bool moved = false;
        std::string reason;     ///< "nothing to undo" / "nothing to redo" when not moved
    };

    EventLog() = default;
    explicit EventLog(CanvasReducer reducer);

    /// Append an event, discarding any undone events first
    /// @return Number of events discarded from the redo tail
    size_t append(CanvasEvent event);

    MoveResult undo();
    MoveResult redo();

    bool canUndo() const { return currentIndex_ >= 0; }
    bool canRedo() const { return currentIndex_ < static_cast<int>(events_.size()) - 1; }

    /// Index of the last applied event, -1 when nothing is applied
    int currentIndex() const { return currentIndex_; }

    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }

    /// Number of undone events available for redo
    size_t undoneCount() const;

    const std::vector<CanvasEvent>& events() const { return events_; }
    const CanvasEvent& at(size_t index) const { return events_.at(index); }

    /// Fold events[0..index] from the initial state
    CanvasState deriveState(int index) const;

    /// State at the cursor
    CanvasState currentState() const { return deriveState(currentIndex_); }

    /// Replace the history (e.g. with events loaded from a store),
    /// cursor at the tip
    void replace(std::vector<CanvasEvent> events);

    /// Drop all history
    void clear();

    const CanvasReducer& reducer() const { return reducer_; }

private:
    CanvasReducer reducer_;
    std::vector<CanvasEvent> events_;
    int currentIndex_ = -1;
};

}  // namespace flowcanvas
