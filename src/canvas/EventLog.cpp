#include "flowcanvas/canvas/EventLog.h"
#include "flowcanvas/common/Logger.h"

namespace flowcanvas {

EventLog::EventLog(CanvasReducer reducer)
    : reducer_(std::move(reducer)) {}

size_t EventLog::append(CanvasEvent event) {
    size_t discarded = undoneCount();
    if (discarded > 0) {
        events_.resize(static_cast<size_t>(currentIndex_ + 1));
        LOG_DEBUG("discarded {} undone event(s) before append", discarded);
    }

    events_.push_back(std::move(event));
    currentIndex_ = static_cast<int>(events_.size()) - 1;
    return discarded;
}

EventLog::MoveResult EventLog::undo() {
    if (!canUndo()) {
        LOG_DEBUG("nothing to undo");
        return {false, "nothing to undo"};
    }
    --currentIndex_;
    return {true, {}};
}

EventLog::MoveResult EventLog::redo() {
    if (!canRedo()) {
        LOG_DEBUG("nothing to redo");
        return {false, "nothing to redo"};
    }
    ++currentIndex_;
    return {true, {}};
}

size_t EventLog::undoneCount() const {
    return events_.size() - static_cast<size_t>(currentIndex_ + 1);
}

CanvasState EventLog::deriveState(int index) const {
    return reducer_.fold(events_, index);
}

void EventLog::replace(std::vector<CanvasEvent> events) {
    events_ = std::move(events);
    currentIndex_ = static_cast<int>(events_.size()) - 1;
}

void EventLog::clear() {
    events_.clear();
    currentIndex_ = -1;
}

}  // namespace flowcanvas
