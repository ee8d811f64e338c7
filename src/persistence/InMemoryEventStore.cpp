#include "flowcanvas/persistence/InMemoryEventStore.h"

#include <algorithm>

namespace flowcanvas {

bool EventFilter::matches(const CanvasEvent& event) const {
    if (!kinds.empty() &&
        std::find(kinds.begin(), kinds.end(), event.kind()) == kinds.end()) {
        return false;
    }
    if (fromTimestamp && event.timestamp < *fromTimestamp) {
        return false;
    }
    return true;
}

CanvasEvent InMemoryEventStore::create(const CanvasEvent& event) {
    if (!available_) {
        throw PersistenceError("event store unavailable");
    }
    if (failuresRemaining_ > 0) {
        --failuresRemaining_;
        throw PersistenceError("event store rejected write");
    }

    CanvasEvent stored = event;
    stored.eventId = "evt-" + std::to_string(nextSeq_++);
    events_.push_back(stored);
    return stored;
}

std::vector<CanvasEvent> InMemoryEventStore::list(const EventFilter& filter) const {
    if (!available_) {
        throw PersistenceError("event store unavailable");
    }

    std::vector<CanvasEvent> result;
    for (const auto& event : events_) {
        if (filter.matches(event)) {
            result.push_back(event);
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const CanvasEvent& a, const CanvasEvent& b) {
        if (!a.sequence || !b.sequence) {
            return a.sequence.has_value() && !b.sequence.has_value();
        }
        return *a.sequence < *b.sequence;
    });

    if (filter.limit && result.size() > *filter.limit) {
        result.resize(*filter.limit);
    }
    return result;
}

void InMemoryEventStore::clear() {
    events_.clear();
    nextSeq_ = 1;
}

}  // namespace flowcanvas
