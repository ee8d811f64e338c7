#pragma once

#include "flowcanvas/persistence/IEventStore.h"

#include <vector>

namespace flowcanvas {

/// IEventStore kept in process memory
///
/// Assigns sequential event ids ("evt-1", "evt-2", ...). Availability can
/// be toggled to exercise the failure paths of callers.
class InMemoryEventStore : public IEventStore {
public:
    CanvasEvent create(const CanvasEvent& event) override;
    std::vector<CanvasEvent> list(const EventFilter& filter = {}) const override;

    /// While unavailable, create() and list() throw PersistenceError
    void setAvailable(bool available) { available_ = available; }
    bool isAvailable() const { return available_; }

    /// Make the next n create() calls fail, then recover
    void failNextCreates(size_t count) { failuresRemaining_ = count; }

    size_t size() const { return events_.size(); }
    const std::vector<CanvasEvent>& events() const { return events_; }

    void clear();

private:
    std::vector<CanvasEvent> events_;
    uint64_t nextSeq_ = 1;
    bool available_ = true;
    size_t failuresRemaining_ = 0;
};

}  // namespace flowcanvas
