#pragma once

#include "flowcanvas/canvas/CanvasEvent.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace flowcanvas {

/// Raised by an event store that cannot accept or return events
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Query for IEventStore::list
struct EventFilter {
    /// Kinds to return; empty means every kind
    std::vector<EventKind> kinds;

    /// Only events with timestamp >= fromTimestamp
    std::optional<int64_t> fromTimestamp;

    /// Maximum number of events, earliest first
    std::optional<size_t> limit;

    bool matches(const CanvasEvent& event) const;
};

/// Durable event sink the controller persists to
///
/// Implementations throw PersistenceError when the backing store is
/// unavailable. Callers treat the local log as authoritative.
class IEventStore {
public:
    virtual ~IEventStore() = default;

    /// Persist one event
    /// @return The stored event, with eventId assigned
    /// @throws PersistenceError
    virtual CanvasEvent create(const CanvasEvent& event) = 0;

    /// Stored events matching the filter, in dispatch order
    ///
    /// Events are ordered by sequence, not by the order they were written,
    /// since batched writes are reordered by priority. Events without a
    /// sequence follow in insertion order.
    /// @throws PersistenceError
    virtual std::vector<CanvasEvent> list(const EventFilter& filter = {}) const = 0;
};

}  // namespace flowcanvas
