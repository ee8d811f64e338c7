#pragma once

#include "flowcanvas/canvas/CanvasEvent.h"
#include "flowcanvas/canvas/EventLog.h"

#include <optional>
#include <string>
#include <vector>

namespace flowcanvas {

/// JSON encoding of canvas events, edge paths and event logs
///
/// Event documents use the wire shape
/// {"type": "ADD_NODE", "payload": {...}, "timestamp": ms, "userId": ..., "id": ...}.
/// Decoding a list skips entries that are malformed or of an unknown type,
/// logging a warning for each, so a partly corrupted history still loads.
class EventSerializer {
public:
    // === Single events ===

    static std::string toJson(const CanvasEvent& event);

    /// @return std::nullopt when the text is not a well-formed event
    static std::optional<CanvasEvent> eventFromJson(const std::string& json);

    // === Event lists ===

    /// Serialize events as {"version": 1, "events": [...]}
    static std::string toJson(const std::vector<CanvasEvent>& events);

    /// Parse an event list, skipping malformed entries
    /// @return std::nullopt when the document itself cannot be parsed
    static std::optional<std::vector<CanvasEvent>> eventsFromJson(const std::string& json);

    // === Edge paths ===

    static std::string toJson(const EdgePath& path);
    static std::optional<EdgePath> pathFromJson(const std::string& json);

    // === Event logs (events plus undo cursor) ===

    static std::string toJson(const EventLog& log);

    /// Replace the log's history with the serialized one
    /// @return true if parsing succeeded; the log is untouched otherwise
    static bool fromJson(EventLog& log, const std::string& json);

    /// Save an event log to file
    /// @return true if save succeeded
    static bool saveToFile(const EventLog& log, const std::string& path);

    /// Load an event log from file
    /// @return true if load succeeded
    static bool loadFromFile(EventLog& log, const std::string& path);
};

}  // namespace flowcanvas
