#pragma once

#include "flowcanvas/canvas/CanvasTypes.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace flowcanvas {

/// Closed set of canvas event kinds. Order matches EventPayload alternatives.
enum class EventKind {
    AddNode,
    MoveNode,
    DeleteNode,
    SelectElement,
    PanCanvas,
    ZoomCanvas,
    ResetView,
    CreateEdge,
    DeleteEdge,
    UpdateEdgePath
};

enum class ElementType {
    Node,
    Edge
};

enum class ResetType {
    Keyboard,
    Button,
    Auto
};

enum class PathUpdateReason {
    NodeMoved,
    ManualEdit
};

/// Persistence urgency, used to order batch flushes
enum class EventPriority {
    High,
    Medium,
    Low
};

// =========================================================================
// Payloads
// =========================================================================

struct AddNodePayload {
    NodeId nodeId;
    NodeType nodeType = NodeType::Document;
    Point position;
    std::optional<std::string> title;   ///< Defaults to "<Type> <count+1>"

    bool operator==(const AddNodePayload&) const = default;
};

struct MoveNodePayload {
    NodeId nodeId;
    Point fromPosition;
    Point toPosition;
    bool isDragging = false;            ///< Intermediate drag sample

    bool operator==(const MoveNodePayload&) const = default;
};

/// Carries the removed node's data so the deletion is self-describing
struct DeleteNodePayload {
    NodeId nodeId;
    std::optional<NodeType> nodeType;
    std::optional<Point> position;
    std::optional<std::string> title;

    bool operator==(const DeleteNodePayload&) const = default;
};

/// elementId == nullopt clears the selection
struct SelectElementPayload {
    std::optional<std::string> elementId;
    ElementType elementType = ElementType::Node;
    std::optional<std::string> previousSelection;

    bool operator==(const SelectElementPayload&) const = default;
};

struct PanCanvasPayload {
    ViewBox fromViewBox;
    ViewBox toViewBox;
    float deltaX = 0.0f;
    float deltaY = 0.0f;

    bool operator==(const PanCanvasPayload&) const = default;
};

struct ZoomCanvasPayload {
    float fromZoom = limits::DEFAULT_SCALE;
    float toZoom = limits::DEFAULT_SCALE;
    ViewBox fromViewBox;
    ViewBox toViewBox;
    std::optional<Point> zoomCenter;

    bool operator==(const ZoomCanvasPayload&) const = default;
};

struct ResetViewPayload {
    ViewBox fromViewBox;
    float fromZoom = limits::DEFAULT_SCALE;
    ViewBox toViewBox;
    float toZoom = limits::DEFAULT_SCALE;
    ResetType resetType = ResetType::Button;

    bool operator==(const ResetViewPayload&) const = default;
};

struct CreateEdgePayload {
    EdgeId edgeId;
    ConnectionPoint source;
    ConnectionPoint target;
    EdgeType edgeType = EdgeType::Bezier;
    EdgeStyle style;

    bool operator==(const CreateEdgePayload&) const = default;
};

struct DeleteEdgePayload {
    EdgeId edgeId;
    std::optional<ConnectionPoint> source;
    std::optional<ConnectionPoint> target;
    std::optional<EdgeType> edgeType;

    bool operator==(const DeleteEdgePayload&) const = default;
};

/// reason is informational and never interpreted by the reducer
struct UpdateEdgePathPayload {
    EdgeId edgeId;
    std::optional<EdgePath> oldPath;
    EdgePath newPath;
    PathUpdateReason reason = PathUpdateReason::ManualEdit;

    bool operator==(const UpdateEdgePathPayload&) const = default;
};

using EventPayload = std::variant<
    AddNodePayload,
    MoveNodePayload,
    DeleteNodePayload,
    SelectElementPayload,
    PanCanvasPayload,
    ZoomCanvasPayload,
    ResetViewPayload,
    CreateEdgePayload,
    DeleteEdgePayload,
    UpdateEdgePathPayload>;

/// Immutable record of a single state-changing intent
struct CanvasEvent {
    EventPayload payload;
    int64_t timestamp = 0;                  ///< Milliseconds since epoch
    std::optional<std::string> userId;
    std::optional<std::string> eventId;     ///< Assigned by the event store
    std::optional<uint64_t> sequence;       ///< Dispatch order within the session history

    EventKind kind() const { return static_cast<EventKind>(payload.index()); }

    template <typename T>
    const T* as() const { return std::get_if<T>(&payload); }

    bool operator==(const CanvasEvent&) const = default;
};

/// Build an event stamped with the given time
CanvasEvent makeEvent(EventPayload payload, int64_t timestamp,
                      std::optional<std::string> userId = std::nullopt);

/// Current wall-clock time in milliseconds since epoch
int64_t currentTimeMillis();

// Wire names ("ADD_NODE", "node", "keyboard", "node_moved", ...)
std::string eventKindName(EventKind kind);
std::optional<EventKind> parseEventKind(const std::string& name);

std::string elementTypeName(ElementType type);
std::optional<ElementType> parseElementType(const std::string& name);

std::string resetTypeName(ResetType type);
std::optional<ResetType> parseResetType(const std::string& name);

std::string pathUpdateReasonName(PathUpdateReason reason);
std::optional<PathUpdateReason> parsePathUpdateReason(const std::string& name);

/// Persistence priority of an event
///
/// High: structural changes and view resets (never batched).
/// Medium: settled moves, selection, zoom.
/// Low: pans, path updates, intermediate drag samples.
EventPriority eventPriority(const CanvasEvent& event);

/// Whether the event may wait in the batch buffer
bool shouldBatch(const CanvasEvent& event);

}  // namespace flowcanvas
