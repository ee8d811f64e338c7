#include "flowcanvas/canvas/CanvasEvent.h"

#include <chrono>

namespace flowcanvas {

CanvasEvent makeEvent(EventPayload payload, int64_t timestamp,
                      std::optional<std::string> userId) {
    CanvasEvent event;
    event.payload = std::move(payload);
    event.timestamp = timestamp;
    event.userId = std::move(userId);
    return event;
}

int64_t currentTimeMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::AddNode: return "ADD_NODE";
        case EventKind::MoveNode: return "MOVE_NODE";
        case EventKind::DeleteNode: return "DELETE_NODE";
        case EventKind::SelectElement: return "SELECT_ELEMENT";
        case EventKind::PanCanvas: return "PAN_CANVAS";
        case EventKind::ZoomCanvas: return "ZOOM_CANVAS";
        case EventKind::ResetView: return "RESET_VIEW";
        case EventKind::CreateEdge: return "CREATE_EDGE";
        case EventKind::DeleteEdge: return "DELETE_EDGE";
        case EventKind::UpdateEdgePath: return "UPDATE_EDGE_PATH";
    }
    return "UNKNOWN";
}

std::optional<EventKind> parseEventKind(const std::string& name) {
    if (name == "ADD_NODE") return EventKind::AddNode;
    if (name == "MOVE_NODE") return EventKind::MoveNode;
    if (name == "DELETE_NODE") return EventKind::DeleteNode;
    if (name == "SELECT_ELEMENT") return EventKind::SelectElement;
    if (name == "PAN_CANVAS") return EventKind::PanCanvas;
    if (name == "ZOOM_CANVAS") return EventKind::ZoomCanvas;
    if (name == "RESET_VIEW") return EventKind::ResetView;
    if (name == "CREATE_EDGE") return EventKind::CreateEdge;
    if (name == "DELETE_EDGE") return EventKind::DeleteEdge;
    if (name == "UPDATE_EDGE_PATH") return EventKind::UpdateEdgePath;
    return std::nullopt;
}

std::string elementTypeName(ElementType type) {
    return type == ElementType::Edge ? "edge" : "node";
}

std::optional<ElementType> parseElementType(const std::string& name) {
    if (name == "node") return ElementType::Node;
    if (name == "edge") return ElementType::Edge;
    return std::nullopt;
}

std::string resetTypeName(ResetType type) {
    switch (type) {
        case ResetType::Keyboard: return "keyboard";
        case ResetType::Button: return "button";
        case ResetType::Auto: return "auto";
    }
    return "button";
}

std::optional<ResetType> parseResetType(const std::string& name) {
    if (name == "keyboard") return ResetType::Keyboard;
    if (name == "button") return ResetType::Button;
    if (name == "auto") return ResetType::Auto;
    return std::nullopt;
}

std::string pathUpdateReasonName(PathUpdateReason reason) {
    return reason == PathUpdateReason::NodeMoved ? "node_moved" : "manual_edit";
}

std::optional<PathUpdateReason> parsePathUpdateReason(const std::string& name) {
    if (name == "node_moved") return PathUpdateReason::NodeMoved;
    if (name == "manual_edit") return PathUpdateReason::ManualEdit;
    return std::nullopt;
}

EventPriority eventPriority(const CanvasEvent& event) {
    switch (event.kind()) {
        case EventKind::AddNode:
        case EventKind::DeleteNode:
        case EventKind::CreateEdge:
        case EventKind::DeleteEdge:
        case EventKind::ResetView:
            return EventPriority::High;

        case EventKind::MoveNode:
            return event.as<MoveNodePayload>()->isDragging ? EventPriority::Low
                                                           : EventPriority::Medium;

        case EventKind::SelectElement:
        case EventKind::ZoomCanvas:
            return EventPriority::Medium;

        case EventKind::PanCanvas:
        case EventKind::UpdateEdgePath:
            return EventPriority::Low;
    }
    return EventPriority::Low;
}

bool shouldBatch(const CanvasEvent& event) {
    return eventPriority(event) != EventPriority::High;
}

}  // namespace flowcanvas
