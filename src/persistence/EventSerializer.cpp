#include "flowcanvas/persistence/EventSerializer.h"
#include "flowcanvas/common/Logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace flowcanvas {

namespace {

template <typename T>
T require(const std::optional<T>& value, const std::string& what, const std::string& name) {
    if (!value) {
        throw std::invalid_argument("unknown " + what + " '" + name + "'");
    }
    return *value;
}

// =========================================================================
// Value encoders
// =========================================================================

json pointToJson(const Point& p) {
    return {{"x", p.x}, {"y", p.y}};
}

Point pointFromJson(const json& j) {
    return {j.at("x").get<float>(), j.at("y").get<float>()};
}

json viewBoxToJson(const ViewBox& vb) {
    return {{"x", vb.x}, {"y", vb.y}, {"width", vb.width}, {"height", vb.height}};
}

ViewBox viewBoxFromJson(const json& j) {
    return {j.at("x").get<float>(), j.at("y").get<float>(),
            j.at("width").get<float>(), j.at("height").get<float>()};
}

json connectionToJson(const ConnectionPoint& cp) {
    return {{"nodeId", cp.nodeId}, {"anchorId", cp.anchorId}, {"position", pointToJson(cp.position)}};
}

ConnectionPoint connectionFromJson(const json& j) {
    return {j.at("nodeId").get<std::string>(),
            j.at("anchorId").get<std::string>(),
            pointFromJson(j.at("position"))};
}

json styleToJson(const EdgeStyle& style) {
    json j = {
        {"stroke", style.stroke},
        {"strokeWidth", style.strokeWidth},
        {"opacity", style.opacity}
    };
    if (style.dashArray) j["dashArray"] = *style.dashArray;
    if (style.markerStart) j["markerStart"] = *style.markerStart;
    if (style.markerEnd) j["markerEnd"] = *style.markerEnd;
    return j;
}

EdgeStyle styleFromJson(const json& j) {
    EdgeStyle style;
    style.stroke = j.value("stroke", style.stroke);
    style.strokeWidth = j.value("strokeWidth", style.strokeWidth);
    style.opacity = j.value("opacity", style.opacity);
    if (j.contains("dashArray")) style.dashArray = j["dashArray"].get<std::string>();
    if (j.contains("markerStart")) style.markerStart = j["markerStart"].get<std::string>();
    if (j.contains("markerEnd")) style.markerEnd = j["markerEnd"].get<std::string>();
    return style;
}

json pathToJson(const EdgePath& path) {
    json j = {
        {"type", edgeTypeName(path.type())},
        {"start", pointToJson(path.start)},
        {"end", pointToJson(path.end)}
    };
    if (const auto* cps = path.controlPoints()) {
        j["controlPoints"] = {{"cp1", pointToJson(cps->cp1)}, {"cp2", pointToJson(cps->cp2)}};
    }
    if (const auto* waypoints = path.waypoints()) {
        json points = json::array();
        for (const auto& wp : *waypoints) {
            points.push_back(pointToJson(wp));
        }
        j["waypoints"] = points;
    }
    return j;
}

EdgePath pathFromJsonValue(const json& j) {
    std::string typeName = j.at("type").get<std::string>();
    EdgeType type = require(parseEdgeType(typeName), "edge type", typeName);
    Point start = pointFromJson(j.at("start"));
    Point end = pointFromJson(j.at("end"));

    switch (type) {
        case EdgeType::Straight:
            return EdgePath::straight(start, end);
        case EdgeType::Bezier: {
            const json& cps = j.at("controlPoints");
            return EdgePath::bezier(start, end, {pointFromJson(cps.at("cp1")), pointFromJson(cps.at("cp2"))});
        }
        case EdgeType::Orthogonal: {
            std::vector<Point> waypoints;
            for (const auto& wp : j.at("waypoints")) {
                waypoints.push_back(pointFromJson(wp));
            }
            return EdgePath::orthogonal(start, end, std::move(waypoints));
        }
    }
    throw std::invalid_argument("unhandled edge type");
}

template <typename T>
std::optional<T> optionalValue(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

// =========================================================================
// Payload encoders
// =========================================================================

json payloadToJson(const CanvasEvent& event) {
    json p = json::object();

    switch (event.kind()) {
        case EventKind::AddNode: {
            const auto& e = std::get<AddNodePayload>(event.payload);
            p["nodeId"] = e.nodeId;
            p["nodeType"] = nodeTypeName(e.nodeType);
            p["position"] = pointToJson(e.position);
            if (e.title) p["title"] = *e.title;
            break;
        }
        case EventKind::MoveNode: {
            const auto& e = std::get<MoveNodePayload>(event.payload);
            p["nodeId"] = e.nodeId;
            p["fromPosition"] = pointToJson(e.fromPosition);
            p["toPosition"] = pointToJson(e.toPosition);
            p["isDragging"] = e.isDragging;
            break;
        }
        case EventKind::DeleteNode: {
            const auto& e = std::get<DeleteNodePayload>(event.payload);
            p["nodeId"] = e.nodeId;
            if (e.nodeType) p["nodeType"] = nodeTypeName(*e.nodeType);
            if (e.position) p["position"] = pointToJson(*e.position);
            if (e.title) p["title"] = *e.title;
            break;
        }
        case EventKind::SelectElement: {
            const auto& e = std::get<SelectElementPayload>(event.payload);
            p["elementId"] = e.elementId ? json(*e.elementId) : json(nullptr);
            p["elementType"] = elementTypeName(e.elementType);
            if (e.previousSelection) p["previousSelection"] = *e.previousSelection;
            break;
        }
        case EventKind::PanCanvas: {
            const auto& e = std::get<PanCanvasPayload>(event.payload);
            p["fromViewBox"] = viewBoxToJson(e.fromViewBox);
            p["toViewBox"] = viewBoxToJson(e.toViewBox);
            p["deltaX"] = e.deltaX;
            p["deltaY"] = e.deltaY;
            break;
        }
        case EventKind::ZoomCanvas: {
            const auto& e = std::get<ZoomCanvasPayload>(event.payload);
            p["fromZoom"] = e.fromZoom;
            p["toZoom"] = e.toZoom;
            p["fromViewBox"] = viewBoxToJson(e.fromViewBox);
            p["toViewBox"] = viewBoxToJson(e.toViewBox);
            if (e.zoomCenter) p["zoomCenter"] = pointToJson(*e.zoomCenter);
            break;
        }
        case EventKind::ResetView: {
            const auto& e = std::get<ResetViewPayload>(event.payload);
            p["fromViewBox"] = viewBoxToJson(e.fromViewBox);
            p["fromZoom"] = e.fromZoom;
            p["toViewBox"] = viewBoxToJson(e.toViewBox);
            p["toZoom"] = e.toZoom;
            p["resetType"] = resetTypeName(e.resetType);
            break;
        }
        case EventKind::CreateEdge: {
            const auto& e = std::get<CreateEdgePayload>(event.payload);
            p["edgeId"] = e.edgeId;
            p["source"] = connectionToJson(e.source);
            p["target"] = connectionToJson(e.target);
            p["edgeType"] = edgeTypeName(e.edgeType);
            p["style"] = styleToJson(e.style);
            break;
        }
        case EventKind::DeleteEdge: {
            const auto& e = std::get<DeleteEdgePayload>(event.payload);
            p["edgeId"] = e.edgeId;
            if (e.source) p["source"] = connectionToJson(*e.source);
            if (e.target) p["target"] = connectionToJson(*e.target);
            if (e.edgeType) p["edgeType"] = edgeTypeName(*e.edgeType);
            break;
        }
        case EventKind::UpdateEdgePath: {
            const auto& e = std::get<UpdateEdgePathPayload>(event.payload);
            p["edgeId"] = e.edgeId;
            if (e.oldPath) p["oldPath"] = pathToJson(*e.oldPath);
            p["newPath"] = pathToJson(e.newPath);
            p["reason"] = pathUpdateReasonName(e.reason);
            break;
        }
    }
    return p;
}

EventPayload payloadFromJson(EventKind kind, const json& p) {
    switch (kind) {
        case EventKind::AddNode: {
            AddNodePayload e;
            e.nodeId = p.at("nodeId").get<std::string>();
            std::string type = p.at("nodeType").get<std::string>();
            e.nodeType = require(parseNodeType(type), "node type", type);
            e.position = pointFromJson(p.at("position"));
            e.title = optionalValue<std::string>(p, "title");
            return e;
        }
        case EventKind::MoveNode: {
            MoveNodePayload e;
            e.nodeId = p.at("nodeId").get<std::string>();
            e.fromPosition = pointFromJson(p.at("fromPosition"));
            e.toPosition = pointFromJson(p.at("toPosition"));
            e.isDragging = p.value("isDragging", false);
            return e;
        }
        case EventKind::DeleteNode: {
            DeleteNodePayload e;
            e.nodeId = p.at("nodeId").get<std::string>();
            if (auto type = optionalValue<std::string>(p, "nodeType")) {
                e.nodeType = require(parseNodeType(*type), "node type", *type);
            }
            if (p.contains("position")) e.position = pointFromJson(p["position"]);
            e.title = optionalValue<std::string>(p, "title");
            return e;
        }
        case EventKind::SelectElement: {
            SelectElementPayload e;
            e.elementId = optionalValue<std::string>(p, "elementId");
            std::string type = p.value("elementType", std::string("node"));
            e.elementType = require(parseElementType(type), "element type", type);
            e.previousSelection = optionalValue<std::string>(p, "previousSelection");
            return e;
        }
        case EventKind::PanCanvas: {
            PanCanvasPayload e;
            e.fromViewBox = viewBoxFromJson(p.at("fromViewBox"));
            e.toViewBox = viewBoxFromJson(p.at("toViewBox"));
            e.deltaX = p.at("deltaX").get<float>();
            e.deltaY = p.at("deltaY").get<float>();
            return e;
        }
        case EventKind::ZoomCanvas: {
            ZoomCanvasPayload e;
            e.fromZoom = p.at("fromZoom").get<float>();
            e.toZoom = p.at("toZoom").get<float>();
            e.fromViewBox = viewBoxFromJson(p.at("fromViewBox"));
            e.toViewBox = viewBoxFromJson(p.at("toViewBox"));
            if (p.contains("zoomCenter")) e.zoomCenter = pointFromJson(p["zoomCenter"]);
            return e;
        }
        case EventKind::ResetView: {
            ResetViewPayload e;
            e.fromViewBox = viewBoxFromJson(p.at("fromViewBox"));
            e.fromZoom = p.at("fromZoom").get<float>();
            e.toViewBox = viewBoxFromJson(p.at("toViewBox"));
            e.toZoom = p.at("toZoom").get<float>();
            std::string type = p.value("resetType", std::string("keyboard"));
            e.resetType = require(parseResetType(type), "reset type", type);
            return e;
        }
        case EventKind::CreateEdge: {
            CreateEdgePayload e;
            e.edgeId = p.at("edgeId").get<std::string>();
            e.source = connectionFromJson(p.at("source"));
            e.target = connectionFromJson(p.at("target"));
            std::string type = p.at("edgeType").get<std::string>();
            e.edgeType = require(parseEdgeType(type), "edge type", type);
            if (p.contains("style")) e.style = styleFromJson(p["style"]);
            return e;
        }
        case EventKind::DeleteEdge: {
            DeleteEdgePayload e;
            e.edgeId = p.at("edgeId").get<std::string>();
            if (p.contains("source")) e.source = connectionFromJson(p["source"]);
            if (p.contains("target")) e.target = connectionFromJson(p["target"]);
            if (auto type = optionalValue<std::string>(p, "edgeType")) {
                e.edgeType = require(parseEdgeType(*type), "edge type", *type);
            }
            return e;
        }
        case EventKind::UpdateEdgePath: {
            UpdateEdgePathPayload e;
            e.edgeId = p.at("edgeId").get<std::string>();
            if (p.contains("oldPath")) e.oldPath = pathFromJsonValue(p["oldPath"]);
            e.newPath = pathFromJsonValue(p.at("newPath"));
            std::string reason = p.value("reason", std::string("manual_edit"));
            e.reason = require(parsePathUpdateReason(reason), "path update reason", reason);
            return e;
        }
    }
    throw std::invalid_argument("unhandled event kind");
}

json eventToJsonValue(const CanvasEvent& event) {
    json j = {
        {"type", eventKindName(event.kind())},
        {"payload", payloadToJson(event)},
        {"timestamp", event.timestamp}
    };
    if (event.userId) j["userId"] = *event.userId;
    if (event.eventId) j["id"] = *event.eventId;
    if (event.sequence) j["seq"] = *event.sequence;
    return j;
}

/// @throws json::exception or std::invalid_argument when malformed
CanvasEvent eventFromJsonValue(const json& j) {
    std::string typeName = j.at("type").get<std::string>();
    EventKind kind = require(parseEventKind(typeName), "event type", typeName);

    CanvasEvent event;
    event.payload = payloadFromJson(kind, j.at("payload"));
    event.timestamp = j.value("timestamp", int64_t{0});
    event.userId = optionalValue<std::string>(j, "userId");
    event.eventId = optionalValue<std::string>(j, "id");
    event.sequence = optionalValue<uint64_t>(j, "seq");
    return event;
}

/// @param skipped Receives the indices of entries that were dropped
std::vector<CanvasEvent> eventListFromJsonValue(const json& list, std::vector<int>* skipped = nullptr) {
    std::vector<CanvasEvent> events;
    int index = 0;
    for (const auto& entry : list) {
        bool ok = false;
        try {
            events.push_back(eventFromJsonValue(entry));
            ok = true;
        } catch (const json::exception& e) {
            LOG_WARN("skipping malformed event at index {}: {}", index, e.what());
        } catch (const std::invalid_argument& e) {
            LOG_WARN("skipping malformed event at index {}: {}", index, e.what());
        }
        if (!ok && skipped) {
            skipped->push_back(index);
        }
        ++index;
    }
    return events;
}

bool writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        LOG_ERROR("cannot open '{}' for writing", path);
        return false;
    }
    file << content;
    return file.good();
}

std::optional<std::string> readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        LOG_ERROR("cannot open '{}' for reading", path);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

// =========================================================================
// Single events
// =========================================================================

std::string EventSerializer::toJson(const CanvasEvent& event) {
    return eventToJsonValue(event).dump(2);
}

std::optional<CanvasEvent> EventSerializer::eventFromJson(const std::string& jsonStr) {
    try {
        return eventFromJsonValue(json::parse(jsonStr));
    } catch (const json::exception& e) {
        LOG_WARN("invalid event JSON: {}", e.what());
    } catch (const std::invalid_argument& e) {
        LOG_WARN("invalid event JSON: {}", e.what());
    }
    return std::nullopt;
}

// =========================================================================
// Event lists
// =========================================================================

std::string EventSerializer::toJson(const std::vector<CanvasEvent>& events) {
    json list = json::array();
    for (const auto& event : events) {
        list.push_back(eventToJsonValue(event));
    }
    json j;
    j["version"] = 1;
    j["events"] = list;
    return j.dump(2);
}

std::optional<std::vector<CanvasEvent>> EventSerializer::eventsFromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        return eventListFromJsonValue(j.at("events"));
    } catch (const json::exception& e) {
        LOG_WARN("invalid event list JSON: {}", e.what());
        return std::nullopt;
    }
}

// =========================================================================
// Edge paths
// =========================================================================

std::string EventSerializer::toJson(const EdgePath& path) {
    return pathToJson(path).dump(2);
}

std::optional<EdgePath> EventSerializer::pathFromJson(const std::string& jsonStr) {
    try {
        return pathFromJsonValue(json::parse(jsonStr));
    } catch (const json::exception& e) {
        LOG_WARN("invalid path JSON: {}", e.what());
    } catch (const std::invalid_argument& e) {
        LOG_WARN("invalid path JSON: {}", e.what());
    }
    return std::nullopt;
}

// =========================================================================
// Event logs
// =========================================================================

std::string EventSerializer::toJson(const EventLog& log) {
    json list = json::array();
    for (const auto& event : log.events()) {
        list.push_back(eventToJsonValue(event));
    }
    json j;
    j["version"] = 1;
    j["currentIndex"] = log.currentIndex();
    j["events"] = list;
    return j.dump(2);
}

bool EventSerializer::fromJson(EventLog& log, const std::string& jsonStr) {
    std::vector<CanvasEvent> events;
    int currentIndex = -1;

    try {
        json j = json::parse(jsonStr);
        const json& list = j.at("events");
        std::vector<int> skipped;
        events = eventListFromJsonValue(list, &skipped);
        currentIndex = j.value("currentIndex", static_cast<int>(list.size()) - 1);

        // Skipped entries at or before the cursor shift it down, so undone
        // events stay undone
        currentIndex -= static_cast<int>(std::count_if(skipped.begin(), skipped.end(),
            [currentIndex](int index) { return index <= currentIndex; }));
    } catch (const json::exception& e) {
        LOG_WARN("invalid event log JSON: {}", e.what());
        return false;
    }

    currentIndex = std::max(-1, std::min(currentIndex, static_cast<int>(events.size()) - 1));

    log.replace(std::move(events));
    while (log.currentIndex() > currentIndex) {
        log.undo();
    }
    return true;
}

bool EventSerializer::saveToFile(const EventLog& log, const std::string& path) {
    return writeFile(path, toJson(log));
}

bool EventSerializer::loadFromFile(EventLog& log, const std::string& path) {
    auto content = readFile(path);
    if (!content) {
        return false;
    }
    return fromJson(log, *content);
}

}  // namespace flowcanvas
