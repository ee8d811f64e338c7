#include "flowcanvas/config/ConfigSerializer.h"
#include "flowcanvas/common/Logger.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace flowcanvas {

std::string ConfigSerializer::routingAlgorithmToString(RoutingAlgorithm algorithm) {
    switch (algorithm) {
        case RoutingAlgorithm::Straight: return "straight";
        case RoutingAlgorithm::Bezier: return "bezier";
        case RoutingAlgorithm::Orthogonal: return "orthogonal";
        case RoutingAlgorithm::Smart: return "smart";
    }
    return "bezier";
}

RoutingAlgorithm ConfigSerializer::stringToRoutingAlgorithm(const std::string& str) {
    if (str == "straight") return RoutingAlgorithm::Straight;
    if (str == "bezier") return RoutingAlgorithm::Bezier;
    if (str == "orthogonal") return RoutingAlgorithm::Orthogonal;
    if (str == "smart") return RoutingAlgorithm::Smart;
    LOG_WARN("unknown routing algorithm '{}', using bezier", str);
    return RoutingAlgorithm::Bezier;
}

std::string ConfigSerializer::toJson(const CanvasOptions& options) {
    json j;
    j["version"] = 1;

    const auto& vp = options.viewport;
    j["viewport"] = {
        {"minScale", vp.minScale},
        {"maxScale", vp.maxScale},
        {"defaultScale", vp.defaultScale},
        {"maxPanDistance", vp.maxPanDistance},
        {"panMargin", vp.panMargin},
        {"defaultViewBox", {
            {"x", vp.defaultViewBox.x},
            {"y", vp.defaultViewBox.y},
            {"width", vp.defaultViewBox.width},
            {"height", vp.defaultViewBox.height}
        }},
        {"minViewBoxWidth", vp.minViewBoxWidth},
        {"minViewBoxHeight", vp.minViewBoxHeight},
        {"zoomStep", vp.zoomStep},
        {"minZoomChange", vp.minZoomChange},
        {"wheelSensitivity", vp.wheelSensitivity},
        {"fitPadding", vp.fitPadding},
        {"nodeRadius", vp.nodeRadius},
        {"visibilityMargin", vp.visibilityMargin}
    };

    const auto& conn = options.connection;
    json style = {
        {"stroke", conn.defaultStyle.stroke},
        {"strokeWidth", conn.defaultStyle.strokeWidth},
        {"opacity", conn.defaultStyle.opacity}
    };
    if (conn.defaultStyle.dashArray) style["dashArray"] = *conn.defaultStyle.dashArray;
    if (conn.defaultStyle.markerStart) style["markerStart"] = *conn.defaultStyle.markerStart;
    if (conn.defaultStyle.markerEnd) style["markerEnd"] = *conn.defaultStyle.markerEnd;

    j["connection"] = {
        {"snapDistance", conn.snapDistance},
        {"allowSelfConnection", conn.allowSelfConnection},
        {"allowMultipleEdges", conn.allowMultipleEdges},
        {"defaultEdgeType", edgeTypeName(conn.defaultEdgeType)},
        {"defaultStyle", style}
    };

    const auto& path = options.path;
    j["path"] = {
        {"curvature", path.curvature},
        {"maxBezierOffset", path.maxBezierOffset},
        {"cornerRadius", path.cornerRadius},
        {"obstacleMargin", path.obstacleMargin},
        {"tangentEpsilon", path.tangentEpsilon},
        {"minNearestSamples", path.minNearestSamples}
    };

    const auto& routing = options.routing;
    j["routing"] = {
        {"algorithm", routingAlgorithmToString(routing.algorithm)},
        {"avoidNodes", routing.avoidNodes},
        {"padding", routing.padding},
        {"smoothing", routing.smoothing},
        {"cornerRadius", routing.cornerRadius},
        {"maxBezierOffset", routing.maxBezierOffset}
    };

    j["persistence"] = {
        {"batchWindowMs", options.persistence.batchWindowMs},
        {"zoomDebounceMs", options.persistence.zoomDebounceMs},
        {"historyLoadLimit", options.persistence.historyLoadLimit}
    };

    j["reducer"] = {
        {"cascadeNodeDeletion", options.reducer.cascadeNodeDeletion}
    };

    j["rerouteEdgesOnMove"] = options.rerouteEdgesOnMove;

    return j.dump(2);
}

bool ConfigSerializer::fromJson(CanvasOptions& options, const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        // Parse into a copy so a type error leaves the caller's options intact
        CanvasOptions parsed = options;

        if (j.contains("viewport")) {
            const auto& v = j["viewport"];
            auto& vp = parsed.viewport;
            vp.minScale = v.value("minScale", vp.minScale);
            vp.maxScale = v.value("maxScale", vp.maxScale);
            vp.defaultScale = v.value("defaultScale", vp.defaultScale);
            vp.maxPanDistance = v.value("maxPanDistance", vp.maxPanDistance);
            vp.panMargin = v.value("panMargin", vp.panMargin);
            if (v.contains("defaultViewBox")) {
                const auto& vb = v["defaultViewBox"];
                vp.defaultViewBox.x = vb.value("x", vp.defaultViewBox.x);
                vp.defaultViewBox.y = vb.value("y", vp.defaultViewBox.y);
                vp.defaultViewBox.width = vb.value("width", vp.defaultViewBox.width);
                vp.defaultViewBox.height = vb.value("height", vp.defaultViewBox.height);
            }
            vp.minViewBoxWidth = v.value("minViewBoxWidth", vp.minViewBoxWidth);
            vp.minViewBoxHeight = v.value("minViewBoxHeight", vp.minViewBoxHeight);
            vp.zoomStep = v.value("zoomStep", vp.zoomStep);
            vp.minZoomChange = v.value("minZoomChange", vp.minZoomChange);
            vp.wheelSensitivity = v.value("wheelSensitivity", vp.wheelSensitivity);
            vp.fitPadding = v.value("fitPadding", vp.fitPadding);
            vp.nodeRadius = v.value("nodeRadius", vp.nodeRadius);
            vp.visibilityMargin = v.value("visibilityMargin", vp.visibilityMargin);
        }

        if (j.contains("connection")) {
            const auto& c = j["connection"];
            auto& conn = parsed.connection;
            conn.snapDistance = c.value("snapDistance", conn.snapDistance);
            conn.allowSelfConnection = c.value("allowSelfConnection", conn.allowSelfConnection);
            conn.allowMultipleEdges = c.value("allowMultipleEdges", conn.allowMultipleEdges);
            if (c.contains("defaultEdgeType")) {
                std::string name = c["defaultEdgeType"].get<std::string>();
                if (auto type = parseEdgeType(name)) {
                    conn.defaultEdgeType = *type;
                } else {
                    LOG_WARN("unknown edge type '{}', keeping {}", name, edgeTypeName(conn.defaultEdgeType));
                }
            }
            if (c.contains("defaultStyle")) {
                const auto& s = c["defaultStyle"];
                auto& style = conn.defaultStyle;
                style.stroke = s.value("stroke", style.stroke);
                style.strokeWidth = s.value("strokeWidth", style.strokeWidth);
                style.opacity = s.value("opacity", style.opacity);
                if (s.contains("dashArray")) style.dashArray = s["dashArray"].get<std::string>();
                if (s.contains("markerStart")) style.markerStart = s["markerStart"].get<std::string>();
                if (s.contains("markerEnd")) style.markerEnd = s["markerEnd"].get<std::string>();
            }
        }

        if (j.contains("path")) {
            const auto& p = j["path"];
            auto& path = parsed.path;
            path.curvature = p.value("curvature", path.curvature);
            path.maxBezierOffset = p.value("maxBezierOffset", path.maxBezierOffset);
            path.cornerRadius = p.value("cornerRadius", path.cornerRadius);
            path.obstacleMargin = p.value("obstacleMargin", path.obstacleMargin);
            path.tangentEpsilon = p.value("tangentEpsilon", path.tangentEpsilon);
            path.minNearestSamples = p.value("minNearestSamples", path.minNearestSamples);
        }

        if (j.contains("routing")) {
            const auto& r = j["routing"];
            auto& routing = parsed.routing;
            if (r.contains("algorithm")) {
                routing.algorithm = stringToRoutingAlgorithm(r["algorithm"].get<std::string>());
            }
            routing.avoidNodes = r.value("avoidNodes", routing.avoidNodes);
            routing.padding = r.value("padding", routing.padding);
            routing.smoothing = r.value("smoothing", routing.smoothing);
            routing.cornerRadius = r.value("cornerRadius", routing.cornerRadius);
            routing.maxBezierOffset = r.value("maxBezierOffset", routing.maxBezierOffset);
        }

        if (j.contains("persistence")) {
            const auto& p = j["persistence"];
            auto& persistence = parsed.persistence;
            persistence.batchWindowMs = p.value("batchWindowMs", persistence.batchWindowMs);
            persistence.zoomDebounceMs = p.value("zoomDebounceMs", persistence.zoomDebounceMs);
            persistence.historyLoadLimit = p.value("historyLoadLimit", persistence.historyLoadLimit);
        }

        if (j.contains("reducer")) {
            const auto& r = j["reducer"];
            parsed.reducer.cascadeNodeDeletion =
                r.value("cascadeNodeDeletion", parsed.reducer.cascadeNodeDeletion);
        }

        parsed.rerouteEdgesOnMove = j.value("rerouteEdgesOnMove", parsed.rerouteEdgesOnMove);

        options = parsed;
        return true;
    } catch (const json::exception& e) {
        LOG_WARN("invalid options JSON: {}", e.what());
        return false;
    }
}

bool ConfigSerializer::saveToFile(const CanvasOptions& options, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        LOG_ERROR("cannot open '{}' for writing", path);
        return false;
    }
    file << toJson(options);
    return file.good();
}

bool ConfigSerializer::loadFromFile(CanvasOptions& options, const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        LOG_ERROR("cannot open '{}' for reading", path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(options, buffer.str());
}

}  // namespace flowcanvas
