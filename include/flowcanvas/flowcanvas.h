#pragma once

/// @file flowcanvas.h
/// @brief Main header for the flowcanvas canvas engine
///
/// flowcanvas is the event-sourced state engine of a node/edge workflow
/// canvas: an undoable event log folded into canvas state, edge path
/// geometry, anchor snapping for edge creation and viewport math.
///
/// Example usage:
/// @code
/// #include <flowcanvas/flowcanvas.h>
///
/// flowcanvas::CanvasController canvas;
/// canvas.dispatch(flowcanvas::AddNodeIntent{"n1", flowcanvas::NodeType::Document, {0, 0}});
/// canvas.dispatch(flowcanvas::AddNodeIntent{"n2", flowcanvas::NodeType::Agent, {300, 0}});
///
/// canvas.beginEdgeCreation("n1", "right");
/// canvas.updateEdgeCreation({265, 0});
/// canvas.commitEdgeCreation();
///
/// auto d = canvas.edgeDrawString("edge-1");
/// @endcode

#include <string>

// Core module - Geometry primitives
#include "core/Types.h"
#include "core/GeometryUtils.h"

// Geometry module - Edge paths and routing
#include "geometry/EdgePath.h"
#include "geometry/PathGeometry.h"
#include "geometry/EdgeRouting.h"

// Canvas module - Events, state and history
#include "canvas/CanvasTypes.h"
#include "canvas/CanvasEvent.h"
#include "canvas/CanvasReducer.h"
#include "canvas/EventLog.h"

// Interaction and viewport
#include "interaction/AnchorRegistry.h"
#include "interaction/ConnectionManager.h"
#include "viewport/ViewportTransform.h"

// Persistence and configuration
#include "persistence/IEventStore.h"
#include "persistence/InMemoryEventStore.h"
#include "persistence/EventBatcher.h"
#include "persistence/ZoomDebouncer.h"
#include "persistence/EventSerializer.h"
#include "config/CanvasOptions.h"
#include "config/ConfigSerializer.h"

// Session
#include "session/CanvasController.h"

namespace flowcanvas {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace flowcanvas
