#pragma once

#include "flowcanvas/canvas/CanvasReducer.h"
#include "flowcanvas/geometry/EdgeRouting.h"
#include "flowcanvas/geometry/PathGeometry.h"
#include "flowcanvas/interaction/ConnectionManager.h"
#include "flowcanvas/viewport/ViewportTransform.h"

#include <chrono>

namespace flowcanvas {

/// Timing of best-effort persistence
struct PersistenceConfig {
    int batchWindowMs = 500;        ///< Batch window for medium/low priority events
    int zoomDebounceMs = 50;        ///< Quiet period before a wheel zoom is committed
    int historyLoadLimit = 100;     ///< Maximum events replayed by loadFromStore

    std::chrono::milliseconds batchWindow() const { return std::chrono::milliseconds(batchWindowMs); }
    std::chrono::milliseconds zoomDebounce() const { return std::chrono::milliseconds(zoomDebounceMs); }
};

/// Complete configuration of a canvas session
///
/// The controller derives reducer.allowSelfConnection from
/// connection.allowSelfConnection and reducer.path from path, so edge
/// creation and the event fold always agree.
struct CanvasOptions {
    ViewportConfig viewport;
    ConnectionConfig connection;
    PathOptions path;
    RoutingOptions routing;
    PersistenceConfig persistence;
    ReducerOptions reducer;

    /// Append obstacle-aware UPDATE_EDGE_PATH events after settled node moves
    bool rerouteEdgesOnMove = false;
};

}  // namespace flowcanvas
