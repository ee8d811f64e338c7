#pragma once

#include "flowcanvas/canvas/CanvasEvent.h"
#include "flowcanvas/canvas/EventLog.h"
#include "flowcanvas/config/CanvasOptions.h"
#include "flowcanvas/interaction/AnchorRegistry.h"
#include "flowcanvas/interaction/ConnectionManager.h"
#include "flowcanvas/persistence/EventBatcher.h"
#include "flowcanvas/persistence/IEventStore.h"
#include "flowcanvas/persistence/ZoomDebouncer.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace flowcanvas {

// =========================================================================
// Intents
// =========================================================================

/// Place a node. An empty id is replaced by a generated one.
struct AddNodeIntent {
    NodeId nodeId;
    NodeType nodeType = NodeType::Document;
    Point position;
    std::optional<std::string> title;
};

struct MoveNodeIntent {
    NodeId nodeId;
    Point position;
    bool isDragging = false;
};

struct DeleteNodeIntent {
    NodeId nodeId;
};

/// elementId == nullopt clears the selection
struct SelectIntent {
    std::optional<std::string> elementId;
    ElementType elementType = ElementType::Node;
};

/// Pan by a world-space delta
struct PanIntent {
    float deltaX = 0.0f;
    float deltaY = 0.0f;
};

/// Zoom to a target scale about a world point (viewBox centre when unset)
struct ZoomIntent {
    float targetScale = limits::DEFAULT_SCALE;
    std::optional<Point> focal;
};

/// One zoom step in or out about the viewBox centre
struct ZoomStepIntent {
    bool zoomIn = true;
};

/// Return to the default viewBox and scale
struct ResetViewIntent {
    ResetType resetType = ResetType::Button;
};

/// Frame all nodes (recorded as an automatic view reset)
struct FitToContentIntent {};

/// Center the view on a node unless it is already comfortably visible
struct PanToNodeIntent {
    NodeId nodeId;
};

struct DeleteEdgeIntent {
    EdgeId edgeId;
};

/// Replace an edge path by hand
struct EditEdgePathIntent {
    EdgeId edgeId;
    EdgePath path;
};

using CanvasIntent = std::variant<
    AddNodeIntent,
    MoveNodeIntent,
    DeleteNodeIntent,
    SelectIntent,
    PanIntent,
    ZoomIntent,
    ZoomStepIntent,
    ResetViewIntent,
    FitToContentIntent,
    PanToNodeIntent,
    DeleteEdgeIntent,
    EditEdgePathIntent>;

/// Owned state container of one canvas session
///
/// Translates intents into events, appends them to the event log, derives
/// the canvas state and notifies subscribers. Every event is checked
/// against the reducer before it is appended, so the log only ever
/// records events that apply. Persistence is optimistic: events go to the
/// event store through a batcher, and a store failure only raises
/// persistenceError() while local state stays authoritative.
///
/// Usage:
/// @code
/// CanvasController canvas;
/// canvas.dispatch(AddNodeIntent{"n1", NodeType::Document, {0, 0}});
/// canvas.dispatch(AddNodeIntent{"n2", NodeType::Agent, {300, 0}});
/// canvas.beginEdgeCreation("n1", "right");
/// canvas.updateEdgeCreation({265, 0});
/// canvas.commitEdgeCreation();
/// canvas.undo();
/// @endcode
class CanvasController {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Listener = std::function<void(const CanvasState&)>;
    using SubscriptionId = size_t;

    /// Outcome of dispatch()
    struct DispatchResult {
        bool success = false;
        std::string reason;                 ///< Rejection reason, or why nothing was recorded
        std::optional<CanvasEvent> event;   ///< Recorded event (nullopt when nothing changed)
    };

    /// Outcome of tick()
    struct TickResult {
        bool zoomCommitted = false;
        size_t persisted = 0;
    };

    /// @param registry Anchor source; a default AnchorRegistry when null
    /// @param store Event store; persistence is disabled when null
    explicit CanvasController(CanvasOptions options = {},
                              std::shared_ptr<const INodeAnchorRegistry> registry = nullptr,
                              std::shared_ptr<IEventStore> store = nullptr);

    // =========================================================================
    // Dispatch
    // =========================================================================

    DispatchResult dispatch(const CanvasIntent& intent);
    DispatchResult dispatch(const CanvasIntent& intent, TimePoint now);

    /// Validate and append a prebuilt event
    DispatchResult appendEvent(CanvasEvent event, TimePoint now);

    // =========================================================================
    // State and history
    // =========================================================================

    const CanvasState& getState() const { return state_; }
    const EventLog& history() const { return log_; }

    EventLog::MoveResult undo();
    EventLog::MoveResult redo();
    bool canUndo() const { return log_.canUndo(); }
    bool canRedo() const { return log_.canRedo(); }

    /// Register a listener called with the new state after every change
    SubscriptionId subscribe(Listener listener);

    /// @return true if the subscription existed
    bool unsubscribe(SubscriptionId id);

    // =========================================================================
    // Edge creation
    // =========================================================================

    ConnectionManager::BeginResult beginEdgeCreation(const NodeId& nodeId, const AnchorId& anchorId);
    ConnectionManager::UpdateResult updateEdgeCreation(const Point& pointerWorld);

    /// Commit the session as a CREATE_EDGE event with a generated edge id
    DispatchResult commitEdgeCreation();
    DispatchResult commitEdgeCreation(TimePoint now);

    bool cancelEdgeCreation() { return connections_.cancel(); }
    bool handleCanvasClick() { return connections_.handleCanvasClick(); }
    bool handleEscape() { return connections_.handleEscape(); }
    bool isCreatingEdge() const { return connections_.isCreating(); }

    const ConnectionManager& connections() const { return connections_; }

    // =========================================================================
    // Debounced zoom and timers
    // =========================================================================

    /// Record wheel-zoom input; committed by tick() once input settles
    void wheelZoom(float targetScale, const Point& focal, TimePoint now);

    /// View the pending wheel zoom would produce, for live rendering
    std::optional<ViewState> pendingZoomView() const;

    /// Commit a settled zoom and flush due persistence batches
    TickResult tick(TimePoint now);

    /// Persist everything buffered immediately
    bool flushPersistence(TimePoint now);

    // =========================================================================
    // Persistence
    // =========================================================================

    /// Replace the local history with the persisted one
    /// @return false when no store is configured or it is unavailable;
    ///         local state is kept in that case
    bool loadFromStore();

    /// Last persistence failure, cleared by the next successful write
    const std::optional<std::string>& persistenceError() const { return persistenceError_; }

    size_t pendingPersistenceCount() const { return batcher_ ? batcher_->pendingCount() : 0; }

    // =========================================================================
    // Rendering helpers
    // =========================================================================

    /// Draw string of an edge path, rounded with the configured corner radius
    std::optional<std::string> edgeDrawString(const EdgeId& edgeId) const;

    /// Unit tangent of an edge path at ratio, used to orient arrowheads
    std::optional<Point> edgeTangentAt(const EdgeId& edgeId, float ratio) const;

    /// Closest sampled point of an edge path to a world point
    std::optional<ClosestPathPoint> closestPointOnEdge(const EdgeId& edgeId,
                                                                 const Point& point) const;

    // =========================================================================
    // Configuration
    // =========================================================================

    const CanvasOptions& options() const { return options_; }
    const INodeAnchorRegistry& anchorRegistry() const { return *registry_; }

    void setUserId(std::optional<std::string> userId) { userId_ = std::move(userId); }

private:
    struct IntentTranslator;

    DispatchResult record(CanvasEvent event, TimePoint now);
    void persist(const CanvasEvent& event, TimePoint now);
    void handleFlush(const EventBatcher::FlushResult& result);
    void rerouteAttachedEdges(const NodeId& nodeId, TimePoint now);
    void refreshState();
    void notify();

    NodeId nextNodeId();
    EdgeId nextEdgeId();

    CanvasOptions options_;
    std::shared_ptr<const INodeAnchorRegistry> registry_;
    std::shared_ptr<IEventStore> store_;

    EventLog log_;
    CanvasState state_;
    ConnectionManager connections_;
    ZoomDebouncer zoomDebouncer_;
    std::unique_ptr<EventBatcher> batcher_;

    std::map<SubscriptionId, Listener> listeners_;
    SubscriptionId nextSubscriptionId_ = 1;

    std::optional<std::string> userId_;
    std::optional<std::string> persistenceError_;
    uint64_t nextSequence_ = 1;
    size_t nodeCounter_ = 0;
    size_t edgeCounter_ = 0;
};

}  // namespace flowcanvas
