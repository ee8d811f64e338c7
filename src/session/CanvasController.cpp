#include "flowcanvas/session/CanvasController.h"
#include "flowcanvas/common/Logger.h"
#include "flowcanvas/geometry/EdgeRouting.h"
#include "flowcanvas/geometry/PathGeometry.h"
#include "flowcanvas/viewport/ViewportTransform.h"

#include <vector>

namespace flowcanvas {

namespace {

ReducerOptions reducerOptionsFor(const CanvasOptions& options) {
    ReducerOptions reducer = options.reducer;
    reducer.allowSelfConnection = options.connection.allowSelfConnection;
    reducer.path = options.path;
    return reducer;
}

ConnectionConfig connectionConfigFor(const CanvasOptions& options) {
    ConnectionConfig config = options.connection;
    config.preview = options.path;
    return config;
}

}  // namespace

// =========================================================================
// Intent translation
// =========================================================================

/// Turns an intent into an event payload against the current state
struct CanvasController::IntentTranslator {
    struct Translation {
        std::optional<EventPayload> payload;
        bool rejected = false;
        std::string reason;

        static Translation reject(std::string why) { return {std::nullopt, true, std::move(why)}; }
        static Translation unchanged(std::string why) { return {std::nullopt, false, std::move(why)}; }
    };

    CanvasController& controller;

    const CanvasState& state() const { return controller.state_; }
    const ViewportConfig& viewportConfig() const { return controller.options_.viewport; }
    ViewState view() const { return {state().viewBox, state().scale}; }

    Translation zoomTo(const ViewState& target, std::optional<Point> center) const {
        const ViewState current = view();
        if (!viewport::isSignificantZoomChange(current.scale, target.scale, viewportConfig())) {
            return Translation::unchanged("zoom change below threshold");
        }
        ZoomCanvasPayload zoom;
        zoom.fromZoom = current.scale;
        zoom.toZoom = target.scale;
        zoom.fromViewBox = current.viewBox;
        zoom.toViewBox = target.viewBox;
        zoom.zoomCenter = center;
        return {zoom};
    }

    Translation panTo(const ViewBox& target) const {
        const ViewBox& current = state().viewBox;
        if (target == current) {
            return Translation::unchanged("view already at pan limit");
        }
        PanCanvasPayload pan;
        pan.fromViewBox = current;
        pan.toViewBox = target;
        pan.deltaX = target.x - current.x;
        pan.deltaY = target.y - current.y;
        return {pan};
    }

    Translation operator()(const AddNodeIntent& intent) const {
        AddNodePayload add;
        add.nodeId = intent.nodeId.empty() ? controller.nextNodeId() : intent.nodeId;
        add.nodeType = intent.nodeType;
        add.position = intent.position;
        add.title = intent.title;
        return {add};
    }

    Translation operator()(const MoveNodeIntent& intent) const {
        const Node* node = state().findNode(intent.nodeId);
        if (!node) {
            return Translation::reject("unknown node '" + intent.nodeId + "'");
        }
        MoveNodePayload move;
        move.nodeId = intent.nodeId;
        move.fromPosition = node->position;
        move.toPosition = intent.position;
        move.isDragging = intent.isDragging;
        return {move};
    }

    Translation operator()(const DeleteNodeIntent& intent) const {
        const Node* node = state().findNode(intent.nodeId);
        if (!node) {
            return Translation::reject("unknown node '" + intent.nodeId + "'");
        }
        DeleteNodePayload del;
        del.nodeId = node->id;
        del.nodeType = node->type;
        del.position = node->position;
        del.title = node->title;
        return {del};
    }

    Translation operator()(const SelectIntent& intent) const {
        SelectElementPayload select;
        select.elementId = intent.elementId;
        select.elementType = intent.elementType;
        if (state().selectedNodeId) {
            select.previousSelection = state().selectedNodeId;
        } else if (state().selectedEdgeId) {
            select.previousSelection = state().selectedEdgeId;
        }
        return {select};
    }

    Translation operator()(const PanIntent& intent) const {
        return panTo(viewport::panBy(state().viewBox, intent.deltaX, intent.deltaY, viewportConfig()));
    }

    Translation operator()(const ZoomIntent& intent) const {
        Point focal = intent.focal.value_or(state().viewBox.center());
        ViewState target = viewport::zoomAroundPoint(view(), focal, intent.targetScale, viewportConfig());
        return zoomTo(target, focal);
    }

    Translation operator()(const ZoomStepIntent& intent) const {
        ViewState target = viewport::zoomStep(view(), intent.zoomIn, viewportConfig());
        return zoomTo(target, state().viewBox.center());
    }

    Translation operator()(const ResetViewIntent& intent) const {
        ResetViewPayload reset;
        reset.fromViewBox = state().viewBox;
        reset.fromZoom = state().scale;
        reset.toViewBox = viewportConfig().defaultViewBox;
        reset.toZoom = viewportConfig().defaultScale;
        reset.resetType = intent.resetType;
        return {reset};
    }

    Translation operator()(const FitToContentIntent&) const {
        std::vector<Point> positions;
        positions.reserve(state().nodes.size());
        for (const auto& [id, node] : state().nodes) {
            positions.push_back(node.position);
        }
        ViewState fitted = viewport::fitToContent(positions, view(), viewportConfig());

        ResetViewPayload reset;
        reset.fromViewBox = state().viewBox;
        reset.fromZoom = state().scale;
        reset.toViewBox = fitted.viewBox;
        reset.toZoom = fitted.scale;
        reset.resetType = ResetType::Auto;
        return {reset};
    }

    Translation operator()(const PanToNodeIntent& intent) const {
        const Node* node = state().findNode(intent.nodeId);
        if (!node) {
            return Translation::reject("unknown node '" + intent.nodeId + "'");
        }
        if (viewport::isPointVisible(node->position, state().viewBox, viewportConfig())) {
            return Translation::unchanged("node already visible");
        }
        return panTo(viewport::centerOn(state().viewBox, node->position, viewportConfig()));
    }

    Translation operator()(const DeleteEdgeIntent& intent) const {
        const Edge* edge = state().findEdge(intent.edgeId);
        if (!edge) {
            return Translation::reject("unknown edge '" + intent.edgeId + "'");
        }
        DeleteEdgePayload del;
        del.edgeId = edge->id;
        del.source = edge->source;
        del.target = edge->target;
        del.edgeType = edge->type;
        return {del};
    }

    Translation operator()(const EditEdgePathIntent& intent) const {
        const Edge* edge = state().findEdge(intent.edgeId);
        if (!edge) {
            return Translation::reject("unknown edge '" + intent.edgeId + "'");
        }
        UpdateEdgePathPayload update;
        update.edgeId = edge->id;
        update.oldPath = edge->path;
        update.newPath = intent.path;
        update.reason = PathUpdateReason::ManualEdit;
        return {update};
    }
};

// =========================================================================
// Construction
// =========================================================================

CanvasController::CanvasController(CanvasOptions options,
                                   std::shared_ptr<const INodeAnchorRegistry> registry,
                                   std::shared_ptr<IEventStore> store)
    : options_(std::move(options))
    , registry_(registry ? std::move(registry) : std::make_shared<AnchorRegistry>())
    , store_(std::move(store))
    , log_(CanvasReducer(reducerOptionsFor(options_)))
    , state_(CanvasReducer::initialState())
    , connections_(registry_, connectionConfigFor(options_))
    , zoomDebouncer_(options_.persistence.zoomDebounce()) {
    if (store_) {
        batcher_ = std::make_unique<EventBatcher>(store_, options_.persistence.batchWindow());
    }
}

// =========================================================================
// Dispatch
// =========================================================================

CanvasController::DispatchResult CanvasController::dispatch(const CanvasIntent& intent) {
    return dispatch(intent, Clock::now());
}

CanvasController::DispatchResult CanvasController::dispatch(const CanvasIntent& intent, TimePoint now) {
    auto translation = std::visit(IntentTranslator{*this}, intent);

    if (!translation.payload) {
        DispatchResult result;
        result.success = !translation.rejected;
        result.reason = translation.reason;
        if (translation.rejected) {
            LOG_DEBUG("[CanvasController] intent rejected: {}", translation.reason);
        }
        return result;
    }

    auto result = record(makeEvent(std::move(*translation.payload), currentTimeMillis(), userId_), now);

    if (result.success && options_.rerouteEdgesOnMove) {
        if (const auto* move = std::get_if<MoveNodeIntent>(&intent); move && !move->isDragging) {
            rerouteAttachedEdges(move->nodeId, now);
        }
    }
    return result;
}

CanvasController::DispatchResult CanvasController::appendEvent(CanvasEvent event, TimePoint now) {
    return record(std::move(event), now);
}

CanvasController::DispatchResult CanvasController::record(CanvasEvent event, TimePoint now) {
    DispatchResult result;

    // Check against a scratch copy so only applicable events enter the log
    CanvasState next = state_;
    ApplyResult applied = log_.reducer().step(next, event);
    if (!applied.applied) {
        LOG_DEBUG("[CanvasController] {} rejected: {}", eventKindName(event.kind()), applied.reason);
        result.reason = applied.reason;
        return result;
    }

    event.sequence = nextSequence_++;
    log_.append(event);
    state_ = std::move(next);

    notify();
    persist(event, now);

    result.success = true;
    result.event = std::move(event);
    return result;
}

void CanvasController::rerouteAttachedEdges(const NodeId& nodeId, TimePoint now) {
    if (!options_.routing.avoidNodes) {
        return;
    }

    std::vector<NodeBounds> bounds;
    bounds.reserve(state_.nodes.size());
    for (const auto& [id, node] : state_.nodes) {
        bounds.push_back(geometry::createNodeBounds(id, node.type, node.position));
    }

    for (const auto& edgeId : edgesAttachedTo(state_, nodeId)) {
        const Edge* edge = state_.findEdge(edgeId);
        if (!edge || edge->path.type() == EdgeType::Straight) {
            continue;
        }

        auto obstacles = geometry::createRoutingObstacles(
            bounds, {edge->source.nodeId, edge->target.nodeId}, options_.routing.padding);

        EdgePath routed = edge->path.type() == EdgeType::Bezier
            ? geometry::smartBezierPath(edge->source.position, edge->target.position, obstacles, options_.routing)
            : geometry::smartOrthogonalPath(edge->source.position, edge->target.position, obstacles, options_.routing);

        if (routed == edge->path) {
            continue;
        }

        UpdateEdgePathPayload update;
        update.edgeId = edgeId;
        update.oldPath = edge->path;
        update.newPath = std::move(routed);
        update.reason = PathUpdateReason::NodeMoved;
        record(makeEvent(std::move(update), currentTimeMillis(), userId_), now);
    }
}

// =========================================================================
// History
// =========================================================================

EventLog::MoveResult CanvasController::undo() {
    auto result = log_.undo();
    if (result.moved) {
        refreshState();
        notify();
    }
    return result;
}

EventLog::MoveResult CanvasController::redo() {
    auto result = log_.redo();
    if (result.moved) {
        refreshState();
        notify();
    }
    return result;
}

CanvasController::SubscriptionId CanvasController::subscribe(Listener listener) {
    SubscriptionId id = nextSubscriptionId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool CanvasController::unsubscribe(SubscriptionId id) {
    return listeners_.erase(id) > 0;
}

void CanvasController::refreshState() {
    state_ = log_.currentState();
}

void CanvasController::notify() {
    // Listeners may unsubscribe while being notified
    auto listeners = listeners_;
    for (const auto& [id, listener] : listeners) {
        if (listener) {
            listener(state_);
        }
    }
}

// =========================================================================
// Edge creation
// =========================================================================

ConnectionManager::BeginResult CanvasController::beginEdgeCreation(const NodeId& nodeId,
                                                                   const AnchorId& anchorId) {
    return connections_.begin(state_, nodeId, anchorId);
}

ConnectionManager::UpdateResult CanvasController::updateEdgeCreation(const Point& pointerWorld) {
    return connections_.update(state_, pointerWorld);
}

CanvasController::DispatchResult CanvasController::commitEdgeCreation() {
    return commitEdgeCreation(Clock::now());
}

CanvasController::DispatchResult CanvasController::commitEdgeCreation(TimePoint now) {
    auto commit = connections_.commit(state_, nextEdgeId());
    if (!commit.success || !commit.payload) {
        DispatchResult result;
        result.reason = commit.reason;
        return result;
    }
    return record(makeEvent(std::move(*commit.payload), currentTimeMillis(), userId_), now);
}

// =========================================================================
// Debounced zoom and timers
// =========================================================================

void CanvasController::wheelZoom(float targetScale, const Point& focal, TimePoint now) {
    zoomDebouncer_.push(targetScale, focal, now);
}

std::optional<ViewState> CanvasController::pendingZoomView() const {
    const auto& pending = zoomDebouncer_.pending();
    if (!pending) {
        return std::nullopt;
    }
    return viewport::zoomAroundPoint({state_.viewBox, state_.scale}, pending->focal,
                                     pending->targetScale, options_.viewport);
}

CanvasController::TickResult CanvasController::tick(TimePoint now) {
    TickResult result;

    if (auto request = zoomDebouncer_.poll(now)) {
        auto dispatched = dispatch(ZoomIntent{request->targetScale, request->focal}, now);
        result.zoomCommitted = dispatched.success && dispatched.event.has_value();
        if (result.zoomCommitted) {
            LOG_DEBUG("[CanvasController] committed debounced zoom to {}", request->targetScale);
        }
    }

    if (batcher_) {
        auto flushed = batcher_->tick(now);
        handleFlush(flushed);
        result.persisted = flushed.persisted.size();
    }
    return result;
}

bool CanvasController::flushPersistence(TimePoint now) {
    if (!batcher_) {
        return true;
    }
    auto flushed = batcher_->flush(now);
    handleFlush(flushed);
    return flushed.success;
}

// =========================================================================
// Persistence
// =========================================================================

void CanvasController::persist(const CanvasEvent& event, TimePoint now) {
    if (!batcher_) {
        return;
    }
    handleFlush(batcher_->enqueue(event, now));
}

void CanvasController::handleFlush(const EventBatcher::FlushResult& result) {
    if (!result.success) {
        persistenceError_ = result.reason;
    } else if (!result.persisted.empty()) {
        persistenceError_.reset();
    }
}

bool CanvasController::loadFromStore() {
    if (!store_) {
        LOG_DEBUG("[CanvasController] no event store configured");
        return false;
    }

    std::vector<CanvasEvent> events;
    try {
        EventFilter filter;
        if (options_.persistence.historyLoadLimit > 0) {
            filter.limit = static_cast<size_t>(options_.persistence.historyLoadLimit);
        }
        events = store_->list(filter);
    } catch (const PersistenceError& e) {
        LOG_WARN("[CanvasController] event store unavailable, continuing locally: {}", e.what());
        persistenceError_ = e.what();
        return false;
    }

    LOG_INFO("[CanvasController] loaded {} event(s) from store", events.size());
    for (const auto& event : events) {
        if (event.sequence && *event.sequence >= nextSequence_) {
            nextSequence_ = *event.sequence + 1;
        }
    }
    connections_.cancel();
    log_.replace(std::move(events));
    refreshState();
    notify();
    return true;
}

// =========================================================================
// Helpers
// =========================================================================

std::optional<std::string> CanvasController::edgeDrawString(const EdgeId& edgeId) const {
    const Edge* edge = state_.findEdge(edgeId);
    if (!edge) {
        return std::nullopt;
    }
    return geometry::pathToDrawString(edge->path, options_.path.cornerRadius);
}

std::optional<Point> CanvasController::edgeTangentAt(const EdgeId& edgeId, float ratio) const {
    const Edge* edge = state_.findEdge(edgeId);
    if (!edge) {
        return std::nullopt;
    }
    return geometry::tangentAtRatio(edge->path, ratio, options_.path.tangentEpsilon);
}

std::optional<ClosestPathPoint> CanvasController::closestPointOnEdge(
    const EdgeId& edgeId, const Point& point) const {
    const Edge* edge = state_.findEdge(edgeId);
    if (!edge) {
        return std::nullopt;
    }
    return geometry::closestPointOnPath(edge->path, point, options_.path.minNearestSamples);
}

NodeId CanvasController::nextNodeId() {
    NodeId id;
    do {
        id = "node-" + std::to_string(++nodeCounter_);
    } while (state_.nodes.count(id) > 0);
    return id;
}

EdgeId CanvasController::nextEdgeId() {
    EdgeId id;
    do {
        id = "edge-" + std::to_string(++edgeCounter_);
    } while (state_.edges.count(id) > 0);
    return id;
}

}  // namespace flowcanvas
