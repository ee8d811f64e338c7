#pragma once

#include "flowcanvas/canvas/CanvasEvent.h"
#include "flowcanvas/canvas/CanvasTypes.h"
#include "flowcanvas/geometry/PathGeometry.h"

#include <string>
#include <vector>

namespace flowcanvas {

/// Behaviour switches for the transition function
struct ReducerOptions {
    /// Accept CREATE_EDGE whose source and target are the same node
    bool allowSelfConnection = false;

    /// Remove edges attached to a node when the node is deleted.
    /// When false they are kept and filtered with connectedEdges().
    bool cascadeNodeDeletion = false;

    /// Parameters used when the reducer computes edge paths
    PathOptions path;
};

/// Outcome of applying a single event
struct ApplyResult {
    bool applied = false;
    std::string reason;     ///< Why the event was rejected (empty when applied)
};

/// Pure transition function from events to CanvasState
///
/// Malformed events (missing ids, non-finite coordinates, references to
/// unknown nodes or edges, duplicate ids, disallowed self-connections)
/// leave the state untouched. During a fold they are skipped with a
/// warning so replay survives partial corruption.
class CanvasReducer {
public:
    CanvasReducer() = default;
    explicit CanvasReducer(ReducerOptions options);

    /// Fixed initial state every fold starts from
    static CanvasState initialState();

    /// Apply one event to a state in place
    /// @return applied=false with a reason when the event is malformed
    ApplyResult step(CanvasState& state, const CanvasEvent& event) const;

    /// (state, event) -> state'
    CanvasState apply(const CanvasState& state, const CanvasEvent& event) const;

    /// Fold events[0..lastIndex] from the initial state
    /// @param lastIndex Inclusive index, -1 yields the initial state
    CanvasState fold(const std::vector<CanvasEvent>& events, int lastIndex) const;

    /// Fold every event
    CanvasState fold(const std::vector<CanvasEvent>& events) const;

    const ReducerOptions& options() const { return options_; }

private:
    ReducerOptions options_;
};

}  // namespace flowcanvas
