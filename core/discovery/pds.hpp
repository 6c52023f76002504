#pragma once

#include "graph/graph.hpp"

namespace pagoracle {

// ─── Possible-d-separating sets ───────────────────────────────
// PDS of y relative to x: every node w ∉ {x, y} joined to y by a path
// whose internal nodes are all colliders on the path and possible
// ancestors of y. x is never traversed. An empty set is a normal
// result.

class Pds {
public:
    /// Throws UnknownNode for unknown nodes and InvalidQuery if x == y.
    /// `max_path_length` caps the path length in edges (-1 = unbounded).
    static NodeSet compute(const MixedEdgeGraph& g, const NodeId& x, const NodeId& y,
                           int max_path_length = -1);

    /// As compute(), restricted to paths whose nodes other than y all lie
    /// in `pds_set` and that are uncovered. `pds_set` must not contain x
    /// or y (InvalidQuery).
    static NodeSet computeRestricted(const MixedEdgeGraph& g, const NodeId& x, const NodeId& y,
                                     const NodeSet& pds_set, int max_path_length = -1);

private:
    static void validate(const MixedEdgeGraph& g, const NodeId& x, const NodeId& y);
};

} // namespace pagoracle
