#pragma once

#include "graph/graph.hpp"

namespace pagoracle {

// ─── AncestralReachability ────────────────────────────────────
// Possible ancestors/descendants under partial orientation: nodes
// reachable along edges that are possibly directed in the required
// direction. Results always contain the sources themselves.

class AncestralReachability {
public:
    static NodeSet possibleAncestors(const MixedEdgeGraph& g, const NodeId& v);
    static NodeSet possibleDescendants(const MixedEdgeGraph& g, const NodeId& v);

    /// Union over every node of `sources`.
    static NodeSet possibleAncestors(const MixedEdgeGraph& g, const NodeSet& sources);
    static NodeSet possibleDescendants(const MixedEdgeGraph& g, const NodeSet& sources);

    /// Possible ancestors, additionally closed under undirected edges
    /// (u − v makes each end anterior to the other). Nodes in `closed`
    /// still take part but are never left through an undirected edge.
    static NodeSet possibleAnteriors(const MixedEdgeGraph& g, const NodeSet& sources,
                                     const NodeSet& closed = {});

    /// w ∈ possibleAncestors(g, v)
    static bool isPossibleAncestor(const MixedEdgeGraph& g, const NodeId& w, const NodeId& v);

private:
    static NodeSet reach(const MixedEdgeGraph& g, const NodeSet& sources,
                         bool forward, bool through_undirected = false,
                         const NodeSet& closed = {});
};

} // namespace pagoracle
