#pragma once

#include "graph/graph.hpp"

#include <map>

namespace pagoracle {

/// Undirected adjacency: node → neighbors.
using UndirectedAdjacency = std::map<NodeId, NodeSet>;

// ─── Moralization ─────────────────────────────────────────────
// Augmented (moral) graph of a node-induced sub-graph. Two nodes are
// joined iff they are collider-connected inside the sub-graph: some
// path between them has an arrowhead on both sides of every internal
// node. This joins parents of a common child, the two ends of a
// bidirected chain, and their parents. Undirected edges never form
// colliders, so they only contribute their own adjacency.

class Moralization {
public:
    /// Augmented graph over `nodes` (restricted to nodes of g).
    static UndirectedAdjacency augment(const MixedEdgeGraph& g, const NodeSet& nodes);

    /// Nodes reachable from `sources` in `adjacency` without entering `blocked`.
    static NodeSet reachable(const UndirectedAdjacency& adjacency,
                             const NodeSet& sources, const NodeSet& blocked);
};

} // namespace pagoracle
