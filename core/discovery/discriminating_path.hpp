#pragma once

#include "graph/graph.hpp"
#include "graph/path.hpp"

#include <optional>

namespace pagoracle {

// ─── DiscriminatingPathSearch ─────────────────────────────────
// Finds a discriminating path for the triple a *-* b *-* c, where b
// is the node whose collider status is in question and c is the far
// endpoint. The path p = ⟨v, …, a, b, c⟩ satisfies:
//   - p has at least three edges
//   - v and c are not adjacent
//   - every node strictly between v and b is a collider on p and a
//     possible parent of c (w *-* c possibly directed into c)
//   - p is uncovered
//
// The search is breadth-first outward from a, away from b, over whole
// partial paths (a node may recur across paths but never within one),
// with neighbors in ascending order; it returns the shortest path,
// earliest in that order. No path is a normal result.

class DiscriminatingPathSearch {
public:
    /// Throws UnknownNode for unknown nodes, and InvalidQuery unless a, b,
    /// c are distinct with a *-* b and b *-* c. `max_path_length` caps the
    /// number of edges of p (-1 = unbounded).
    static std::optional<Path> find(const MixedEdgeGraph& g,
                                    const NodeId& a, const NodeId& b, const NodeId& c,
                                    int max_path_length = -1);

    /// Re-checks every defining condition on an existing path ending in c.
    static bool isDiscriminatingPath(const MixedEdgeGraph& g, const Path& path);
};

} // namespace pagoracle
