#pragma once

#include "graph/graph.hpp"
#include "graph/path.hpp"

namespace pagoracle {

// ─── PathPredicates ────────────────────────────────────────────
// Stateless tests over a graph and a triple or path. Triple tests
// require the edges a *-* b and b *-* c to exist (InvalidQuery
// otherwise); unknown nodes raise UnknownNode.

class PathPredicates {
public:
    /// Both marks at b (on b–a and b–c) are arrowheads: a *→ b ←* c.
    static bool isCollider(const MixedEdgeGraph& g,
                           const NodeId& a, const NodeId& b, const NodeId& c);

    /// At least one mark at b is a tail.
    static bool isDefiniteNonCollider(const MixedEdgeGraph& g,
                                      const NodeId& a, const NodeId& b, const NodeId& c);

    /// The edge u *-* v is compatible with u → v: mark at v is an arrowhead
    /// or circle and mark at u is not an arrowhead. False if not adjacent.
    static bool isPossiblyDirected(const MixedEdgeGraph& g, const NodeId& u, const NodeId& v);

    /// Same test on an incidence seen from u.
    static bool isPossiblyDirected(const Incidence& from_u);

    /// a and c are adjacent and carry the same marks as the path edges:
    /// mark at a on a–b equals mark at a on a–c, and mark at c on c–b
    /// equals mark at c on c–a.
    static bool isCoveredTriple(const MixedEdgeGraph& g,
                                const NodeId& a, const NodeId& b, const NodeId& c);

    /// No three consecutive nodes of the path form a covered triple.
    static bool isUncoveredPath(const MixedEdgeGraph& g, const Path& path);

    /// Every step of the path is possibly directed from its first node
    /// towards its last.
    static bool isPossiblyDirectedPath(const MixedEdgeGraph& g, const Path& path);

    /// m-connection test. The path is blocked by Z iff a non-collider on it
    /// is in Z, or a collider on it is outside Z and has no possible
    /// descendant in Z. Returns true iff the path is open (not blocked).
    static bool isOpenPath(const MixedEdgeGraph& g, const Path& path, const NodeSet& z);

private:
    static void requireTriple(const MixedEdgeGraph& g,
                              const NodeId& a, const NodeId& b, const NodeId& c);
};

} // namespace pagoracle
