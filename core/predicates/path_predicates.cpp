#include "predicates/path_predicates.hpp"
#include "reachability/ancestral_reachability.hpp"

namespace pagoracle {

void PathPredicates::requireTriple(const MixedEdgeGraph& g,
                                   const NodeId& a, const NodeId& b, const NodeId& c) {
    g.requireNode(a);
    g.requireNode(b);
    g.requireNode(c);
    if (a == c) {
        throw InvalidQuery("Triple endpoints must differ: " + a);
    }
    if (!g.adjacent(a, b) || !g.adjacent(b, c)) {
        throw InvalidQuery("Triple (" + a + ", " + b + ", " + c + ") is missing an edge");
    }
}

bool PathPredicates::isCollider(const MixedEdgeGraph& g,
                                const NodeId& a, const NodeId& b, const NodeId& c) {
    requireTriple(g, a, b, c);
    return g.markAt(a, b) == EndpointMark::Arrow &&
           g.markAt(c, b) == EndpointMark::Arrow;
}

bool PathPredicates::isDefiniteNonCollider(const MixedEdgeGraph& g,
                                           const NodeId& a, const NodeId& b, const NodeId& c) {
    requireTriple(g, a, b, c);
    return g.markAt(a, b) == EndpointMark::Tail ||
           g.markAt(c, b) == EndpointMark::Tail;
}

bool PathPredicates::isPossiblyDirected(const MixedEdgeGraph& g,
                                        const NodeId& u, const NodeId& v) {
    g.requireNode(u);
    g.requireNode(v);
    const Incidence* inc = g.incidence(u, v);
    return inc && isPossiblyDirected(*inc);
}

bool PathPredicates::isPossiblyDirected(const Incidence& from_u) {
    return from_u.mark_here != EndpointMark::Arrow &&
           (from_u.mark_there == EndpointMark::Arrow ||
            from_u.mark_there == EndpointMark::Circle);
}

bool PathPredicates::isCoveredTriple(const MixedEdgeGraph& g,
                                     const NodeId& a, const NodeId& b, const NodeId& c) {
    requireTriple(g, a, b, c);
    const Incidence* ac = g.incidence(a, c);
    if (!ac) return false;

    const Incidence* ab = g.incidence(a, b);
    const Incidence* cb = g.incidence(c, b);
    return ab->mark_here == ac->mark_here &&
           cb->mark_here == ac->mark_there;
}

bool PathPredicates::isUncoveredPath(const MixedEdgeGraph& g, const Path& path) {
    for (size_t i = 0; i + 2 < path.nodes.size(); ++i) {
        if (isCoveredTriple(g, path.nodes[i], path.nodes[i + 1], path.nodes[i + 2])) {
            return false;
        }
    }
    return true;
}

bool PathPredicates::isPossiblyDirectedPath(const MixedEdgeGraph& g, const Path& path) {
    for (size_t i = 0; i + 1 < path.nodes.size(); ++i) {
        if (!isPossiblyDirected(g, path.nodes[i], path.nodes[i + 1])) return false;
    }
    return true;
}

bool PathPredicates::isOpenPath(const MixedEdgeGraph& g, const Path& path, const NodeSet& z) {
    if (path.empty()) {
        throw InvalidQuery("Empty path");
    }
    for (const auto& id : path.nodes) {
        g.requireNode(id);
    }
    g.requireNodes(z);

    for (size_t i = 1; i + 1 < path.nodes.size(); ++i) {
        const NodeId& node = path.nodes[i];
        bool conditioned = z.count(node) > 0;

        if (!path.colliderAt(i)) {
            if (conditioned) return false;
            continue;
        }
        if (conditioned) continue;

        bool activated = false;
        for (const auto& d : AncestralReachability::possibleDescendants(g, node)) {
            if (z.count(d)) {
                activated = true;
                break;
            }
        }
        if (!activated) return false;
    }
    return true;
}

} // namespace pagoracle
