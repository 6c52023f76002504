#include "reachability/ancestral_reachability.hpp"
#include "predicates/path_predicates.hpp"
#include "common/logging.hpp"

#include <deque>

namespace pagoracle {

NodeSet AncestralReachability::reach(const MixedEdgeGraph& g, const NodeSet& sources,
                                     bool forward, bool through_undirected,
                                     const NodeSet& closed) {
    g.requireNodes(sources);

    NodeSet visited(sources.begin(), sources.end());
    std::deque<NodeId> frontier(sources.begin(), sources.end());

    while (!frontier.empty()) {
        NodeId current = frontier.front();
        frontier.pop_front();

        for (const auto& inc : g.neighbors(current)) {
            if (visited.count(inc.neighbor)) continue;

            // Forward: current → neighbor. Backward: neighbor → current,
            // i.e. the same incidence seen from the neighbor.
            bool follows = forward
                ? PathPredicates::isPossiblyDirected(inc)
                : PathPredicates::isPossiblyDirected(
                      Incidence{current, inc.kind, inc.mark_there, inc.mark_here});
            if (through_undirected && inc.kind == EdgeKind::Undirected &&
                !closed.count(current)) {
                follows = true;
            }
            if (!follows) continue;

            visited.insert(inc.neighbor);
            frontier.push_back(inc.neighbor);
        }
    }

    logging::get_logger()->trace("possible {} of {} node(s): {} node(s)",
                                 forward ? "descendants" : (through_undirected ? "anteriors" : "ancestors"),
                                 sources.size(), visited.size());
    return visited;
}

NodeSet AncestralReachability::possibleAncestors(const MixedEdgeGraph& g, const NodeId& v) {
    return reach(g, NodeSet{v}, false);
}

NodeSet AncestralReachability::possibleDescendants(const MixedEdgeGraph& g, const NodeId& v) {
    return reach(g, NodeSet{v}, true);
}

NodeSet AncestralReachability::possibleAncestors(const MixedEdgeGraph& g, const NodeSet& sources) {
    return reach(g, sources, false);
}

NodeSet AncestralReachability::possibleDescendants(const MixedEdgeGraph& g, const NodeSet& sources) {
    return reach(g, sources, true);
}

NodeSet AncestralReachability::possibleAnteriors(const MixedEdgeGraph& g, const NodeSet& sources,
                                                 const NodeSet& closed) {
    g.requireNodes(closed);
    return reach(g, sources, false, true, closed);
}

bool AncestralReachability::isPossibleAncestor(const MixedEdgeGraph& g,
                                               const NodeId& w, const NodeId& v) {
    g.requireNode(w);
    return possibleAncestors(g, v).count(w) > 0;
}

} // namespace pagoracle
