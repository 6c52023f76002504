#include "separation/moralization.hpp"
#include "common/logging.hpp"

#include <deque>

namespace pagoracle {

UndirectedAdjacency Moralization::augment(const MixedEdgeGraph& g, const NodeSet& nodes) {
    MixedEdgeGraph sub = g.extractSubgraph(nodes);

    UndirectedAdjacency moral;
    for (const auto& id : sub.nodeIds()) {
        moral[id];
    }

    size_t added = 0;
    for (const auto& source : sub.nodeIds()) {
        // Nodes entered from `source` with an arrowhead at the node, i.e.
        // nodes that may act as colliders on a path leaving `source`.
        NodeSet collider_ready;
        std::deque<NodeId> frontier;

        for (const auto& inc : sub.neighbors(source)) {
            moral[source].insert(inc.neighbor);
            if (inc.mark_there == EndpointMark::Arrow && !collider_ready.count(inc.neighbor)) {
                collider_ready.insert(inc.neighbor);
                frontier.push_back(inc.neighbor);
            }
        }

        while (!frontier.empty()) {
            NodeId middle = frontier.front();
            frontier.pop_front();

            for (const auto& inc : sub.neighbors(middle)) {
                if (inc.neighbor == source) continue;
                if (inc.mark_here != EndpointMark::Arrow) continue;

                if (moral[source].insert(inc.neighbor).second) {
                    moral[inc.neighbor].insert(source);
                    added++;
                }
                if (inc.mark_there == EndpointMark::Arrow && !collider_ready.count(inc.neighbor)) {
                    collider_ready.insert(inc.neighbor);
                    frontier.push_back(inc.neighbor);
                }
            }
        }
    }

    logging::get_logger()->trace("moralized {} node(s), {} augmenting link(s)",
                                 moral.size(), added);
    return moral;
}

NodeSet Moralization::reachable(const UndirectedAdjacency& adjacency,
                                const NodeSet& sources, const NodeSet& blocked) {
    NodeSet visited;
    std::deque<NodeId> frontier;
    for (const auto& s : sources) {
        if (blocked.count(s) || !adjacency.count(s)) continue;
        visited.insert(s);
        frontier.push_back(s);
    }

    while (!frontier.empty()) {
        NodeId current = frontier.front();
        frontier.pop_front();
        for (const auto& n : adjacency.at(current)) {
            if (blocked.count(n) || visited.count(n)) continue;
            visited.insert(n);
            frontier.push_back(n);
        }
    }
    return visited;
}

} // namespace pagoracle
