#include "discovery/uncovered_path.hpp"
#include "predicates/path_predicates.hpp"
#include "common/logging.hpp"

#include <deque>
#include <map>
#include <vector>

namespace pagoracle {

std::optional<Path> UncoveredPathSearch::possiblyDirected(const MixedEdgeGraph& g,
                                                          const NodeId& u, const NodeId& c,
                                                          const NodeSet& excluded,
                                                          int max_path_length) {
    g.requireNode(u);
    g.requireNode(c);
    g.requireNodes(excluded);
    if (u == c) {
        throw InvalidQuery("Path endpoints must differ: " + u);
    }
    if (excluded.count(u) || excluded.count(c)) {
        throw InvalidQuery("Excluded nodes must not contain the endpoints");
    }
    logging::get_logger()->debug("uncovered possibly-directed path {} -> {}", u, c);

    std::map<NodeId, NodeId> predecessor;
    std::map<NodeId, int> depth;
    NodeSet visited{u};
    std::deque<NodeId> frontier{u};
    depth[u] = 0;

    while (!frontier.empty()) {
        NodeId current = frontier.front();
        frontier.pop_front();
        if (max_path_length >= 0 && depth.at(current) >= max_path_length) continue;

        for (const auto& inc : g.neighbors(current)) {
            const NodeId& next = inc.neighbor;
            if (visited.count(next) || excluded.count(next)) continue;
            if (!PathPredicates::isPossiblyDirected(inc)) continue;

            // A covered step p → current → next implies p → next, so next
            // is reached no later than through current. One visit per node suffices.
            auto before = predecessor.find(current);
            if (before != predecessor.end() &&
                PathPredicates::isCoveredTriple(g, before->second, current, next)) {
                continue;
            }

            predecessor[next] = current;
            depth[next] = depth.at(current) + 1;

            if (next == c) {
                std::vector<NodeId> nodes{c};
                NodeId walk = c;
                while (walk != u) {
                    walk = predecessor.at(walk);
                    nodes.push_back(walk);
                }
                Path path = Path::fromNodes(g, std::vector<NodeId>(nodes.rbegin(), nodes.rend()));
                logging::get_logger()->trace("uncovered path found: {}", path.toString());
                return path;
            }

            visited.insert(next);
            frontier.push_back(next);
        }
    }
    return std::nullopt;
}

} // namespace pagoracle
