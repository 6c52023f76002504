#include "discovery/discriminating_path.hpp"
#include "predicates/path_predicates.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <deque>
#include <utility>
#include <vector>

namespace pagoracle {

namespace {

/// w sits between v and b: collider on the path and possible parent of c.
bool isInnerNode(const MixedEdgeGraph& g, const NodeId& w, const NodeId& c) {
    return PathPredicates::isPossiblyDirected(g, w, c);
}

} // namespace

std::optional<Path> DiscriminatingPathSearch::find(const MixedEdgeGraph& g,
                                                   const NodeId& a, const NodeId& b,
                                                   const NodeId& c, int max_path_length) {
    g.requireNode(a);
    g.requireNode(b);
    g.requireNode(c);
    if (a == b || b == c || a == c) {
        throw InvalidQuery("Discriminating path triple needs three distinct nodes");
    }
    if (!g.adjacent(a, b) || !g.adjacent(b, c)) {
        throw InvalidQuery("Triple (" + a + ", " + b + ", " + c + ") is missing an edge");
    }

    auto log = logging::get_logger();
    log->debug("discriminating path search for ({}, {}, {})", a, b, c);

    // a is the first inner node: arrowhead at a from b, possible parent of c.
    if (g.markAt(b, a) != EndpointMark::Arrow || !isInnerNode(g, a, c)) {
        log->trace("discriminating path: {} cannot be an inner node", a);
        return std::nullopt;
    }

    // Partial paths run from a outward: trail.back() is the newest node and
    // the one before it lies toward b. A node is excluded only from trails
    // that already contain it.
    struct Trail {
        std::vector<NodeId> nodes;
    };

    auto assemble = [&](const std::vector<NodeId>& trail, const NodeId& end) {
        std::vector<NodeId> nodes{end};
        nodes.insert(nodes.end(), trail.rbegin(), trail.rend());
        nodes.push_back(b);
        nodes.push_back(c);
        return Path::fromNodes(g, nodes);
    };

    std::deque<Trail> frontier;
    frontier.push_back({{a}});

    while (!frontier.empty()) {
        Trail trail = std::move(frontier.front());
        frontier.pop_front();

        const NodeId& inner = trail.nodes.back();
        const NodeId& toward_b = trail.nodes.size() >= 2
            ? trail.nodes[trail.nodes.size() - 2] : b;

        // Extending adds one edge to a path with trail.size() + 1 edges.
        const int edges = static_cast<int>(trail.nodes.size()) + 2;
        if (max_path_length >= 0 && edges > max_path_length) continue;

        for (const auto& inc : g.neighbors(inner)) {
            const NodeId& next = inc.neighbor;
            if (next == b || next == c) continue;
            if (std::find(trail.nodes.begin(), trail.nodes.end(), next) != trail.nodes.end()) {
                continue;
            }

            // `inner` must be a collider: arrowhead at inner on inner–next.
            if (inc.mark_here != EndpointMark::Arrow) continue;
            if (PathPredicates::isCoveredTriple(g, next, inner, toward_b)) continue;

            if (!g.adjacent(next, c)) {
                Path path = assemble(trail.nodes, next);
                log->trace("discriminating path found: {}", path.toString());
                return path;
            }

            // Adjacent to c: next can only continue the path as an inner node.
            if (inc.mark_there != EndpointMark::Arrow || !isInnerNode(g, next, c)) continue;

            Trail extended = trail;
            extended.nodes.push_back(next);
            frontier.push_back(std::move(extended));
        }
    }

    log->trace("discriminating path: none for ({}, {}, {})", a, b, c);
    return std::nullopt;
}

bool DiscriminatingPathSearch::isDiscriminatingPath(const MixedEdgeGraph& g, const Path& path) {
    const size_t n = path.nodes.size();
    if (n < 4) return false;

    const NodeId& v = path.nodes.front();
    const NodeId& c = path.nodes.back();
    if (g.adjacent(v, c)) return false;

    // Inner nodes are indices 1 .. n-3; b sits at n-2.
    for (size_t i = 1; i + 2 < n; ++i) {
        if (!path.colliderAt(i)) return false;
        if (!isInnerNode(g, path.nodes[i], c)) return false;
    }
    return PathPredicates::isUncoveredPath(g, path);
}

} // namespace pagoracle
