#include "discovery/pds.hpp"
#include "predicates/path_predicates.hpp"
#include "reachability/ancestral_reachability.hpp"
#include "common/logging.hpp"

#include <deque>
#include <set>
#include <utility>
#include <vector>

namespace pagoracle {

void Pds::validate(const MixedEdgeGraph& g, const NodeId& x, const NodeId& y) {
    g.requireNode(x);
    g.requireNode(y);
    if (x == y) {
        throw InvalidQuery("PDS endpoints must differ: " + x);
    }
}

NodeSet Pds::compute(const MixedEdgeGraph& g, const NodeId& x, const NodeId& y,
                     int max_path_length) {
    validate(g, x, y);
    logging::get_logger()->debug("pds query x={} y={}", x, y);

    const NodeSet ancestors_of_y = AncestralReachability::possibleAncestors(g, y);

    // State: the last edge walked, (previous node, current node). The mark
    // at the current node on that edge decides whether it can be a collider.
    struct State {
        NodeId node;
        EndpointMark arrival_mark;
        int depth;
    };

    NodeSet result;
    std::set<std::pair<NodeId, NodeId>> visited;
    std::deque<State> frontier;

    for (const auto& inc : g.neighbors(y)) {
        if (inc.neighbor == x) continue;
        result.insert(inc.neighbor);
        visited.insert({y, inc.neighbor});
        frontier.push_back({inc.neighbor, inc.mark_there, 1});
    }

    while (!frontier.empty()) {
        State state = frontier.front();
        frontier.pop_front();

        if (max_path_length >= 0 && state.depth >= max_path_length) continue;
        if (state.arrival_mark != EndpointMark::Arrow) continue;
        if (!ancestors_of_y.count(state.node)) continue;

        for (const auto& inc : g.neighbors(state.node)) {
            const NodeId& next = inc.neighbor;
            if (next == x || next == y) continue;
            if (inc.mark_here != EndpointMark::Arrow) continue;
            if (!visited.insert({state.node, next}).second) continue;

            result.insert(next);
            frontier.push_back({next, inc.mark_there, state.depth + 1});
        }
    }

    logging::get_logger()->trace("pds({}, {}) has {} node(s)", x, y, result.size());
    return result;
}

NodeSet Pds::computeRestricted(const MixedEdgeGraph& g, const NodeId& x, const NodeId& y,
                               const NodeSet& pds_set, int max_path_length) {
    validate(g, x, y);
    g.requireNodes(pds_set);
    if (pds_set.count(x) || pds_set.count(y)) {
        throw InvalidQuery("Restricting set must not contain " + x + " or " + y);
    }
    logging::get_logger()->debug("pds path query x={} y={} |restriction|={}",
                                 x, y, pds_set.size());

    const NodeSet ancestors_of_y = AncestralReachability::possibleAncestors(g, y);

    // Uncoveredness depends on the whole path, so walk simple paths with
    // an explicit stack rather than sharing per-edge state.
    struct Frame {
        NodeId node;
        EndpointMark arrival_mark;
        std::vector<Incidence> neighbors;
        size_t next = 0;
    };

    NodeSet result;
    NodeSet on_path{y};
    std::vector<Frame> stack;
    stack.push_back({y, EndpointMark::Tail, g.neighbors(y), 0});

    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.next >= top.neighbors.size()) {
            on_path.erase(top.node);
            stack.pop_back();
            continue;
        }

        const Incidence inc = top.neighbors[top.next++];
        const NodeId& next = inc.neighbor;
        if (on_path.count(next) || !pds_set.count(next)) continue;

        // `top.node` becomes internal unless it is y itself.
        if (stack.size() >= 2) {
            if (top.arrival_mark != EndpointMark::Arrow ||
                inc.mark_here != EndpointMark::Arrow ||
                !ancestors_of_y.count(top.node)) {
                continue;
            }
            const NodeId& before = stack[stack.size() - 2].node;
            if (PathPredicates::isCoveredTriple(g, before, top.node, next)) continue;
        }

        result.insert(next);

        int depth = static_cast<int>(stack.size());
        if (max_path_length >= 0 && depth >= max_path_length) continue;

        EndpointMark arrival = inc.mark_there;
        on_path.insert(next);
        stack.push_back({next, arrival, g.neighbors(next), 0});
    }

    logging::get_logger()->trace("pds path({}, {}) has {} node(s)", x, y, result.size());
    return result;
}

} // namespace pagoracle
