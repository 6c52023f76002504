#include "separation/separation_oracle.hpp"
#include "separation/moralization.hpp"
#include "predicates/path_predicates.hpp"
#include "reachability/ancestral_reachability.hpp"
#include "graph/path.hpp"
#include "common/logging.hpp"

#include <vector>

namespace pagoracle {

namespace {

void requireDisjoint(const NodeSet& lhs, const NodeSet& rhs,
                     const char* lhs_name, const char* rhs_name) {
    for (const auto& id : lhs) {
        if (rhs.count(id)) {
            throw InvalidQuery(std::string(lhs_name) + " and " + rhs_name +
                               " share node " + id);
        }
    }
}

} // namespace

void SeparationOracle::validate(const MixedEdgeGraph& g,
                                const NodeSet& x, const NodeSet& y, const NodeSet& z) {
    g.requireNodes(x);
    g.requireNodes(y);
    g.requireNodes(z);
    requireDisjoint(x, y, "X", "Y");
    requireDisjoint(x, z, "X", "Z");
    requireDisjoint(y, z, "Y", "Z");
}

bool SeparationOracle::mSeparated(const MixedEdgeGraph& g,
                                  const NodeSet& x, const NodeSet& y, const NodeSet& z) const {
    logging::get_logger()->debug("m-separation query |X|={} |Y|={} |Z|={} strategy={}",
                                 x.size(), y.size(), z.size(), toString(config_.strategy));
    switch (config_.strategy) {
        case SeparationStrategy::AncestralMoralization:
            return separatedByMoralization(g, x, y, z);
        case SeparationStrategy::LegalPath:
            return separatedByLegalPaths(g, x, y, z);
    }
    return separatedByMoralization(g, x, y, z);
}

bool SeparationOracle::mSeparated(const MixedEdgeGraph& g,
                                  const NodeId& x, const NodeId& y, const NodeSet& z) const {
    return mSeparated(g, NodeSet{x}, NodeSet{y}, z);
}

// ─── Ancestral moralization ───────────────────────────────────

bool SeparationOracle::separatedByMoralization(const MixedEdgeGraph& g,
                                               const NodeSet& x, const NodeSet& y,
                                               const NodeSet& z) {
    validate(g, x, y, z);
    if (x.empty() || y.empty()) return true;

    NodeSet relevant(x.begin(), x.end());
    relevant.insert(y.begin(), y.end());
    relevant.insert(z.begin(), z.end());

    // Anterior rather than ancestral closure: selection edges u − v keep
    // both ends in the restricted graph. Members of Z do not extend the
    // closure across their own undirected edges.
    NodeSet anterior = AncestralReachability::possibleAnteriors(g, relevant, z);
    UndirectedAdjacency moral = Moralization::augment(g, anterior);
    NodeSet reached = Moralization::reachable(moral, x, z);

    for (const auto& target : y) {
        if (reached.count(target)) {
            logging::get_logger()->trace("moralization: {} reachable, not separated", target);
            return false;
        }
    }
    return true;
}

// ─── Legal path enumeration ───────────────────────────────────

bool SeparationOracle::separatedByLegalPaths(const MixedEdgeGraph& g,
                                             const NodeSet& x, const NodeSet& y,
                                             const NodeSet& z) {
    validate(g, x, y, z);
    if (x.empty() || y.empty()) return true;

    // A collider opens the path iff it is a possible ancestor of Z.
    NodeSet activators = AncestralReachability::possibleAncestors(g, z);

    struct Frame {
        NodeId node;
        EndpointMark arrival_mark;  // mark at `node` on the edge used to reach it
        std::vector<Incidence> neighbors;
        size_t next = 0;
    };

    size_t paths_checked = 0;
    for (const auto& start : x) {
        std::vector<Frame> stack;
        NodeSet on_path{start};
        stack.push_back({start, EndpointMark::Tail, g.neighbors(start), 0});

        while (!stack.empty()) {
            Frame& top = stack.back();
            if (top.next >= top.neighbors.size()) {
                on_path.erase(top.node);
                stack.pop_back();
                continue;
            }

            const Incidence inc = top.neighbors[top.next++];
            const NodeId& next = inc.neighbor;
            if (on_path.count(next) || x.count(next)) continue;

            // `top.node` becomes internal: prune prefixes it already blocks.
            if (stack.size() >= 2) {
                bool collider = top.arrival_mark == EndpointMark::Arrow &&
                                inc.mark_here == EndpointMark::Arrow;
                if (!collider && z.count(top.node)) continue;
                if (collider && !activators.count(top.node)) continue;
            }

            if (y.count(next)) {
                std::vector<NodeId> nodes;
                nodes.reserve(stack.size() + 1);
                for (const auto& frame : stack) nodes.push_back(frame.node);
                nodes.push_back(next);

                paths_checked++;
                Path path = Path::fromNodes(g, nodes);
                if (PathPredicates::isOpenPath(g, path, z)) {
                    logging::get_logger()->trace("legal path: open path {}", path.toString());
                    return false;
                }
                continue;
            }

            EndpointMark arrival = inc.mark_there;
            on_path.insert(next);
            stack.push_back({next, arrival, g.neighbors(next), 0});
        }
    }

    logging::get_logger()->trace("legal path: {} candidate path(s), all blocked", paths_checked);
    return true;
}

} // namespace pagoracle
