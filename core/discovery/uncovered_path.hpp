#pragma once

#include "graph/graph.hpp"
#include "graph/path.hpp"

#include <optional>

namespace pagoracle {

/// Uncovered possibly-directed paths, as consumed by orientation rules
/// that look for u o→ … → c chains.
class UncoveredPathSearch {
public:
    /// Shortest uncovered path from u to c on which every edge is possibly
    /// directed towards c, avoiding the nodes of `excluded`. Breadth-first
    /// with a visited set; neighbors in ascending order.
    static std::optional<Path> possiblyDirected(const MixedEdgeGraph& g,
                                                const NodeId& u, const NodeId& c,
                                                const NodeSet& excluded = {},
                                                int max_path_length = -1);
};

} // namespace pagoracle
