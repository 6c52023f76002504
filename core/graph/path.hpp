#pragma once

#include "graph/graph.hpp"

#include <string>
#include <vector>

namespace pagoracle {

/// The edge a path uses between two consecutive nodes, with the mark at
/// each end as seen along the path direction.
struct PathStep {
    EdgeKind kind = EdgeKind::Directed;
    EndpointMark mark_at_from = EndpointMark::Tail;
    EndpointMark mark_at_to = EndpointMark::Arrow;
};

/// A simple path ⟨v0, …, vk⟩ plus the edge metadata of each step.
/// steps[i] describes the edge between nodes[i] and nodes[i + 1].
/// Paths hold no reference to the graph they were built from.
struct Path {
    std::vector<NodeId> nodes;
    std::vector<PathStep> steps;

    /// Build a path by looking up each consecutive edge in `g`.
    /// Throws UnknownNode for missing nodes and InvalidQuery for
    /// repeated or non-adjacent nodes.
    static Path fromNodes(const MixedEdgeGraph& g, const std::vector<NodeId>& nodes);

    size_t length() const { return steps.size(); }
    bool empty() const { return nodes.empty(); }
    const NodeId& front() const { return nodes.front(); }
    const NodeId& back() const { return nodes.back(); }

    /// Both marks at internal node i are arrowheads.
    bool colliderAt(size_t i) const;

    /// The same path walked from the other end.
    Path reversed() const;

    std::string toString() const;

    bool operator==(const Path& other) const { return nodes == other.nodes; }
};

} // namespace pagoracle
