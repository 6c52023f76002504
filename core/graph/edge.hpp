#pragma once

#include "graph/node.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pagoracle {

/// Edge kinds of a mixed-edge causal graph.
///   Directed    u → v   known causal direction
///   Bidirected  u ↔ v   latent confounding
///   Undirected  u − v   selection-induced association
///   Circle      u *-* v two explicit endpoint marks (o→, o-o, o−, ...)
enum class EdgeKind : uint8_t {
    Directed,
    Bidirected,
    Undirected,
    Circle
};

/// Mark at one end of an edge.
enum class EndpointMark : uint8_t {
    Arrow,
    Tail,
    Circle
};

using EdgeKindSet = std::vector<EdgeKind>;

/// Every edge kind, in enum order.
inline const EdgeKindSet& allEdgeKinds() {
    static const EdgeKindSet kinds = {
        EdgeKind::Directed, EdgeKind::Bidirected,
        EdgeKind::Undirected, EdgeKind::Circle};
    return kinds;
}

inline std::string toString(EdgeKind kind) {
    switch (kind) {
        case EdgeKind::Directed:   return "directed";
        case EdgeKind::Bidirected: return "bidirected";
        case EdgeKind::Undirected: return "undirected";
        case EdgeKind::Circle:     return "circle";
    }
    return "unknown";
}

inline std::string toString(EndpointMark mark) {
    switch (mark) {
        case EndpointMark::Arrow:  return "arrow";
        case EndpointMark::Tail:   return "tail";
        case EndpointMark::Circle: return "circle";
    }
    return "unknown";
}

/// A stored edge. For Directed edges `source → target`; for Bidirected and
/// Undirected edges source < target; Circle edges keep insertion order and
/// carry their own marks.
struct Edge {
    NodeId source;
    NodeId target;
    EdgeKind kind = EdgeKind::Directed;
    EndpointMark source_mark = EndpointMark::Tail;
    EndpointMark target_mark = EndpointMark::Arrow;

    Edge() = default;
    Edge(NodeId source, NodeId target, EdgeKind kind,
         EndpointMark source_mark, EndpointMark target_mark)
        : source(std::move(source)), target(std::move(target)), kind(kind),
          source_mark(source_mark), target_mark(target_mark) {}

    bool operator==(const Edge& other) const {
        return source == other.source && target == other.target &&
               kind == other.kind && source_mark == other.source_mark &&
               target_mark == other.target_mark;
    }
};

/// One edge seen from one of its endpoints.
struct Incidence {
    NodeId neighbor;
    EdgeKind kind = EdgeKind::Directed;
    EndpointMark mark_here = EndpointMark::Tail;   // mark at the viewing node
    EndpointMark mark_there = EndpointMark::Arrow; // mark at `neighbor`
};

} // namespace pagoracle
