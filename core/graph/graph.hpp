#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"
#include "common/errors.hpp"

#include <functional>
#include <map>
#include <set>
#include <utility>
#include <vector>

namespace pagoracle {

// ─── MixedEdgeGraph ────────────────────────────────────────────
// Node set plus one edge bucket per EdgeKind, with an adjacency
// index node → neighbor → Incidence (kind and both endpoint marks).
//
// Invariants:
//   - at most one edge between any unordered pair of nodes
//   - no self-loops
//   - Directed and Circle edges are ordered pairs; Bidirected and
//     Undirected edges are stored as (smaller, larger)
//   - adjacency iterates in ascending NodeId order
//
// Queries take the graph by const reference and never mutate it.
// Callers must not mutate a graph while queries are in flight.

class MixedEdgeGraph {
public:
    using EdgeKey = std::pair<NodeId, NodeId>;

    MixedEdgeGraph() = default;

    // ── Node operations ──
    bool addNode(const NodeId& id);
    bool addNode(const Node& node);
    bool removeNode(const NodeId& id);
    Node* getNode(const NodeId& id);
    const Node* getNode(const NodeId& id) const;
    bool hasNode(const NodeId& id) const { return nodes_.count(id) > 0; }
    std::vector<NodeId> nodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }

    /// Throws UnknownNode if `id` is not in the graph.
    void requireNode(const NodeId& id) const;
    void requireNodes(const NodeSet& ids) const;

    // ── Edge operations ──

    /// Add an edge of a fixed kind. A Circle edge added this way is o-o.
    /// Throws UnknownNode for missing endpoints and InvalidQuery for
    /// self-loops or when u and v are already adjacent.
    void addEdge(const NodeId& u, const NodeId& v, EdgeKind kind);

    /// Add an edge from its two endpoint marks. Mark pairs without a
    /// circle are stored under the matching concrete kind (tail/arrow is
    /// Directed, arrow/arrow Bidirected, tail/tail Undirected).
    /// Returns the kind the edge was stored under.
    EdgeKind addEdgeWithMarks(const NodeId& u, const NodeId& v,
                              EndpointMark mark_at_u, EndpointMark mark_at_v);

    bool removeEdge(const NodeId& u, const NodeId& v);
    size_t edgeCount() const;

    // ── Adjacency queries ──

    /// True iff an edge of `kind` joins u and v. Directed edges are
    /// matched as u → v only.
    bool hasEdge(const NodeId& u, const NodeId& v, EdgeKind kind) const;
    bool adjacent(const NodeId& u, const NodeId& v) const;

    /// The edge u *-* v seen from u, or nullptr.
    const Incidence* incidence(const NodeId& u, const NodeId& v) const;

    /// Mark at v on the edge u *-* v. Throws InvalidQuery if the nodes
    /// are not adjacent.
    EndpointMark markAt(const NodeId& u, const NodeId& v) const;

    /// Incident edges of v whose kind is in `kinds`, ascending by neighbor.
    std::vector<Incidence> neighbors(const NodeId& v, const EdgeKindSet& kinds) const;
    std::vector<Incidence> neighbors(const NodeId& v) const;
    NodeSet adjacentNodes(const NodeId& v) const;

    // ── Directed structure ──
    NodeSet parents(const NodeId& v) const;
    NodeSet children(const NodeId& v) const;

    /// Strict ancestors/descendants along directed edges only; v excluded.
    NodeSet ancestors(const NodeId& v) const;
    NodeSet descendants(const NodeId& v) const;

    bool isDirectedAcyclic() const;

    /// Connected components of the bidirected-edge subgraph.
    /// Every node belongs to exactly one component.
    std::vector<NodeSet> cComponents() const;

    // ── Derived graphs ──
    MixedEdgeGraph extractSubgraph(const NodeSet& node_ids) const;

    /// Reverse every directed edge and swap the marks of every circle edge.
    MixedEdgeGraph transpose() const;

    // ── Iteration ──
    std::vector<Edge> edges(EdgeKind kind) const;
    void forEachNode(std::function<void(const Node&)> fn) const;
    void forEachEdge(std::function<void(const Edge&)> fn) const;

private:
    std::map<NodeId, Node> nodes_;
    std::map<NodeId, std::map<NodeId, Incidence>> adjacency_;
    std::map<EdgeKind, std::set<EdgeKey>> buckets_;

    void insertEdge(const NodeId& u, const NodeId& v, EdgeKind kind,
                    EndpointMark mark_at_u, EndpointMark mark_at_v);
    Edge makeEdge(const EdgeKey& key, EdgeKind kind) const;
    NodeSet directedReach(const NodeId& v, bool forward) const;
};

} // namespace pagoracle
