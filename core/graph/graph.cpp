#include "graph/graph.hpp"
#include <algorithm>
#include <deque>

namespace pagoracle {

namespace {

MixedEdgeGraph::EdgeKey canonicalKey(const NodeId& u, const NodeId& v) {
    return u < v ? MixedEdgeGraph::EdgeKey{u, v} : MixedEdgeGraph::EdgeKey{v, u};
}

} // namespace

// ─── Node operations ───────────────────────────────────────────

bool MixedEdgeGraph::addNode(const NodeId& id) {
    return addNode(Node(id));
}

bool MixedEdgeGraph::addNode(const Node& node) {
    if (nodes_.count(node.id)) return false;
    nodes_.emplace(node.id, node);
    adjacency_[node.id];  // ensure entry exists
    return true;
}

bool MixedEdgeGraph::removeNode(const NodeId& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    std::vector<NodeId> incident;
    for (const auto& [neighbor, _] : adjacency_[id]) {
        incident.push_back(neighbor);
    }
    for (const auto& neighbor : incident) {
        removeEdge(id, neighbor);
    }

    adjacency_.erase(id);
    nodes_.erase(it);
    return true;
}

Node* MixedEdgeGraph::getNode(const NodeId& id) {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const Node* MixedEdgeGraph::getNode(const NodeId& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

std::vector<NodeId> MixedEdgeGraph::nodeIds() const {
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

void MixedEdgeGraph::requireNode(const NodeId& id) const {
    if (!nodes_.count(id)) {
        throw UnknownNode(id);
    }
}

void MixedEdgeGraph::requireNodes(const NodeSet& ids) const {
    for (const auto& id : ids) {
        requireNode(id);
    }
}

// ─── Edge operations ───────────────────────────────────────────

void MixedEdgeGraph::addEdge(const NodeId& u, const NodeId& v, EdgeKind kind) {
    switch (kind) {
        case EdgeKind::Directed:
            insertEdge(u, v, kind, EndpointMark::Tail, EndpointMark::Arrow);
            break;
        case EdgeKind::Bidirected:
            insertEdge(u, v, kind, EndpointMark::Arrow, EndpointMark::Arrow);
            break;
        case EdgeKind::Undirected:
            insertEdge(u, v, kind, EndpointMark::Tail, EndpointMark::Tail);
            break;
        case EdgeKind::Circle:
            insertEdge(u, v, kind, EndpointMark::Circle, EndpointMark::Circle);
            break;
    }
}

EdgeKind MixedEdgeGraph::addEdgeWithMarks(const NodeId& u, const NodeId& v,
                                          EndpointMark mark_at_u, EndpointMark mark_at_v) {
    if (mark_at_u == EndpointMark::Circle || mark_at_v == EndpointMark::Circle) {
        insertEdge(u, v, EdgeKind::Circle, mark_at_u, mark_at_v);
        return EdgeKind::Circle;
    }
    if (mark_at_u == EndpointMark::Arrow && mark_at_v == EndpointMark::Arrow) {
        addEdge(u, v, EdgeKind::Bidirected);
        return EdgeKind::Bidirected;
    }
    if (mark_at_u == EndpointMark::Tail && mark_at_v == EndpointMark::Tail) {
        addEdge(u, v, EdgeKind::Undirected);
        return EdgeKind::Undirected;
    }
    if (mark_at_v == EndpointMark::Arrow) {
        addEdge(u, v, EdgeKind::Directed);
    } else {
        addEdge(v, u, EdgeKind::Directed);
    }
    return EdgeKind::Directed;
}

void MixedEdgeGraph::insertEdge(const NodeId& u, const NodeId& v, EdgeKind kind,
                                EndpointMark mark_at_u, EndpointMark mark_at_v) {
    requireNode(u);
    requireNode(v);
    if (u == v) {
        throw InvalidQuery("Self-loop not allowed on node " + u);
    }
    if (adjacent(u, v)) {
        throw InvalidQuery("Nodes " + u + " and " + v + " are already adjacent");
    }

    EdgeKey key{u, v};
    if (kind == EdgeKind::Bidirected || kind == EdgeKind::Undirected) {
        key = canonicalKey(u, v);
    }
    buckets_[kind].insert(key);
    adjacency_[u][v] = Incidence{v, kind, mark_at_u, mark_at_v};
    adjacency_[v][u] = Incidence{u, kind, mark_at_v, mark_at_u};
}

bool MixedEdgeGraph::removeEdge(const NodeId& u, const NodeId& v) {
    const Incidence* inc = incidence(u, v);
    if (!inc) return false;

    auto& bucket = buckets_[inc->kind];
    bucket.erase(EdgeKey{u, v});
    bucket.erase(EdgeKey{v, u});

    adjacency_[u].erase(v);
    adjacency_[v].erase(u);
    return true;
}

size_t MixedEdgeGraph::edgeCount() const {
    size_t total = 0;
    for (const auto& [_, bucket] : buckets_) {
        total += bucket.size();
    }
    return total;
}

// ─── Adjacency queries ────────────────────────────────────────

bool MixedEdgeGraph::hasEdge(const NodeId& u, const NodeId& v, EdgeKind kind) const {
    const Incidence* inc = incidence(u, v);
    if (!inc || inc->kind != kind) return false;
    if (kind == EdgeKind::Directed) {
        return inc->mark_there == EndpointMark::Arrow;
    }
    return true;
}

bool MixedEdgeGraph::adjacent(const NodeId& u, const NodeId& v) const {
    return incidence(u, v) != nullptr;
}

const Incidence* MixedEdgeGraph::incidence(const NodeId& u, const NodeId& v) const {
    auto it = adjacency_.find(u);
    if (it == adjacency_.end()) return nullptr;
    auto jt = it->second.find(v);
    return jt != it->second.end() ? &jt->second : nullptr;
}

EndpointMark MixedEdgeGraph::markAt(const NodeId& u, const NodeId& v) const {
    requireNode(u);
    requireNode(v);
    const Incidence* inc = incidence(u, v);
    if (!inc) {
        throw InvalidQuery("No edge between " + u + " and " + v);
    }
    return inc->mark_there;
}

std::vector<Incidence> MixedEdgeGraph::neighbors(const NodeId& v,
                                                 const EdgeKindSet& kinds) const {
    requireNode(v);
    std::vector<Incidence> result;
    for (const auto& [_, inc] : adjacency_.at(v)) {
        if (std::find(kinds.begin(), kinds.end(), inc.kind) != kinds.end()) {
            result.push_back(inc);
        }
    }
    return result;
}

std::vector<Incidence> MixedEdgeGraph::neighbors(const NodeId& v) const {
    return neighbors(v, allEdgeKinds());
}

NodeSet MixedEdgeGraph::adjacentNodes(const NodeId& v) const {
    requireNode(v);
    NodeSet result;
    for (const auto& [neighbor, _] : adjacency_.at(v)) {
        result.insert(neighbor);
    }
    return result;
}

// ─── Directed structure ───────────────────────────────────────

NodeSet MixedEdgeGraph::parents(const NodeId& v) const {
    NodeSet result;
    for (const auto& inc : neighbors(v, {EdgeKind::Directed})) {
        if (inc.mark_here == EndpointMark::Arrow) result.insert(inc.neighbor);
    }
    return result;
}

NodeSet MixedEdgeGraph::children(const NodeId& v) const {
    NodeSet result;
    for (const auto& inc : neighbors(v, {EdgeKind::Directed})) {
        if (inc.mark_there == EndpointMark::Arrow) result.insert(inc.neighbor);
    }
    return result;
}

NodeSet MixedEdgeGraph::directedReach(const NodeId& v, bool forward) const {
    requireNode(v);
    NodeSet seen;
    std::deque<NodeId> frontier{v};
    while (!frontier.empty()) {
        NodeId current = frontier.front();
        frontier.pop_front();
        NodeSet next = forward ? children(current) : parents(current);
        for (const auto& n : next) {
            if (n == v || seen.count(n)) continue;
            seen.insert(n);
            frontier.push_back(n);
        }
    }
    return seen;
}

NodeSet MixedEdgeGraph::ancestors(const NodeId& v) const {
    return directedReach(v, false);
}

NodeSet MixedEdgeGraph::descendants(const NodeId& v) const {
    return directedReach(v, true);
}

bool MixedEdgeGraph::isDirectedAcyclic() const {
    // Kahn's algorithm over the directed bucket
    std::map<NodeId, size_t> in_degree;
    for (const auto& [id, _] : nodes_) in_degree[id] = 0;

    auto bucket = buckets_.find(EdgeKind::Directed);
    if (bucket == buckets_.end()) return true;
    for (const auto& [u, v] : bucket->second) {
        in_degree[v]++;
    }

    std::deque<NodeId> ready;
    for (const auto& [id, deg] : in_degree) {
        if (deg == 0) ready.push_back(id);
    }

    size_t removed = 0;
    while (!ready.empty()) {
        NodeId current = ready.front();
        ready.pop_front();
        removed++;
        for (const auto& child : children(current)) {
            if (--in_degree[child] == 0) ready.push_back(child);
        }
    }
    return removed == nodes_.size();
}

std::vector<NodeSet> MixedEdgeGraph::cComponents() const {
    std::vector<NodeSet> components;
    NodeSet assigned;
    for (const auto& [id, _] : nodes_) {
        if (assigned.count(id)) continue;

        NodeSet component{id};
        assigned.insert(id);
        std::deque<NodeId> frontier{id};
        while (!frontier.empty()) {
            NodeId current = frontier.front();
            frontier.pop_front();
            for (const auto& inc : neighbors(current, {EdgeKind::Bidirected})) {
                if (assigned.count(inc.neighbor)) continue;
                assigned.insert(inc.neighbor);
                component.insert(inc.neighbor);
                frontier.push_back(inc.neighbor);
            }
        }
        components.push_back(std::move(component));
    }
    return components;
}

// ─── Derived graphs ───────────────────────────────────────────

MixedEdgeGraph MixedEdgeGraph::extractSubgraph(const NodeSet& node_ids) const {
    MixedEdgeGraph sub;
    for (const auto& id : node_ids) {
        const Node* n = getNode(id);
        if (!n) continue;
        sub.addNode(*n);
    }
    forEachEdge([&](const Edge& e) {
        if (sub.hasNode(e.source) && sub.hasNode(e.target)) {
            sub.insertEdge(e.source, e.target, e.kind, e.source_mark, e.target_mark);
        }
    });
    return sub;
}

MixedEdgeGraph MixedEdgeGraph::transpose() const {
    MixedEdgeGraph reversed;
    for (const auto& [_, node] : nodes_) {
        reversed.addNode(node);
    }
    forEachEdge([&](const Edge& e) {
        switch (e.kind) {
            case EdgeKind::Directed:
                reversed.insertEdge(e.target, e.source, e.kind,
                                    EndpointMark::Tail, EndpointMark::Arrow);
                break;
            case EdgeKind::Circle:
                reversed.insertEdge(e.source, e.target, e.kind,
                                    e.target_mark, e.source_mark);
                break;
            case EdgeKind::Bidirected:
            case EdgeKind::Undirected:
                reversed.insertEdge(e.source, e.target, e.kind,
                                    e.source_mark, e.target_mark);
                break;
        }
    });
    return reversed;
}

// ─── Iteration ─────────────────────────────────────────────────

Edge MixedEdgeGraph::makeEdge(const EdgeKey& key, EdgeKind kind) const {
    const Incidence& inc = adjacency_.at(key.first).at(key.second);
    return Edge(key.first, key.second, kind, inc.mark_here, inc.mark_there);
}

std::vector<Edge> MixedEdgeGraph::edges(EdgeKind kind) const {
    std::vector<Edge> result;
    auto it = buckets_.find(kind);
    if (it == buckets_.end()) return result;
    result.reserve(it->second.size());
    for (const auto& key : it->second) {
        result.push_back(makeEdge(key, kind));
    }
    return result;
}

void MixedEdgeGraph::forEachNode(std::function<void(const Node&)> fn) const {
    for (const auto& [_, node] : nodes_) {
        fn(node);
    }
}

void MixedEdgeGraph::forEachEdge(std::function<void(const Edge&)> fn) const {
    for (EdgeKind kind : allEdgeKinds()) {
        for (const auto& e : edges(kind)) {
            fn(e);
        }
    }
}

} // namespace pagoracle
