#include "graph/path.hpp"
#include <sstream>

namespace pagoracle {

Path Path::fromNodes(const MixedEdgeGraph& g, const std::vector<NodeId>& nodes) {
    for (const auto& id : nodes) {
        g.requireNode(id);
    }

    NodeSet distinct(nodes.begin(), nodes.end());
    if (distinct.size() != nodes.size()) {
        throw InvalidQuery("Path repeats a node");
    }

    Path path;
    path.nodes = nodes;
    for (size_t i = 0; i + 1 < nodes.size(); ++i) {
        const Incidence* inc = g.incidence(nodes[i], nodes[i + 1]);
        if (!inc) {
            throw InvalidQuery("Path nodes " + nodes[i] + " and " + nodes[i + 1] +
                               " are not adjacent");
        }
        path.steps.push_back({inc->kind, inc->mark_here, inc->mark_there});
    }
    return path;
}

bool Path::colliderAt(size_t i) const {
    if (i == 0 || i + 1 >= nodes.size()) return false;
    return steps[i - 1].mark_at_to == EndpointMark::Arrow &&
           steps[i].mark_at_from == EndpointMark::Arrow;
}

Path Path::reversed() const {
    Path r;
    r.nodes.assign(nodes.rbegin(), nodes.rend());
    for (auto it = steps.rbegin(); it != steps.rend(); ++it) {
        r.steps.push_back({it->kind, it->mark_at_to, it->mark_at_from});
    }
    return r;
}

std::string Path::toString() const {
    auto left = [](EndpointMark m) {
        switch (m) {
            case EndpointMark::Arrow:  return "<";
            case EndpointMark::Tail:   return "-";
            case EndpointMark::Circle: return "o";
        }
        return "?";
    };
    auto right = [](EndpointMark m) {
        switch (m) {
            case EndpointMark::Arrow:  return ">";
            case EndpointMark::Tail:   return "-";
            case EndpointMark::Circle: return "o";
        }
        return "?";
    };

    std::ostringstream oss;
    for (size_t i = 0; i < nodes.size(); ++i) {
        oss << nodes[i];
        if (i < steps.size()) {
            oss << " " << left(steps[i].mark_at_from) << "-"
                << right(steps[i].mark_at_to) << " ";
        }
    }
    return oss.str();
}

} // namespace pagoracle
