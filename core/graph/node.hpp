#pragma once

#include <set>
#include <string>
#include <utility>
#include <unordered_map>
#include <vector>

namespace pagoracle {

/// Opaque node label. Identity is by value.
using NodeId = std::string;

/// Ordered node set. Ordering keeps every traversal deterministic.
using NodeSet = std::set<NodeId>;

/// A node of a mixed-edge graph.
/// Attributes are carried for conversion collaborators; queries ignore them.
struct Node {
    NodeId id;
    std::unordered_map<std::string, std::string> attributes;

    Node() = default;
    explicit Node(NodeId id)
        : id(std::move(id)) {}

    void setAttribute(const std::string& key, const std::string& value) {
        attributes[key] = value;
    }

    std::string getAttribute(const std::string& key, const std::string& default_val = "") const {
        auto it = attributes.find(key);
        return it != attributes.end() ? it->second : default_val;
    }

    bool hasAttribute(const std::string& key) const {
        return attributes.count(key) > 0;
    }
};

} // namespace pagoracle
