#pragma once

#include <stdexcept>
#include <string>

namespace pagoracle {

/// Base class for every error raised by graph queries.
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& message)
        : std::runtime_error(message) {}
};

/// A referenced node is not part of the graph.
class UnknownNode : public GraphError {
public:
    explicit UnknownNode(const std::string& node)
        : GraphError("Node not found: " + node), node_(node) {}

    const std::string& node() const { return node_; }

private:
    std::string node_;
};

/// Arguments violate a query precondition (set overlap, missing edge,
/// self-adjacency, duplicate edge between a pair).
class InvalidQuery : public GraphError {
public:
    explicit InvalidQuery(const std::string& message)
        : GraphError(message) {}
};

} // namespace pagoracle
