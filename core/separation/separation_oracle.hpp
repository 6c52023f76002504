#pragma once

#include "graph/graph.hpp"
#include "separation/separation_config.hpp"

namespace pagoracle {

// ─── SeparationOracle ─────────────────────────────────────────
// m-separation of X and Y given Z in a mixed-edge graph.
//
// Preconditions (checked before any traversal):
//   - every node of X, Y, Z is in the graph      (UnknownNode)
//   - X, Y and Z are pairwise disjoint           (InvalidQuery)
// An empty X or Y is separated by convention.

class SeparationOracle {
public:
    explicit SeparationOracle(SeparationConfig config = SeparationConfig{})
        : config_(config) {}

    void setStrategy(SeparationStrategy strategy) { config_.strategy = strategy; }
    const SeparationConfig& config() const { return config_; }

    /// Decide X ⊥ Y | Z with the configured strategy.
    bool mSeparated(const MixedEdgeGraph& g,
                    const NodeSet& x, const NodeSet& y, const NodeSet& z) const;

    /// Single-node convenience form.
    bool mSeparated(const MixedEdgeGraph& g,
                    const NodeId& x, const NodeId& y, const NodeSet& z) const;

    /// Separation in the augmented graph of the possible anteriors of X ∪ Y ∪ Z
    /// (possible ancestors, closed under undirected edges leaving non-Z nodes).
    static bool separatedByMoralization(const MixedEdgeGraph& g,
                                        const NodeSet& x, const NodeSet& y, const NodeSet& z);

    /// No simple path between X and Y is open given Z.
    static bool separatedByLegalPaths(const MixedEdgeGraph& g,
                                      const NodeSet& x, const NodeSet& y, const NodeSet& z);

private:
    SeparationConfig config_;

    static void validate(const MixedEdgeGraph& g,
                         const NodeSet& x, const NodeSet& y, const NodeSet& z);
};

} // namespace pagoracle
