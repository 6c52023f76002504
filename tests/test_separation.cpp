#include <gtest/gtest.h>
#include "separation/separation_oracle.hpp"
#include "separation/moralization.hpp"

using namespace pagoracle;

namespace {

MixedEdgeGraph makeGraph(const std::vector<NodeId>& ids) {
    MixedEdgeGraph g;
    for (const auto& id : ids) g.addNode(id);
    return g;
}

const SeparationOracle kMoral{SeparationConfig{SeparationStrategy::AncestralMoralization}};
const SeparationOracle kLegal{SeparationConfig{SeparationStrategy::LegalPath}};

// A → B → C → D,  F → E → D,  A ↔ C,  B ↔ E
MixedEdgeGraph makeAdmg() {
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "D", "E", "F"});
    g.addEdge("A", "B", EdgeKind::Directed);
    g.addEdge("B", "C", EdgeKind::Directed);
    g.addEdge("C", "D", EdgeKind::Directed);
    g.addEdge("F", "E", EdgeKind::Directed);
    g.addEdge("E", "D", EdgeKind::Directed);
    g.addEdge("A", "C", EdgeKind::Bidirected);
    g.addEdge("B", "E", EdgeKind::Bidirected);
    return g;
}

// A → B ← C,  B − D
MixedEdgeGraph makeSelectedCollider() {
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "D"});
    g.addEdge("A", "B", EdgeKind::Directed);
    g.addEdge("C", "B", EdgeKind::Directed);
    g.addEdge("B", "D", EdgeKind::Undirected);
    return g;
}

// A − B → C ↔ D ← E
MixedEdgeGraph makeMag() {
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "D", "E"});
    g.addEdge("A", "B", EdgeKind::Undirected);
    g.addEdge("B", "C", EdgeKind::Directed);
    g.addEdge("D", "C", EdgeKind::Bidirected);
    g.addEdge("E", "D", EdgeKind::Directed);
    return g;
}

// A o-o B o→ C ← D
MixedEdgeGraph makePag() {
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "D"});
    g.addEdge("A", "B", EdgeKind::Circle);
    g.addEdgeWithMarks("B", "C", EndpointMark::Circle, EndpointMark::Arrow);
    g.addEdge("D", "C", EdgeKind::Directed);
    return g;
}

// Every ordered pair under every conditioning set drawn from the other nodes.
void expectStrategiesAgree(const MixedEdgeGraph& g) {
    std::vector<NodeId> ids = g.nodeIds();

    for (const auto& x : ids) {
        for (const auto& y : ids) {
            if (x == y) continue;

            std::vector<NodeId> rest;
            for (const auto& id : ids) {
                if (id != x && id != y) rest.push_back(id);
            }
            for (unsigned mask = 0; mask < (1u << rest.size()); ++mask) {
                NodeSet z;
                for (size_t i = 0; i < rest.size(); ++i) {
                    if (mask & (1u << i)) z.insert(rest[i]);
                }
                bool moral = kMoral.mSeparated(g, x, y, z);
                EXPECT_EQ(moral, kLegal.mSeparated(g, x, y, z))
                    << x << " vs " << y << " mask " << mask;
                EXPECT_EQ(moral, kMoral.mSeparated(g, y, x, z))
                    << x << " vs " << y << " mask " << mask;
            }
        }
    }
}

} // namespace

// ─── Concrete scenarios ────────────────────────────────────────

TEST(SeparationTest, UnconditionedColliderBlocks) {
    // A → B ← C → D
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "D"});
    g.addEdge("A", "B", EdgeKind::Directed);
    g.addEdge("C", "B", EdgeKind::Directed);
    g.addEdge("C", "D", EdgeKind::Directed);

    for (const auto* oracle : {&kMoral, &kLegal}) {
        EXPECT_TRUE(oracle->mSeparated(g, "A", "C", {}));
        EXPECT_FALSE(oracle->mSeparated(g, "A", "C", {"B"}));
        EXPECT_TRUE(oracle->mSeparated(g, "A", "D", {}));
        EXPECT_FALSE(oracle->mSeparated(g, "A", "D", {"B"}));
        EXPECT_TRUE(oracle->mSeparated(g, "A", "D", {"B", "C"}));
    }
}

TEST(SeparationTest, ChainBlockedByMiddle) {
    MixedEdgeGraph g = makeGraph({"A", "B", "C"});
    g.addEdge("A", "B", EdgeKind::Directed);
    g.addEdge("B", "C", EdgeKind::Directed);

    for (const auto* oracle : {&kMoral, &kLegal}) {
        EXPECT_FALSE(oracle->mSeparated(g, "A", "C", {}));
        EXPECT_TRUE(oracle->mSeparated(g, "A", "C", {"B"}));
    }
}

TEST(SeparationTest, ConditionedDescendantOfColliderOpensPath) {
    // A → B ← C, B → D
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "D"});
    g.addEdge("A", "B", EdgeKind::Directed);
    g.addEdge("C", "B", EdgeKind::Directed);
    g.addEdge("B", "D", EdgeKind::Directed);

    for (const auto* oracle : {&kMoral, &kLegal}) {
        EXPECT_TRUE(oracle->mSeparated(g, "A", "C", {}));
        EXPECT_FALSE(oracle->mSeparated(g, "A", "C", {"D"}));
    }
}

TEST(SeparationTest, BidirectedColliderChain) {
    // A → B ↔ C ← D
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "D"});
    g.addEdge("A", "B", EdgeKind::Directed);
    g.addEdge("B", "C", EdgeKind::Bidirected);
    g.addEdge("D", "C", EdgeKind::Directed);

    for (const auto* oracle : {&kMoral, &kLegal}) {
        EXPECT_TRUE(oracle->mSeparated(g, "A", "D", {}));
        EXPECT_TRUE(oracle->mSeparated(g, "A", "D", {"B"}));
        EXPECT_FALSE(oracle->mSeparated(g, "A", "D", {"B", "C"}));
    }
}

TEST(SeparationTest, LatentConfoundingNeverSeparates) {
    MixedEdgeGraph g = makeGraph({"A", "B", "C"});
    g.addEdge("A", "B", EdgeKind::Bidirected);
    g.addEdge("C", "A", EdgeKind::Directed);

    for (const auto* oracle : {&kMoral, &kLegal}) {
        EXPECT_FALSE(oracle->mSeparated(g, "A", "B", {}));
        EXPECT_FALSE(oracle->mSeparated(g, "A", "B", {"C"}));
    }
}

TEST(SeparationTest, SelectionEdgesActAsNonColliders) {
    // A − B − C
    MixedEdgeGraph g = makeGraph({"A", "B", "C"});
    g.addEdge("A", "B", EdgeKind::Undirected);
    g.addEdge("B", "C", EdgeKind::Undirected);

    for (const auto* oracle : {&kMoral, &kLegal}) {
        EXPECT_FALSE(oracle->mSeparated(g, "A", "C", {}));
        EXPECT_TRUE(oracle->mSeparated(g, "A", "C", {"B"}));
    }
}

TEST(SeparationTest, CircleMarksInPag) {
    // A o→ B ← C, and D o-o E o-o F
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "D", "E", "F"});
    g.addEdgeWithMarks("A", "B", EndpointMark::Circle, EndpointMark::Arrow);
    g.addEdge("C", "B", EdgeKind::Directed);
    g.addEdge("D", "E", EdgeKind::Circle);
    g.addEdge("E", "F", EdgeKind::Circle);

    for (const auto* oracle : {&kMoral, &kLegal}) {
        EXPECT_TRUE(oracle->mSeparated(g, "A", "C", {}));
        EXPECT_FALSE(oracle->mSeparated(g, "A", "C", {"B"}));
        EXPECT_FALSE(oracle->mSeparated(g, "D", "F", {}));
        EXPECT_TRUE(oracle->mSeparated(g, "D", "F", {"E"}));
    }
}

TEST(SeparationTest, ConditionedSelectionNeighborKeepsColliderClosed) {
    MixedEdgeGraph g = makeSelectedCollider();

    for (const auto* oracle : {&kMoral, &kLegal}) {
        // B is not an ancestor of D, and D blocks the only edge out of it.
        EXPECT_TRUE(oracle->mSeparated(g, "A", "C", {}));
        EXPECT_TRUE(oracle->mSeparated(g, "A", "C", {"D"}));
        EXPECT_FALSE(oracle->mSeparated(g, "A", "C", {"B"}));
        EXPECT_FALSE(oracle->mSeparated(g, "A", "C", {"B", "D"}));

        EXPECT_FALSE(oracle->mSeparated(g, "A", "D", {}));
        EXPECT_TRUE(oracle->mSeparated(g, "A", "D", {"B"}));
        EXPECT_FALSE(oracle->mSeparated(g, "A", "D", {"C"}));
        EXPECT_TRUE(oracle->mSeparated(g, "A", "D", {"B", "C"}));
    }
}

TEST(SeparationTest, MagWithSelectionAndConfounding) {
    MixedEdgeGraph g = makeMag();

    for (const auto* oracle : {&kMoral, &kLegal}) {
        EXPECT_TRUE(oracle->mSeparated(g, "A", "C", {"B"}));
        EXPECT_TRUE(oracle->mSeparated(g, "A", "E", {}));
        EXPECT_TRUE(oracle->mSeparated(g, "A", "E", {"D"}));
        // C and D are both colliders on the only path
        EXPECT_TRUE(oracle->mSeparated(g, "A", "E", {"C"}));
        EXPECT_FALSE(oracle->mSeparated(g, "A", "E", {"C", "D"}));
    }
}

TEST(SeparationTest, SetValuedQuery) {
    MixedEdgeGraph g = makeAdmg();
    // F's only route to A passes the collider D (C → D ← E) or E ↔ B.
    EXPECT_FALSE(kMoral.mSeparated(g, NodeSet{"A", "F"}, NodeSet{"D"}, {}));
    EXPECT_TRUE(kMoral.mSeparated(g, NodeSet{"F"}, NodeSet{"A", "C"}, {}));
    EXPECT_TRUE(kLegal.mSeparated(g, NodeSet{"F"}, NodeSet{"A", "C"}, {}));
}

// ─── Properties ───────────────────────────────────────────────

TEST(SeparationTest, StrategiesAgreeAndAreSymmetricOnAdmg) {
    expectStrategiesAgree(makeAdmg());
}

TEST(SeparationTest, StrategiesAgreeWithSelectionEdges) {
    expectStrategiesAgree(makeSelectedCollider());
    expectStrategiesAgree(makeMag());
}

TEST(SeparationTest, StrategiesAgreeWithCircleMarks) {
    expectStrategiesAgree(makePag());
}

// ─── Edge cases ───────────────────────────────────────────────

TEST(SeparationTest, EmptySidesAreSeparated) {
    MixedEdgeGraph g = makeAdmg();
    EXPECT_TRUE(kMoral.mSeparated(g, NodeSet{}, NodeSet{"A"}, {}));
    EXPECT_TRUE(kLegal.mSeparated(g, NodeSet{"A"}, NodeSet{}, {}));
}

TEST(SeparationTest, OverlappingSetsRejected) {
    MixedEdgeGraph g = makeAdmg();
    EXPECT_THROW(kMoral.mSeparated(g, NodeSet{"A", "B"}, NodeSet{"B"}, {}), InvalidQuery);
    EXPECT_THROW(kMoral.mSeparated(g, "A", "C", {"A"}), InvalidQuery);
    EXPECT_THROW(kLegal.mSeparated(g, "A", "C", {"C"}), InvalidQuery);
}

TEST(SeparationTest, UnknownNodesRejectedBeforeTraversal) {
    MixedEdgeGraph g = makeAdmg();
    EXPECT_THROW(kMoral.mSeparated(g, "A", "Q", {}), UnknownNode);
    EXPECT_THROW(kLegal.mSeparated(g, "A", "C", {"Q"}), UnknownNode);
    // Empty X still validates the other sets
    EXPECT_THROW(kMoral.mSeparated(g, NodeSet{}, NodeSet{"Q"}, {}), UnknownNode);
}

TEST(SeparationTest, StrategyCanBeSwitched) {
    SeparationOracle oracle;
    EXPECT_EQ(oracle.config().strategy, SeparationStrategy::AncestralMoralization);
    oracle.setStrategy(SeparationStrategy::LegalPath);
    EXPECT_EQ(oracle.config().strategy, SeparationStrategy::LegalPath);
}

// ─── Moralization ─────────────────────────────────────────────

TEST(MoralizationTest, JoinsColliderConnectedNodes) {
    // A → B ↔ C ← D, E − A
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "D", "E"});
    g.addEdge("A", "B", EdgeKind::Directed);
    g.addEdge("B", "C", EdgeKind::Bidirected);
    g.addEdge("D", "C", EdgeKind::Directed);
    g.addEdge("E", "A", EdgeKind::Undirected);

    UndirectedAdjacency moral = Moralization::augment(g, {"A", "B", "C", "D", "E"});
    EXPECT_EQ(moral.at("A"), (NodeSet{"B", "C", "D", "E"}));
    EXPECT_EQ(moral.at("D"), (NodeSet{"A", "B", "C"}));
    EXPECT_EQ(moral.at("E"), (NodeSet{"A"}));

    // Restricting to {A, B, D} drops the chain through C.
    UndirectedAdjacency restricted = Moralization::augment(g, {"A", "B", "D"});
    EXPECT_EQ(restricted.at("A"), (NodeSet{"B"}));
    EXPECT_TRUE(restricted.at("D").empty());
}

TEST(MoralizationTest, ReachableSkipsBlockedNodes) {
    UndirectedAdjacency adjacency{
        {"A", {"B"}}, {"B", {"A", "C"}}, {"C", {"B"}}};
    EXPECT_EQ(Moralization::reachable(adjacency, {"A"}, {}), (NodeSet{"A", "B", "C"}));
    EXPECT_EQ(Moralization::reachable(adjacency, {"A"}, {"B"}), (NodeSet{"A"}));
}
