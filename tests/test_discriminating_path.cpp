#include <gtest/gtest.h>
#include "discovery/discriminating_path.hpp"
#include "predicates/path_predicates.hpp"

using namespace pagoracle;

namespace {

MixedEdgeGraph makeGraph(const std::vector<NodeId>& ids) {
    MixedEdgeGraph g;
    for (const auto& id : ids) g.addNode(id);
    return g;
}

// V → A ↔ B o-o C,  A → C
MixedEdgeGraph makeShortCase() {
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "V"});
    g.addEdge("V", "A", EdgeKind::Directed);
    g.addEdge("A", "B", EdgeKind::Bidirected);
    g.addEdge("B", "C", EdgeKind::Circle);
    g.addEdge("A", "C", EdgeKind::Directed);
    return g;
}

// V → W ↔ A ↔ B o-o C,  W → C,  A → C
MixedEdgeGraph makeLongCase() {
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "V", "W"});
    g.addEdge("V", "W", EdgeKind::Directed);
    g.addEdge("W", "A", EdgeKind::Bidirected);
    g.addEdge("A", "B", EdgeKind::Bidirected);
    g.addEdge("B", "C", EdgeKind::Circle);
    g.addEdge("W", "C", EdgeKind::Directed);
    g.addEdge("A", "C", EdgeKind::Directed);
    return g;
}

// A ↔ B o-o C, with A, P1, P2 and W all colliders into C:
// P1 ↔ A ↔ P2,  W ↔ P1,  W ↔ P2,  P1 → C,  P2 → C,  W → C,  A → C,
// and V ↔ W, V ↔ P1, V ↔ A, V ↔ B
MixedEdgeGraph makeSharedPredecessorCase() {
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "P1", "P2", "V", "W"});
    g.addEdge("A", "B", EdgeKind::Bidirected);
    g.addEdge("A", "C", EdgeKind::Directed);
    g.addEdge("B", "C", EdgeKind::Circle);
    g.addEdge("P1", "A", EdgeKind::Bidirected);
    g.addEdge("P2", "A", EdgeKind::Bidirected);
    g.addEdge("P1", "C", EdgeKind::Directed);
    g.addEdge("P2", "C", EdgeKind::Directed);
    g.addEdge("W", "P1", EdgeKind::Bidirected);
    g.addEdge("W", "P2", EdgeKind::Bidirected);
    g.addEdge("W", "C", EdgeKind::Directed);
    g.addEdge("V", "W", EdgeKind::Bidirected);
    g.addEdge("V", "P1", EdgeKind::Bidirected);
    g.addEdge("V", "A", EdgeKind::Bidirected);
    g.addEdge("V", "B", EdgeKind::Bidirected);
    return g;
}

} // namespace

TEST(DiscriminatingPathTest, FindsShortestPath) {
    MixedEdgeGraph g = makeShortCase();
    auto path = DiscriminatingPathSearch::find(g, "A", "B", "C");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->nodes, (std::vector<NodeId>{"V", "A", "B", "C"}));
    EXPECT_EQ(path->length(), 3u);
    EXPECT_TRUE(DiscriminatingPathSearch::isDiscriminatingPath(g, *path));
}

TEST(DiscriminatingPathTest, ExtendsThroughColliderParentsOfEndpoint) {
    MixedEdgeGraph g = makeLongCase();
    auto path = DiscriminatingPathSearch::find(g, "A", "B", "C");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->nodes, (std::vector<NodeId>{"V", "W", "A", "B", "C"}));
    EXPECT_TRUE(path->colliderAt(1));
    EXPECT_TRUE(path->colliderAt(2));
    EXPECT_TRUE(PathPredicates::isUncoveredPath(g, *path));
    EXPECT_TRUE(DiscriminatingPathSearch::isDiscriminatingPath(g, *path));
}

TEST(DiscriminatingPathTest, ReachesNodeAgainThroughLaterPredecessor) {
    MixedEdgeGraph g = makeSharedPredecessorCase();
    // W is first reached from P1, where V would cover the triple.
    // Reached from P2 instead, V ↔ W ↔ P2 is uncovered.
    auto path = DiscriminatingPathSearch::find(g, "A", "B", "C");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->nodes, (std::vector<NodeId>{"V", "W", "P2", "A", "B", "C"}));
    EXPECT_TRUE(PathPredicates::isUncoveredPath(g, *path));
    EXPECT_TRUE(DiscriminatingPathSearch::isDiscriminatingPath(g, *path));

    EXPECT_FALSE(DiscriminatingPathSearch::find(g, "A", "B", "C", 4).has_value());
}

TEST(DiscriminatingPathTest, RespectsMaxPathLength) {
    MixedEdgeGraph g = makeLongCase();
    EXPECT_FALSE(DiscriminatingPathSearch::find(g, "A", "B", "C", 3).has_value());
    EXPECT_TRUE(DiscriminatingPathSearch::find(g, "A", "B", "C", 4).has_value());
}

TEST(DiscriminatingPathTest, NoArrowheadAtFirstInnerNode) {
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "V"});
    g.addEdge("V", "A", EdgeKind::Directed);
    g.addEdge("A", "B", EdgeKind::Directed);
    g.addEdge("B", "C", EdgeKind::Circle);
    g.addEdge("A", "C", EdgeKind::Directed);

    EXPECT_FALSE(DiscriminatingPathSearch::find(g, "A", "B", "C").has_value());
}

TEST(DiscriminatingPathTest, FirstInnerNodeMustBeParentOfEndpoint) {
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "V"});
    g.addEdge("V", "A", EdgeKind::Directed);
    g.addEdge("A", "B", EdgeKind::Bidirected);
    g.addEdge("B", "C", EdgeKind::Circle);
    g.addEdge("A", "C", EdgeKind::Bidirected);

    EXPECT_FALSE(DiscriminatingPathSearch::find(g, "A", "B", "C").has_value());
}

TEST(DiscriminatingPathTest, StartMustNotBeAdjacentToEndpoint) {
    MixedEdgeGraph g = makeShortCase();
    g.addEdge("V", "C", EdgeKind::Directed);

    EXPECT_FALSE(DiscriminatingPathSearch::find(g, "A", "B", "C").has_value());
}

TEST(DiscriminatingPathTest, RejectsMalformedTriples) {
    MixedEdgeGraph g = makeShortCase();
    EXPECT_THROW(DiscriminatingPathSearch::find(g, "A", "B", "A"), InvalidQuery);
    EXPECT_THROW(DiscriminatingPathSearch::find(g, "V", "B", "C"), InvalidQuery);
    EXPECT_THROW(DiscriminatingPathSearch::find(g, "A", "B", "Q"), UnknownNode);
}

TEST(DiscriminatingPathTest, RecheckRejectsOrdinaryPaths) {
    MixedEdgeGraph g = makeShortCase();
    EXPECT_FALSE(DiscriminatingPathSearch::isDiscriminatingPath(
        g, Path::fromNodes(g, {"A", "B", "C"})));
    // A → C is a tail at A: the path ⟨V, A, C, B⟩ has no collider at A.
    EXPECT_FALSE(DiscriminatingPathSearch::isDiscriminatingPath(
        g, Path::fromNodes(g, {"V", "A", "C", "B"})));
}

TEST(DiscriminatingPathTest, UnshieldedCircleTripleHasNoPath) {
    // A o→ B ← C → D,  B o-o D
    MixedEdgeGraph g = makeGraph({"A", "B", "C", "D"});
    g.addEdgeWithMarks("A", "B", EndpointMark::Circle, EndpointMark::Arrow);
    g.addEdge("C", "B", EdgeKind::Directed);
    g.addEdge("C", "D", EdgeKind::Directed);
    g.addEdge("B", "D", EdgeKind::Circle);

    // Neither A (circle mark) nor C (tail) has an arrowhead from B.
    EXPECT_FALSE(DiscriminatingPathSearch::find(g, "A", "B", "D").has_value());
    EXPECT_FALSE(DiscriminatingPathSearch::find(g, "C", "B", "D").has_value());
}
