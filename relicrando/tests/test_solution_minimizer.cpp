#include <gtest/gtest.h>
#include <relicrando/errors.hpp>
#include <relicrando/reachability.hpp>
#include <relicrando/solution_minimizer.hpp>
#include "test_helpers.hpp"

using namespace relicrando;
using test_utils::leaf;
using test_utils::node;

namespace {

// Requirement of depth 2: token with a single leaf prerequisite
ProofNodePtr two_deep(TokenId token, TokenId prerequisite) {
    return node(token, {{leaf(prerequisite)}});
}

ProofGraph graph_of(std::vector<ProofLock> solutions) {
    ProofGraph graph;
    graph.solutions = std::move(solutions);
    return graph;
}

} // namespace

class SolutionMinimizerTest : public ::testing::Test {
protected:
    SolutionMinimizer minimizer;
};

// === SCORING ===

TEST(SolutionScoreTest, LexicographicOrder) {
    SolutionScore shallow{1, 5, 5};
    SolutionScore deep{2, 2, 1};
    EXPECT_TRUE(shallow.better_than(deep));
    EXPECT_FALSE(deep.better_than(shallow));

    SolutionScore light{2, 3, 2};
    SolutionScore heavy{2, 4, 2};
    EXPECT_TRUE(light.better_than(heavy));

    // 4/3 < 4/2
    SolutionScore balanced{2, 4, 3};
    SolutionScore lopsided{2, 4, 2};
    EXPECT_TRUE(balanced.better_than(lopsided));
    EXPECT_FALSE(lopsided.better_than(balanced));
}

TEST(SolutionScoreTest, EqualAveragesAreNotBetter) {
    // 6/3 == 4/2 exactly
    SolutionScore a{2, 6, 3};
    SolutionScore b{2, 6, 3};
    EXPECT_FALSE(a.better_than(b));
    EXPECT_FALSE(b.better_than(a));
}

// === SELECTION ===

TEST_F(SolutionMinimizerTest, SingleLeaf) {
    auto proof = minimizer.minimize(graph_of({{leaf(0)}}));

    ASSERT_EQ(proof.solutions.size(), 1u);
    EXPECT_EQ(proof.solutions[0], Solution(SolutionLeaf{0}));
    EXPECT_EQ(proof.depth, 1u);
}

TEST_F(SolutionMinimizerTest, ShallowestAlternativeWins) {
    auto root = node(0, {
        {two_deep(2, 3)},
        {leaf(1)},
    });
    auto proof = minimizer.minimize(graph_of({{root}}));

    ASSERT_EQ(proof.solutions.size(), 1u);
    EXPECT_EQ(proof.solutions[0], Solution(SolutionCompound{{0, 1}, {}}));
    EXPECT_EQ(proof.depth, 2u);
}

TEST_F(SolutionMinimizerTest, LighterAlternativeWinsAtEqualDepth) {
    auto root = node(0, {
        {leaf(1), two_deep(2, 3)},  // depth 2, weight 3
        {two_deep(4, 5)},           // depth 2, weight 2
    });
    auto proof = minimizer.minimize(graph_of({{root}}));

    EXPECT_EQ(proof.solutions[0], Solution(SolutionCompound{{0, 4, 5}, {}}));
}

TEST_F(SolutionMinimizerTest, BalancedAlternativeWinsAtEqualWeight) {
    auto root = node(0, {
        {two_deep(1, 2), two_deep(3, 4)},         // weight 4 over 2
        {two_deep(5, 6), leaf(7), leaf(8)},       // weight 4 over 3
    });
    auto proof = minimizer.minimize(graph_of({{root}}));

    const auto& chosen = proof.solutions[0];
    EXPECT_EQ(chosen.tokens(), (std::vector<TokenId>{0}));
    ASSERT_EQ(chosen.requirements().size(), 3u);
    EXPECT_EQ(chosen.requirements()[0], Solution(SolutionCompound{{5, 6}, {}}));
}

TEST_F(SolutionMinimizerTest, FirstAlternativeWinsFullTie) {
    auto root = node(0, {
        {leaf(1)},
        {leaf(2)},
    });
    auto proof = minimizer.minimize(graph_of({{root}}));

    EXPECT_EQ(proof.solutions[0], Solution(SolutionCompound{{0, 1}, {}}));
}

TEST_F(SolutionMinimizerTest, ShallowestTargetWins) {
    auto proof = minimizer.minimize(graph_of({
        {two_deep(0, 1)},
        {leaf(2), leaf(3)},
    }));

    EXPECT_EQ(proof.depth, 1u);
    ASSERT_EQ(proof.solutions.size(), 2u);
    EXPECT_EQ(proof.solutions[0], Solution(SolutionLeaf{2}));
    EXPECT_EQ(proof.solutions[1], Solution(SolutionLeaf{3}));
}

// === PRUNING AND COLLAPSING ===

TEST_F(SolutionMinimizerTest, CoveredRequirementIsPruned) {
    // Root needs X and Y, but X already needs Y
    auto y = leaf(2);
    auto x = node(1, {{y}});
    auto root = node(0, {{y, x}});
    auto proof = minimizer.minimize(graph_of({{root}}));

    ASSERT_EQ(proof.solutions.size(), 1u);
    EXPECT_EQ(proof.solutions[0], Solution(SolutionCompound{{0, 1, 2}, {}}));
    EXPECT_EQ(proof.depth, 3u);
}

TEST_F(SolutionMinimizerTest, DisjointRequirementsAreKeptDeepestFirst) {
    auto root = node(0, {{leaf(1), two_deep(2, 3)}});
    auto proof = minimizer.minimize(graph_of({{root}}));

    SolutionCompound expected{{0}, {Solution(SolutionCompound{{2, 3}, {}}), Solution(SolutionLeaf{1})}};
    EXPECT_EQ(proof.solutions[0], Solution(expected));
}

TEST_F(SolutionMinimizerTest, TopLevelTargetIsNotPruned) {
    auto y = leaf(2);
    auto x = node(1, {{y}});
    auto proof = minimizer.minimize(graph_of({{x, y}}));

    ASSERT_EQ(proof.solutions.size(), 2u);
    EXPECT_EQ(proof.solutions[0], Solution(SolutionCompound{{1, 2}, {}}));
    EXPECT_EQ(proof.solutions[1], Solution(SolutionLeaf{2}));
}

TEST_F(SolutionMinimizerTest, MinimizationIsIdempotent) {
    auto y = leaf(5);
    auto x = node(4, {{y}});
    auto z = node(3, {{leaf(6)}, {x, y}});
    auto root = node(0, {
        {z, leaf(1), two_deep(2, 7)},
        {leaf(1), x},
    });
    auto first = minimizer.minimize(graph_of({{root, leaf(8)}}));
    auto second = minimizer.minimize(expand_solutions(first.solutions));

    EXPECT_EQ(first.solutions, second.solutions);
    EXPECT_EQ(first.depth, second.depth);
}

TEST_F(SolutionMinimizerTest, MinimizesConstructedProof) {
    auto model = test_utils::three_location_model();
    auto assignment = test_utils::assign(*model, {{"L1", "a"}, {"L2", "b"}, {"L3", "c"}});
    auto graph = build_proof(*model, assignment, simulate(*model, assignment));

    auto proof = minimizer.minimize(graph);
    EXPECT_EQ(proof.depth, 3u);
    ASSERT_EQ(proof.solutions.size(), 3u);

    // c needs a and b; b already needs a
    const auto a = *model->find_token("a");
    const auto b = *model->find_token("b");
    const auto c = *model->find_token("c");
    EXPECT_EQ(proof.solutions[2], Solution(SolutionCompound{{c, b, a}, {}}));
}

// === MALFORMED GRAPHS ===

TEST_F(SolutionMinimizerTest, EmptyGraphIsProofError) {
    EXPECT_THROW(minimizer.minimize(ProofGraph{}), ProofError);
}

TEST_F(SolutionMinimizerTest, EmptyLockIsProofError) {
    EXPECT_THROW(minimizer.minimize(graph_of({ProofLock{}})), ProofError);
    EXPECT_THROW(minimizer.minimize(graph_of({{node(0, {ProofLock{}})}})), ProofError);
}

TEST_F(SolutionMinimizerTest, NullNodeIsProofError) {
    EXPECT_THROW(minimizer.minimize(graph_of({{ProofNodePtr{}}})), ProofError);
}

TEST_F(SolutionMinimizerTest, CycleIsProofError) {
    auto first = std::make_shared<ProofNode>();
    auto second = std::make_shared<ProofNode>();
    first->token = 0;
    second->token = 1;
    first->locks.push_back({second});
    second->locks.push_back({first});

    EXPECT_THROW(minimizer.minimize(graph_of({{first}})), ProofError);

    // Break the reference cycle
    second->locks.clear();
}
