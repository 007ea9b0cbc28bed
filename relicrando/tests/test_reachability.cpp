#include <gtest/gtest.h>
#include <relicrando/errors.hpp>
#include <relicrando/reachability.hpp>
#include "test_helpers.hpp"
#include <algorithm>
#include <numeric>

using namespace relicrando;

class ReachabilityTest : public ::testing::Test {
protected:
    void SetUp() override {
        model = test_utils::three_location_model();
    }

    std::shared_ptr<const AccessibilityModel> model;
};

// === FORWARD SIMULATION ===

TEST_F(ReachabilityTest, ValidChainCollectsEverything) {
    auto assignment = test_utils::assign(*model, {{"L1", "a"}, {"L2", "b"}, {"L3", "c"}});
    auto reach = simulate(*model, assignment);

    EXPECT_TRUE(reach.collected_all(model->num_tokens()));
    EXPECT_EQ(reach.token_wave[*model->find_token("a")], 0u);
    EXPECT_EQ(reach.token_wave[*model->find_token("b")], 1u);
    EXPECT_EQ(reach.token_wave[*model->find_token("c")], 2u);
    EXPECT_EQ(reach.waves, 3u);
    EXPECT_EQ(reach.max_depth(), 3u);
}

TEST_F(ReachabilityTest, TokenLockedBehindItselfIsRejected) {
    // c at L1, a at L3: L3 needs a, which only L3 holds
    auto assignment = test_utils::assign(*model, {{"L1", "c"}, {"L2", "b"}, {"L3", "a"}});
    auto reach = simulate(*model, assignment);

    EXPECT_FALSE(reach.collected_all(model->num_tokens()));
    EXPECT_TRUE(reach.collected.contains(*model->find_token("c")));
    EXPECT_FALSE(reach.reached(*model->find_location("L2")));
    EXPECT_FALSE(reach.reached(*model->find_location("L3")));
}

TEST_F(ReachabilityTest, OnlyOneAssignmentOfTheScenarioIsSound) {
    std::vector<TokenId> order(model->num_tokens());
    std::iota(order.begin(), order.end(), 0);

    size_t sound = 0;
    do {
        Assignment assignment(model->num_locations(), model->num_tokens());
        for (LocationId l = 0; l < order.size(); ++l) {
            assignment.place(l, order[l]);
        }
        if (simulate(*model, assignment).collected_all(model->num_tokens())) {
            ++sound;
            EXPECT_EQ(model->token(order[0]).id, "a");
            EXPECT_EQ(model->token(order[1]).id, "b");
        }
    } while (std::next_permutation(order.begin(), order.end()));

    EXPECT_EQ(sound, 1u);
}

TEST_F(ReachabilityTest, OpenSlotsOpenButYieldNothing) {
    auto assignment = test_utils::assign(*model, {{"L1", "a"}});
    auto reach = simulate(*model, assignment);

    EXPECT_TRUE(reach.reached(*model->find_location("L2")));
    EXPECT_FALSE(reach.reached(*model->find_location("L3")));
    EXPECT_EQ(reach.collected.count(), 1u);
}

TEST_F(ReachabilityTest, ExcludedLocationsNeverOpen) {
    auto assignment = test_utils::assign(*model, {{"L1", "a"}, {"L2", "b"}, {"L3", "c"}});
    auto reach = simulate(*model, assignment, {*model->find_location("L2")});

    EXPECT_EQ(reach.collected, (TokenSet{*model->find_token("a")}));
    EXPECT_FALSE(reach.reached(*model->find_location("L3")));
}

// === ESCAPE RULES ===

TEST(EscapeTest, GuaranteedTokensIncludePrerequisites) {
    auto model = test_utils::make_model({"a", "b", "c"}, {
        {"L1", {}},
        {"L2", {{"a"}}},
        {"L3", {{"b"}}, {{"a"}}},
    });
    auto assignment = test_utils::assign(*model, {{"L1", "a"}, {"L2", "b"}, {"L3", "c"}});

    const auto a = *model->find_token("a");
    const auto b = *model->find_token("b");
    auto guaranteed = guaranteed_tokens(*model, assignment, *model->find_location("L3"), TokenSet{b});
    ASSERT_TRUE(guaranteed.has_value());
    EXPECT_EQ(*guaranteed, (TokenSet{a, b}));

    std::string offending;
    EXPECT_TRUE(escapes_satisfied(*model, assignment, &offending));
    EXPECT_TRUE(offending.empty());
}

TEST(EscapeTest, RouteThroughTheLocationItselfIsIgnored) {
    auto model = test_utils::make_model({"a", "b", "c"}, {
        {"L1", {}},
        {"L2", {{"a"}}},
        {"L3", {{"b"}}},
    });
    auto assignment = test_utils::assign(*model, {{"L1", "a"}, {"L2", "c"}, {"L3", "b"}});

    auto guaranteed = guaranteed_tokens(*model, assignment, *model->find_location("L3"),
                                        TokenSet{*model->find_token("b")});
    EXPECT_FALSE(guaranteed.has_value());
}

TEST(EscapeTest, EveryRouteMustCoverAnEscape) {
    // Entering L3 with only b leaves the player without a
    auto model = test_utils::make_model({"a", "b", "c", "d"}, {
        {"L1", {}},
        {"L2", {}},
        {"L3", {{"a"}, {"b"}}, {{"a"}}},
        {"L4", {{"a", "b"}}},
    });
    auto assignment = test_utils::assign(*model, {{"L1", "a"}, {"L2", "b"}, {"L3", "c"}, {"L4", "d"}});

    std::string offending;
    EXPECT_FALSE(escapes_satisfied(*model, assignment, &offending));
    EXPECT_EQ(offending, "L3");
}

TEST(EscapeTest, UnconditionalLocationIsEnteredEmptyHanded) {
    auto model = test_utils::make_model({"a", "b"}, {
        {"L1", {}, {{"a"}}},
        {"L2", {}},
    });
    auto assignment = test_utils::assign(*model, {{"L1", "b"}, {"L2", "a"}});

    EXPECT_FALSE(escapes_satisfied(*model, assignment));
}

// === GOAL DEPTH AND PROOF ===

TEST_F(ReachabilityTest, GoalDepthIsShallowestGoalLock) {
    ModelBuilder builder;
    builder.add_token("a").add_token("b").add_token("c");
    builder.add_location("L1").add_location("L2").add_location("L3");
    builder.set_locks("L2", {{"a"}}).set_locks("L3", {{"a", "b"}});
    builder.set_goal(1, std::nullopt, {{"c"}, {"b"}});
    auto with_goal = builder.build();

    auto assignment = test_utils::assign(*with_goal, {{"L1", "a"}, {"L2", "b"}, {"L3", "c"}});
    auto depth = goal_depth(*with_goal, simulate(*with_goal, assignment));
    ASSERT_TRUE(depth.has_value());
    EXPECT_EQ(*depth, 2u);

    EXPECT_FALSE(goal_depth(*model, simulate(*model, assignment)).has_value());
}

TEST_F(ReachabilityTest, ProofFollowsAcquisitionOrder) {
    auto assignment = test_utils::assign(*model, {{"L1", "a"}, {"L2", "b"}, {"L3", "c"}});
    auto proof = build_proof(*model, assignment, simulate(*model, assignment));

    ASSERT_EQ(proof.solutions.size(), 1u);
    const auto& target = proof.solutions[0];
    ASSERT_EQ(target.size(), 3u);

    const auto& a = target[0];
    const auto& b = target[1];
    const auto& c = target[2];
    EXPECT_TRUE(a->is_leaf());
    ASSERT_EQ(b->locks.size(), 1u);
    EXPECT_EQ(b->locks[0][0], a);  // Shared node
    ASSERT_EQ(c->locks.size(), 1u);
    EXPECT_EQ(c->locks[0].size(), 2u);
}

TEST(ProofConstructionTest, LocksFromLaterWavesAreDropped) {
    auto model = test_utils::make_model({"a", "b", "c", "d"}, {
        {"L1", {}},
        {"L2", {{"a"}}},
        {"L3", {{"b"}}},
        {"L4", {{"a"}, {"c"}}},
    });
    auto assignment = test_utils::assign(*model, {{"L1", "a"}, {"L2", "b"}, {"L3", "c"}, {"L4", "d"}});
    auto proof = build_proof(*model, assignment, simulate(*model, assignment));

    const auto d = *model->find_token("d");
    ProofNodePtr d_node;
    for (const auto& node : proof.solutions[0]) {
        if (node->token == d) d_node = node;
    }
    ASSERT_TRUE(d_node);
    ASSERT_EQ(d_node->locks.size(), 1u);
    EXPECT_EQ(d_node->locks[0][0]->token, *model->find_token("a"));
}
