#include <gtest/gtest.h>
#include <relicrando/accessibility_model.hpp>
#include <relicrando/catalog.hpp>
#include <relicrando/errors.hpp>
#include "test_helpers.hpp"

using namespace relicrando;

namespace {

// Runs fn and returns the ModelError message, or "" when nothing was thrown
template<typename F>
std::string model_error_of(F&& fn) {
    try {
        fn();
    } catch (const ModelError& e) {
        return e.what();
    }
    return "";
}

} // namespace

// === CONSTRUCTION ===

TEST(AccessibilityModelTest, BuildResolvesTokensAndLocks) {
    auto model = test_utils::three_location_model();

    EXPECT_EQ(model->num_tokens(), 3u);
    EXPECT_EQ(model->num_locations(), 3u);

    const auto a = *model->find_token("a");
    const auto b = *model->find_token("b");
    const auto& l3 = model->location(*model->find_location("L3"));
    ASSERT_EQ(l3.locks.size(), 1u);
    EXPECT_EQ(l3.locks[0], (TokenSet{a, b}));
    EXPECT_TRUE(model->location(*model->find_location("L1")).unconditional());
}

TEST(AccessibilityModelTest, TokenNameDefaultsToId) {
    ModelBuilder builder;
    builder.add_token("x").add_token("y", "Wand of Y");
    builder.add_location("L1").add_location("L2");
    auto model = builder.build();

    EXPECT_EQ(model->token(0).name, "x");
    EXPECT_EQ(model->token(1).name, "Wand of Y");
}

TEST(AccessibilityModelTest, EmptyLockMakesLocationUnconditional) {
    auto model = test_utils::make_model({"a", "b"}, {
        {"L1", {}},
        {"L2", {{"a"}, {}}},
    });

    EXPECT_TRUE(model->location(1).unconditional());
}

TEST(AccessibilityModelTest, PinnedLookups) {
    auto model = test_utils::make_model({"a", "b"}, {{"L1", {}}, {"L2", {{"a"}}}},
                                        {{"b", "L1"}});

    EXPECT_EQ(model->pinned_token(*model->find_location("L1")), *model->find_token("b"));
    EXPECT_EQ(model->pinned_token(*model->find_location("L2")), INVALID_ID);
    EXPECT_TRUE(model->is_pinned(*model->find_token("b")));
    EXPECT_FALSE(model->is_pinned(*model->find_token("a")));
}

// === VALIDATION ===

TEST(AccessibilityModelTest, DuplicateLocationRejected) {
    auto message = model_error_of([] {
        ModelBuilder builder;
        builder.add_token("a").add_token("b");
        builder.add_location("L1").add_location("L1");
        builder.build();
    });
    EXPECT_NE(message.find("appears twice"), std::string::npos) << message;
}

TEST(AccessibilityModelTest, UnknownTokenInLockRejected) {
    auto message = model_error_of([] {
        test_utils::make_model({"a", "b"}, {{"L1", {}}, {"L2", {{"zz"}}}});
    });
    EXPECT_NE(message.find("zz"), std::string::npos) << message;
}

TEST(AccessibilityModelTest, UnknownLocationOverrideRejected) {
    EXPECT_THROW({
        ModelBuilder builder;
        builder.add_token("a").add_location("L1");
        builder.set_locks("nowhere", {{"a"}});
        builder.build();
    }, ModelError);
}

TEST(AccessibilityModelTest, CountMismatchRejected) {
    auto message = model_error_of([] {
        test_utils::make_model({"a", "b", "c"}, {{"L1", {}}, {"L2", {{"a"}}}});
    });
    EXPECT_NE(message.find("3 tokens for 2 locations"), std::string::npos) << message;
}

TEST(AccessibilityModelTest, PlacedTokenLockingItsOwnLocationRejected) {
    EXPECT_THROW(test_utils::make_model({"a", "b"}, {{"L1", {}}, {"L2", {{"a"}}}}, {{"a", "L2"}}),
                 ModelError);
}

TEST(AccessibilityModelTest, PlacedTwiceRejected) {
    EXPECT_THROW(test_utils::make_model({"a", "b"}, {{"L1", {}}, {"L2", {}}},
                                        {{"a", "L1"}, {"a", "L2"}}),
                 ModelError);
    EXPECT_THROW(test_utils::make_model({"a", "b"}, {{"L1", {}}, {"L2", {}}},
                                        {{"a", "L1"}, {"b", "L1"}}),
                 ModelError);
}

TEST(AccessibilityModelTest, PlacedUnknownNamesRejected) {
    EXPECT_THROW(test_utils::make_model({"a"}, {{"L1", {}}}, {{"q", "L1"}}), ModelError);
    EXPECT_THROW(test_utils::make_model({"a"}, {{"L1", {}}}, {{"a", "L9"}}), ModelError);
}

TEST(AccessibilityModelTest, GoalValidation) {
    auto build_with_goal = [](uint32_t min, std::optional<uint32_t> max, std::vector<LockSpec> locks) {
        ModelBuilder builder;
        builder.add_token("a").add_token("b");
        builder.add_location("L1").add_location("L2");
        builder.set_goal(min, max, locks);
        return builder.build();
    };

    EXPECT_NO_THROW(build_with_goal(1, 2, {{"a"}}));
    EXPECT_THROW(build_with_goal(3, 2, {{"a"}}), ModelError);
    EXPECT_THROW(build_with_goal(1, std::nullopt, {}), ModelError);
    EXPECT_THROW(build_with_goal(1, std::nullopt, {{}}), ModelError);
    EXPECT_THROW(build_with_goal(1, std::nullopt, {{"nope"}}), ModelError);
}

TEST(AccessibilityModelTest, ClearGoalDropsPendingGoal) {
    ModelBuilder builder;
    builder.add_token("a").add_token("b");
    builder.add_location("L1").add_location("L2");
    builder.set_goal(3, 2, {{"a"}});
    builder.clear_goal();

    auto model = builder.build();
    EXPECT_FALSE(model->goal().has_value());

    TokenSet all = model->all_tokens();
    EXPECT_EQ(all.count(), 2u);
    EXPECT_TRUE(all.contains(*model->find_token("a")));
    EXPECT_TRUE(all.contains(*model->find_token("b")));
}

// === LOCATION SETS ===

TEST(AccessibilityModelTest, ExtensionModesNest) {
    const auto none = catalog::build_locations(ExtensionMode::None);
    const auto guarded = catalog::build_locations(ExtensionMode::Guarded);
    const auto equipment = catalog::build_locations(ExtensionMode::Equipment);

    EXPECT_EQ(none.size(), catalog::relics().size());
    EXPECT_GT(guarded.size(), none.size());
    EXPECT_GT(equipment.size(), guarded.size());

    // Each mode is a prefix of the next one
    for (size_t i = 0; i < guarded.size(); ++i) {
        EXPECT_EQ(equipment[i].id, guarded[i].id);
    }
    for (size_t i = 0; i < none.size(); ++i) {
        EXPECT_EQ(guarded[i].id, none[i].id);
        EXPECT_EQ(none[i].kind, LocationKind::Base);
    }
    for (size_t i = none.size(); i < guarded.size(); ++i) {
        EXPECT_EQ(guarded[i].tier, ExtensionMode::Guarded);
    }
    for (size_t i = guarded.size(); i < equipment.size(); ++i) {
        EXPECT_EQ(equipment[i].tier, ExtensionMode::Equipment);
    }
}

TEST(AccessibilityModelTest, CatalogModelsAreValid) {
    for (auto mode : {ExtensionMode::None, ExtensionMode::Guarded, ExtensionMode::Equipment}) {
        auto model = catalog::make_builder(mode).build();
        EXPECT_EQ(model->num_tokens(), model->num_locations());
        EXPECT_EQ(model->num_locations(), catalog::build_locations(mode).size());
    }
}
