/**
 * Tests for the Minutes Planner
 */

#include "test_fixtures.hpp"

// ============================================================================
// TARGETS
// ============================================================================

TEST(MinutesPlanner, TargetsSumToLineupMinutes) {
    Roster roster(make_players("h"));
    MinutesPlanner planner;
    planner.calculate_targets(roster);

    TEST_ASSERT_NEAR(240.0, planner.total_game_minutes(), 1e-6);
    TEST_ASSERT_NEAR(60.0, planner.total_quarter_minutes(), 1e-6);

    for (const auto& player : roster.players()) {
        TEST_ASSERT_TRUE(planner.game_target(player.id) <= MinutesPlanner::MAX_GAME_MINUTES + 1e-6);
        TEST_ASSERT_NEAR(planner.game_target(player.id) / 4.0, planner.quarter_target(player.id), 1e-9);
    }
}

TEST(MinutesPlanner, BetterPlayersGetMoreMinutes) {
    Roster roster(make_players("h"));
    MinutesPlanner planner;
    planner.calculate_targets(roster);

    TEST_ASSERT_NEAR(40.0, planner.game_target("h1"), 1e-6);
    TEST_ASSERT_TRUE(planner.game_target("h4") >= planner.game_target("h5"));
    TEST_ASSERT_TRUE(planner.game_target("h5") > planner.game_target("h6"));
    TEST_ASSERT_TRUE(planner.game_target("h6") > planner.game_target("h10"));
    TEST_ASSERT_TRUE(planner.game_target("h10") > 0.0);
}

TEST(MinutesPlanner, FivePlayerRosterPlaysFullGame) {
    Roster roster(make_players("h", {90, 50, 50, 50, 50}));
    MinutesPlanner planner;
    planner.calculate_targets(roster);

    for (const auto& player : roster.players()) {
        TEST_ASSERT_NEAR(48.0, planner.game_target(player.id), 1e-6);
    }
}

TEST(MinutesPlanner, UnknownPlayerHasNoTarget) {
    MinutesPlanner planner;
    planner.calculate_targets(Roster(make_players("h")));
    TEST_ASSERT_NULL(planner.target_for("nobody"));
    TEST_ASSERT_EQ(0.0, planner.game_target("nobody"));
}

// ============================================================================
// ALLOTMENT
// ============================================================================

TEST(MinutesPlanner, ApplyAllotment) {
    Roster roster(make_players("h"));
    MinutesPlanner planner;
    planner.apply_allotment(roster, standard_allotment("h"));

    TEST_ASSERT_NEAR(36.0, planner.game_target("h1"), 1e-9);
    TEST_ASSERT_NEAR(9.0, planner.quarter_target("h1"), 1e-9);
    TEST_ASSERT_NEAR(1.0, planner.quarter_target("h10"), 1e-9);
    TEST_ASSERT_NEAR(240.0, planner.total_game_minutes(), 1e-9);
}

TEST(MinutesPlanner, RejectsInvalidAllotment) {
    Roster roster(make_players("h"));

    auto short_total = standard_allotment("h");
    short_total["h10"] = 3.0;

    auto unknown = standard_allotment("h");
    unknown["x1"] = 0.0;

    auto negative = standard_allotment("h");
    negative["h10"] = -4.0;
    negative["h9"] = 14.0;

    auto too_many = standard_allotment("h");
    too_many["h1"] = 50.0;
    too_many["h6"] = 18.0;

    for (const auto& allotment : {short_total, unknown, negative, too_many}) {
        MinutesPlanner planner;
        bool threw = false;
        try {
            planner.apply_allotment(roster, allotment);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        TEST_ASSERT_TRUE(threw);
    }
}

// ============================================================================
// REDISTRIBUTION
// ============================================================================

TEST(MinutesPlanner, RedistributionConservesTotal) {
    Roster roster(make_players("h"));
    MinutesPlanner planner;
    planner.calculate_targets(roster);

    const double before_h2 = planner.game_target("h2");
    const double before_h6 = planner.game_target("h6");
    const double before_h10 = planner.game_target("h10");

    double moved = planner.redistribute("h1", 20.0, roster);

    TEST_ASSERT_NEAR(20.0, moved, 1e-6);
    TEST_ASSERT_NEAR(240.0, planner.total_game_minutes(), 1e-6);
    TEST_ASSERT_NEAR(20.0, planner.game_target("h1"), 1e-6);
    TEST_ASSERT_EQ(0.0, planner.quarter_target("h1"));
    TEST_ASSERT_TRUE(planner.is_removed("h1"));

    // Weighted toward better players
    const double gain_h2 = planner.game_target("h2") - before_h2;
    const double gain_h6 = planner.game_target("h6") - before_h6;
    const double gain_h10 = planner.game_target("h10") - before_h10;
    TEST_ASSERT_TRUE(gain_h2 > gain_h6);
    TEST_ASSERT_TRUE(gain_h6 > gain_h10);
    TEST_ASSERT_TRUE(gain_h10 > 0.0);
}

TEST(MinutesPlanner, RemovedPlayersReceiveNothing) {
    Roster roster(make_players("h"));
    MinutesPlanner planner;
    planner.calculate_targets(roster);

    planner.redistribute("h1", 20.0, roster);
    planner.redistribute("h2", 10.0, roster);

    TEST_ASSERT_NEAR(20.0, planner.game_target("h1"), 1e-6);
    TEST_ASSERT_NEAR(10.0, planner.game_target("h2"), 1e-6);
    TEST_ASSERT_NEAR(240.0, planner.total_game_minutes(), 1e-6);

    // Second removal of the same player is a no-op
    TEST_ASSERT_EQ(0.0, planner.redistribute("h2", 12.0, roster));
    TEST_ASSERT_NEAR(10.0, planner.game_target("h2"), 1e-6);
}

TEST(MinutesPlanner, PlayedPastTargetMovesNothing) {
    Roster roster(make_players("h"));
    MinutesPlanner planner;
    planner.calculate_targets(roster);

    TEST_ASSERT_EQ(0.0, planner.redistribute("h10", 30.0, roster));
    TEST_ASSERT_NEAR(240.0, planner.total_game_minutes(), 1e-6);
    TEST_ASSERT_TRUE(planner.is_removed("h10"));
}

// ============================================================================
// VERIFICATION
// ============================================================================

TEST(MinutesPlanner, VerifyUsesTargetSizedTolerance) {
    Roster roster(make_players("h"));
    MinutesPlanner planner;
    planner.apply_allotment(roster, standard_allotment("h"));

    auto actual = standard_allotment("h");
    actual["h1"] = 33.0;    // 36 target, off by 3 (> 2)
    actual["h2"] = 34.5;    // off by 1.5, fine
    actual["h7"] = 14.0;    // 10 target, off by 4 (<= 5)
    actual["h8"] = 14.0;    // 8 target, off by 6 (> 5)

    auto misses = planner.verify(roster, actual);
    TEST_ASSERT_EQ(2u, misses.size());
    TEST_ASSERT_EQ("h1", misses[0].player_id);
    TEST_ASSERT_NEAR(-3.0, misses[0].diff, 1e-9);
    TEST_ASSERT_EQ("h8", misses[1].player_id);
    TEST_ASSERT_NEAR(6.0, misses[1].diff, 1e-9);
}
