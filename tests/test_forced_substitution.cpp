/**
 * Tests for foul-outs, injuries and coach's substitutions
 */

#include "test_fixtures.hpp"

// ============================================================================
// FOUL-OUT
// ============================================================================

TEST(ForcedSubstitution, FoulOutReplacesWithRoleMatch) {
    StaminaTable stamina;
    SubstitutionManager manager(make_team_setup("h"), make_team_setup("a"), stamina);
    GameContext game(3, 400, 60, 58);
    manager.start_quarter(GameContext(3, 720, 50, 50));
    manager.update_time_on_court(320.0);

    FoulRecord record;
    for (int i = 0; i < 6; i++) {
        record = manager.record_foul(TeamSide::HOME, "h3");
    }
    TEST_ASSERT_TRUE(record.fouled_out);
    TEST_ASSERT_TRUE(record.in_bonus);

    auto result = manager.handle_foul_out(TeamSide::HOME, "h3", game);
    TEST_ASSERT_TRUE(result.success());
    TEST_ASSERT_TRUE(result.event.has_value());
    TEST_ASSERT_EQ("h3", result.event->player_out);
    TEST_ASSERT_EQ("h8", result.event->player_in);
    TEST_ASSERT_TRUE(result.event->reason == SubstitutionReason::FOULED_OUT);

    const auto& team = manager.team(TeamSide::HOME);
    TEST_ASSERT_FALSE(team.lineup.is_active("h3"));
    TEST_ASSERT_TRUE(team.lineup.validate());

    // Unplayed target moved to the rest of the roster
    const double played = 320.0 / 60.0;
    TEST_ASSERT_NEAR(played, team.minutes.game_target("h3"), 1e-6);
    TEST_ASSERT_NEAR(240.0, team.minutes.total_game_minutes(), 1e-6);
    TEST_ASSERT_TRUE(result.redistributed_minutes > 0.0);

    TEST_ASSERT_EQ(1u, manager.event_log().size());
}

TEST(ForcedSubstitution, FouledOutPlayerNeverReturns) {
    StaminaTable stamina;
    SubstitutionManager manager(make_team_setup("h"), make_team_setup("a"), stamina);
    GameContext game(2, 500, 30, 30);
    manager.start_quarter(GameContext(2, 720, 25, 25));

    manager.handle_foul_out(TeamSide::HOME, "h1", game);

    // Everyone on the floor is exhausted; h1 is the only fresh starter on the bench
    stamina.set_all({"h6", "h2", "h3", "h4", "h5"}, 40.0);
    stamina.set_all({"h7", "h8", "h9", "h10"}, 95.0);
    auto check = manager.check_and_execute(GameContext(2, 480, 32, 30));

    for (const auto& event : check.events) {
        TEST_ASSERT_NE(std::string("h1"), event.player_in);
    }
    TEST_ASSERT_FALSE(manager.team(TeamSide::HOME).lineup.is_active("h1"));

    auto manual = manager.make_substitution(TeamSide::HOME, "h7", "h1", GameContext(2, 470, 32, 30));
    TEST_ASSERT_FALSE(manual.success);
    TEST_ASSERT_TRUE(manual.status == SubstitutionStatus::PLAYER_IN_UNAVAILABLE);
}

TEST(ForcedSubstitution, BenchPlayerRemovedWithoutEvent) {
    StaminaTable stamina;
    SubstitutionManager manager(make_team_setup("h"), make_team_setup("a"), stamina);

    const double before = manager.team(TeamSide::HOME).minutes.game_target("h9");
    auto result = manager.handle_injury(TeamSide::HOME, "h9", GameContext(1, 600, 4, 2));

    TEST_ASSERT_TRUE(result.status == ForcedStatus::PLAYER_NOT_ACTIVE);
    TEST_ASSERT_FALSE(result.event.has_value());
    TEST_ASSERT_NEAR(before, result.redistributed_minutes, 1e-9);
    TEST_ASSERT_TRUE(manager.team(TeamSide::HOME).discipline.is_injured("h9"));
    TEST_ASSERT_TRUE(manager.event_log().empty());
}

TEST(ForcedSubstitution, InjuryOnCourt) {
    StaminaTable stamina;
    stamina.set("h7", 70.0);
    SubstitutionManager manager(make_team_setup("h"), make_team_setup("a"), stamina);

    auto result = manager.handle_injury(TeamSide::HOME, "h2", GameContext(1, 400, 12, 14));
    TEST_ASSERT_TRUE(result.success());
    TEST_ASSERT_TRUE(result.event->reason == SubstitutionReason::INJURY);

    // Rested PG beats the tired SG within the guard group
    TEST_ASSERT_EQ("h6", result.event->player_in);
}

TEST(ForcedSubstitution, UnknownPlayer) {
    StaminaTable stamina;
    SubstitutionManager manager(make_team_setup("h"), make_team_setup("a"), stamina);
    auto result = manager.handle_foul_out(TeamSide::AWAY, "h1", GameContext(1, 400, 0, 0));
    TEST_ASSERT_TRUE(result.status == ForcedStatus::UNKNOWN_PLAYER);
    TEST_ASSERT_FALSE(result.success());
}

// ============================================================================
// ROSTER EXHAUSTION
// ============================================================================

TEST(ForcedSubstitution, ExhaustedRosterKeepsLineupAndTargets) {
    StaminaTable stamina;
    SubstitutionManager manager(make_team_setup("h", {70, 70, 70, 70, 70}), make_team_setup("a"), stamina);
    manager.start_quarter(GameContext(3, 720, 60, 60));

    const auto& home = manager.team(TeamSide::HOME);
    const PlayerIDList before = home.lineup.active_ids();

    auto result = manager.handle_foul_out(TeamSide::HOME, "h1", GameContext(3, 300, 70, 70));
    TEST_ASSERT_TRUE(result.status == ForcedStatus::ROSTER_EXHAUSTED);
    TEST_ASSERT_FALSE(result.event.has_value());
    TEST_ASSERT_TRUE(home.lineup.active_ids() == before);
    TEST_ASSERT_TRUE(home.discipline.is_fouled_out("h1"));
    TEST_ASSERT_FALSE(home.minutes.is_removed("h1"));
    TEST_ASSERT_NEAR(240.0, home.minutes.total_game_minutes(), 1e-6);

    auto check = manager.check_and_execute(GameContext(3, 280, 72, 70));
    TEST_ASSERT_TRUE(check.is_infeasible(TeamSide::HOME));
    TEST_ASSERT_FALSE(check.is_infeasible(TeamSide::AWAY));
    TEST_ASSERT_TRUE(events_for(check.events, TeamSide::HOME).empty());
    TEST_ASSERT_TRUE(home.lineup.active_ids() == before);
}

// ============================================================================
// MANUAL SUBSTITUTION
// ============================================================================

TEST(ForcedSubstitution, ManualSubstitutionRecordsEvent) {
    StaminaTable stamina;
    SubstitutionManager manager(make_team_setup("h"), make_team_setup("a"), stamina);

    auto rejected = manager.make_substitution(TeamSide::AWAY, "a6", "a7", GameContext(1, 500, 0, 0));
    TEST_ASSERT_FALSE(rejected.success);
    TEST_ASSERT_TRUE(manager.event_log().empty());

    auto accepted = manager.make_substitution(TeamSide::AWAY, "a5", "a10", GameContext(1, 500, 0, 0));
    TEST_ASSERT_TRUE(accepted.success);
    TEST_ASSERT_EQ(1u, manager.event_log().size());
    TEST_ASSERT_TRUE(manager.event_log().events()[0].reason == SubstitutionReason::MANUAL);
    TEST_ASSERT_TRUE(manager.event_log().events()[0].team == TeamSide::AWAY);
}
