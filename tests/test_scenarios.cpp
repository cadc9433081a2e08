/**
 * End-to-end rotation scenarios driven through the substitution manager
 */

#include "test_fixtures.hpp"

namespace {

TeamSetup allotted_team(const std::string& prefix) {
    TeamSetup setup = make_team_setup(prefix);
    setup.tactics.minutes_allotment = standard_allotment(prefix);
    return setup;
}

void check_lineup_invariants(const SubstitutionManager& manager) {
    for (TeamSide side : {TeamSide::HOME, TeamSide::AWAY}) {
        const auto& team = manager.team(side);
        TEST_ASSERT_TRUE(team.lineup.validate());
        TEST_ASSERT_EQ(5u, team.lineup.active_ids().size());
        for (const auto& id : team.lineup.active_ids()) {
            TEST_ASSERT_TRUE(team.is_eligible(id));
        }
    }
}

void drain_and_recover(const SubstitutionManager& manager, StaminaTable& stamina) {
    for (TeamSide side : {TeamSide::HOME, TeamSide::AWAY}) {
        const auto& lineup = manager.team(side).lineup;
        for (const auto& id : lineup.roster().ids()) {
            const double delta = lineup.is_active(id) ? -1.1 : 1.5;
            stamina.set(id, stamina.stamina(id) + delta);
        }
    }
}

/**
 * Four quarters of fixed-length possessions with a foul-out and an
 * injury along the way. Checks lineup invariants after every possession.
 */
std::vector<SubstitutionEvent> play_scripted_game() {
    StaminaTable stamina;
    SubstitutionManager manager(make_team_setup("h"), make_team_setup("a"), stamina);
    std::vector<SubstitutionEvent> events;

    int home = 0;
    int away = 0;
    int possession = 0;

    for (int quarter = 1; quarter <= 4; quarter++) {
        manager.start_quarter(GameContext(quarter, 720, home, away));
        int clock = 720;

        while (clock > 0) {
            const int duration = std::min(clock, 18 + (possession % 3) * 3);
            clock -= duration;

            drain_and_recover(manager, stamina);
            manager.update_time_on_court(duration);

            if (possession % 2 == 0) {
                home += 2;
            } else {
                away += (possession % 5 == 0) ? 3 : 2;
            }
            GameContext game(quarter, clock, home, away);

            if (possession % 7 == 3 && manager.team(TeamSide::HOME).is_eligible("h3")) {
                FoulRecord record = manager.record_foul(TeamSide::HOME, "h3");
                if (record.fouled_out) {
                    auto forced = manager.handle_foul_out(TeamSide::HOME, "h3", game);
                    if (forced.event.has_value()) {
                        events.push_back(*forced.event);
                    }
                }
            }
            if (quarter == 4 && clock <= 500 && !manager.team(TeamSide::AWAY).discipline.is_injured("a2")) {
                auto forced = manager.handle_injury(TeamSide::AWAY, "a2", game);
                if (forced.event.has_value()) {
                    events.push_back(*forced.event);
                }
            }

            auto result = manager.check_and_execute(game);
            events.insert(events.end(), result.events.begin(), result.events.end());

            check_lineup_invariants(manager);
            possession++;
        }
    }
    manager.finish_match(GameContext(4, 0, home, away));

    TEST_ASSERT_EQ(events.size(), manager.event_log().size());
    TEST_ASSERT_TRUE(manager.team(TeamSide::HOME).discipline.is_fouled_out("h3"));
    TEST_ASSERT_FALSE(manager.team(TeamSide::HOME).lineup.is_active("h3"));
    TEST_ASSERT_FALSE(manager.team(TeamSide::AWAY).lineup.is_active("a2"));

    // Every second of the game was played by exactly five players per side
    for (TeamSide side : {TeamSide::HOME, TeamSide::AWAY}) {
        double total = 0.0;
        for (const auto& entry : manager.team(side).court_time.game_minutes_by_player()) {
            total += entry.second;
        }
        TEST_ASSERT_NEAR(240.0, total, 1e-6);
    }

    return events;
}

} // namespace

// ============================================================================
// STAMINA AND STARTER RETURN
// ============================================================================

TEST(Scenarios, TiredStarterReplacedMidQuarter) {
    StaminaTable stamina;
    stamina.set_all({"h1", "h2", "h3", "h4", "h5", "a1", "a2", "a3", "a4", "a5"}, 85.0);
    stamina.set_all({"h6", "h7", "h8", "h9", "h10", "a6", "a7", "a8", "a9", "a10"}, 95.0);
    SubstitutionManager manager(allotted_team("h"), allotted_team("a"), stamina);

    manager.start_quarter(GameContext(2, 720, 24, 22));
    manager.update_time_on_court(328.0);
    stamina.set("h1", 68.0);

    auto result = manager.check_and_execute(GameContext(2, 392, 30, 28));

    TEST_ASSERT_EQ(1u, result.events.size());
    const auto& event = result.events[0];
    TEST_ASSERT_TRUE(event.team == TeamSide::HOME);
    TEST_ASSERT_EQ("h1", event.player_out);
    TEST_ASSERT_EQ("h6", event.player_in);
    TEST_ASSERT_EQ("6:32", event.game_time());
    TEST_ASSERT_NEAR(68.0, event.stamina_out, 1e-9);
    TEST_ASSERT_NEAR(95.0, event.stamina_in, 1e-9);
    TEST_ASSERT_EQ(1u, manager.event_log().size());
}

TEST(Scenarios, StarterReturnsAfterFullStandInStint) {
    StaminaTable stamina;
    SubstitutionManager manager(allotted_team("h"), allotted_team("a"), stamina);
    manager.start_quarter(GameContext(2, 720, 20, 20));

    stamina.set("h1", 60.0);
    auto first = manager.check_and_execute(GameContext(2, 700, 20, 20));
    TEST_ASSERT_EQ(1u, first.events.size());
    TEST_ASSERT_EQ("h6", first.events[0].player_in);

    // Rested, but the stand-in has only played five minutes
    stamina.set("h1", 95.0);
    manager.update_time_on_court(300.0);
    TEST_ASSERT_TRUE(manager.check_and_execute(GameContext(2, 400, 32, 30)).events.empty());

    manager.update_time_on_court(60.0);
    auto back = manager.check_and_execute(GameContext(2, 340, 34, 32));
    TEST_ASSERT_EQ(1u, back.events.size());
    TEST_ASSERT_EQ("h6", back.events[0].player_out);
    TEST_ASSERT_EQ("h1", back.events[0].player_in);
    TEST_ASSERT_TRUE(back.events[0].reason == SubstitutionReason::STARTER_RETURN);
    TEST_ASSERT_FALSE(manager.team(TeamSide::HOME).lineup.stand_in_for("h1").has_value());
}

// ============================================================================
// BLOWOUT AND COMEBACK
// ============================================================================

TEST(Scenarios, BlowoutRestThenComeback) {
    StaminaTable stamina;
    SubstitutionManager manager(make_team_setup("h"), make_team_setup("a"), stamina);
    manager.start_quarter(GameContext(4, 720, 94, 80));

    auto rest = manager.check_and_execute(GameContext(4, 330, 112, 90));
    auto home_rest = events_for(rest.events, TeamSide::HOME);
    TEST_ASSERT_EQ(5u, home_rest.size());
    TEST_ASSERT_EQ(5u, count_reason(home_rest, SubstitutionReason::BLOWOUT_REST));
    TEST_ASSERT_TRUE(events_for(rest.events, TeamSide::AWAY).empty());

    PlayerIDList bench_five = {"h6", "h7", "h8", "h9", "h10"};
    TEST_ASSERT_TRUE(manager.team(TeamSide::HOME).lineup.active_ids() == bench_five);

    // Lead cut from 22 to 10: starters go back in
    auto comeback = manager.check_and_execute(GameContext(4, 300, 112, 102));
    auto home_back = events_for(comeback.events, TeamSide::HOME);
    TEST_ASSERT_EQ(5u, home_back.size());
    TEST_ASSERT_EQ(5u, count_reason(home_back, SubstitutionReason::COMEBACK_REINSERT));

    PlayerIDList starters = {"h1", "h2", "h3", "h4", "h5"};
    TEST_ASSERT_TRUE(manager.team(TeamSide::HOME).lineup.active_ids() == starters);
}

TEST(Scenarios, RestResumesWhenLeadReturnsToBand) {
    StaminaTable stamina;
    SubstitutionManager manager(make_team_setup("h"), make_team_setup("a"), stamina);
    manager.start_quarter(GameContext(4, 720, 94, 80));

    manager.check_and_execute(GameContext(4, 330, 112, 90));
    auto comeback = manager.check_and_execute(GameContext(4, 300, 112, 102));
    TEST_ASSERT_EQ(5u, count_reason(comeback.events, SubstitutionReason::COMEBACK_REINSERT));

    // +21 with 4:00 left is inside the 6:00 band again
    auto again = manager.check_and_execute(GameContext(4, 240, 121, 100));
    auto home_again = events_for(again.events, TeamSide::HOME);
    TEST_ASSERT_EQ(5u, home_again.size());
    TEST_ASSERT_EQ(5u, count_reason(home_again, SubstitutionReason::BLOWOUT_REST));

    PlayerIDList bench_five = {"h6", "h7", "h8", "h9", "h10"};
    TEST_ASSERT_TRUE(manager.team(TeamSide::HOME).lineup.active_ids() == bench_five);
}

// ============================================================================
// FULL GAME
// ============================================================================

TEST(Scenarios, ScriptedGameIsDeterministic) {
    auto first = play_scripted_game();
    auto second = play_scripted_game();

    TEST_ASSERT_FALSE(first.empty());
    TEST_ASSERT_EQ(first.size(), second.size());
    TEST_ASSERT_TRUE(first == second);
}
