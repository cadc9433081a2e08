/**
 * Tests for the Q4 closing plan and the closer rules
 */

#include "test_fixtures.hpp"

namespace {

StarterPlan make_plan(const PlayerID& id, RotationPlan plan, bool on_court) {
    StarterPlan entry;
    entry.player_id = id;
    entry.plan = plan;
    entry.on_court = on_court;
    return entry;
}

} // namespace

// ============================================================================
// DECISION TABLE
// ============================================================================

TEST(Q4ClosingPlanner, DecisionTable) {
    RotationPlan stay = Q4ClosingPlanner::decide(true, 15.0, 12.0);
    TEST_ASSERT_TRUE(std::holds_alternative<StayIn>(stay));

    RotationPlan fatigue = Q4ClosingPlanner::decide(true, 8.0, 12.0);
    TEST_ASSERT_NEAR(4.0, std::get<WillFatigue>(fatigue).sub_out_at, 1e-9);

    RotationPlan fresh = Q4ClosingPlanner::decide(false, 14.0, 12.0);
    TEST_ASSERT_NEAR(12.0, std::get<InsertAt>(fresh).time, 1e-9);

    RotationPlan late = Q4ClosingPlanner::decide(false, 7.0, 12.0);
    TEST_ASSERT_NEAR(7.0, std::get<InsertAt>(late).time, 1e-9);

    TEST_ASSERT_EQ(std::string("WILL_FATIGUE"), plan_name(fatigue));
}

TEST(Q4ClosingPlanner, PlansEligibleStarters) {
    LineupManager lineup(Roster(make_players("h")));
    lineup.substitute("h1", "h6");

    StaminaTable stamina;
    stamina.set_all(lineup.roster().ids(), 95.0);
    stamina.set("h3", 78.0);

    DisciplineTracker discipline;
    discipline.mark_fouled_out("h2");

    Q4ClosingPlanner planner;
    Q4ClosingPlan plan = planner.plan(lineup, stamina, TacticalSettings{}, discipline);

    TEST_ASSERT_EQ(4u, plan.size());
    TEST_ASSERT_NULL(plan.find("h2"));

    // Neutral ratings at standard pace drain 2.05 per minute
    const StarterPlan* h1 = plan.find("h1");
    TEST_ASSERT_NOT_NULL(h1);
    TEST_ASSERT_FALSE(h1->on_court);
    TEST_ASSERT_NEAR(25.0 / 2.05, h1->playable_minutes, 1e-9);
    TEST_ASSERT_NEAR(12.0, std::get<InsertAt>(h1->plan).time, 1e-9);

    const StarterPlan* h3 = plan.find("h3");
    TEST_ASSERT_NEAR(12.0 - 8.0 / 2.05, std::get<WillFatigue>(h3->plan).sub_out_at, 1e-9);

    TEST_ASSERT_TRUE(std::holds_alternative<StayIn>(plan.find("h4")->plan));
    TEST_ASSERT_TRUE(describe_plan(*h3).find("WILL_FATIGUE") != std::string::npos);
}

// ============================================================================
// PLAN EXECUTION
// ============================================================================

TEST(Q4ClosingPlanner, SubOutAtFatigueMark) {
    RotationEngine engine;
    TeamRotationState team = make_team_state("h");
    Q4ClosingPlan plan;
    plan.add(make_plan("h1", WillFatigue{4.0}, true));
    team.q4_plan = plan;

    StaminaTable stamina;
    stamina.set("h1", 80.0);

    TEST_ASSERT_TRUE(engine.check_team(team, GameContext(4, 300, 100, 100), stamina).events.empty());

    auto result = engine.check_team(team, GameContext(4, 240, 100, 100), stamina);
    TEST_ASSERT_EQ(1u, result.events.size());
    TEST_ASSERT_EQ("h1", result.events[0].player_out);
    TEST_ASSERT_EQ("h6", result.events[0].player_in);
    TEST_ASSERT_TRUE(result.events[0].reason == SubstitutionReason::Q4_PLAN_SUB_OUT);
}

TEST(Q4ClosingPlanner, CloserStaysThroughFatigueMarkInCloseGame) {
    RotationEngine engine;
    TacticalSettings tactics;
    tactics.closers = {"h1"};
    TeamRotationState team = make_team_state("h", tactics);
    Q4ClosingPlan plan;
    plan.add(make_plan("h1", WillFatigue{4.0}, true));
    team.q4_plan = plan;

    StaminaTable stamina;
    stamina.set("h1", 80.0);

    auto result = engine.check_team(team, GameContext(4, 240, 100, 100), stamina);
    TEST_ASSERT_TRUE(result.events.empty());
    TEST_ASSERT_TRUE(team.lineup.is_active("h1"));
}

TEST(Q4ClosingPlanner, InsertAtMarkWithBuffer) {
    RotationEngine engine;
    TeamRotationState team = make_team_state("h");
    team.lineup.substitute("h1", "h6");
    Q4ClosingPlan plan;
    plan.add(make_plan("h1", InsertAt{3.0}, false));
    team.q4_plan = plan;

    StaminaTable stamina;

    TEST_ASSERT_TRUE(engine.check_team(team, GameContext(4, 240, 100, 100), stamina).events.empty());

    auto result = engine.check_team(team, GameContext(4, 210, 100, 100), stamina);
    TEST_ASSERT_EQ(1u, result.events.size());
    TEST_ASSERT_EQ("h6", result.events[0].player_out);
    TEST_ASSERT_EQ("h1", result.events[0].player_in);
    TEST_ASSERT_TRUE(result.events[0].reason == SubstitutionReason::Q4_PLAN_INSERT);
}

TEST(Q4ClosingPlanner, FoulTroubleDelaysInsertUntilClosingWindow) {
    RotationEngine engine;
    TeamRotationState team = make_team_state("h");
    team.lineup.substitute("h1", "h6");
    for (int i = 0; i < 5; i++) {
        team.discipline.record_foul("h1");
    }
    Q4ClosingPlan plan;
    plan.add(make_plan("h1", InsertAt{3.0}, false));
    team.q4_plan = plan;

    StaminaTable stamina;

    TEST_ASSERT_TRUE(engine.check_team(team, GameContext(4, 210, 100, 100), stamina).events.empty());

    auto result = engine.check_team(team, GameContext(4, 110, 100, 98), stamina);
    TEST_ASSERT_EQ(1u, result.events.size());
    TEST_ASSERT_EQ("h1", result.events[0].player_in);
}

// ============================================================================
// CLOSERS
// ============================================================================

TEST(Q4ClosingPlanner, CloserInsertedLateInCloseGame) {
    RotationEngine engine;
    TacticalSettings tactics;
    tactics.closers = {"h6"};
    TeamRotationState team = make_team_state("h", tactics);

    StaminaTable stamina;
    stamina.set("h1", 90.0);
    stamina.set("h2", 80.0);

    // Not yet inside two minutes
    TEST_ASSERT_TRUE(engine.check_team(team, GameContext(4, 150, 100, 98), stamina).events.empty());

    auto result = engine.check_team(team, GameContext(4, 110, 100, 98), stamina);
    TEST_ASSERT_EQ(1u, result.events.size());
    TEST_ASSERT_EQ("h2", result.events[0].player_out);
    TEST_ASSERT_EQ("h6", result.events[0].player_in);
    TEST_ASSERT_TRUE(result.events[0].reason == SubstitutionReason::CLOSER_INSERT);
}

TEST(Q4ClosingPlanner, TiredCloserStaysOnBench) {
    RotationEngine engine;
    TacticalSettings tactics;
    tactics.closers = {"h6"};
    TeamRotationState team = make_team_state("h", tactics);

    StaminaTable stamina;
    stamina.set("h6", 45.0);

    TEST_ASSERT_TRUE(engine.check_team(team, GameContext(4, 110, 100, 98), stamina).events.empty());
}

TEST(Q4ClosingPlanner, ScoringOptionsCloseWhenNoClosersNamed) {
    TacticalSettings tactics;
    tactics.scoring_options = {"h1", "h7"};
    TEST_ASSERT_TRUE(tactics.is_closer("h7"));

    tactics.closers = {"h2"};
    TEST_ASSERT_FALSE(tactics.is_closer("h7"));
}
