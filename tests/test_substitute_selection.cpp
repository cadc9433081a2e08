/**
 * Tests for substitute and make-room selection
 */

#include "test_fixtures.hpp"

TEST(SubstituteSelection, RoleGroups) {
    TEST_ASSERT_TRUE(roles_compatible(Position::PG, Position::SG));
    TEST_ASSERT_TRUE(roles_compatible(Position::SF, Position::PF));
    TEST_ASSERT_FALSE(roles_compatible(Position::PF, Position::C));
    TEST_ASSERT_FALSE(roles_compatible(Position::SG, Position::SF));
}

TEST(SubstituteSelection, PrefersRestedRoleMatch) {
    LineupManager lineup(Roster(make_players("h")));
    StaminaTable stamina;
    stamina.set("h6", 80.0);
    stamina.set("h7", 95.0);

    const Player outgoing = *lineup.roster().find("h1");
    auto sub = select_substitute(lineup, outgoing, stamina, nullptr, 90.0);
    TEST_ASSERT_EQ("h7", sub.value());
}

TEST(SubstituteSelection, RoleMatchBeatsFresherOtherRole) {
    LineupManager lineup(Roster(make_players("h")));
    StaminaTable stamina;
    stamina.set("h6", 85.0);
    stamina.set("h7", 85.0);

    const Player outgoing = *lineup.roster().find("h2");
    auto sub = select_substitute(lineup, outgoing, stamina, nullptr, 90.0);

    // Tie on stamina resolves to roster order
    TEST_ASSERT_EQ("h6", sub.value());
}

TEST(SubstituteSelection, FallsBackToAnyRole) {
    LineupManager lineup(Roster(make_players("h")));
    StaminaTable stamina;
    stamina.set("h9", 99.0);

    const Player outgoing = *lineup.roster().find("h1");
    auto no_guards = [](const Player& p) { return role_group(p.position) != RoleGroup::GUARD; };
    auto sub = select_substitute(lineup, outgoing, stamina, no_guards, 90.0);
    TEST_ASSERT_EQ("h8", sub.value());

    auto nobody = [](const Player&) { return false; };
    TEST_ASSERT_FALSE(select_substitute(lineup, outgoing, stamina, nobody, 90.0).has_value());
}

TEST(SubstituteSelection, ReplaceLowestStaminaRoleMatch) {
    LineupManager lineup(Roster(make_players("h")));
    StaminaTable stamina;
    stamina.set("h1", 80.0);
    stamina.set("h2", 60.0);
    stamina.set_all({"h3", "h4", "h5"}, 50.0);

    const Player incoming = *lineup.roster().find("h6");
    TEST_ASSERT_EQ("h2", select_player_to_replace(lineup, incoming, stamina, nullptr).value());

    auto no_guards = [](const Player& p) { return role_group(p.position) != RoleGroup::GUARD; };
    TEST_ASSERT_EQ("h3", select_player_to_replace(lineup, incoming, stamina, no_guards).value());
}
