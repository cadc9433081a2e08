/**
 * Hoops Rotation Engine - Rotation Configuration
 *
 * Every tunable threshold used by the rotation rules. Defaults reproduce
 * the standard rotation; a match setup file may override any field.
 */

#pragma once

namespace hoops {

struct RotationConfig {
    // Match shape
    double quarter_minutes = 12.0;
    int quarters = 4;

    // Stamina rules
    double stamina_threshold = 70.0;          // Sub out below this in ordinary play
    double crunch_stamina_threshold = 50.0;   // Relaxed threshold in crunch time
    double return_stamina = 90.0;             // Benched starter may return at or above
    double preferred_sub_stamina = 90.0;      // Substitute pool "well rested" cut

    // Anti-thrashing
    double min_stand_in_minutes = 6.0;        // Stand-in must log this before a starter returns
    double quota_tolerance_minutes = 0.1;
    int max_directives_per_check = 5;

    // Crunch time: Q4, <= 2:00, |diff| <= 5
    int crunch_seconds = 120;
    int crunch_margin = 5;

    // Blowouts
    int comeback_swing = 10;

    // Q4 closing plan
    double rest_threshold = 70.0;             // Stamina floor for playable-minute estimates
    double insert_buffer_minutes = 0.5;
    double transition_rate = 0.20;

    // Discipline
    int foul_out_count = 6;
    int team_bonus_fouls = 5;

    double game_minutes() const { return quarter_minutes * quarters; }
    double lineup_minutes_per_quarter() const { return quarter_minutes * 5.0; }
    double lineup_minutes_per_game() const { return game_minutes() * 5.0; }
};

} // namespace hoops
