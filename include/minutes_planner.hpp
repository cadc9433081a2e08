/**
 * Hoops Rotation Engine - Minutes Planner
 *
 * Per-player whole-game and per-quarter minute targets derived from
 * relative skill, plus conservation-preserving redistribution when a
 * player becomes permanently unavailable mid-match.
 */

#pragma once

#include "roster.hpp"
#include "rotation_config.hpp"

namespace hoops {

/**
 * MinutesTarget - One player's allocation.
 */
struct MinutesTarget {
    double game_minutes = 0.0;
    double quarter_minutes = 0.0;
    bool removed = false;      // Fouled out / injured: target frozen at minutes played
};

/**
 * End-of-match target check entry.
 */
struct MinutesDiscrepancy {
    PlayerID player_id;
    double actual = 0.0;
    double target = 0.0;
    double diff = 0.0;
};

/**
 * MinutesPlanner - Target table for one team.
 *
 * Invariant: the sum of game targets equals five times the game length,
 * before and after any redistribution.
 */
class MinutesPlanner {
public:
    static constexpr double TARGET_EXPONENT = 1.0;
    static constexpr double REDISTRIBUTION_EXPONENT = 1.6;
    static constexpr double MAX_GAME_MINUTES = 40.0;   // Per 48-minute game
    static constexpr int MAX_CEILING_ITERATIONS = 20;

    explicit MinutesPlanner(RotationConfig config = RotationConfig{});

    // ========================================================================
    // TARGETS
    // ========================================================================

    /**
     * Assign targets proportional to (overall - min overall + 1), capped at
     * 40 minutes per 48 with the excess spread over uncapped players.
     */
    void calculate_targets(const Roster& roster);

    /**
     * Use an explicit game-minutes allotment instead of computed targets.
     *
     * @throws ConfigurationError if the allotment does not total 5 x game
     *         length, names an unknown player, or has an out-of-range entry
     */
    void apply_allotment(const Roster& roster,
                         const std::unordered_map<PlayerID, double>& allotment);

    /**
     * Move a removed player's unplayed target onto the remaining roster.
     *
     * Weight per recipient is (overall - min overall + 1) ^ 1.6, so better
     * players absorb disproportionately more. The removed player's target
     * collapses to minutes_played and their quarter target to zero.
     *
     * @return Minutes redistributed
     */
    double redistribute(const PlayerID& removed_player,
                        double minutes_played,
                        const Roster& roster);

    // ========================================================================
    // QUERIES
    // ========================================================================

    const MinutesTarget* target_for(const PlayerID& id) const;
    double game_target(const PlayerID& id) const;
    double quarter_target(const PlayerID& id) const;
    bool is_removed(const PlayerID& id) const;

    double total_game_minutes() const;
    double total_quarter_minutes() const;

    const std::unordered_map<PlayerID, MinutesTarget>& targets() const { return targets_; }

    /**
     * Players whose actual minutes missed the target by more than 2 (targets
     * of 30+) or 5 minutes.
     */
    std::vector<MinutesDiscrepancy> verify(const Roster& roster,
                                           const std::unordered_map<PlayerID, double>& actual_minutes) const;

private:
    RotationConfig config_;
    std::unordered_map<PlayerID, MinutesTarget> targets_;

    void set_game_target(const PlayerID& id, double game_minutes);
};

} // namespace hoops
