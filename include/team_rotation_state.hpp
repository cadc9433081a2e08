/**
 * Hoops Rotation Engine - Team Rotation State
 *
 * Everything the rotation rules know about one team. The two teams share
 * no mutable state; only the game context is common.
 */

#pragma once

#include "court_time.hpp"
#include "discipline.hpp"
#include "lineup_manager.hpp"
#include "minutes_planner.hpp"
#include "q4_closing_planner.hpp"
#include "tactics.hpp"

namespace hoops {

/**
 * BlowoutMemory - Which starters were rested for a blowout, and the margin
 * at the time, so a comeback can be detected and the rest undone.
 */
struct BlowoutMemory {
    PlayerIDList rested;                   // In the order they were rested
    std::optional<int> rest_differential;  // Lead when the first starter sat
    bool comeback = false;

    bool is_rested(const PlayerID& id) const {
        return std::find(rested.begin(), rested.end(), id) != rested.end();
    }

    void mark_rested(const PlayerID& id, int differential) {
        if (rested.empty()) {
            rest_differential = differential;
        }
        if (!is_rested(id)) {
            rested.push_back(id);
        }
    }

    void mark_returned(const PlayerID& id) {
        rested.erase(std::remove(rested.begin(), rested.end(), id), rested.end());
    }

    void reset() {
        rested.clear();
        rest_differential.reset();
        comeback = false;
    }
};

/**
 * TeamRotationState - Lineup, targets, clocks, discipline and Q4 plan for
 * one side.
 */
struct TeamRotationState {
    TeamSide side = TeamSide::HOME;
    std::string name;

    LineupManager lineup;
    TacticalSettings tactics;
    MinutesPlanner minutes;
    CourtTimeTracker court_time;
    DisciplineTracker discipline;

    BlowoutMemory blowout;
    std::optional<Q4ClosingPlan> q4_plan;   // Set once at the start of the final quarter

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    /**
     * Validates tactics against the roster and computes minute targets
     * (explicit allotment when present, skill-based otherwise).
     *
     * @throws ConfigurationError on unknown tactic ids or a bad allotment
     */
    TeamRotationState(TeamSide side_,
                      std::string name_,
                      LineupManager lineup_,
                      TacticalSettings tactics_,
                      const RotationConfig& config);

    // ========================================================================
    // QUERIES
    // ========================================================================

    const Roster& roster() const { return lineup.roster(); }

    PlayerIDList eligible_ids() const;
    std::size_t eligible_count() const;

    bool is_eligible(const PlayerID& id) const { return discipline.is_eligible(id); }
};

} // namespace hoops
