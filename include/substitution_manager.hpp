/**
 * Hoops Rotation Engine - Substitution Manager
 *
 * Match-level entry point the possession loop talks to. After each
 * possession the caller:
 *   1. update_time_on_court(elapsed seconds)
 *   2. check_and_execute(game context)
 * and on a foul-out or injury calls the forced-substitution entry points,
 * which bypass the rule engine.
 */

#pragma once

#include "event_log.hpp"
#include "match_setup.hpp"
#include "rotation_engine.hpp"
#include "trace_logger.hpp"
#include <array>

namespace hoops {

// ============================================================================
// RESULT TYPES
// ============================================================================

enum class ForcedStatus : uint8_t {
    SUBSTITUTED,
    ROSTER_EXHAUSTED,     // No eligible bench player; lineup and minutes targets left as they
                          // were, but the foul-out or injury is still recorded in discipline
    PLAYER_NOT_ACTIVE,    // Already on the bench; marked unavailable only
    UNKNOWN_PLAYER
};

inline const char* to_string(ForcedStatus status) {
    switch (status) {
        case ForcedStatus::SUBSTITUTED: return "substituted";
        case ForcedStatus::ROSTER_EXHAUSTED: return "roster_exhausted";
        case ForcedStatus::PLAYER_NOT_ACTIVE: return "player_not_active";
        case ForcedStatus::UNKNOWN_PLAYER: return "unknown_player";
        default: return "unknown";
    }
}

struct ForcedSubstitutionResult {
    ForcedStatus status = ForcedStatus::UNKNOWN_PLAYER;
    std::optional<SubstitutionEvent> event;
    double redistributed_minutes = 0.0;
    std::string message;

    bool success() const { return status == ForcedStatus::SUBSTITUTED; }
};

/**
 * Result of one possession's rotation check for both teams.
 */
struct RotationCheckResult {
    std::vector<SubstitutionEvent> events;
    std::vector<TeamSide> infeasible_teams;

    bool is_infeasible(TeamSide side) const {
        return std::find(infeasible_teams.begin(), infeasible_teams.end(), side) != infeasible_teams.end();
    }
};

// ============================================================================
// SUBSTITUTION MANAGER
// ============================================================================

class SubstitutionManager {
public:
    /**
     * @param stamina External stamina source; must outlive the manager
     * @throws ConfigurationError on an invalid roster, starting five,
     *         tactics or minutes allotment
     */
    SubstitutionManager(const MatchSetup& setup, const StaminaSource& stamina);

    SubstitutionManager(const TeamSetup& home,
                        const TeamSetup& away,
                        const StaminaSource& stamina,
                        RotationConfig config = RotationConfig{});

    /**
     * Optional trace sink (not owned).
     */
    void set_trace_logger(RotationTraceLogger* logger) { trace_ = logger; }

    // ========================================================================
    // POSSESSION LOOP
    // ========================================================================

    /**
     * Quarter boundary: resets quarter minutes and team fouls, and at the
     * start of the final quarter computes each team's Q4 closing plan.
     */
    void start_quarter(const GameContext& game);

    void update_time_on_court(double seconds);

    /**
     * Evaluate both teams (home, then away) and apply their directives.
     */
    RotationCheckResult check_and_execute(const GameContext& game);

    // ========================================================================
    // DISCIPLINE AND FORCED SUBSTITUTION
    // ========================================================================

    /**
     * Record a personal foul. When record.fouled_out is set the caller must
     * follow up with handle_foul_out().
     */
    FoulRecord record_foul(TeamSide side, const PlayerID& player_id);

    ForcedSubstitutionResult handle_foul_out(TeamSide side, const PlayerID& player_id,
                                             const GameContext& game);

    ForcedSubstitutionResult handle_injury(TeamSide side, const PlayerID& player_id,
                                           const GameContext& game);

    /**
     * Coach's substitution outside the rule engine.
     */
    SubstitutionResult make_substitution(TeamSide side,
                                         const PlayerID& player_out,
                                         const PlayerID& player_in,
                                         const GameContext& game);

    // ========================================================================
    // QUERIES
    // ========================================================================

    TeamRotationState& team(TeamSide side) { return side == TeamSide::HOME ? home_ : away_; }
    const TeamRotationState& team(TeamSide side) const { return side == TeamSide::HOME ? home_ : away_; }

    const EventLog& event_log() const { return log_; }
    const RotationEngine& engine() const { return engine_; }
    const RotationConfig& config() const { return config_; }

    /**
     * Players whose game minutes missed their final target.
     */
    std::vector<MinutesDiscrepancy> verify_minutes_targets(TeamSide side) const;

    void finish_match(const GameContext& game);

private:
    RotationConfig config_;
    RotationEngine engine_;
    Q4ClosingPlanner planner_;
    const StaminaSource* stamina_;
    TeamRotationState home_;
    TeamRotationState away_;
    EventLog log_;
    RotationTraceLogger* trace_ = nullptr;
    std::array<bool, 2> infeasible_reported_{{false, false}};

    ForcedSubstitutionResult handle_forced(TeamSide side, const PlayerID& player_id,
                                           SubstitutionReason reason, const GameContext& game);

    void record_event(const SubstitutionEvent& event);
};

} // namespace hoops
