/**
 * Hoops Rotation Engine - Rotation Trace Logger
 *
 * Full rotation visibility for debugging a match: every check that changed
 * something, every substitution with both players' stamina, the Q4 closing
 * plans, forced removals, infeasibility reports and lineup snapshots.
 */

#pragma once

#include "game_context.hpp"
#include "stamina.hpp"
#include "substitution_event.hpp"
#include "team_rotation_state.hpp"
#include <fstream>

namespace hoops {

class RotationTraceLogger {
public:
    /**
     * Constructor - creates a timestamped trace file.
     *
     * A file that cannot be opened disables the logger with a warning.
     *
     * @param output_dir Directory for trace files
     */
    explicit RotationTraceLogger(const std::string& output_dir = "rotation_traces");

    ~RotationTraceLogger();

    /**
     * Header for a check that produced changes or a report.
     */
    void log_check(const GameContext& game);

    void log_event(const SubstitutionEvent& event);

    /**
     * Q4 closing plan for one team, logged once when it is computed.
     */
    void log_q4_plan(const TeamRotationState& team);

    /**
     * Foul-out or injury and how it was resolved.
     */
    void log_forced(TeamSide side, const PlayerID& player_id,
                    SubstitutionReason reason, const std::string& outcome);

    void log_infeasible(TeamSide side, std::size_t eligible_players);

    /**
     * Both active fives and benches with current stamina and minutes.
     */
    void log_lineups(const TeamRotationState& home,
                     const TeamRotationState& away,
                     const StaminaSource& stamina);

    void log_match_end(const GameContext& game, std::size_t total_events);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    void log_team(const TeamRotationState& team, const StaminaSource& stamina);

    static std::string timestamp(const char* format);
};

} // namespace hoops
