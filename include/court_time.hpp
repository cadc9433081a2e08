/**
 * Hoops Rotation Engine - Court Time Tracker
 *
 * Per-player clock accounting: continuous stint length (anti-thrashing
 * memory), minutes this quarter (quota rule) and minutes this game
 * (target verification, redistribution).
 */

#pragma once

#include "types.hpp"

namespace hoops {

class CourtTimeTracker {
public:
    CourtTimeTracker() = default;

    /**
     * Credit elapsed game time to every active player.
     */
    void add_time(const PlayerIDList& active, double seconds);

    /**
     * Both participants of a substitution start a new stint.
     */
    void on_substitution(const PlayerID& player_out, const PlayerID& player_in);

    /**
     * Quarter minutes restart; continuous stints carry over the break.
     */
    void start_quarter();

    void reset();

    double continuous_minutes(const PlayerID& id) const;
    double quarter_minutes(const PlayerID& id) const;
    double game_minutes(const PlayerID& id) const;

    std::unordered_map<PlayerID, double> game_minutes_by_player() const;

private:
    // Stored in seconds so whole-second possessions sum exactly
    std::unordered_map<PlayerID, double> continuous_seconds_;
    std::unordered_map<PlayerID, double> quarter_seconds_;
    std::unordered_map<PlayerID, double> game_seconds_;

    static double lookup(const std::unordered_map<PlayerID, double>& table, const PlayerID& id);
};

} // namespace hoops
