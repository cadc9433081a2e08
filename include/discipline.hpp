/**
 * Hoops Rotation Engine - Discipline Tracker
 *
 * Personal fouls, foul-outs, injuries and team fouls for one team.
 * Eligibility for the active five is derived from here.
 */

#pragma once

#include "rotation_config.hpp"
#include "types.hpp"

namespace hoops {

/**
 * Outcome of recording one personal foul.
 */
struct FoulRecord {
    PlayerID player_id;
    int personal_fouls = 0;
    int team_fouls = 0;
    bool fouled_out = false;   // True only on the foul that reached the limit
    bool in_bonus = false;
};

class DisciplineTracker {
public:
    explicit DisciplineTracker(RotationConfig config = RotationConfig{});

    // ========================================================================
    // FOULS
    // ========================================================================

    /**
     * Add a personal foul. Fouls on a player who already fouled out are
     * ignored, so the count never exceeds the limit.
     */
    FoulRecord record_foul(const PlayerID& id);

    /**
     * Force the fouled-out state (foul source reported it directly).
     *
     * @return true if the player was not already fouled out
     */
    bool mark_fouled_out(const PlayerID& id);

    int personal_fouls(const PlayerID& id) const;
    bool is_fouled_out(const PlayerID& id) const;

    /**
     * Foul trouble: personal fouls >= quarter + 1.
     */
    bool in_foul_trouble(const PlayerID& id, int quarter) const;

    int team_fouls() const { return team_fouls_; }
    bool in_bonus() const { return team_fouls_ >= config_.team_bonus_fouls; }

    // ========================================================================
    // INJURIES
    // ========================================================================

    /**
     * @return true if the player was not already injured
     */
    bool mark_injured(const PlayerID& id);
    bool is_injured(const PlayerID& id) const;

    // ========================================================================
    // ELIGIBILITY
    // ========================================================================

    bool is_eligible(const PlayerID& id) const;

    std::size_t count_eligible(const PlayerIDList& ids) const;

    /**
     * Team fouls reset each quarter.
     */
    void start_quarter();

private:
    RotationConfig config_;
    std::unordered_map<PlayerID, int> personal_fouls_;
    PlayerIDSet fouled_out_;
    PlayerIDSet injured_;
    int team_fouls_ = 0;
};

} // namespace hoops
