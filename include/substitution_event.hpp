/**
 * Hoops Rotation Engine - Substitution Event
 *
 * Immutable record of one lineup change. Every change to an active five
 * produces exactly one event.
 */

#pragma once

#include "types.hpp"

namespace hoops {

struct SubstitutionEvent {
    TeamSide team = TeamSide::HOME;
    int quarter = 1;
    int seconds_remaining = 0;
    PlayerID player_out;
    PlayerID player_in;
    SubstitutionReason reason = SubstitutionReason::MANUAL;
    double stamina_out = 0.0;
    double stamina_in = 0.0;

    SubstitutionEvent() = default;

    SubstitutionEvent(TeamSide team_, int quarter_, int seconds_remaining_,
                      PlayerID player_out_, PlayerID player_in_,
                      SubstitutionReason reason_, double stamina_out_, double stamina_in_)
        : team(team_)
        , quarter(quarter_)
        , seconds_remaining(seconds_remaining_)
        , player_out(std::move(player_out_))
        , player_in(std::move(player_in_))
        , reason(reason_)
        , stamina_out(stamina_out_)
        , stamina_in(stamina_in_)
    {}

    /**
     * Game clock of the change ("6:32").
     */
    std::string game_time() const;

    bool operator==(const SubstitutionEvent& other) const {
        return team == other.team &&
               quarter == other.quarter &&
               seconds_remaining == other.seconds_remaining &&
               player_out == other.player_out &&
               player_in == other.player_in &&
               reason == other.reason &&
               stamina_out == other.stamina_out &&
               stamina_in == other.stamina_in;
    }

    bool operator!=(const SubstitutionEvent& other) const { return !(*this == other); }
};

} // namespace hoops
