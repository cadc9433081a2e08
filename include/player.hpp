/**
 * Hoops Rotation Engine - Player
 *
 * Immutable per-match player record. Fouls, injuries and stamina are
 * owned by other subsystems and looked up by id.
 */

#pragma once

#include "types.hpp"

namespace hoops {

/**
 * Player - A rostered player for one match.
 *
 * Skill attributes are read-only for the rotation core. `overall` drives
 * minutes targets; the physical attributes feed the stamina drain model.
 */
struct Player {
    // Identity (stable for the whole match)
    PlayerID id;
    std::string name;
    Position position = Position::SF;

    // Skill attributes (1-100)
    double overall = 50.0;
    int stamina = 50;          // Endurance rating, not current stamina
    int acceleration = 50;
    int top_speed = 50;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Player() = default;

    Player(PlayerID id_, std::string name_, Position position_, double overall_)
        : id(std::move(id_))
        , name(std::move(name_))
        , position(position_)
        , overall(overall_)
    {}

    bool operator==(const Player& other) const { return id == other.id; }
    bool operator!=(const Player& other) const { return id != other.id; }
};

} // namespace hoops
