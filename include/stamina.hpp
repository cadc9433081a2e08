/**
 * Hoops Rotation Engine - Stamina
 *
 * Read-only view of the external stamina subsystem plus the drain model
 * the Q4 closing planner uses to project how long a player can last.
 */

#pragma once

#include "player.hpp"

namespace hoops {

// ============================================================================
// STAMINA SOURCE
// ============================================================================

/**
 * StaminaSource - Current stamina (0-100) by player id.
 *
 * Owned and updated by the possession-cost model; the rotation core only
 * reads it.
 */
class StaminaSource {
public:
    virtual ~StaminaSource() = default;

    virtual double stamina(const PlayerID& id) const = 0;
};

/**
 * StaminaTable - Map-backed source used by the replay console, the
 * Python bindings and tests. Unknown players read as fully rested.
 */
class StaminaTable : public StaminaSource {
public:
    static constexpr double FULL_STAMINA = 100.0;

    double stamina(const PlayerID& id) const override;

    /**
     * Set a player's stamina, clamped to [0, 100].
     */
    void set(const PlayerID& id, double value);

    void set_all(const PlayerIDList& ids, double value);

    void clear() { values_.clear(); }

private:
    std::unordered_map<PlayerID, double> values_;
};

// ============================================================================
// DRAIN MODEL
// ============================================================================

namespace drain {

constexpr double BASE_COST = 0.8;
constexpr double FAST_PACE_COST = 0.3;
constexpr double SLOW_PACE_COST = -0.3;
constexpr double SCORING_OPTION_COST = 0.2;
constexpr double TRANSITION_COST = 0.1;
constexpr double ENDURANCE_FACTOR = 0.15;
constexpr double SPEED_FACTOR = 0.002;

/**
 * Stamina cost of one possession for this player.
 */
double possession_cost(const Player& player, Pace pace, bool scoring_option, bool transition);

/**
 * Expected cost per possession, mixing transition and half-court trips.
 */
double average_possession_cost(const Player& player, Pace pace, bool scoring_option,
                               double transition_rate);

double possessions_per_minute(Pace pace);

double drain_per_minute(const Player& player, Pace pace, bool scoring_option,
                        double transition_rate);

/**
 * Minutes until current stamina falls to rest_threshold. Zero when the
 * player is already at or below it.
 */
double playable_minutes(double current_stamina, double rest_threshold, double drain_per_minute);

} // namespace drain

} // namespace hoops
