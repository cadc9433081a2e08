/**
 * Hoops Rotation Engine - Stamina Implementation
 */

#include "stamina.hpp"
#include <algorithm>

namespace hoops {

// ============================================================================
// STAMINA TABLE
// ============================================================================

double StaminaTable::stamina(const PlayerID& id) const {
    auto it = values_.find(id);
    return it != values_.end() ? it->second : FULL_STAMINA;
}

void StaminaTable::set(const PlayerID& id, double value) {
    values_[id] = std::clamp(value, 0.0, FULL_STAMINA);
}

void StaminaTable::set_all(const PlayerIDList& ids, double value) {
    for (const auto& id : ids) {
        set(id, value);
    }
}

// ============================================================================
// DRAIN MODEL
// ============================================================================

namespace drain {

double possession_cost(const Player& player, Pace pace, bool scoring_option, bool transition) {
    double cost = BASE_COST;

    if (pace == Pace::FAST) {
        cost += FAST_PACE_COST;
    } else if (pace == Pace::SLOW) {
        cost += SLOW_PACE_COST;
    }

    if (scoring_option) {
        cost += SCORING_OPTION_COST;
    }
    if (transition) {
        cost += TRANSITION_COST;
    }

    // Endurance: 50 is neutral, higher ratings drain slower
    const double endurance = 1.0 + (50.0 - player.stamina) / 50.0 * ENDURANCE_FACTOR;

    // Speed: quick players cover ground more efficiently
    const double speed = (player.acceleration + player.top_speed) / 2.0;
    const double efficiency = 1.0 - (speed - 50.0) * SPEED_FACTOR;

    return cost * endurance * efficiency;
}

double average_possession_cost(const Player& player, Pace pace, bool scoring_option,
                               double transition_rate) {
    const double rate = std::clamp(transition_rate, 0.0, 1.0);
    return rate * possession_cost(player, pace, scoring_option, true) +
           (1.0 - rate) * possession_cost(player, pace, scoring_option, false);
}

double possessions_per_minute(Pace pace) {
    switch (pace) {
        case Pace::FAST: return 2.8;
        case Pace::SLOW: return 2.2;
        case Pace::STANDARD:
        default: return 2.5;
    }
}

double drain_per_minute(const Player& player, Pace pace, bool scoring_option,
                        double transition_rate) {
    return average_possession_cost(player, pace, scoring_option, transition_rate) *
           possessions_per_minute(pace);
}

double playable_minutes(double current_stamina, double rest_threshold, double drain_per_minute) {
    const double headroom = current_stamina - rest_threshold;
    if (headroom <= 0.0 || drain_per_minute <= 0.0) {
        return 0.0;
    }
    return headroom / drain_per_minute;
}

} // namespace drain

} // namespace hoops
