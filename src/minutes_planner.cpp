/**
 * Hoops Rotation Engine - Minutes Planner Implementation
 */

#include "minutes_planner.hpp"
#include <cmath>
#include <limits>

namespace hoops {

MinutesPlanner::MinutesPlanner(RotationConfig config)
    : config_(config) {}

void MinutesPlanner::set_game_target(const PlayerID& id, double game_minutes) {
    MinutesTarget& target = targets_[id];
    target.game_minutes = game_minutes;
    target.quarter_minutes = game_minutes / config_.quarters;
}

// ============================================================================
// TARGETS
// ============================================================================

void MinutesPlanner::calculate_targets(const Roster& roster) {
    targets_.clear();
    if (roster.empty()) {
        return;
    }

    const double total = config_.lineup_minutes_per_game();
    const double ceiling = std::max(MAX_GAME_MINUTES * config_.game_minutes() / 48.0,
                                    total / static_cast<double>(roster.size()));

    double min_overall = std::numeric_limits<double>::max();
    for (const auto& player : roster.players()) {
        min_overall = std::min(min_overall, player.overall);
    }

    std::vector<double> weights;
    double total_weight = 0.0;
    for (const auto& player : roster.players()) {
        double weight = std::pow(player.overall - min_overall + 1.0, TARGET_EXPONENT);
        weights.push_back(weight);
        total_weight += weight;
    }

    std::vector<double> minutes;
    for (double weight : weights) {
        minutes.push_back(total * weight / total_weight);
    }

    // Apply the ceiling and spread the excess until nobody is over it
    for (int iteration = 0; iteration < MAX_CEILING_ITERATIONS; iteration++) {
        double excess = 0.0;
        for (double& m : minutes) {
            if (m > ceiling) {
                excess += m - ceiling;
                m = ceiling;
            }
        }
        if (excess <= 0.0) {
            break;
        }

        double eligible_weight = 0.0;
        for (std::size_t i = 0; i < minutes.size(); i++) {
            if (minutes[i] < ceiling) {
                eligible_weight += weights[i];
            }
        }
        if (eligible_weight <= 0.0) {
            break;
        }

        for (std::size_t i = 0; i < minutes.size(); i++) {
            if (minutes[i] < ceiling) {
                minutes[i] += excess * weights[i] / eligible_weight;
            }
        }
    }

    for (std::size_t i = 0; i < roster.size(); i++) {
        set_game_target(roster.at(i).id, minutes[i]);
    }
}

void MinutesPlanner::apply_allotment(const Roster& roster,
                                     const std::unordered_map<PlayerID, double>& allotment) {
    const double expected = config_.lineup_minutes_per_game();
    double total = 0.0;

    for (const auto& entry : allotment) {
        if (!roster.contains(entry.first)) {
            throw ConfigurationError("Minutes allotment names unknown player: " + entry.first);
        }
        if (entry.second < 0.0) {
            throw ConfigurationError("Player " + entry.first + " has negative minutes");
        }
        if (entry.second > config_.game_minutes()) {
            throw ConfigurationError("Player " + entry.first + " exceeds " +
                                     std::to_string(static_cast<int>(config_.game_minutes())) +
                                     " minutes");
        }
        total += entry.second;
    }

    if (std::abs(total - expected) > 0.1) {
        throw ConfigurationError("Minutes allotment must total " +
                                 std::to_string(static_cast<int>(expected)) + ", got " +
                                 std::to_string(total));
    }

    targets_.clear();
    for (const auto& player : roster.players()) {
        auto it = allotment.find(player.id);
        set_game_target(player.id, it != allotment.end() ? it->second : 0.0);
    }
}

double MinutesPlanner::redistribute(const PlayerID& removed_player,
                                    double minutes_played,
                                    const Roster& roster) {
    auto removed_it = targets_.find(removed_player);
    if (removed_it == targets_.end() || removed_it->second.removed) {
        return 0.0;
    }

    const double remaining = std::max(0.0, removed_it->second.game_minutes - minutes_played);

    // Recipients: everyone still available, in roster order
    std::vector<const Player*> recipients;
    double min_overall = std::numeric_limits<double>::max();
    for (const auto& player : roster.players()) {
        if (player.id == removed_player) continue;
        auto it = targets_.find(player.id);
        if (it == targets_.end() || it->second.removed) continue;
        recipients.push_back(&player);
        min_overall = std::min(min_overall, player.overall);
    }

    if (recipients.empty()) {
        // Nobody left to absorb the minutes; keep the total intact
        removed_it->second.removed = true;
        removed_it->second.quarter_minutes = 0.0;
        return 0.0;
    }

    std::vector<double> weights;
    double total_weight = 0.0;
    for (const Player* player : recipients) {
        double weight = std::pow(player->overall - min_overall + 1.0, REDISTRIBUTION_EXPONENT);
        weights.push_back(weight);
        total_weight += weight;
    }

    for (std::size_t i = 0; i < recipients.size(); i++) {
        MinutesTarget& target = targets_[recipients[i]->id];
        set_game_target(recipients[i]->id, target.game_minutes + remaining * weights[i] / total_weight);
    }

    MinutesTarget& removed = targets_[removed_player];
    removed.game_minutes -= remaining;
    removed.quarter_minutes = 0.0;
    removed.removed = true;

    return remaining;
}

// ============================================================================
// QUERIES
// ============================================================================

const MinutesTarget* MinutesPlanner::target_for(const PlayerID& id) const {
    auto it = targets_.find(id);
    if (it == targets_.end()) {
        return nullptr;
    }
    return &it->second;
}

double MinutesPlanner::game_target(const PlayerID& id) const {
    const MinutesTarget* target = target_for(id);
    return target ? target->game_minutes : 0.0;
}

double MinutesPlanner::quarter_target(const PlayerID& id) const {
    const MinutesTarget* target = target_for(id);
    return target ? target->quarter_minutes : 0.0;
}

bool MinutesPlanner::is_removed(const PlayerID& id) const {
    const MinutesTarget* target = target_for(id);
    return target && target->removed;
}

double MinutesPlanner::total_game_minutes() const {
    double total = 0.0;
    for (const auto& entry : targets_) {
        total += entry.second.game_minutes;
    }
    return total;
}

double MinutesPlanner::total_quarter_minutes() const {
    double total = 0.0;
    for (const auto& entry : targets_) {
        total += entry.second.quarter_minutes;
    }
    return total;
}

std::vector<MinutesDiscrepancy> MinutesPlanner::verify(
    const Roster& roster,
    const std::unordered_map<PlayerID, double>& actual_minutes) const {

    std::vector<MinutesDiscrepancy> out;
    for (const auto& player : roster.players()) {
        const double target = game_target(player.id);
        auto it = actual_minutes.find(player.id);
        const double actual = it != actual_minutes.end() ? it->second : 0.0;
        const double diff = actual - target;
        const double threshold = target >= 30.0 ? 2.0 : 5.0;
        if (std::abs(diff) > threshold) {
            out.push_back({player.id, actual, target, diff});
        }
    }
    return out;
}

} // namespace hoops
