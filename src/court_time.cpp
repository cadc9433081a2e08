/**
 * Hoops Rotation Engine - Court Time Tracker Implementation
 */

#include "court_time.hpp"

namespace hoops {

void CourtTimeTracker::add_time(const PlayerIDList& active, double seconds) {
    if (seconds <= 0.0) {
        return;
    }
    for (const auto& id : active) {
        continuous_seconds_[id] += seconds;
        quarter_seconds_[id] += seconds;
        game_seconds_[id] += seconds;
    }
}

void CourtTimeTracker::on_substitution(const PlayerID& player_out, const PlayerID& player_in) {
    continuous_seconds_[player_out] = 0.0;
    continuous_seconds_[player_in] = 0.0;
}

void CourtTimeTracker::start_quarter() {
    quarter_seconds_.clear();
}

void CourtTimeTracker::reset() {
    continuous_seconds_.clear();
    quarter_seconds_.clear();
    game_seconds_.clear();
}

double CourtTimeTracker::lookup(const std::unordered_map<PlayerID, double>& table, const PlayerID& id) {
    auto it = table.find(id);
    return it != table.end() ? it->second : 0.0;
}

double CourtTimeTracker::continuous_minutes(const PlayerID& id) const {
    return lookup(continuous_seconds_, id) / 60.0;
}

double CourtTimeTracker::quarter_minutes(const PlayerID& id) const {
    return lookup(quarter_seconds_, id) / 60.0;
}

double CourtTimeTracker::game_minutes(const PlayerID& id) const {
    return lookup(game_seconds_, id) / 60.0;
}

std::unordered_map<PlayerID, double> CourtTimeTracker::game_minutes_by_player() const {
    std::unordered_map<PlayerID, double> out;
    for (const auto& entry : game_seconds_) {
        out[entry.first] = entry.second / 60.0;
    }
    return out;
}

} // namespace hoops
