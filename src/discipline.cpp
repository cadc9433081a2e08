/**
 * Hoops Rotation Engine - Discipline Tracker Implementation
 */

#include "discipline.hpp"
#include <algorithm>

namespace hoops {

DisciplineTracker::DisciplineTracker(RotationConfig config)
    : config_(config) {}

// ============================================================================
// FOULS
// ============================================================================

FoulRecord DisciplineTracker::record_foul(const PlayerID& id) {
    FoulRecord record;
    record.player_id = id;

    if (!is_fouled_out(id)) {
        int& fouls = personal_fouls_[id];
        fouls++;
        team_fouls_++;
        if (fouls >= config_.foul_out_count) {
            fouled_out_.insert(id);
            record.fouled_out = true;
        }
    }

    record.personal_fouls = personal_fouls(id);
    record.team_fouls = team_fouls_;
    record.in_bonus = in_bonus();
    return record;
}

bool DisciplineTracker::mark_fouled_out(const PlayerID& id) {
    if (is_fouled_out(id)) {
        return false;
    }
    int& fouls = personal_fouls_[id];
    fouls = std::max(fouls, config_.foul_out_count);
    fouled_out_.insert(id);
    return true;
}

int DisciplineTracker::personal_fouls(const PlayerID& id) const {
    auto it = personal_fouls_.find(id);
    return it != personal_fouls_.end() ? it->second : 0;
}

bool DisciplineTracker::is_fouled_out(const PlayerID& id) const {
    return fouled_out_.count(id) > 0;
}

bool DisciplineTracker::in_foul_trouble(const PlayerID& id, int quarter) const {
    return personal_fouls(id) >= quarter + 1;
}

// ============================================================================
// INJURIES
// ============================================================================

bool DisciplineTracker::mark_injured(const PlayerID& id) {
    return injured_.insert(id).second;
}

bool DisciplineTracker::is_injured(const PlayerID& id) const {
    return injured_.count(id) > 0;
}

// ============================================================================
// ELIGIBILITY
// ============================================================================

bool DisciplineTracker::is_eligible(const PlayerID& id) const {
    return !is_fouled_out(id) && !is_injured(id);
}

std::size_t DisciplineTracker::count_eligible(const PlayerIDList& ids) const {
    return static_cast<std::size_t>(std::count_if(ids.begin(), ids.end(), [this](const PlayerID& id) {
        return is_eligible(id);
    }));
}

void DisciplineTracker::start_quarter() {
    team_fouls_ = 0;
}

} // namespace hoops
