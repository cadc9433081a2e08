/**
 * Hoops Rotation Engine - Tactical Settings
 *
 * Read-only team tactics consumed by drain estimation and closer logic.
 */

#pragma once

#include "types.hpp"
#include <algorithm>

namespace hoops {

struct TacticalSettings {
    Pace pace = Pace::STANDARD;

    // Up to three designated scoring options, in priority order
    PlayerIDList scoring_options;

    // Explicit closers; when empty the scoring options close games
    PlayerIDList closers;

    // Optional explicit game-minutes allotment (must total 240 when present)
    std::unordered_map<PlayerID, double> minutes_allotment;

    bool is_scoring_option(const PlayerID& id) const {
        return std::find(scoring_options.begin(), scoring_options.end(), id) != scoring_options.end();
    }

    const PlayerIDList& effective_closers() const {
        return closers.empty() ? scoring_options : closers;
    }

    bool is_closer(const PlayerID& id) const {
        const auto& list = effective_closers();
        return std::find(list.begin(), list.end(), id) != list.end();
    }
};

} // namespace hoops
