/**
 * Hoops Rotation Engine - Match Setup
 *
 * Loads rosters, starting fives, tactics and rotation overrides from
 * JSON, plus the scripted possession sequences the replay console drives.
 */

#pragma once

#include "player.hpp"
#include "rotation_config.hpp"
#include "tactics.hpp"
#include <nlohmann/json_fwd.hpp>

namespace hoops {

// ============================================================================
// SETUP
// ============================================================================

struct TeamSetup {
    std::string name;
    std::vector<Player> players;
    std::optional<PlayerIDList> starting_five;
    TacticalSettings tactics;
};

struct MatchSetup {
    TeamSetup home;
    TeamSetup away;
    RotationConfig rotation;
};

/**
 * @throws ConfigurationError naming the offending field
 */
MatchSetup parse_match_setup(const nlohmann::json& data);

/**
 * @throws ConfigurationError if the file is missing, not JSON, or invalid
 */
MatchSetup load_match_setup(const std::string& filepath);

/**
 * Override fields of `base` with whatever the "rotation" block supplies.
 */
RotationConfig parse_rotation_config(const nlohmann::json& data, RotationConfig base = RotationConfig{});

// ============================================================================
// REPLAY SCRIPT
// ============================================================================

struct ScriptedIncident {
    TeamSide team = TeamSide::HOME;
    PlayerID player_id;
};

/**
 * One possession: elapsed clock, score after it, and any stamina, foul or
 * injury updates reported by the collaborating systems.
 */
struct ScriptedPossession {
    int duration_seconds = 0;
    int home_score = 0;
    int away_score = 0;
    std::vector<std::pair<PlayerID, double>> stamina;
    std::vector<ScriptedIncident> fouls;
    std::vector<ScriptedIncident> injuries;
};

struct ReplayScript {
    std::vector<std::pair<PlayerID, double>> initial_stamina;
    std::vector<ScriptedPossession> possessions;
};

ReplayScript parse_replay_script(const nlohmann::json& data);
ReplayScript load_replay_script(const std::string& filepath);

} // namespace hoops
