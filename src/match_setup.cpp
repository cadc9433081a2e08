/**
 * Hoops Rotation Engine - Match Setup Implementation
 *
 * Parses match and replay files using nlohmann/json.
 */

#include "match_setup.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace hoops {

namespace {

// ============================================================================
// FIELD HELPERS
// ============================================================================

const json& require(const json& obj, const char* key, const std::string& where) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw ConfigurationError(where + ": missing '" + key + "'");
    }
    return obj[key];
}

std::string string_field(const json& obj, const char* key, const std::string& where) {
    const json& value = require(obj, key, where);
    if (!value.is_string()) {
        throw ConfigurationError(where + "." + key + " must be a string");
    }
    return value.get<std::string>();
}

double number_or(const json& obj, const char* key, double fallback, const std::string& where) {
    if (!obj.contains(key)) {
        return fallback;
    }
    if (!obj[key].is_number()) {
        throw ConfigurationError(where + "." + key + " must be a number");
    }
    return obj[key].get<double>();
}

int int_or(const json& obj, const char* key, int fallback, const std::string& where) {
    if (!obj.contains(key)) {
        return fallback;
    }
    if (!obj[key].is_number_integer()) {
        throw ConfigurationError(where + "." + key + " must be an integer");
    }
    return obj[key].get<int>();
}

PlayerIDList id_list(const json& value, const std::string& where) {
    if (!value.is_array()) {
        throw ConfigurationError(where + " must be an array of player ids");
    }
    PlayerIDList out;
    for (const auto& id : value) {
        if (!id.is_string()) {
            throw ConfigurationError(where + " must contain only strings");
        }
        out.push_back(id.get<std::string>());
    }
    return out;
}

TeamSide parse_team_side(const json& value, const std::string& where) {
    if (!value.is_string()) {
        throw ConfigurationError(where + ".team must be \"home\" or \"away\"");
    }
    const std::string side = value.get<std::string>();
    if (side == "home") return TeamSide::HOME;
    if (side == "away") return TeamSide::AWAY;
    throw ConfigurationError(where + ".team must be \"home\" or \"away\", got \"" + side + "\"");
}

std::vector<std::pair<PlayerID, double>> stamina_map(const json& value, const std::string& where) {
    if (!value.is_object()) {
        throw ConfigurationError(where + " must be an object of id -> stamina");
    }
    std::vector<std::pair<PlayerID, double>> out;
    for (const auto& item : value.items()) {
        if (!item.value().is_number()) {
            throw ConfigurationError(where + "." + item.key() + " must be a number");
        }
        out.emplace_back(item.key(), item.value().get<double>());
    }
    return out;
}

// ============================================================================
// SETUP PARSERS
// ============================================================================

Player parse_player(const json& player_json, const std::string& where) {
    Player player;
    player.id = string_field(player_json, "id", where);
    player.name = player_json.contains("name") ? string_field(player_json, "name", where) : player.id;

    const std::string position = string_field(player_json, "position", where);
    auto parsed = parse_position(position);
    if (!parsed.has_value()) {
        throw ConfigurationError(where + ".position: unknown position \"" + position + "\"");
    }
    player.position = *parsed;

    player.overall = number_or(player_json, "overall", player.overall, where);
    player.stamina = int_or(player_json, "stamina", player.stamina, where);
    player.acceleration = int_or(player_json, "acceleration", player.acceleration, where);
    player.top_speed = int_or(player_json, "top_speed", player.top_speed, where);
    return player;
}

TacticalSettings parse_tactics(const json& tactics_json, const std::string& where) {
    TacticalSettings tactics;
    if (!tactics_json.is_object()) {
        throw ConfigurationError(where + " must be an object");
    }

    if (tactics_json.contains("pace")) {
        const std::string pace = string_field(tactics_json, "pace", where);
        auto parsed = parse_pace(pace);
        if (!parsed.has_value()) {
            throw ConfigurationError(where + ".pace: unknown pace \"" + pace + "\"");
        }
        tactics.pace = *parsed;
    }

    if (tactics_json.contains("scoring_options")) {
        tactics.scoring_options = id_list(tactics_json["scoring_options"], where + ".scoring_options");
    }
    if (tactics_json.contains("closers")) {
        tactics.closers = id_list(tactics_json["closers"], where + ".closers");
    }

    if (tactics_json.contains("minutes_allotment")) {
        const json& allotment = tactics_json["minutes_allotment"];
        if (!allotment.is_object()) {
            throw ConfigurationError(where + ".minutes_allotment must be an object of id -> minutes");
        }
        for (const auto& item : allotment.items()) {
            if (!item.value().is_number()) {
                throw ConfigurationError(where + ".minutes_allotment." + item.key() + " must be a number");
            }
            tactics.minutes_allotment[item.key()] = item.value().get<double>();
        }
    }

    return tactics;
}

TeamSetup parse_team(const json& team_json, const std::string& where) {
    TeamSetup team;
    team.name = team_json.contains("name") ? string_field(team_json, "name", where) : where;

    const json& players = require(team_json, "players", where);
    if (!players.is_array()) {
        throw ConfigurationError(where + ".players must be an array");
    }
    for (std::size_t i = 0; i < players.size(); i++) {
        team.players.push_back(parse_player(players[i], where + ".players[" + std::to_string(i) + "]"));
    }

    if (team_json.contains("starting_five")) {
        team.starting_five = id_list(team_json["starting_five"], where + ".starting_five");
    }
    if (team_json.contains("tactics")) {
        team.tactics = parse_tactics(team_json["tactics"], where + ".tactics");
    }
    return team;
}

json read_json_file(const std::string& filepath, const char* component) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[" << component << "] Failed to open: " << filepath << std::endl;
        throw ConfigurationError("Cannot open " + filepath);
    }

    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        std::cerr << "[" << component << "] JSON parse error: " << e.what() << std::endl;
        throw ConfigurationError(filepath + ": " + e.what());
    }
}

} // namespace

// ============================================================================
// PUBLIC API
// ============================================================================

RotationConfig parse_rotation_config(const json& data, RotationConfig base) {
    const std::string where = "rotation";
    if (!data.is_object()) {
        throw ConfigurationError("rotation must be an object");
    }

    base.quarter_minutes = number_or(data, "quarter_minutes", base.quarter_minutes, where);
    base.quarters = int_or(data, "quarters", base.quarters, where);
    base.stamina_threshold = number_or(data, "stamina_threshold", base.stamina_threshold, where);
    base.crunch_stamina_threshold = number_or(data, "crunch_stamina_threshold", base.crunch_stamina_threshold, where);
    base.return_stamina = number_or(data, "return_stamina", base.return_stamina, where);
    base.preferred_sub_stamina = number_or(data, "preferred_sub_stamina", base.preferred_sub_stamina, where);
    base.min_stand_in_minutes = number_or(data, "min_stand_in_minutes", base.min_stand_in_minutes, where);
    base.quota_tolerance_minutes = number_or(data, "quota_tolerance_minutes", base.quota_tolerance_minutes, where);
    base.max_directives_per_check = int_or(data, "max_directives_per_check", base.max_directives_per_check, where);
    base.crunch_seconds = int_or(data, "crunch_seconds", base.crunch_seconds, where);
    base.crunch_margin = int_or(data, "crunch_margin", base.crunch_margin, where);
    base.comeback_swing = int_or(data, "comeback_swing", base.comeback_swing, where);
    base.rest_threshold = number_or(data, "rest_threshold", base.rest_threshold, where);
    base.insert_buffer_minutes = number_or(data, "insert_buffer_minutes", base.insert_buffer_minutes, where);
    base.transition_rate = number_or(data, "transition_rate", base.transition_rate, where);
    base.foul_out_count = int_or(data, "foul_out_count", base.foul_out_count, where);
    base.team_bonus_fouls = int_or(data, "team_bonus_fouls", base.team_bonus_fouls, where);

    if (base.quarters < 1 || base.quarter_minutes <= 0.0) {
        throw ConfigurationError("rotation: quarters and quarter_minutes must be positive");
    }
    if (base.max_directives_per_check < 1) {
        throw ConfigurationError("rotation.max_directives_per_check must be at least 1");
    }
    return base;
}

MatchSetup parse_match_setup(const json& data) {
    MatchSetup setup;
    try {
        setup.home = parse_team(require(data, "home", "match"), "home");
        setup.away = parse_team(require(data, "away", "match"), "away");
        if (data.contains("rotation")) {
            setup.rotation = parse_rotation_config(data["rotation"]);
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("match setup: ") + e.what());
    }
    return setup;
}

MatchSetup load_match_setup(const std::string& filepath) {
    json data = read_json_file(filepath, "MatchSetup");
    return parse_match_setup(data);
}

ReplayScript parse_replay_script(const json& data) {
    ReplayScript script;
    try {
        if (data.contains("initial_stamina")) {
            script.initial_stamina = stamina_map(data["initial_stamina"], "initial_stamina");
        }

        const json& possessions = require(data, "possessions", "script");
        if (!possessions.is_array()) {
            throw ConfigurationError("script.possessions must be an array");
        }

        for (std::size_t i = 0; i < possessions.size(); i++) {
            const json& entry = possessions[i];
            const std::string where = "possessions[" + std::to_string(i) + "]";

            ScriptedPossession possession;
            possession.duration_seconds = int_or(entry, "duration", 0, where);
            if (possession.duration_seconds < 0) {
                throw ConfigurationError(where + ".duration must not be negative");
            }
            possession.home_score = int_or(entry, "home_score", 0, where);
            possession.away_score = int_or(entry, "away_score", 0, where);

            if (entry.contains("stamina")) {
                possession.stamina = stamina_map(entry["stamina"], where + ".stamina");
            }

            for (const char* key : {"fouls", "injuries"}) {
                if (!entry.contains(key)) continue;
                const json& list = entry[key];
                if (!list.is_array()) {
                    throw ConfigurationError(where + "." + key + " must be an array");
                }
                for (const auto& incident_json : list) {
                    ScriptedIncident incident;
                    incident.team = parse_team_side(require(incident_json, "team", where), where);
                    incident.player_id = string_field(incident_json, "player", where);
                    if (std::string(key) == "fouls") {
                        possession.fouls.push_back(incident);
                    } else {
                        possession.injuries.push_back(incident);
                    }
                }
            }

            script.possessions.push_back(std::move(possession));
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("replay script: ") + e.what());
    }
    return script;
}

ReplayScript load_replay_script(const std::string& filepath) {
    json data = read_json_file(filepath, "ReplayScript");
    return parse_replay_script(data);
}

} // namespace hoops
