/**
 * Hoops Rotation Engine - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the engine.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_set>
#include <unordered_map>
#include <optional>

namespace hoops {

// ============================================================================
// ENUMS
// ============================================================================

enum class Position : uint8_t {
    PG,
    SG,
    SF,
    PF,
    C
};

enum class Pace : uint8_t {
    FAST,
    STANDARD,
    SLOW
};

enum class TeamSide : uint8_t {
    HOME,
    AWAY
};

/**
 * Why a lineup changed. Control data only; display text lives in
 * describe_reason() (event_log.hpp).
 */
enum class SubstitutionReason : uint8_t {
    STAMINA_CRITICAL,
    MINUTES_QUOTA,
    STARTER_RETURN,
    BLOWOUT_REST,
    GARBAGE_TIME,
    COMEBACK_REINSERT,
    CLOSER_INSERT,
    Q4_PLAN_SUB_OUT,
    Q4_PLAN_INSERT,
    FOULED_OUT,
    INJURY,
    MANUAL
};

enum class BlowoutLevel : uint8_t {
    NONE,
    REST_STARTERS,
    GARBAGE_TIME
};

enum class RuleId : uint8_t {
    INFEASIBLE_ROSTER,
    BLOWOUT_REST,
    STAMINA_CRITICAL,
    Q4_PLAN_SUB_OUT,
    CLOSER_INSERT,
    Q4_PLAN_INSERT,
    COMEBACK_REINSERT,
    MINUTES_QUOTA,
    STARTER_RETURN
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using PlayerID = std::string;         // Stable roster id (e.g., "hom_pg1")
using PlayerIDList = std::vector<PlayerID>;
using PlayerIDSet = std::unordered_set<PlayerID>;

constexpr int LINEUP_SIZE = 5;

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(Position position) {
    switch (position) {
        case Position::PG: return "PG";
        case Position::SG: return "SG";
        case Position::SF: return "SF";
        case Position::PF: return "PF";
        case Position::C: return "C";
        default: return "??";
    }
}

inline const char* to_string(Pace pace) {
    switch (pace) {
        case Pace::FAST: return "fast";
        case Pace::STANDARD: return "standard";
        case Pace::SLOW: return "slow";
        default: return "unknown";
    }
}

inline const char* to_string(TeamSide side) {
    switch (side) {
        case TeamSide::HOME: return "home";
        case TeamSide::AWAY: return "away";
        default: return "unknown";
    }
}

/**
 * Stable machine-readable reason code (used in logs, JSON and tests).
 */
inline const char* to_string(SubstitutionReason reason) {
    switch (reason) {
        case SubstitutionReason::STAMINA_CRITICAL: return "stamina_rule2";
        case SubstitutionReason::MINUTES_QUOTA: return "minutes_quota";
        case SubstitutionReason::STARTER_RETURN: return "starter_return_rule1";
        case SubstitutionReason::BLOWOUT_REST: return "blowout_rest";
        case SubstitutionReason::GARBAGE_TIME: return "garbage_time";
        case SubstitutionReason::COMEBACK_REINSERT: return "comeback_reinsert";
        case SubstitutionReason::CLOSER_INSERT: return "close_game_insert_closer";
        case SubstitutionReason::Q4_PLAN_SUB_OUT: return "q4_plan_sub_out";
        case SubstitutionReason::Q4_PLAN_INSERT: return "q4_plan_insert";
        case SubstitutionReason::FOULED_OUT: return "fouled_out";
        case SubstitutionReason::INJURY: return "injury";
        case SubstitutionReason::MANUAL: return "manual";
        default: return "unknown";
    }
}

inline const char* to_string(BlowoutLevel level) {
    switch (level) {
        case BlowoutLevel::NONE: return "none";
        case BlowoutLevel::REST_STARTERS: return "blowout_rest";
        case BlowoutLevel::GARBAGE_TIME: return "garbage_time";
        default: return "unknown";
    }
}

inline const char* to_string(RuleId rule) {
    switch (rule) {
        case RuleId::INFEASIBLE_ROSTER: return "infeasible_roster";
        case RuleId::BLOWOUT_REST: return "blowout_rest";
        case RuleId::STAMINA_CRITICAL: return "stamina_critical";
        case RuleId::Q4_PLAN_SUB_OUT: return "q4_plan_sub_out";
        case RuleId::CLOSER_INSERT: return "closer_insert";
        case RuleId::Q4_PLAN_INSERT: return "q4_plan_insert";
        case RuleId::COMEBACK_REINSERT: return "comeback_reinsert";
        case RuleId::MINUTES_QUOTA: return "minutes_quota";
        case RuleId::STARTER_RETURN: return "starter_return";
        default: return "unknown";
    }
}

inline std::optional<Position> parse_position(const std::string& text) {
    if (text == "PG") return Position::PG;
    if (text == "SG") return Position::SG;
    if (text == "SF") return Position::SF;
    if (text == "PF") return Position::PF;
    if (text == "C") return Position::C;
    return std::nullopt;
}

inline std::optional<Pace> parse_pace(const std::string& text) {
    if (text == "fast") return Pace::FAST;
    if (text == "standard") return Pace::STANDARD;
    if (text == "slow") return Pace::SLOW;
    return std::nullopt;
}

inline TeamSide opponent_of(TeamSide side) {
    return side == TeamSide::HOME ? TeamSide::AWAY : TeamSide::HOME;
}

} // namespace hoops
