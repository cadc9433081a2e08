/**
 * Hoops Rotation Engine - C++ Implementation
 *
 * Player rotation and substitution engine for a possession-level
 * basketball simulation.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "errors.hpp"

// Data structures
#include "player.hpp"
#include "roster.hpp"
#include "rotation_config.hpp"
#include "tactics.hpp"
#include "game_context.hpp"

// Per-team components
#include "lineup_manager.hpp"
#include "minutes_planner.hpp"
#include "court_time.hpp"
#include "discipline.hpp"
#include "stamina.hpp"
#include "q4_closing_planner.hpp"
#include "team_rotation_state.hpp"

// Rules
#include "substitute_selector.hpp"
#include "rule_registry.hpp"
#include "rotation_rules.hpp"
#include "rotation_engine.hpp"

// Match level
#include "substitution_event.hpp"
#include "event_log.hpp"
#include "match_setup.hpp"
#include "trace_logger.hpp"
#include "substitution_manager.hpp"

namespace hoops {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace hoops
