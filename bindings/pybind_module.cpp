/**
 * Hoops Rotation Engine - Python Bindings
 *
 * pybind11 wrapper for the rotation engine, so the Python simulation
 * harness can drive the C++ substitution logic directly.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "hoops_engine.hpp"

namespace py = pybind11;

PYBIND11_MODULE(hoops_engine_cpp, m) {
    m.doc() = "Player rotation and substitution engine";

    py::register_exception<hoops::ConfigurationError>(m, "ConfigurationError");

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<hoops::Position>(m, "Position")
        .value("PG", hoops::Position::PG)
        .value("SG", hoops::Position::SG)
        .value("SF", hoops::Position::SF)
        .value("PF", hoops::Position::PF)
        .value("C", hoops::Position::C)
        .export_values();

    py::enum_<hoops::Pace>(m, "Pace")
        .value("FAST", hoops::Pace::FAST)
        .value("STANDARD", hoops::Pace::STANDARD)
        .value("SLOW", hoops::Pace::SLOW)
        .export_values();

    py::enum_<hoops::TeamSide>(m, "TeamSide")
        .value("HOME", hoops::TeamSide::HOME)
        .value("AWAY", hoops::TeamSide::AWAY)
        .export_values();

    py::enum_<hoops::SubstitutionReason>(m, "SubstitutionReason")
        .value("STAMINA_CRITICAL", hoops::SubstitutionReason::STAMINA_CRITICAL)
        .value("MINUTES_QUOTA", hoops::SubstitutionReason::MINUTES_QUOTA)
        .value("STARTER_RETURN", hoops::SubstitutionReason::STARTER_RETURN)
        .value("BLOWOUT_REST", hoops::SubstitutionReason::BLOWOUT_REST)
        .value("GARBAGE_TIME", hoops::SubstitutionReason::GARBAGE_TIME)
        .value("COMEBACK_REINSERT", hoops::SubstitutionReason::COMEBACK_REINSERT)
        .value("CLOSER_INSERT", hoops::SubstitutionReason::CLOSER_INSERT)
        .value("Q4_PLAN_SUB_OUT", hoops::SubstitutionReason::Q4_PLAN_SUB_OUT)
        .value("Q4_PLAN_INSERT", hoops::SubstitutionReason::Q4_PLAN_INSERT)
        .value("FOULED_OUT", hoops::SubstitutionReason::FOULED_OUT)
        .value("INJURY", hoops::SubstitutionReason::INJURY)
        .value("MANUAL", hoops::SubstitutionReason::MANUAL)
        .export_values();

    py::enum_<hoops::SubstitutionStatus>(m, "SubstitutionStatus")
        .value("OK", hoops::SubstitutionStatus::OK)
        .value("UNKNOWN_PLAYER", hoops::SubstitutionStatus::UNKNOWN_PLAYER)
        .value("SAME_PLAYER", hoops::SubstitutionStatus::SAME_PLAYER)
        .value("PLAYER_OUT_NOT_ACTIVE", hoops::SubstitutionStatus::PLAYER_OUT_NOT_ACTIVE)
        .value("PLAYER_IN_NOT_ON_BENCH", hoops::SubstitutionStatus::PLAYER_IN_NOT_ON_BENCH)
        .value("PLAYER_IN_UNAVAILABLE", hoops::SubstitutionStatus::PLAYER_IN_UNAVAILABLE)
        .export_values();

    py::enum_<hoops::ForcedStatus>(m, "ForcedStatus")
        .value("SUBSTITUTED", hoops::ForcedStatus::SUBSTITUTED)
        .value("ROSTER_EXHAUSTED", hoops::ForcedStatus::ROSTER_EXHAUSTED)
        .value("PLAYER_NOT_ACTIVE", hoops::ForcedStatus::PLAYER_NOT_ACTIVE)
        .value("UNKNOWN_PLAYER", hoops::ForcedStatus::UNKNOWN_PLAYER)
        .export_values();

    m.def("reason_code", [](hoops::SubstitutionReason reason) {
        return std::string(hoops::to_string(reason));
    });
    m.def("describe_reason", [](hoops::SubstitutionReason reason) {
        return std::string(hoops::describe_reason(reason));
    });

    // ========================================================================
    // PLAYERS AND CONFIGURATION
    // ========================================================================

    py::class_<hoops::Player>(m, "Player")
        .def(py::init<>())
        .def(py::init<hoops::PlayerID, std::string, hoops::Position, double>())
        .def_readwrite("id", &hoops::Player::id)
        .def_readwrite("name", &hoops::Player::name)
        .def_readwrite("position", &hoops::Player::position)
        .def_readwrite("overall", &hoops::Player::overall)
        .def_readwrite("stamina", &hoops::Player::stamina)
        .def_readwrite("acceleration", &hoops::Player::acceleration)
        .def_readwrite("top_speed", &hoops::Player::top_speed)
        .def(py::self == py::self)
        .def(py::self != py::self);

    py::class_<hoops::Roster>(m, "Roster")
        .def(py::init<>())
        .def(py::init<std::vector<hoops::Player>>())
        .def("add_player", &hoops::Roster::add_player)
        .def("size", &hoops::Roster::size)
        .def("contains", &hoops::Roster::contains)
        .def("ids", &hoops::Roster::ids)
        .def("players", &hoops::Roster::players)
        .def("top_by_overall", &hoops::Roster::top_by_overall);

    py::class_<hoops::RotationConfig>(m, "RotationConfig")
        .def(py::init<>())
        .def_readwrite("quarter_minutes", &hoops::RotationConfig::quarter_minutes)
        .def_readwrite("quarters", &hoops::RotationConfig::quarters)
        .def_readwrite("stamina_threshold", &hoops::RotationConfig::stamina_threshold)
        .def_readwrite("crunch_stamina_threshold", &hoops::RotationConfig::crunch_stamina_threshold)
        .def_readwrite("return_stamina", &hoops::RotationConfig::return_stamina)
        .def_readwrite("min_stand_in_minutes", &hoops::RotationConfig::min_stand_in_minutes)
        .def_readwrite("quota_tolerance_minutes", &hoops::RotationConfig::quota_tolerance_minutes)
        .def_readwrite("max_directives_per_check", &hoops::RotationConfig::max_directives_per_check)
        .def_readwrite("comeback_swing", &hoops::RotationConfig::comeback_swing)
        .def_readwrite("foul_out_count", &hoops::RotationConfig::foul_out_count);

    py::class_<hoops::TacticalSettings>(m, "TacticalSettings")
        .def(py::init<>())
        .def_readwrite("pace", &hoops::TacticalSettings::pace)
        .def_readwrite("scoring_options", &hoops::TacticalSettings::scoring_options)
        .def_readwrite("closers", &hoops::TacticalSettings::closers)
        .def_readwrite("minutes_allotment", &hoops::TacticalSettings::minutes_allotment);

    py::class_<hoops::GameContext>(m, "GameContext")
        .def(py::init<>())
        .def(py::init<int, int, int, int>(),
             py::arg("quarter"), py::arg("seconds_remaining"),
             py::arg("home_score"), py::arg("away_score"))
        .def_readwrite("quarter", &hoops::GameContext::quarter)
        .def_readwrite("seconds_remaining", &hoops::GameContext::seconds_remaining)
        .def_readwrite("home_score", &hoops::GameContext::home_score)
        .def_readwrite("away_score", &hoops::GameContext::away_score)
        .def("clock", &hoops::GameContext::clock);

    py::class_<hoops::TeamSetup>(m, "TeamSetup")
        .def(py::init<>())
        .def_readwrite("name", &hoops::TeamSetup::name)
        .def_readwrite("players", &hoops::TeamSetup::players)
        .def_readwrite("starting_five", &hoops::TeamSetup::starting_five)
        .def_readwrite("tactics", &hoops::TeamSetup::tactics);

    py::class_<hoops::MatchSetup>(m, "MatchSetup")
        .def(py::init<>())
        .def_readwrite("home", &hoops::MatchSetup::home)
        .def_readwrite("away", &hoops::MatchSetup::away)
        .def_readwrite("rotation", &hoops::MatchSetup::rotation);

    m.def("load_match_setup", &hoops::load_match_setup);

    // ========================================================================
    // STAMINA
    // ========================================================================

    py::class_<hoops::StaminaSource>(m, "StaminaSource")
        .def("stamina", &hoops::StaminaSource::stamina);

    py::class_<hoops::StaminaTable, hoops::StaminaSource>(m, "StaminaTable")
        .def(py::init<>())
        .def("set", &hoops::StaminaTable::set)
        .def("set_all", &hoops::StaminaTable::set_all)
        .def("clear", &hoops::StaminaTable::clear);

    // ========================================================================
    // LINEUP AND MINUTES
    // ========================================================================

    py::class_<hoops::SubstitutionResult>(m, "SubstitutionResult")
        .def_readonly("success", &hoops::SubstitutionResult::success)
        .def_readonly("status", &hoops::SubstitutionResult::status)
        .def_readonly("message", &hoops::SubstitutionResult::message);

    py::class_<hoops::LineupManager>(m, "LineupManager")
        .def(py::init<hoops::Roster, const std::optional<hoops::PlayerIDList>&>(),
             py::arg("roster"), py::arg("starting_five") = std::nullopt)
        .def("get_active", &hoops::LineupManager::get_active)
        .def("get_bench", &hoops::LineupManager::get_bench)
        .def("active_ids", &hoops::LineupManager::active_ids)
        .def("bench_ids", &hoops::LineupManager::bench_ids)
        .def("substitute", &hoops::LineupManager::substitute)
        .def("validate", &hoops::LineupManager::validate)
        .def("stand_in_for", &hoops::LineupManager::stand_in_for)
        .def("is_active", &hoops::LineupManager::is_active)
        .def("is_starter", &hoops::LineupManager::is_starter);

    py::class_<hoops::MinutesDiscrepancy>(m, "MinutesDiscrepancy")
        .def_readonly("player_id", &hoops::MinutesDiscrepancy::player_id)
        .def_readonly("actual", &hoops::MinutesDiscrepancy::actual)
        .def_readonly("target", &hoops::MinutesDiscrepancy::target)
        .def_readonly("diff", &hoops::MinutesDiscrepancy::diff);

    py::class_<hoops::MinutesPlanner>(m, "MinutesPlanner")
        .def(py::init<>())
        .def("calculate_targets", &hoops::MinutesPlanner::calculate_targets)
        .def("apply_allotment", &hoops::MinutesPlanner::apply_allotment)
        .def("redistribute", &hoops::MinutesPlanner::redistribute)
        .def("game_target", &hoops::MinutesPlanner::game_target)
        .def("quarter_target", &hoops::MinutesPlanner::quarter_target)
        .def("total_game_minutes", &hoops::MinutesPlanner::total_game_minutes);

    // ========================================================================
    // EVENTS
    // ========================================================================

    py::class_<hoops::SubstitutionEvent>(m, "SubstitutionEvent")
        .def_readonly("team", &hoops::SubstitutionEvent::team)
        .def_readonly("quarter", &hoops::SubstitutionEvent::quarter)
        .def_readonly("seconds_remaining", &hoops::SubstitutionEvent::seconds_remaining)
        .def_readonly("player_out", &hoops::SubstitutionEvent::player_out)
        .def_readonly("player_in", &hoops::SubstitutionEvent::player_in)
        .def_readonly("reason", &hoops::SubstitutionEvent::reason)
        .def_readonly("stamina_out", &hoops::SubstitutionEvent::stamina_out)
        .def_readonly("stamina_in", &hoops::SubstitutionEvent::stamina_in)
        .def("game_time", &hoops::SubstitutionEvent::game_time)
        .def("__str__", &hoops::EventLog::format_event)
        .def(py::self == py::self);

    py::class_<hoops::EventLog>(m, "EventLog")
        .def("events", &hoops::EventLog::events)
        .def("size", &hoops::EventLog::size)
        .def("for_team", &hoops::EventLog::for_team)
        .def("format", &hoops::EventLog::format)
        .def("to_json_string", &hoops::EventLog::to_json_string, py::arg("indent") = 2);

    py::class_<hoops::FoulRecord>(m, "FoulRecord")
        .def_readonly("player_id", &hoops::FoulRecord::player_id)
        .def_readonly("personal_fouls", &hoops::FoulRecord::personal_fouls)
        .def_readonly("team_fouls", &hoops::FoulRecord::team_fouls)
        .def_readonly("fouled_out", &hoops::FoulRecord::fouled_out)
        .def_readonly("in_bonus", &hoops::FoulRecord::in_bonus);

    py::class_<hoops::ForcedSubstitutionResult>(m, "ForcedSubstitutionResult")
        .def_readonly("status", &hoops::ForcedSubstitutionResult::status)
        .def_readonly("event", &hoops::ForcedSubstitutionResult::event)
        .def_readonly("redistributed_minutes", &hoops::ForcedSubstitutionResult::redistributed_minutes)
        .def_readonly("message", &hoops::ForcedSubstitutionResult::message)
        .def("success", &hoops::ForcedSubstitutionResult::success);

    py::class_<hoops::RotationCheckResult>(m, "RotationCheckResult")
        .def_readonly("events", &hoops::RotationCheckResult::events)
        .def_readonly("infeasible_teams", &hoops::RotationCheckResult::infeasible_teams)
        .def("is_infeasible", &hoops::RotationCheckResult::is_infeasible);

    // ========================================================================
    // SUBSTITUTION MANAGER
    // ========================================================================

    py::class_<hoops::SubstitutionManager>(m, "SubstitutionManager")
        .def(py::init<const hoops::MatchSetup&, const hoops::StaminaSource&>(),
             py::keep_alive<1, 3>())
        .def("start_quarter", &hoops::SubstitutionManager::start_quarter)
        .def("update_time_on_court", &hoops::SubstitutionManager::update_time_on_court)
        .def("check_and_execute", &hoops::SubstitutionManager::check_and_execute)
        .def("record_foul", &hoops::SubstitutionManager::record_foul)
        .def("handle_foul_out", &hoops::SubstitutionManager::handle_foul_out)
        .def("handle_injury", &hoops::SubstitutionManager::handle_injury)
        .def("make_substitution", &hoops::SubstitutionManager::make_substitution)
        .def("verify_minutes_targets", &hoops::SubstitutionManager::verify_minutes_targets)
        .def("event_log", &hoops::SubstitutionManager::event_log,
             py::return_value_policy::reference_internal)
        .def("active_ids", [](const hoops::SubstitutionManager& manager, hoops::TeamSide side) {
            return manager.team(side).lineup.active_ids();
        })
        .def("bench_ids", [](const hoops::SubstitutionManager& manager, hoops::TeamSide side) {
            return manager.team(side).lineup.bench_ids();
        })
        .def("game_minutes", [](const hoops::SubstitutionManager& manager, hoops::TeamSide side,
                                const hoops::PlayerID& id) {
            return manager.team(side).court_time.game_minutes(id);
        });

    // ========================================================================
    // VERSION
    // ========================================================================

    m.attr("VERSION") = hoops::get_version();
    m.attr("__version__") = hoops::get_version();
}
