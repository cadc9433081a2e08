/**
 * Hoops Rotation Engine - Rotation Trace Logger Implementation
 */

#include "trace_logger.hpp"
#include "event_log.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace hoops {

RotationTraceLogger::RotationTraceLogger(const std::string& output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[Trace Logger] Cannot create " << output_dir << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    log_path_ = output_dir + "/rotation_" + timestamp("%Y%m%d_%H%M%S") + ".log";

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[Trace Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "ROTATION TRACE\n";
    log_file_ << "Started: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[Trace Logger] Logging to: " << log_path_ << std::endl;
}

RotationTraceLogger::~RotationTraceLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string RotationTraceLogger::timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

void RotationTraceLogger::log_check(const GameContext& game) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "--- Q" << game.quarter << " " << game.clock()
              << " | HOME " << game.home_score << " - AWAY " << game.away_score << " ---\n";
}

void RotationTraceLogger::log_event(const SubstitutionEvent& event) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "  SUB " << EventLog::format_event(event)
              << " [" << to_string(event.reason) << "]\n";
    log_file_.flush();
}

void RotationTraceLogger::log_q4_plan(const TeamRotationState& team) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "\n[Q4 CLOSING PLAN - " << to_string(team.side) << " " << team.name << "]\n";
    if (!team.q4_plan.has_value() || team.q4_plan->empty()) {
        log_file_ << "  (no eligible starters)\n";
        return;
    }
    for (const auto& entry : team.q4_plan->plans()) {
        log_file_ << "  " << describe_plan(entry) << "\n";
    }
    log_file_.flush();
}

void RotationTraceLogger::log_forced(TeamSide side, const PlayerID& player_id,
                                     SubstitutionReason reason, const std::string& outcome) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "  FORCED [" << to_string(side) << "] " << player_id
              << " " << to_string(reason) << ": " << outcome << "\n";
    log_file_.flush();
}

void RotationTraceLogger::log_infeasible(TeamSide side, std::size_t eligible_players) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "  INFEASIBLE [" << to_string(side) << "] only "
              << eligible_players << " eligible player(s)\n";
    log_file_.flush();
}

void RotationTraceLogger::log_team(const TeamRotationState& team, const StaminaSource& stamina) {
    log_file_ << "\n[" << to_string(team.side) << " " << team.name << "]\n";
    log_file_ << std::fixed << std::setprecision(1);

    auto write_player = [&](const Player& player, const char* label) {
        log_file_ << label << ":  " << player.name << " (" << player.id << ", "
                  << to_string(player.position) << ")"
                  << " | Stamina: " << stamina.stamina(player.id)
                  << " | Stint: " << team.court_time.continuous_minutes(player.id)
                  << " | Game: " << team.court_time.game_minutes(player.id)
                  << "/" << team.minutes.game_target(player.id)
                  << " | PF: " << team.discipline.personal_fouls(player.id);
        if (!team.discipline.is_eligible(player.id)) {
            log_file_ << " | OUT";
        }
        log_file_ << "\n";
    };

    for (const auto& player : team.lineup.get_active()) {
        write_player(player, "ACTIVE");
    }
    for (const auto& player : team.lineup.get_bench()) {
        write_player(player, "BENCH ");
    }

    log_file_ << std::defaultfloat;
}

void RotationTraceLogger::log_lineups(const TeamRotationState& home,
                                      const TeamRotationState& away,
                                      const StaminaSource& stamina) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '-') << "\n";
    log_team(home, stamina);
    log_team(away, stamina);
    log_file_ << std::string(80, '-') << "\n\n";
    log_file_.flush();
}

void RotationTraceLogger::log_match_end(const GameContext& game, std::size_t total_events) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "MATCH END\n";
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "Final: HOME " << game.home_score << " - AWAY " << game.away_score << "\n";
    log_file_ << "Substitutions: " << total_events << "\n";
    log_file_ << "Ended: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n";

    log_file_.flush();
}

} // namespace hoops
