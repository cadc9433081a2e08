/**
 * Hoops Rotation Engine - Replay Console
 *
 * Simple REPL for driving the rotation engine by hand or from a scripted
 * possession file. Run with a match file and a script to replay a whole
 * match non-interactively:
 *
 *   hoops_replay data/sample_match.json data/sample_script.json [--trace]
 */

#include <iostream>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <memory>

#include "hoops_engine.hpp"

using namespace hoops;

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::optional<TeamSide> parse_side(const std::string& text) {
    if (text == "home" || text == "h") return TeamSide::HOME;
    if (text == "away" || text == "a") return TeamSide::AWAY;
    return std::nullopt;
}

std::optional<double> parse_number(const std::string& text) {
    try {
        std::size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// PRINT HELP
// ============================================================================

void print_help() {
    std::cout << R"(
=== Hoops Rotation Replay Console ===

Commands:
  help                          - Show this help
  quit / exit                   - Exit console

Match Setup:
  load <match.json>             - Load rosters and tactics, start Q1
  script <script.json>          - Load a possession script
  trace on|off                  - Toggle the rotation trace file

Playing:
  step [n]                      - Replay the next n scripted possessions (default 1)
  run                           - Replay the rest of the script
  tick <sec> [home] [away]      - Play one possession by hand
  stamina <id> <value>          - Set a player's current stamina
  foul <home|away> <id>         - Record a personal foul
  injure <home|away> <id>       - Injure a player
  sub <home|away> <out> <in>    - Coach's substitution

Inspecting:
  show / s                      - Clock, score and both lineups
  plan                          - Q4 closing plans
  log                           - Substitution log
  json                          - Substitution log as JSON
  verify                        - Minutes against targets

Examples:
  load data/sample_match.json
  script data/sample_script.json
  step 10
  show
)" << std::endl;
}

// ============================================================================
// CONSOLE
// ============================================================================

class Console {
public:
    std::optional<MatchSetup> setup;
    StaminaTable stamina;
    std::unique_ptr<SubstitutionManager> manager;
    GameContext game;

    ReplayScript script;
    std::size_t next_possession = 0;
    bool match_over = false;

    // Rotation trace for debugging
    bool trace_requested = false;
    std::unique_ptr<RotationTraceLogger> trace_logger;

    // ========================================================================
    // SETUP
    // ========================================================================

    bool cmd_load(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: load <match.json>" << std::endl;
            return false;
        }

        try {
            setup = load_match_setup(args[1]);
        } catch (const ConfigurationError& e) {
            std::cout << "Failed to load match: " << e.what() << std::endl;
            return false;
        }

        std::cout << "Loaded " << setup->home.name << " (" << setup->home.players.size() << " players) vs "
                  << setup->away.name << " (" << setup->away.players.size() << " players)" << std::endl;
        return restart();
    }

    bool restart() {
        if (!setup.has_value()) {
            std::cout << "No match loaded. Use 'load' first." << std::endl;
            return false;
        }

        stamina.clear();
        for (const auto& entry : script.initial_stamina) {
            stamina.set(entry.first, entry.second);
        }

        try {
            manager = std::make_unique<SubstitutionManager>(*setup, stamina);
        } catch (const ConfigurationError& e) {
            std::cout << "Invalid match setup: " << e.what() << std::endl;
            manager.reset();
            return false;
        }

        if (trace_requested) {
            trace_logger = std::make_unique<RotationTraceLogger>();
            if (trace_logger->is_enabled()) {
                std::cout << "Rotation trace: " << trace_logger->get_log_path() << std::endl;
            }
            manager->set_trace_logger(trace_logger.get());
        } else {
            trace_logger.reset();
        }

        game = GameContext(1, quarter_seconds(), 0, 0);
        next_possession = 0;
        match_over = false;
        manager->start_quarter(game);
        return true;
    }

    bool cmd_script(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: script <script.json>" << std::endl;
            return false;
        }

        try {
            script = load_replay_script(args[1]);
        } catch (const ConfigurationError& e) {
            std::cout << "Failed to load script: " << e.what() << std::endl;
            return false;
        }

        std::cout << "Loaded script with " << script.possessions.size() << " possessions" << std::endl;

        // Initial stamina only makes sense from tip-off
        return manager ? restart() : true;
    }

    void cmd_trace(const std::vector<std::string>& args) {
        if (args.size() < 2 || (args[1] != "on" && args[1] != "off")) {
            std::cout << "Usage: trace on|off" << std::endl;
            return;
        }
        trace_requested = (args[1] == "on");
        if (trace_logger) {
            trace_logger->set_enabled(trace_requested);
        } else if (trace_requested && manager) {
            trace_logger = std::make_unique<RotationTraceLogger>();
            manager->set_trace_logger(trace_logger.get());
            std::cout << "Rotation trace: " << trace_logger->get_log_path() << std::endl;
        }
    }

    // ========================================================================
    // PLAYING
    // ========================================================================

    int quarter_seconds() const {
        return static_cast<int>(setup->rotation.quarter_minutes * 60.0);
    }

    bool ready() const {
        if (!manager) {
            std::cout << "No match loaded. Use 'load' first." << std::endl;
            return false;
        }
        if (match_over) {
            std::cout << "Match is over. Use 'load' to start again." << std::endl;
            return false;
        }
        return true;
    }

    /**
     * One possession: stamina updates, clock, score, incidents, then the
     * rotation check. Possessions never run past the end of a quarter.
     */
    void play_possession(const ScriptedPossession& possession) {
        for (const auto& entry : possession.stamina) {
            stamina.set(entry.first, entry.second);
        }

        const int elapsed = std::min(possession.duration_seconds, game.seconds_remaining);
        manager->update_time_on_court(elapsed);
        game.seconds_remaining -= elapsed;
        game.home_score = possession.home_score;
        game.away_score = possession.away_score;

        for (const auto& foul : possession.fouls) {
            FoulRecord record = manager->record_foul(foul.team, foul.player_id);
            std::cout << "  Foul: " << foul.player_id << " (" << record.personal_fouls << " PF, team "
                      << record.team_fouls << (record.in_bonus ? ", bonus" : "") << ")" << std::endl;
            if (record.fouled_out) {
                report_forced(manager->handle_foul_out(foul.team, foul.player_id, game));
            }
        }
        for (const auto& injury : possession.injuries) {
            report_forced(manager->handle_injury(injury.team, injury.player_id, game));
        }

        RotationCheckResult result = manager->check_and_execute(game);
        for (const auto& event : result.events) {
            std::cout << "  " << EventLog::format_event(event) << std::endl;
        }

        if (game.seconds_remaining <= 0) {
            end_quarter();
        }
    }

    void end_quarter() {
        std::cout << "--- End of Q" << game.quarter << ": " << game.home_score
                  << "-" << game.away_score << " ---" << std::endl;

        if (game.quarter >= setup->rotation.quarters) {
            match_over = true;
            manager->finish_match(game);
            std::cout << "Final: " << setup->home.name << " " << game.home_score << ", "
                      << setup->away.name << " " << game.away_score
                      << " (" << manager->event_log().size() << " substitutions)" << std::endl;
            return;
        }

        game.quarter++;
        game.seconds_remaining = quarter_seconds();
        manager->start_quarter(game);
    }

    void report_forced(const ForcedSubstitutionResult& result) {
        if (result.event.has_value()) {
            std::cout << "  " << EventLog::format_event(*result.event) << std::endl;
        } else {
            std::cout << "  [" << to_string(result.status) << "] " << result.message << std::endl;
        }
    }

    void cmd_step(const std::vector<std::string>& args) {
        if (!ready()) return;

        std::size_t count = 1;
        if (args.size() > 1) {
            auto parsed = parse_number(args[1]);
            if (!parsed.has_value() || *parsed < 1) {
                std::cout << "Usage: step [n]" << std::endl;
                return;
            }
            count = static_cast<std::size_t>(*parsed);
        }

        for (std::size_t i = 0; i < count && !match_over; i++) {
            if (next_possession >= script.possessions.size()) {
                std::cout << "Script finished." << std::endl;
                return;
            }
            play_possession(script.possessions[next_possession++]);
        }
    }

    void cmd_run() {
        if (!ready()) return;
        while (!match_over && next_possession < script.possessions.size()) {
            play_possession(script.possessions[next_possession++]);
        }
    }

    void cmd_tick(const std::vector<std::string>& args) {
        if (!ready()) return;
        if (args.size() < 2) {
            std::cout << "Usage: tick <seconds> [home_score] [away_score]" << std::endl;
            return;
        }

        ScriptedPossession possession;
        possession.home_score = game.home_score;
        possession.away_score = game.away_score;

        auto seconds = parse_number(args[1]);
        if (!seconds.has_value() || *seconds < 0) {
            std::cout << "Invalid seconds: " << args[1] << std::endl;
            return;
        }
        possession.duration_seconds = static_cast<int>(*seconds);

        if (args.size() > 2) {
            auto home = parse_number(args[2]);
            if (home.has_value()) possession.home_score = static_cast<int>(*home);
        }
        if (args.size() > 3) {
            auto away = parse_number(args[3]);
            if (away.has_value()) possession.away_score = static_cast<int>(*away);
        }

        play_possession(possession);
    }

    void cmd_stamina(const std::vector<std::string>& args) {
        if (args.size() < 3) {
            std::cout << "Usage: stamina <id> <value>" << std::endl;
            return;
        }
        auto value = parse_number(args[2]);
        if (!value.has_value()) {
            std::cout << "Invalid stamina: " << args[2] << std::endl;
            return;
        }
        stamina.set(args[1], *value);
        std::cout << args[1] << " stamina = " << stamina.stamina(args[1]) << std::endl;
    }

    void cmd_foul(const std::vector<std::string>& args) {
        if (!ready()) return;
        auto side = args.size() > 2 ? parse_side(args[1]) : std::nullopt;
        if (!side.has_value()) {
            std::cout << "Usage: foul <home|away> <id>" << std::endl;
            return;
        }

        FoulRecord record = manager->record_foul(*side, args[2]);
        std::cout << args[2] << ": " << record.personal_fouls << " personal fouls, team fouls "
                  << record.team_fouls << (record.in_bonus ? " (bonus)" : "") << std::endl;
        if (record.fouled_out) {
            report_forced(manager->handle_foul_out(*side, args[2], game));
        }
    }

    void cmd_injure(const std::vector<std::string>& args) {
        if (!ready()) return;
        auto side = args.size() > 2 ? parse_side(args[1]) : std::nullopt;
        if (!side.has_value()) {
            std::cout << "Usage: injure <home|away> <id>" << std::endl;
            return;
        }
        report_forced(manager->handle_injury(*side, args[2], game));
    }

    void cmd_sub(const std::vector<std::string>& args) {
        if (!ready()) return;
        auto side = args.size() > 3 ? parse_side(args[1]) : std::nullopt;
        if (!side.has_value()) {
            std::cout << "Usage: sub <home|away> <out> <in>" << std::endl;
            return;
        }

        SubstitutionResult result = manager->make_substitution(*side, args[2], args[3], game);
        if (result.success) {
            std::cout << "  " << EventLog::format_event(manager->event_log().events().back()) << std::endl;
        } else {
            std::cout << "Rejected (" << to_string(result.status) << "): " << result.message << std::endl;
        }
    }

    // ========================================================================
    // INSPECTING
    // ========================================================================

    void show_team(const TeamRotationState& team) const {
        std::cout << "|  " << team.name << " [" << to_string(team.side) << "]"
                  << " | Team fouls: " << team.discipline.team_fouls() << std::endl;

        auto print_player = [&](const Player& player) {
            std::cout << "|    " << std::left << std::setw(10) << player.id << std::right
                      << " " << std::setw(2) << to_string(player.position)
                      << "  STA " << std::fixed << std::setprecision(1) << std::setw(5) << stamina.stamina(player.id)
                      << "  MIN " << std::setw(4) << team.court_time.game_minutes(player.id)
                      << "/" << std::setw(4) << team.minutes.game_target(player.id)
                      << "  PF " << team.discipline.personal_fouls(player.id);
            if (team.discipline.is_fouled_out(player.id)) std::cout << " [fouled out]";
            if (team.discipline.is_injured(player.id)) std::cout << " [injured]";
            std::cout << std::endl;
        };

        std::cout << "|  Active:" << std::endl;
        for (const auto& player : team.lineup.get_active()) print_player(player);
        std::cout << "|  Bench:" << std::endl;
        for (const auto& player : team.lineup.get_bench()) print_player(player);
    }

    void cmd_show() const {
        if (!manager) {
            std::cout << "No match loaded. Use 'load' first." << std::endl;
            return;
        }
        std::cout << "\n+================================================================+" << std::endl;
        std::cout << "|  Q" << game.quarter << " " << game.clock()
                  << " | " << game.home_score << "-" << game.away_score;
        if (!script.possessions.empty()) {
            std::cout << " | Possession " << next_possession << "/" << script.possessions.size();
        }
        std::cout << std::endl;
        std::cout << "+================================================================+" << std::endl;
        show_team(manager->team(TeamSide::HOME));
        std::cout << "+----------------------------------------------------------------+" << std::endl;
        show_team(manager->team(TeamSide::AWAY));
        std::cout << "+================================================================+" << std::endl;
    }

    void cmd_plan() const {
        if (!manager) return;
        for (TeamSide side : {TeamSide::HOME, TeamSide::AWAY}) {
            const TeamRotationState& team = manager->team(side);
            std::cout << team.name << ":" << std::endl;
            if (!team.q4_plan.has_value()) {
                std::cout << "  (no plan until the final quarter)" << std::endl;
                continue;
            }
            for (const auto& plan : team.q4_plan->plans()) {
                std::cout << "  " << describe_plan(plan) << std::endl;
            }
        }
    }

    void cmd_log() const {
        if (!manager) return;
        if (manager->event_log().empty()) {
            std::cout << "(no substitutions yet)" << std::endl;
            return;
        }
        std::cout << manager->event_log().format();
    }

    void cmd_json() const {
        if (!manager) return;
        std::cout << manager->event_log().to_json_string() << std::endl;
    }

    void cmd_verify() const {
        if (!manager) return;
        for (TeamSide side : {TeamSide::HOME, TeamSide::AWAY}) {
            auto misses = manager->verify_minutes_targets(side);
            std::cout << manager->team(side).name << ": "
                      << (misses.empty() ? "all players within tolerance" : "") << std::endl;
            for (const auto& miss : misses) {
                std::cout << "  " << miss.player_id << std::fixed << std::setprecision(1)
                          << " played " << miss.actual << " of " << miss.target
                          << " (" << std::showpos << miss.diff << std::noshowpos << ")" << std::endl;
            }
        }
    }

    // ========================================================================
    // MAIN LOOP
    // ========================================================================

    void run() {
        std::cout << "Hoops Rotation Replay Console v" << get_version() << std::endl;
        std::cout << "=====================================\n" << std::endl;

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "load") {
                cmd_load(args);
            } else if (cmd == "script") {
                cmd_script(args);
            } else if (cmd == "trace") {
                cmd_trace(args);
            } else if (cmd == "step") {
                cmd_step(args);
            } else if (cmd == "run") {
                cmd_run();
            } else if (cmd == "tick") {
                cmd_tick(args);
            } else if (cmd == "stamina") {
                cmd_stamina(args);
            } else if (cmd == "foul") {
                cmd_foul(args);
            } else if (cmd == "injure") {
                cmd_injure(args);
            } else if (cmd == "sub") {
                cmd_sub(args);
            } else if (cmd == "show" || cmd == "s") {
                cmd_show();
            } else if (cmd == "plan") {
                cmd_plan();
            } else if (cmd == "log") {
                cmd_log();
            } else if (cmd == "json") {
                cmd_json();
            } else if (cmd == "verify") {
                cmd_verify();
            } else {
                std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    Console console;

    std::vector<std::string> files;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--trace") {
            console.trace_requested = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: hoops_replay [match.json [script.json]] [--trace]" << std::endl;
            return 0;
        } else {
            files.push_back(arg);
        }
    }

    if (!files.empty() && !console.cmd_load({"load", files[0]})) {
        return 1;
    }

    // Match and script: replay everything, print the log and exit
    if (files.size() > 1) {
        if (!console.cmd_script({"script", files[1]})) {
            return 1;
        }
        console.cmd_run();
        std::cout << "\n=== Substitutions ===" << std::endl;
        console.cmd_log();
        std::cout << "\n=== Minutes ===" << std::endl;
        console.cmd_verify();
        return 0;
    }

    console.run();
    return 0;
}
