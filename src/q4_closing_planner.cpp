/**
 * Hoops Rotation Engine - Q4 Closing Planner Implementation
 */

#include "q4_closing_planner.hpp"
#include "game_context.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace hoops {

const char* plan_name(const RotationPlan& plan) {
    if (std::holds_alternative<StayIn>(plan)) return "STAY_IN";
    if (std::holds_alternative<WillFatigue>(plan)) return "WILL_FATIGUE";
    return "INSERT_AT";
}

std::string describe_plan(const StarterPlan& starter_plan) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << starter_plan.player_id << " " << plan_name(starter_plan.plan);

    if (const auto* fatigue = std::get_if<WillFatigue>(&starter_plan.plan)) {
        out << " sub out at " << format_clock(static_cast<int>(std::lround(fatigue->sub_out_at * 60.0)));
    } else if (const auto* insert = std::get_if<InsertAt>(&starter_plan.plan)) {
        out << " insert at " << format_clock(static_cast<int>(std::lround(insert->time * 60.0)));
    }

    out << " (stamina " << starter_plan.stamina
        << ", playable " << starter_plan.playable_minutes << " min)";
    return out.str();
}

const StarterPlan* Q4ClosingPlan::find(const PlayerID& id) const {
    for (const auto& plan : plans_) {
        if (plan.player_id == id) {
            return &plan;
        }
    }
    return nullptr;
}

// ============================================================================
// PLANNER
// ============================================================================

Q4ClosingPlanner::Q4ClosingPlanner(RotationConfig config)
    : config_(config) {}

RotationPlan Q4ClosingPlanner::decide(bool on_court, double playable_minutes, double quarter_minutes) {
    if (on_court) {
        if (playable_minutes >= quarter_minutes) {
            return StayIn{};
        }
        return WillFatigue{quarter_minutes - playable_minutes};
    }

    // Fresh enough to finish: go straight back in
    if (playable_minutes >= quarter_minutes) {
        return InsertAt{quarter_minutes};
    }
    // Enter with exactly enough in the tank to finish the quarter
    return InsertAt{playable_minutes};
}

double Q4ClosingPlanner::playable_minutes(const Player& player,
                                          double current_stamina,
                                          const TacticalSettings& tactics) const {
    const double per_minute = drain::drain_per_minute(player, tactics.pace,
                                                      tactics.is_scoring_option(player.id),
                                                      config_.transition_rate);
    return drain::playable_minutes(current_stamina, config_.rest_threshold, per_minute);
}

Q4ClosingPlan Q4ClosingPlanner::plan(const LineupManager& lineup,
                                     const StaminaSource& stamina,
                                     const TacticalSettings& tactics,
                                     const DisciplineTracker& discipline) const {
    Q4ClosingPlan out;

    for (const auto& starter_id : lineup.starters()) {
        if (!discipline.is_eligible(starter_id)) {
            continue;
        }
        const Player* player = lineup.roster().find(starter_id);
        if (!player) {
            continue;
        }

        StarterPlan entry;
        entry.player_id = starter_id;
        entry.stamina = stamina.stamina(starter_id);
        entry.on_court = lineup.is_active(starter_id);
        entry.playable_minutes = playable_minutes(*player, entry.stamina, tactics);
        entry.plan = decide(entry.on_court, entry.playable_minutes, config_.quarter_minutes);
        out.add(std::move(entry));
    }

    return out;
}

} // namespace hoops
