/**
 * Hoops Rotation Engine - Rule Registry Implementation
 */

#include "rule_registry.hpp"

namespace hoops {

// ============================================================================
// RULE CONTEXT
// ============================================================================

bool RuleContext::is_available(const PlayerID& id) const {
    return team.is_eligible(id) && !has_moved(id);
}

bool RuleContext::blowout_active() const {
    return blowout_level() != BlowoutLevel::NONE && !team.blowout.comeback;
}

bool RuleContext::q4_plan_active() const {
    return game.is_final_quarter(config) && team.q4_plan.has_value() && !blowout_active();
}

const StarterPlan* RuleContext::plan_for(const PlayerID& id) const {
    if (!q4_plan_active()) {
        return nullptr;
    }
    return team.q4_plan->find(id);
}

bool RuleContext::is_protected(const PlayerID& id) const {
    if (team.tactics.is_closer(id) && game.is_close_game(config)) {
        return true;
    }

    const StarterPlan* plan = plan_for(id);
    if (!plan || !team.lineup.is_active(id)) {
        return false;
    }
    if (std::holds_alternative<StayIn>(plan->plan)) {
        return true;
    }
    if (const auto* fatigue = std::get_if<WillFatigue>(&plan->plan)) {
        return game.minutes_remaining() > fatigue->sub_out_at;
    }
    // Inserted by plan: plays out the quarter
    return true;
}

double RuleContext::stamina_threshold(const PlayerID& id) const {
    if (game.is_crunch_time(config) || is_protected(id)) {
        return config.crunch_stamina_threshold;
    }
    return config.stamina_threshold;
}

bool RuleContext::reached_quarter_quota(const PlayerID& id) const {
    return team.court_time.quarter_minutes(id) >=
           team.minutes.quarter_target(id) - config.quota_tolerance_minutes;
}

bool RuleContext::is_bench_candidate(const Player& player) const {
    if (!is_available(player.id)) {
        return false;
    }
    if (blowout_active() && team.blowout.is_rested(player.id)) {
        return false;
    }
    if (team.lineup.is_starter(player.id)) {
        if (team.lineup.has_active_stand_in(player.id)) {
            return false;
        }
        if (plan_for(player.id) != nullptr) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// REGISTRY
// ============================================================================

void RuleRegistry::register_rule(RuleId id, RuleCallback callback) {
    for (auto& entry : rules_) {
        if (entry.id == id) {
            entry.callback = std::move(callback);
            return;
        }
    }
    rules_.push_back({id, std::move(callback)});
}

bool RuleRegistry::has_rule(RuleId id) const {
    for (const auto& entry : rules_) {
        if (entry.id == id) {
            return true;
        }
    }
    return false;
}

std::optional<RotationDirective> RuleRegistry::evaluate(const RuleContext& ctx) const {
    for (const auto& entry : rules_) {
        auto directive = entry.callback(ctx);
        if (directive.has_value()) {
            directive->rule = entry.id;
            return directive;
        }
    }
    return std::nullopt;
}

std::optional<RotationDirective> RuleRegistry::evaluate_rule(RuleId id, const RuleContext& ctx) const {
    for (const auto& entry : rules_) {
        if (entry.id == id) {
            auto directive = entry.callback(ctx);
            if (directive.has_value()) {
                directive->rule = id;
            }
            return directive;
        }
    }
    return std::nullopt;
}

std::vector<RuleId> RuleRegistry::rule_order() const {
    std::vector<RuleId> out;
    out.reserve(rules_.size());
    for (const auto& entry : rules_) {
        out.push_back(entry.id);
    }
    return out;
}

} // namespace hoops
