/**
 * Hoops Rotation Engine - Rotation Decision Engine Implementation
 */

#include "rotation_engine.hpp"
#include "rotation_rules.hpp"
#include <iostream>

namespace hoops {

RotationEngine::RotationEngine(RotationConfig config)
    : config_(config) {
    register_default_rules(registry_);
}

// ============================================================================
// CHECKS
// ============================================================================

TeamCheckResult RotationEngine::check_team(TeamRotationState& team,
                                           const GameContext& game,
                                           const StaminaSource& stamina) const {
    TeamCheckResult result;
    result.eligible_players = team.eligible_count();

    if (result.eligible_players < static_cast<std::size_t>(LINEUP_SIZE)) {
        result.infeasible = true;
        return result;
    }

    update_blowout_memory(team, game);

    PlayerIDSet moved;
    for (int pass = 0; pass < config_.max_directives_per_check; pass++) {
        auto directive = next_directive(team, game, stamina, moved);
        if (!directive.has_value()) {
            break;
        }

        auto event = execute(team, *directive, game, stamina);
        if (!event.has_value()) {
            std::cerr << "[RotationEngine] Rule " << to_string(directive->rule)
                      << " proposed an invalid swap " << directive->player_out
                      << " -> " << directive->player_in << std::endl;
            break;
        }

        moved.insert(directive->player_out);
        moved.insert(directive->player_in);
        result.events.push_back(*event);
    }

    return result;
}

std::optional<RotationDirective> RotationEngine::next_directive(const TeamRotationState& team,
                                                                const GameContext& game,
                                                                const StaminaSource& stamina,
                                                                const PlayerIDSet& moved) const {
    RuleContext ctx(team, game, config_, stamina, moved);
    return registry_.evaluate(ctx);
}

void RotationEngine::update_blowout_memory(TeamRotationState& team, const GameContext& game) const {
    BlowoutMemory& memory = team.blowout;
    if (!memory.rest_differential.has_value()) {
        return;
    }

    const BlowoutLevel level = game.blowout_level(team.side, config_);
    const int differential = game.differential(team.side);
    const int rest_differential = *memory.rest_differential;

    if (!memory.comeback) {
        if (!memory.rested.empty() &&
            (rest_differential - differential >= config_.comeback_swing ||
             level == BlowoutLevel::NONE)) {
            memory.comeback = true;
        }
        return;
    }

    // Back inside a band without the swing: rest applies again, measured
    // from the current margin
    if (level != BlowoutLevel::NONE && rest_differential - differential < config_.comeback_swing) {
        memory.comeback = false;
        memory.rest_differential = differential;
    }
}

std::optional<SubstitutionEvent> RotationEngine::execute(TeamRotationState& team,
                                                         const RotationDirective& directive,
                                                         const GameContext& game,
                                                         const StaminaSource& stamina) const {
    const double stamina_out = stamina.stamina(directive.player_out);
    const double stamina_in = stamina.stamina(directive.player_in);

    SubstitutionResult swap = team.lineup.substitute(directive.player_out, directive.player_in);
    if (!swap.success) {
        return std::nullopt;
    }

    team.court_time.on_substitution(directive.player_out, directive.player_in);

    if (directive.reason == SubstitutionReason::BLOWOUT_REST ||
        directive.reason == SubstitutionReason::GARBAGE_TIME) {
        team.blowout.mark_rested(directive.player_out, game.differential(team.side));
    } else {
        team.blowout.mark_returned(directive.player_in);
    }

    return SubstitutionEvent(team.side, game.quarter, game.seconds_remaining,
                             directive.player_out, directive.player_in,
                             directive.reason, stamina_out, stamina_in);
}

} // namespace hoops
