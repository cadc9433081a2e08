/**
 * Hoops Rotation Engine - Rotation Rules Implementation
 */

#include "rotation_rules.hpp"
#include "substitute_selector.hpp"

namespace hoops {

namespace {

RotationDirective make_directive(const PlayerID& player_out,
                                 const PlayerID& player_in,
                                 SubstitutionReason reason) {
    RotationDirective directive;
    directive.player_out = player_out;
    directive.player_in = player_in;
    directive.reason = reason;
    return directive;
}

std::optional<PlayerID> pick_substitute(const RuleContext& ctx,
                                        const Player& outgoing,
                                        const CandidateFilter& extra = nullptr) {
    return select_substitute(ctx.team.lineup, outgoing, ctx.stamina,
                             [&ctx, &extra](const Player& candidate) {
                                 if (!ctx.is_bench_candidate(candidate)) return false;
                                 return !extra || extra(candidate);
                             },
                             ctx.config.preferred_sub_stamina);
}

/**
 * Active player to make room for `incoming`: the tracked stand-in when
 * one is on the floor and free to leave, otherwise a non-starter chosen by
 * role and stamina.
 */
std::optional<PlayerID> pick_room_for(const RuleContext& ctx, const Player& incoming) {
    const auto& lineup = ctx.team.lineup;

    auto stand_in = lineup.stand_in_for(incoming.id);
    if (stand_in.has_value() && lineup.is_active(*stand_in) &&
        ctx.is_available(*stand_in) && !ctx.is_protected(*stand_in)) {
        return stand_in;
    }

    return select_player_to_replace(lineup, incoming, ctx.stamina, [&ctx, &lineup](const Player& p) {
        return ctx.is_available(p.id) && !lineup.is_starter(p.id) && !ctx.is_protected(p.id);
    });
}

} // namespace

// ============================================================================
// BLOWOUT REST
// ============================================================================

std::optional<RotationDirective> blowout_rest_rule(const RuleContext& ctx) {
    if (!ctx.blowout_active()) {
        return std::nullopt;
    }

    const auto& lineup = ctx.team.lineup;
    const auto& tactics = ctx.team.tactics;
    const bool garbage = ctx.blowout_level() == BlowoutLevel::GARBAGE_TIME;
    const auto reason = garbage ? SubstitutionReason::GARBAGE_TIME : SubstitutionReason::BLOWOUT_REST;

    // Garbage time also sits the closers and scoring options
    auto is_core = [&](const PlayerID& id) {
        return lineup.is_starter(id) ||
               (garbage && (tactics.is_closer(id) || tactics.is_scoring_option(id)));
    };

    for (const auto& player : lineup.get_active()) {
        if (!is_core(player.id) || ctx.has_moved(player.id)) continue;

        auto sub = pick_substitute(ctx, player, [&](const Player& candidate) {
            return !is_core(candidate.id);
        });
        if (sub.has_value()) {
            return make_directive(player.id, *sub, reason);
        }
    }
    return std::nullopt;
}

// ============================================================================
// STAMINA CRITICAL
// ============================================================================

std::optional<RotationDirective> stamina_critical_rule(const RuleContext& ctx) {
    for (const auto& player : ctx.team.lineup.get_active()) {
        if (ctx.has_moved(player.id)) continue;
        if (ctx.stamina_of(player.id) >= ctx.stamina_threshold(player.id)) continue;

        auto sub = pick_substitute(ctx, player);
        if (sub.has_value()) {
            return make_directive(player.id, *sub, SubstitutionReason::STAMINA_CRITICAL);
        }
    }
    return std::nullopt;
}

// ============================================================================
// Q4 CLOSING PLAN
// ============================================================================

std::optional<RotationDirective> q4_plan_sub_out_rule(const RuleContext& ctx) {
    if (!ctx.q4_plan_active()) {
        return std::nullopt;
    }

    const auto& lineup = ctx.team.lineup;
    const double remaining = ctx.game.minutes_remaining();

    for (const auto& entry : ctx.team.q4_plan->plans()) {
        const auto* fatigue = std::get_if<WillFatigue>(&entry.plan);
        if (!fatigue || remaining > fatigue->sub_out_at) continue;
        if (!lineup.is_active(entry.player_id) || ctx.has_moved(entry.player_id)) continue;
        if (ctx.team.tactics.is_closer(entry.player_id) && ctx.game.is_close_game(ctx.config)) continue;

        const Player* player = lineup.roster().find(entry.player_id);
        if (!player) continue;

        auto sub = pick_substitute(ctx, *player);
        if (sub.has_value()) {
            return make_directive(entry.player_id, *sub, SubstitutionReason::Q4_PLAN_SUB_OUT);
        }
    }
    return std::nullopt;
}

std::optional<RotationDirective> q4_plan_insert_rule(const RuleContext& ctx) {
    if (!ctx.q4_plan_active()) {
        return std::nullopt;
    }

    const auto& lineup = ctx.team.lineup;
    const double remaining = ctx.game.minutes_remaining();
    const bool closer_window = ctx.game.is_closer_window(ctx.config);

    for (const auto& entry : ctx.team.q4_plan->plans()) {
        const auto* insert = std::get_if<InsertAt>(&entry.plan);
        if (!insert || remaining > insert->time + ctx.config.insert_buffer_minutes) continue;
        if (!lineup.is_on_bench(entry.player_id) || !ctx.is_available(entry.player_id)) continue;

        // Foul trouble holds a planned insert back until the closing window
        if (!closer_window &&
            ctx.team.discipline.in_foul_trouble(entry.player_id, ctx.game.quarter)) continue;

        const Player* player = lineup.roster().find(entry.player_id);
        if (!player) continue;

        auto out = pick_room_for(ctx, *player);
        if (out.has_value()) {
            return make_directive(*out, entry.player_id, SubstitutionReason::Q4_PLAN_INSERT);
        }
    }
    return std::nullopt;
}

// ============================================================================
// CLOSERS
// ============================================================================

std::optional<RotationDirective> closer_insert_rule(const RuleContext& ctx) {
    if (!ctx.game.is_closer_window(ctx.config)) {
        return std::nullopt;
    }

    const auto& lineup = ctx.team.lineup;
    const auto& tactics = ctx.team.tactics;

    for (const auto& closer_id : tactics.effective_closers()) {
        if (!lineup.is_on_bench(closer_id) || !ctx.is_available(closer_id)) continue;
        if (ctx.stamina_of(closer_id) < ctx.config.crunch_stamina_threshold) continue;

        const Player* closer = lineup.roster().find(closer_id);
        if (!closer) continue;

        auto out = select_player_to_replace(lineup, *closer, ctx.stamina, [&](const Player& p) {
            return ctx.is_available(p.id) && !tactics.is_closer(p.id);
        });
        if (out.has_value()) {
            return make_directive(*out, closer_id, SubstitutionReason::CLOSER_INSERT);
        }
    }
    return std::nullopt;
}

// ============================================================================
// COMEBACK
// ============================================================================

std::optional<RotationDirective> comeback_reinsert_rule(const RuleContext& ctx) {
    const auto& memory = ctx.team.blowout;
    if (!memory.comeback) {
        return std::nullopt;
    }

    const auto& lineup = ctx.team.lineup;
    for (const auto& rested_id : memory.rested) {
        if (!lineup.is_on_bench(rested_id) || !ctx.is_available(rested_id)) continue;

        const Player* player = lineup.roster().find(rested_id);
        if (!player) continue;

        auto out = pick_room_for(ctx, *player);
        if (out.has_value() && !memory.is_rested(*out)) {
            return make_directive(*out, rested_id, SubstitutionReason::COMEBACK_REINSERT);
        }
    }
    return std::nullopt;
}

// ============================================================================
// MINUTES QUOTA
// ============================================================================

std::optional<RotationDirective> minutes_quota_rule(const RuleContext& ctx) {
    for (const auto& player : ctx.team.lineup.get_active()) {
        if (ctx.has_moved(player.id) || ctx.is_protected(player.id)) continue;
        if (!ctx.reached_quarter_quota(player.id)) continue;

        // Never bring on someone who is already over their own quota
        auto sub = pick_substitute(ctx, player, [&ctx](const Player& candidate) {
            return !ctx.reached_quarter_quota(candidate.id);
        });
        if (sub.has_value()) {
            return make_directive(player.id, *sub, SubstitutionReason::MINUTES_QUOTA);
        }
    }
    return std::nullopt;
}

// ============================================================================
// STARTER RETURN
// ============================================================================

std::optional<RotationDirective> starter_return_rule(const RuleContext& ctx) {
    const auto& lineup = ctx.team.lineup;
    const auto& court_time = ctx.team.court_time;
    const double min_stint = ctx.config.min_stand_in_minutes;

    for (const auto& starter_id : lineup.starters()) {
        if (!lineup.is_on_bench(starter_id) || !ctx.is_available(starter_id)) continue;
        if (ctx.stamina_of(starter_id) < ctx.config.return_stamina) continue;
        if (ctx.plan_for(starter_id) != nullptr) continue;
        if (ctx.blowout_active() && ctx.team.blowout.is_rested(starter_id)) continue;
        if (ctx.reached_quarter_quota(starter_id)) continue;

        auto stand_in = lineup.stand_in_for(starter_id);
        if (stand_in.has_value() && lineup.is_active(*stand_in)) {
            // Only the tracked stand-in may make way, and only after a full stint
            if (ctx.is_available(*stand_in) && !ctx.is_protected(*stand_in) &&
                court_time.continuous_minutes(*stand_in) >= min_stint) {
                return make_directive(*stand_in, starter_id, SubstitutionReason::STARTER_RETURN);
            }
            continue;
        }

        const Player* starter = lineup.roster().find(starter_id);
        if (!starter) continue;

        auto out = select_player_to_replace(lineup, *starter, ctx.stamina, [&](const Player& p) {
            return ctx.is_available(p.id) &&
                   !lineup.is_starter(p.id) &&
                   !ctx.is_protected(p.id) &&
                   roles_compatible(p.position, starter->position) &&
                   court_time.continuous_minutes(p.id) >= min_stint;
        });
        if (out.has_value()) {
            return make_directive(*out, starter_id, SubstitutionReason::STARTER_RETURN);
        }
    }
    return std::nullopt;
}

// ============================================================================
// REGISTRATION
// ============================================================================

void register_default_rules(RuleRegistry& registry) {
    registry.register_rule(RuleId::BLOWOUT_REST, blowout_rest_rule);
    registry.register_rule(RuleId::STAMINA_CRITICAL, stamina_critical_rule);
    registry.register_rule(RuleId::Q4_PLAN_SUB_OUT, q4_plan_sub_out_rule);
    registry.register_rule(RuleId::CLOSER_INSERT, closer_insert_rule);
    registry.register_rule(RuleId::Q4_PLAN_INSERT, q4_plan_insert_rule);
    registry.register_rule(RuleId::COMEBACK_REINSERT, comeback_reinsert_rule);
    registry.register_rule(RuleId::MINUTES_QUOTA, minutes_quota_rule);
    registry.register_rule(RuleId::STARTER_RETURN, starter_return_rule);
}

} // namespace hoops
