/**
 * Hoops Rotation Engine - Substitution Manager Implementation
 */

#include "substitution_manager.hpp"
#include "substitute_selector.hpp"
#include <iostream>

namespace hoops {

namespace {

TeamRotationState build_team(TeamSide side, const TeamSetup& setup, const RotationConfig& config) {
    LineupManager lineup(Roster(setup.players), setup.starting_five);
    return TeamRotationState(side, setup.name, std::move(lineup), setup.tactics, config);
}

std::size_t side_index(TeamSide side) {
    return side == TeamSide::HOME ? 0 : 1;
}

} // namespace

SubstitutionManager::SubstitutionManager(const MatchSetup& setup, const StaminaSource& stamina)
    : SubstitutionManager(setup.home, setup.away, stamina, setup.rotation) {}

SubstitutionManager::SubstitutionManager(const TeamSetup& home,
                                         const TeamSetup& away,
                                         const StaminaSource& stamina,
                                         RotationConfig config)
    : config_(config)
    , engine_(config)
    , planner_(config)
    , stamina_(&stamina)
    , home_(build_team(TeamSide::HOME, home, config))
    , away_(build_team(TeamSide::AWAY, away, config)) {}

// ============================================================================
// POSSESSION LOOP
// ============================================================================

void SubstitutionManager::start_quarter(const GameContext& game) {
    for (TeamRotationState* state : {&home_, &away_}) {
        state->court_time.start_quarter();
        state->discipline.start_quarter();
        state->blowout.reset();

        if (game.is_final_quarter(config_)) {
            state->q4_plan = planner_.plan(state->lineup, *stamina_, state->tactics, state->discipline);
            if (trace_) {
                trace_->log_q4_plan(*state);
            }
        } else {
            state->q4_plan.reset();
        }
    }

    if (trace_) {
        trace_->log_check(game);
        trace_->log_lineups(home_, away_, *stamina_);
    }
}

void SubstitutionManager::update_time_on_court(double seconds) {
    for (TeamRotationState* state : {&home_, &away_}) {
        state->court_time.add_time(state->lineup.active_ids(), seconds);
    }
}

RotationCheckResult SubstitutionManager::check_and_execute(const GameContext& game) {
    RotationCheckResult result;
    bool header_logged = false;

    for (TeamRotationState* state : {&home_, &away_}) {
        TeamCheckResult team_result = engine_.check_team(*state, game, *stamina_);

        if (team_result.infeasible) {
            result.infeasible_teams.push_back(state->side);

            bool& reported = infeasible_reported_[side_index(state->side)];
            if (!reported) {
                std::cerr << "[SubstitutionManager] " << to_string(state->side)
                          << " has only " << team_result.eligible_players
                          << " eligible players; lineup left unchanged" << std::endl;
                reported = true;
            }
            if (trace_) {
                if (!header_logged) {
                    trace_->log_check(game);
                    header_logged = true;
                }
                trace_->log_infeasible(state->side, team_result.eligible_players);
            }
            continue;
        }

        for (const auto& event : team_result.events) {
            if (trace_ && !header_logged) {
                trace_->log_check(game);
                header_logged = true;
            }
            record_event(event);
            result.events.push_back(event);
        }
    }

    return result;
}

void SubstitutionManager::record_event(const SubstitutionEvent& event) {
    log_.append(event);
    if (trace_) {
        trace_->log_event(event);
    }
}

// ============================================================================
// DISCIPLINE AND FORCED SUBSTITUTION
// ============================================================================

FoulRecord SubstitutionManager::record_foul(TeamSide side, const PlayerID& player_id) {
    TeamRotationState& state = team(side);
    if (!state.roster().contains(player_id)) {
        std::cerr << "[SubstitutionManager] Foul on unknown player: " << player_id << std::endl;
        FoulRecord record;
        record.player_id = player_id;
        record.team_fouls = state.discipline.team_fouls();
        record.in_bonus = state.discipline.in_bonus();
        return record;
    }
    return state.discipline.record_foul(player_id);
}

ForcedSubstitutionResult SubstitutionManager::handle_foul_out(TeamSide side, const PlayerID& player_id,
                                                              const GameContext& game) {
    return handle_forced(side, player_id, SubstitutionReason::FOULED_OUT, game);
}

ForcedSubstitutionResult SubstitutionManager::handle_injury(TeamSide side, const PlayerID& player_id,
                                                            const GameContext& game) {
    return handle_forced(side, player_id, SubstitutionReason::INJURY, game);
}

ForcedSubstitutionResult SubstitutionManager::handle_forced(TeamSide side, const PlayerID& player_id,
                                                            SubstitutionReason reason,
                                                            const GameContext& game) {
    ForcedSubstitutionResult result;
    TeamRotationState& state = team(side);
    LineupManager& lineup = state.lineup;

    const Player* player = state.roster().find(player_id);
    if (!player) {
        result.status = ForcedStatus::UNKNOWN_PLAYER;
        result.message = "Unknown player: " + player_id;
        return result;
    }

    // The foul/injury itself is a fact reported by the caller
    if (reason == SubstitutionReason::FOULED_OUT) {
        state.discipline.mark_fouled_out(player_id);
    } else {
        state.discipline.mark_injured(player_id);
    }

    if (!lineup.is_active(player_id)) {
        result.redistributed_minutes =
            state.minutes.redistribute(player_id, state.court_time.game_minutes(player_id), state.roster());
        lineup.clear_stand_in(player_id);
        state.blowout.mark_returned(player_id);

        result.status = ForcedStatus::PLAYER_NOT_ACTIVE;
        result.message = player_id + " was on the bench; marked unavailable";
        if (trace_) {
            trace_->log_forced(side, player_id, reason, result.message);
        }
        return result;
    }

    // Regular pool first, then any eligible body: a forced change always goes through if it can
    auto eligible = [&state](const Player& p) { return state.discipline.is_eligible(p.id); };
    auto substitute = select_substitute(lineup, *player, *stamina_, [&](const Player& p) {
        return eligible(p) && !(lineup.is_starter(p.id) && lineup.has_active_stand_in(p.id));
    }, config_.preferred_sub_stamina);
    if (!substitute.has_value()) {
        substitute = select_substitute(lineup, *player, *stamina_, eligible, config_.preferred_sub_stamina);
    }

    if (!substitute.has_value()) {
        result.status = ForcedStatus::ROSTER_EXHAUSTED;
        result.message = "No eligible bench player to replace " + player_id;
        std::cerr << "[SubstitutionManager] " << to_string(side) << ": " << result.message << std::endl;
        if (trace_) {
            trace_->log_forced(side, player_id, reason, result.message);
        }
        return result;
    }

    // Targets move before the lineup does
    result.redistributed_minutes =
        state.minutes.redistribute(player_id, state.court_time.game_minutes(player_id), state.roster());

    const double stamina_out = stamina_->stamina(player_id);
    const double stamina_in = stamina_->stamina(*substitute);

    SubstitutionResult swap = lineup.substitute(player_id, *substitute);
    if (!swap.success) {
        // Selection only returns bench players, so this is a logic error upstream
        std::cerr << "[SubstitutionManager] Forced swap rejected: " << swap.message << std::endl;
        result.status = ForcedStatus::ROSTER_EXHAUSTED;
        result.message = swap.message;
        return result;
    }

    state.court_time.on_substitution(player_id, *substitute);
    lineup.clear_stand_in(player_id);
    state.blowout.mark_returned(player_id);
    state.blowout.mark_returned(*substitute);

    SubstitutionEvent event(side, game.quarter, game.seconds_remaining,
                            player_id, *substitute, reason, stamina_out, stamina_in);
    record_event(event);

    result.status = ForcedStatus::SUBSTITUTED;
    result.event = event;
    result.message = player_id + " replaced by " + *substitute;
    if (trace_) {
        trace_->log_forced(side, player_id, reason, result.message);
    }
    return result;
}

SubstitutionResult SubstitutionManager::make_substitution(TeamSide side,
                                                          const PlayerID& player_out,
                                                          const PlayerID& player_in,
                                                          const GameContext& game) {
    TeamRotationState& state = team(side);

    if (state.roster().contains(player_in) && !state.discipline.is_eligible(player_in)) {
        SubstitutionResult rejected;
        rejected.status = SubstitutionStatus::PLAYER_IN_UNAVAILABLE;
        rejected.message = player_in + " has fouled out or is injured";
        return rejected;
    }

    const double stamina_out = stamina_->stamina(player_out);
    const double stamina_in = stamina_->stamina(player_in);

    SubstitutionResult result = state.lineup.substitute(player_out, player_in);
    if (!result.success) {
        return result;
    }

    state.court_time.on_substitution(player_out, player_in);
    state.blowout.mark_returned(player_in);

    record_event(SubstitutionEvent(side, game.quarter, game.seconds_remaining,
                                   player_out, player_in, SubstitutionReason::MANUAL,
                                   stamina_out, stamina_in));
    return result;
}

// ============================================================================
// QUERIES
// ============================================================================

std::vector<MinutesDiscrepancy> SubstitutionManager::verify_minutes_targets(TeamSide side) const {
    const TeamRotationState& state = team(side);
    return state.minutes.verify(state.roster(), state.court_time.game_minutes_by_player());
}

void SubstitutionManager::finish_match(const GameContext& game) {
    if (trace_) {
        trace_->log_lineups(home_, away_, *stamina_);
        trace_->log_match_end(game, log_.size());
    }
}

} // namespace hoops
