/**
 * Hoops Rotation Engine - Rule Registry
 *
 * Ordered registry of guarded rotation rules. Each rule inspects a
 * read-only RuleContext and either proposes one substitution directive or
 * passes. Rules are evaluated top-to-bottom and the first proposal wins, so
 * precedence is the registration order and nothing else.
 *
 * Example usage:
 *   registry.register_rule(RuleId::STAMINA_CRITICAL, stamina_critical_rule);
 *   auto directive = registry.evaluate(ctx);
 */

#pragma once

#include "game_context.hpp"
#include "stamina.hpp"
#include "team_rotation_state.hpp"
#include <functional>

namespace hoops {

// ============================================================================
// DIRECTIVE
// ============================================================================

/**
 * One proposed lineup change.
 */
struct RotationDirective {
    RuleId rule = RuleId::STAMINA_CRITICAL;
    PlayerID player_out;
    PlayerID player_in;
    SubstitutionReason reason = SubstitutionReason::STAMINA_CRITICAL;
};

// ============================================================================
// RULE CONTEXT
// ============================================================================

/**
 * RuleContext - Everything a rule may read during one team check.
 *
 * The derived queries encode the eligibility and protection policy shared
 * by several rules.
 */
struct RuleContext {
    const TeamRotationState& team;
    const GameContext& game;
    const RotationConfig& config;
    const StaminaSource& stamina;
    const PlayerIDSet& moved;      // Players already substituted during this check

    RuleContext(const TeamRotationState& team_,
                const GameContext& game_,
                const RotationConfig& config_,
                const StaminaSource& stamina_,
                const PlayerIDSet& moved_)
        : team(team_), game(game_), config(config_), stamina(stamina_), moved(moved_) {}

    double stamina_of(const PlayerID& id) const { return stamina.stamina(id); }
    bool has_moved(const PlayerID& id) const { return moved.count(id) > 0; }

    /**
     * Not fouled out, not injured and not already moved this check.
     */
    bool is_available(const PlayerID& id) const;

    int differential() const { return game.differential(team.side); }
    BlowoutLevel blowout_level() const { return game.blowout_level(team.side, config); }

    /**
     * A blowout regime holds and no comeback has cancelled it.
     */
    bool blowout_active() const;

    /**
     * Final quarter, a plan exists and no blowout regime is in force.
     */
    bool q4_plan_active() const;

    /**
     * The starter's Q4 plan while it is in force, nullptr otherwise.
     */
    const StarterPlan* plan_for(const PlayerID& id) const;

    /**
     * Closer inside the close-game bands, or an on-court starter whose Q4
     * plan keeps them in (StayIn, or WillFatigue before the mark).
     */
    bool is_protected(const PlayerID& id) const;

    /**
     * 70 normally; 50 in crunch time and for protected players.
     */
    double stamina_threshold(const PlayerID& id) const;

    bool reached_quarter_quota(const PlayerID& id) const;

    /**
     * Base admission test for any bench candidate: available, not resting
     * for a blowout, not a benched starter whose stand-in is still on the
     * floor, and not a starter the Q4 plan is managing.
     */
    bool is_bench_candidate(const Player& player) const;
};

// ============================================================================
// RULE REGISTRY
// ============================================================================

// Rule: (context) -> directive or nothing
using RuleCallback = std::function<std::optional<RotationDirective>(const RuleContext&)>;

class RuleRegistry {
public:
    RuleRegistry() = default;

    /**
     * Append a rule at the lowest precedence so far. Re-registering an id
     * replaces its callback in place.
     */
    void register_rule(RuleId id, RuleCallback callback);

    bool has_rule(RuleId id) const;

    /**
     * First directive proposed by any rule, in registration order.
     */
    std::optional<RotationDirective> evaluate(const RuleContext& ctx) const;

    /**
     * Evaluate a single rule regardless of precedence.
     */
    std::optional<RotationDirective> evaluate_rule(RuleId id, const RuleContext& ctx) const;

    std::vector<RuleId> rule_order() const;
    std::size_t size() const { return rules_.size(); }

private:
    struct RuleEntry {
        RuleId id;
        RuleCallback callback;
    };
    std::vector<RuleEntry> rules_;
};

} // namespace hoops
