/**
 * Hoops Rotation Engine - Rotation Decision Engine
 *
 * Per-possession, per-team rule evaluation. A check runs the rule registry
 * repeatedly: each pass executes the highest-precedence directive, and
 * passes continue until no rule fires, the directive limit is reached, or
 * every candidate has already moved once during the check.
 */

#pragma once

#include "rule_registry.hpp"
#include "substitution_event.hpp"

namespace hoops {

/**
 * Outcome of one team check.
 */
struct TeamCheckResult {
    std::vector<SubstitutionEvent> events;
    bool infeasible = false;        // Fewer than five eligible players; lineup untouched
    std::size_t eligible_players = 0;
};

class RotationEngine {
public:
    /**
     * Registers the default rules in default precedence.
     */
    explicit RotationEngine(RotationConfig config = RotationConfig{});

    const RotationConfig& config() const { return config_; }

    const RuleRegistry& registry() const { return registry_; }
    RuleRegistry& registry() { return registry_; }

    // ========================================================================
    // CHECKS
    // ========================================================================

    /**
     * Run one rotation check for a team and apply every directive.
     */
    TeamCheckResult check_team(TeamRotationState& team,
                               const GameContext& game,
                               const StaminaSource& stamina) const;

    /**
     * Highest-precedence directive for the current state, without applying it.
     */
    std::optional<RotationDirective> next_directive(const TeamRotationState& team,
                                                    const GameContext& game,
                                                    const StaminaSource& stamina,
                                                    const PlayerIDSet& moved = PlayerIDSet{}) const;

    /**
     * Detect a comeback against a blowout rest, or re-arm the rest once the
     * lead is back to where it was when the starters sat.
     */
    void update_blowout_memory(TeamRotationState& team, const GameContext& game) const;

    /**
     * Apply one directive: lineup swap, stint reset and blowout bookkeeping.
     *
     * @return The recorded event, or nullopt if the lineup rejected the swap
     */
    std::optional<SubstitutionEvent> execute(TeamRotationState& team,
                                             const RotationDirective& directive,
                                             const GameContext& game,
                                             const StaminaSource& stamina) const;

private:
    RotationConfig config_;
    RuleRegistry registry_;
};

} // namespace hoops
