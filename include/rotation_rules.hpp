/**
 * Hoops Rotation Engine - Rotation Rules
 *
 * The guarded rules of a per-possession rotation check, in default
 * precedence order:
 *
 *   1. Blowout rest / garbage time   (leading team, late Q4)
 *   2. Stamina critical              (70, or 50 in crunch time)
 *   3. Q4 plan sub-out               (WillFatigue mark reached)
 *   4. Closer insert                 (final 2:00 of a close game)
 *   5. Q4 plan insert                (InsertAt mark reached)
 *   6. Comeback reinsert             (blowout lead collapsed)
 *   7. Minutes quota                 (quarter target reached)
 *   8. Starter return                (rested starter swaps with stand-in)
 *
 * Roster infeasibility (fewer than five eligible players) is checked by the
 * engine before any rule runs.
 */

#pragma once

#include "rule_registry.hpp"

namespace hoops {

std::optional<RotationDirective> blowout_rest_rule(const RuleContext& ctx);
std::optional<RotationDirective> stamina_critical_rule(const RuleContext& ctx);
std::optional<RotationDirective> q4_plan_sub_out_rule(const RuleContext& ctx);
std::optional<RotationDirective> closer_insert_rule(const RuleContext& ctx);
std::optional<RotationDirective> q4_plan_insert_rule(const RuleContext& ctx);
std::optional<RotationDirective> comeback_reinsert_rule(const RuleContext& ctx);
std::optional<RotationDirective> minutes_quota_rule(const RuleContext& ctx);
std::optional<RotationDirective> starter_return_rule(const RuleContext& ctx);

/**
 * Register the rules above in default precedence order.
 */
void register_default_rules(RuleRegistry& registry);

} // namespace hoops
