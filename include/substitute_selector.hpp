/**
 * Hoops Rotation Engine - Substitute Selection
 *
 * Who comes on once someone must come off, and who makes room when a
 * specific player must go on.
 */

#pragma once

#include "lineup_manager.hpp"
#include "stamina.hpp"
#include <functional>

namespace hoops {

/**
 * Role groups: the two guard spots are interchangeable, as are the two
 * forward spots; the center only matches itself.
 */
enum class RoleGroup : uint8_t {
    GUARD,
    FORWARD,
    CENTER
};

inline RoleGroup role_group(Position position) {
    switch (position) {
        case Position::PG:
        case Position::SG:
            return RoleGroup::GUARD;
        case Position::SF:
        case Position::PF:
            return RoleGroup::FORWARD;
        case Position::C:
        default:
            return RoleGroup::CENTER;
    }
}

inline bool roles_compatible(Position a, Position b) {
    return role_group(a) == role_group(b);
}

// Rule-specific admission test for a candidate
using CandidateFilter = std::function<bool(const Player&)>;

/**
 * Pick the bench player to bring on for `outgoing`.
 *
 * Tiers, first non-empty wins:
 *   1. role-compatible, stamina >= preferred_stamina
 *   2. role-compatible, any stamina
 *   3. any role, stamina >= preferred_stamina
 *   4. any role, any stamina
 * Within a tier the highest stamina wins; roster order breaks ties.
 */
std::optional<PlayerID> select_substitute(const LineupManager& lineup,
                                          const Player& outgoing,
                                          const StaminaSource& stamina,
                                          const CandidateFilter& allowed,
                                          double preferred_stamina);

/**
 * Pick the active player who makes room for `incoming`: role-compatible
 * before any role, lowest stamina first, roster order breaking ties.
 */
std::optional<PlayerID> select_player_to_replace(const LineupManager& lineup,
                                                 const Player& incoming,
                                                 const StaminaSource& stamina,
                                                 const CandidateFilter& allowed);

} // namespace hoops
