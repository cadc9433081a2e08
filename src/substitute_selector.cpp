/**
 * Hoops Rotation Engine - Substitute Selection Implementation
 */

#include "substitute_selector.hpp"

namespace hoops {

namespace {

struct Tier {
    bool require_role;
    bool require_rested;
};

constexpr Tier SELECTION_TIERS[] = {
    {true, true},
    {true, false},
    {false, true},
    {false, false}
};

} // namespace

std::optional<PlayerID> select_substitute(const LineupManager& lineup,
                                          const Player& outgoing,
                                          const StaminaSource& stamina,
                                          const CandidateFilter& allowed,
                                          double preferred_stamina) {
    const std::vector<Player> bench = lineup.get_bench();

    for (const Tier& tier : SELECTION_TIERS) {
        const Player* best = nullptr;
        double best_stamina = -1.0;

        for (const auto& candidate : bench) {
            if (allowed && !allowed(candidate)) continue;
            if (tier.require_role && !roles_compatible(candidate.position, outgoing.position)) continue;

            const double value = stamina.stamina(candidate.id);
            if (tier.require_rested && value < preferred_stamina) continue;

            // Strict comparison keeps the earlier roster entry on ties
            if (value > best_stamina) {
                best = &candidate;
                best_stamina = value;
            }
        }

        if (best) {
            return best->id;
        }
    }

    return std::nullopt;
}

std::optional<PlayerID> select_player_to_replace(const LineupManager& lineup,
                                                 const Player& incoming,
                                                 const StaminaSource& stamina,
                                                 const CandidateFilter& allowed) {
    // Active players in roster order so ties resolve the same way as the bench
    std::vector<const Player*> active;
    for (const auto& player : lineup.roster().players()) {
        if (lineup.is_active(player.id)) {
            active.push_back(&player);
        }
    }

    for (bool require_role : {true, false}) {
        const Player* best = nullptr;
        double best_stamina = 0.0;

        for (const Player* candidate : active) {
            if (allowed && !allowed(*candidate)) continue;
            if (require_role && !roles_compatible(candidate->position, incoming.position)) continue;

            const double value = stamina.stamina(candidate->id);
            if (!best || value < best_stamina) {
                best = candidate;
                best_stamina = value;
            }
        }

        if (best) {
            return best->id;
        }
    }

    return std::nullopt;
}

} // namespace hoops
