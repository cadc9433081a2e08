/**
 * Hoops Rotation Engine - Lineup Manager
 *
 * Owns the active/bench partition of one team's roster and the single
 * substitution operation that mutates it.
 */

#pragma once

#include "roster.hpp"
#include <array>

namespace hoops {

// ============================================================================
// SUBSTITUTION RESULT
// ============================================================================

enum class SubstitutionStatus : uint8_t {
    OK,
    UNKNOWN_PLAYER,
    SAME_PLAYER,
    PLAYER_OUT_NOT_ACTIVE,
    PLAYER_IN_NOT_ON_BENCH,
    PLAYER_IN_UNAVAILABLE      // Fouled out or injured (checked by the match facade)
};

inline const char* to_string(SubstitutionStatus status) {
    switch (status) {
        case SubstitutionStatus::OK: return "ok";
        case SubstitutionStatus::UNKNOWN_PLAYER: return "unknown_player";
        case SubstitutionStatus::SAME_PLAYER: return "same_player";
        case SubstitutionStatus::PLAYER_OUT_NOT_ACTIVE: return "player_out_not_active";
        case SubstitutionStatus::PLAYER_IN_NOT_ON_BENCH: return "player_in_not_on_bench";
        case SubstitutionStatus::PLAYER_IN_UNAVAILABLE: return "player_in_unavailable";
        default: return "unknown";
    }
}

/**
 * Result of a substitution request. A rejected request leaves the
 * partition untouched.
 */
struct SubstitutionResult {
    bool success = false;
    SubstitutionStatus status = SubstitutionStatus::OK;
    std::string message;
};

// ============================================================================
// LINEUP MANAGER
// ============================================================================

/**
 * LineupManager - Active five / bench partition over a roster arena.
 *
 * The partition is a fixed array of five roster indices plus the bench
 * index list (kept in roster order). Substitution is an index swap: the
 * incoming player takes the outgoing player's slot.
 *
 * The manager also owns the starter/stand-in relation: while a starter
 * sits, the non-starter occupying the slot they vacated is that starter's
 * stand-in. The relation follows the slot (it transfers if the stand-in is
 * replaced by another non-starter) and is dropped as soon as a starter
 * occupies the slot again.
 */
class LineupManager {
public:
    /**
     * @param roster Full team roster (at least 5 players)
     * @param starting_five Optional explicit starters; defaults to the first
     *                      five roster entries
     * @throws ConfigurationError on a short roster or malformed starting five
     */
    explicit LineupManager(Roster roster,
                           const std::optional<PlayerIDList>& starting_five = std::nullopt);

    // ========================================================================
    // QUERIES (copies, never internal references)
    // ========================================================================

    std::vector<Player> get_active() const;
    std::vector<Player> get_bench() const;

    PlayerIDList active_ids() const;
    PlayerIDList bench_ids() const;

    bool is_active(const PlayerID& id) const;
    bool is_on_bench(const PlayerID& id) const;
    bool is_starter(const PlayerID& id) const;

    const PlayerIDList& starters() const { return starters_; }
    const Roster& roster() const { return roster_; }

    // ========================================================================
    // MUTATION
    // ========================================================================

    /**
     * Replace player_out (active) with player_in (bench).
     *
     * The only mutator of the partition. On success player_in occupies
     * player_out's former slot.
     */
    SubstitutionResult substitute(const PlayerID& player_out, const PlayerID& player_in);

    /**
     * Confirm exactly five active players and a clean partition.
     */
    bool validate() const;

    // ========================================================================
    // STARTER / STAND-IN RELATION
    // ========================================================================

    std::optional<PlayerID> stand_in_for(const PlayerID& starter) const;
    std::optional<PlayerID> starter_covered_by(const PlayerID& stand_in) const;
    bool has_active_stand_in(const PlayerID& starter) const;

    /**
     * Drop a starter's relation (used when the starter is permanently
     * unavailable).
     */
    void clear_stand_in(const PlayerID& starter);

private:
    Roster roster_;
    std::array<std::size_t, LINEUP_SIZE> slots_{};
    std::vector<std::size_t> bench_;
    PlayerIDList starters_;
    PlayerIDSet starter_set_;

    // starter -> stand-in and the reverse view; always updated together
    std::unordered_map<PlayerID, PlayerID> stand_in_by_starter_;
    std::unordered_map<PlayerID, PlayerID> starter_by_stand_in_;

    std::optional<std::size_t> active_slot_of(std::size_t roster_index) const;
    void link_stand_in(const PlayerID& starter, const PlayerID& stand_in);
    void update_stand_in_relation(const PlayerID& player_out, const PlayerID& player_in);
};

} // namespace hoops
