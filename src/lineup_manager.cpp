/**
 * Hoops Rotation Engine - Lineup Manager Implementation
 */

#include "lineup_manager.hpp"

namespace hoops {

LineupManager::LineupManager(Roster roster, const std::optional<PlayerIDList>& starting_five)
    : roster_(std::move(roster)) {

    if (roster_.size() < static_cast<std::size_t>(LINEUP_SIZE)) {
        throw ConfigurationError("Team must have at least 5 players, got " +
                                 std::to_string(roster_.size()));
    }

    std::vector<std::size_t> starter_indices;
    if (starting_five.has_value()) {
        if (starting_five->size() != static_cast<std::size_t>(LINEUP_SIZE)) {
            throw ConfigurationError("Starting lineup must have exactly 5 players, got " +
                                     std::to_string(starting_five->size()));
        }
        for (const auto& id : *starting_five) {
            auto index = roster_.index_of(id);
            if (!index.has_value()) {
                throw ConfigurationError("Starting lineup player not on roster: " + id);
            }
            if (std::find(starter_indices.begin(), starter_indices.end(), *index) !=
                starter_indices.end()) {
                throw ConfigurationError("Starting lineup lists " + id + " twice");
            }
            starter_indices.push_back(*index);
        }
    } else {
        for (std::size_t i = 0; i < static_cast<std::size_t>(LINEUP_SIZE); i++) {
            starter_indices.push_back(i);
        }
    }

    for (std::size_t slot = 0; slot < slots_.size(); slot++) {
        slots_[slot] = starter_indices[slot];
        const PlayerID& id = roster_.at(starter_indices[slot]).id;
        starters_.push_back(id);
        starter_set_.insert(id);
    }

    for (std::size_t i = 0; i < roster_.size(); i++) {
        if (std::find(starter_indices.begin(), starter_indices.end(), i) == starter_indices.end()) {
            bench_.push_back(i);
        }
    }
}

// ============================================================================
// QUERIES
// ============================================================================

std::vector<Player> LineupManager::get_active() const {
    std::vector<Player> out;
    out.reserve(slots_.size());
    for (std::size_t index : slots_) {
        out.push_back(roster_.at(index));
    }
    return out;
}

std::vector<Player> LineupManager::get_bench() const {
    std::vector<Player> out;
    out.reserve(bench_.size());
    for (std::size_t index : bench_) {
        out.push_back(roster_.at(index));
    }
    return out;
}

PlayerIDList LineupManager::active_ids() const {
    PlayerIDList out;
    out.reserve(slots_.size());
    for (std::size_t index : slots_) {
        out.push_back(roster_.at(index).id);
    }
    return out;
}

PlayerIDList LineupManager::bench_ids() const {
    PlayerIDList out;
    out.reserve(bench_.size());
    for (std::size_t index : bench_) {
        out.push_back(roster_.at(index).id);
    }
    return out;
}

bool LineupManager::is_active(const PlayerID& id) const {
    auto index = roster_.index_of(id);
    return index.has_value() && active_slot_of(*index).has_value();
}

bool LineupManager::is_on_bench(const PlayerID& id) const {
    auto index = roster_.index_of(id);
    if (!index.has_value()) {
        return false;
    }
    return std::find(bench_.begin(), bench_.end(), *index) != bench_.end();
}

bool LineupManager::is_starter(const PlayerID& id) const {
    return starter_set_.count(id) > 0;
}

std::optional<std::size_t> LineupManager::active_slot_of(std::size_t roster_index) const {
    for (std::size_t slot = 0; slot < slots_.size(); slot++) {
        if (slots_[slot] == roster_index) {
            return slot;
        }
    }
    return std::nullopt;
}

// ============================================================================
// MUTATION
// ============================================================================

SubstitutionResult LineupManager::substitute(const PlayerID& player_out, const PlayerID& player_in) {
    SubstitutionResult result;

    auto out_index = roster_.index_of(player_out);
    auto in_index = roster_.index_of(player_in);
    if (!out_index.has_value() || !in_index.has_value()) {
        result.status = SubstitutionStatus::UNKNOWN_PLAYER;
        result.message = "Unknown player: " + (out_index.has_value() ? player_in : player_out);
        return result;
    }

    if (*out_index == *in_index) {
        result.status = SubstitutionStatus::SAME_PLAYER;
        result.message = "Cannot substitute " + player_out + " for themself";
        return result;
    }

    auto slot = active_slot_of(*out_index);
    if (!slot.has_value()) {
        result.status = SubstitutionStatus::PLAYER_OUT_NOT_ACTIVE;
        result.message = player_out + " is not in the active lineup";
        return result;
    }

    auto bench_it = std::find(bench_.begin(), bench_.end(), *in_index);
    if (bench_it == bench_.end()) {
        result.status = SubstitutionStatus::PLAYER_IN_NOT_ON_BENCH;
        result.message = player_in + " is not on the bench";
        return result;
    }

    // Swap: incoming takes the slot, outgoing joins the bench in roster order
    slots_[*slot] = *in_index;
    bench_.erase(bench_it);
    bench_.insert(std::upper_bound(bench_.begin(), bench_.end(), *out_index), *out_index);

    update_stand_in_relation(player_out, player_in);

    result.success = true;
    result.status = SubstitutionStatus::OK;
    return result;
}

bool LineupManager::validate() const {
    if (slots_.size() != static_cast<std::size_t>(LINEUP_SIZE)) {
        return false;
    }
    if (slots_.size() + bench_.size() != roster_.size()) {
        return false;
    }

    std::vector<bool> seen(roster_.size(), false);
    for (std::size_t index : slots_) {
        if (index >= roster_.size() || seen[index]) return false;
        seen[index] = true;
    }
    for (std::size_t index : bench_) {
        if (index >= roster_.size() || seen[index]) return false;
        seen[index] = true;
    }
    return true;
}

// ============================================================================
// STARTER / STAND-IN RELATION
// ============================================================================

std::optional<PlayerID> LineupManager::stand_in_for(const PlayerID& starter) const {
    auto it = stand_in_by_starter_.find(starter);
    if (it == stand_in_by_starter_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PlayerID> LineupManager::starter_covered_by(const PlayerID& stand_in) const {
    auto it = starter_by_stand_in_.find(stand_in);
    if (it == starter_by_stand_in_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LineupManager::has_active_stand_in(const PlayerID& starter) const {
    auto stand_in = stand_in_for(starter);
    return stand_in.has_value() && is_active(*stand_in);
}

void LineupManager::clear_stand_in(const PlayerID& starter) {
    auto it = stand_in_by_starter_.find(starter);
    if (it == stand_in_by_starter_.end()) {
        return;
    }
    starter_by_stand_in_.erase(it->second);
    stand_in_by_starter_.erase(it);
}

void LineupManager::link_stand_in(const PlayerID& starter, const PlayerID& stand_in) {
    clear_stand_in(starter);
    stand_in_by_starter_[starter] = stand_in;
    starter_by_stand_in_[stand_in] = starter;
}

void LineupManager::update_stand_in_relation(const PlayerID& player_out, const PlayerID& player_in) {
    const bool in_is_starter = is_starter(player_in);

    // A returning starter reclaims their own relation whichever slot they take
    if (in_is_starter) {
        clear_stand_in(player_in);
    }

    // Stand-in leaving: the relation follows the slot
    auto covered = starter_covered_by(player_out);
    if (covered.has_value()) {
        const PlayerID starter = *covered;
        clear_stand_in(starter);
        if (!in_is_starter) {
            link_stand_in(starter, player_in);
        }
        return;
    }

    // Starter leaving for a non-starter: record who covers the slot
    if (is_starter(player_out) && !in_is_starter) {
        link_stand_in(player_out, player_in);
    }
}

} // namespace hoops
