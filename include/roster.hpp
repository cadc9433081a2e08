/**
 * Hoops Rotation Engine - Roster
 *
 * Fixed, ordered collection of players for one team for one match.
 * Acts as the arena the lineup partition indexes into.
 */

#pragma once

#include "player.hpp"
#include "errors.hpp"
#include <algorithm>

namespace hoops {

/**
 * Roster - Ordered player arena with id lookup.
 *
 * Order is significant: it is the deterministic tie-break everywhere a
 * choice between equally ranked players has to be made.
 */
class Roster {
public:
    Roster() = default;

    explicit Roster(std::vector<Player> players) {
        for (auto& player : players) {
            add_player(std::move(player));
        }
    }

    // ========================================================================
    // BUILDING
    // ========================================================================

    void add_player(Player player) {
        if (player.id.empty()) {
            throw ConfigurationError("Roster player has an empty id");
        }
        if (index_.find(player.id) != index_.end()) {
            throw ConfigurationError("Duplicate roster id: " + player.id);
        }
        index_[player.id] = players_.size();
        players_.push_back(std::move(player));
    }

    // ========================================================================
    // QUERIES
    // ========================================================================

    std::size_t size() const { return players_.size(); }

    bool empty() const { return players_.empty(); }

    bool contains(const PlayerID& id) const {
        return index_.find(id) != index_.end();
    }

    std::optional<std::size_t> index_of(const PlayerID& id) const {
        auto it = index_.find(id);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    const Player& at(std::size_t index) const { return players_.at(index); }

    const Player* find(const PlayerID& id) const {
        auto it = index_.find(id);
        if (it == index_.end()) {
            return nullptr;
        }
        return &players_[it->second];
    }

    const std::vector<Player>& players() const { return players_; }

    PlayerIDList ids() const {
        PlayerIDList out;
        out.reserve(players_.size());
        for (const auto& player : players_) {
            out.push_back(player.id);
        }
        return out;
    }

    /**
     * Ids of the `count` highest-rated players, roster order breaking ties.
     */
    PlayerIDList top_by_overall(std::size_t count) const {
        std::vector<std::size_t> order(players_.size());
        for (std::size_t i = 0; i < order.size(); i++) {
            order[i] = i;
        }
        std::stable_sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
            return players_[a].overall > players_[b].overall;
        });

        PlayerIDList out;
        for (std::size_t i = 0; i < order.size() && i < count; i++) {
            out.push_back(players_[order[i]].id);
        }
        return out;
    }

private:
    std::vector<Player> players_;
    std::unordered_map<PlayerID, std::size_t> index_;
};

} // namespace hoops
