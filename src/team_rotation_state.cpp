/**
 * Hoops Rotation Engine - Team Rotation State Implementation
 */

#include "team_rotation_state.hpp"

namespace hoops {

namespace {

constexpr std::size_t MAX_SCORING_OPTIONS = 3;

void check_ids_on_roster(const Roster& roster, const PlayerIDList& ids, const std::string& field) {
    for (const auto& id : ids) {
        if (!roster.contains(id)) {
            throw ConfigurationError("Tactics " + field + " names unknown player: " + id);
        }
    }
}

} // namespace

TeamRotationState::TeamRotationState(TeamSide side_,
                                     std::string name_,
                                     LineupManager lineup_,
                                     TacticalSettings tactics_,
                                     const RotationConfig& config)
    : side(side_)
    , name(std::move(name_))
    , lineup(std::move(lineup_))
    , tactics(std::move(tactics_))
    , minutes(config)
    , discipline(config) {

    if (tactics.scoring_options.size() > MAX_SCORING_OPTIONS) {
        throw ConfigurationError("At most 3 scoring options allowed, got " +
                                 std::to_string(tactics.scoring_options.size()));
    }
    check_ids_on_roster(roster(), tactics.scoring_options, "scoring_options");
    check_ids_on_roster(roster(), tactics.closers, "closers");

    if (tactics.minutes_allotment.empty()) {
        minutes.calculate_targets(roster());
    } else {
        minutes.apply_allotment(roster(), tactics.minutes_allotment);
    }
}

PlayerIDList TeamRotationState::eligible_ids() const {
    PlayerIDList out;
    for (const auto& player : roster().players()) {
        if (discipline.is_eligible(player.id)) {
            out.push_back(player.id);
        }
    }
    return out;
}

std::size_t TeamRotationState::eligible_count() const {
    return eligible_ids().size();
}

} // namespace hoops
