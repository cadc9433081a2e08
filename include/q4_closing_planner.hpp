/**
 * Hoops Rotation Engine - Q4 Closing Planner
 *
 * One-shot projection made the instant the final quarter starts: for each
 * starter, can they finish on the floor, when must they come off, or when
 * should they go back on. The plan is read-only for the rest of the
 * quarter.
 *
 * All marks are game-clock minutes remaining in the quarter, so a plan
 * fires once the clock has run down to (or below) its mark. A benched
 * starter with fewer than 12 playable minutes gets InsertAt{playable},
 * not InsertAt{12 - playable}: on this clock the mark is the time left
 * when they go in, after 12 - playable minutes on the bench.
 */

#pragma once

#include "discipline.hpp"
#include "lineup_manager.hpp"
#include "stamina.hpp"
#include "tactics.hpp"
#include "rotation_config.hpp"
#include <variant>

namespace hoops {

// ============================================================================
// PLAN VARIANTS
// ============================================================================

// On court and can play the whole quarter
struct StayIn {};

// On court, must come off at this clock mark to stay above the rest threshold
struct WillFatigue {
    double sub_out_at = 0.0;
};

// On the bench, goes back in at this clock mark
struct InsertAt {
    double time = 0.0;
};

using RotationPlan = std::variant<StayIn, WillFatigue, InsertAt>;

const char* plan_name(const RotationPlan& plan);

struct StarterPlan {
    PlayerID player_id;
    RotationPlan plan;
    double playable_minutes = 0.0;
    double stamina = 0.0;
    bool on_court = false;
};

std::string describe_plan(const StarterPlan& starter_plan);

/**
 * Q4ClosingPlan - Plans for one team's starters, in starter order.
 */
class Q4ClosingPlan {
public:
    void add(StarterPlan plan) { plans_.push_back(std::move(plan)); }

    const StarterPlan* find(const PlayerID& id) const;

    const std::vector<StarterPlan>& plans() const { return plans_; }
    bool empty() const { return plans_.empty(); }
    std::size_t size() const { return plans_.size(); }

private:
    std::vector<StarterPlan> plans_;
};

// ============================================================================
// PLANNER
// ============================================================================

class Q4ClosingPlanner {
public:
    explicit Q4ClosingPlanner(RotationConfig config = RotationConfig{});

    /**
     * Decision table for one starter given projected playable minutes.
     */
    static RotationPlan decide(bool on_court, double playable_minutes, double quarter_minutes);

    double playable_minutes(const Player& player,
                            double current_stamina,
                            const TacticalSettings& tactics) const;

    /**
     * Plan every starter still eligible to play.
     */
    Q4ClosingPlan plan(const LineupManager& lineup,
                       const StaminaSource& stamina,
                       const TacticalSettings& tactics,
                       const DisciplineTracker& discipline) const;

private:
    RotationConfig config_;
};

} // namespace hoops
