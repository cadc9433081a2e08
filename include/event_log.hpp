/**
 * Hoops Rotation Engine - Event Log
 *
 * Append-only substitution history for box-score and commentary layers,
 * with the human-readable formatting kept apart from the reason codes.
 */

#pragma once

#include "substitution_event.hpp"
#include <nlohmann/json_fwd.hpp>

namespace hoops {

/**
 * Display text for a reason ("stamina below threshold").
 */
const char* describe_reason(SubstitutionReason reason);

class EventLog {
public:
    EventLog() = default;

    void append(const SubstitutionEvent& event);
    void append(const std::vector<SubstitutionEvent>& events);

    const std::vector<SubstitutionEvent>& events() const { return events_; }
    std::size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }

    std::vector<SubstitutionEvent> for_team(TeamSide team) const;
    std::vector<SubstitutionEvent> with_reason(SubstitutionReason reason) const;

    /**
     * "Q2 6:32 [home] OUT p1 (68.0) IN p6 (95.0) - stamina below threshold"
     */
    static std::string format_event(const SubstitutionEvent& event);

    /**
     * One formatted line per event, in order.
     */
    std::string format() const;

    nlohmann::json to_json() const;
    std::string to_json_string(int indent = 2) const;

private:
    std::vector<SubstitutionEvent> events_;
};

} // namespace hoops
