/**
 * Hoops Rotation Engine - Event Log Implementation
 *
 * JSON export uses nlohmann/json.
 */

#include "event_log.hpp"
#include "game_context.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace hoops {

std::string SubstitutionEvent::game_time() const {
    return format_clock(seconds_remaining);
}

const char* describe_reason(SubstitutionReason reason) {
    switch (reason) {
        case SubstitutionReason::STAMINA_CRITICAL: return "stamina below threshold";
        case SubstitutionReason::MINUTES_QUOTA: return "reached quarter minutes";
        case SubstitutionReason::STARTER_RETURN: return "starter returns from rest";
        case SubstitutionReason::BLOWOUT_REST: return "resting starters in a blowout";
        case SubstitutionReason::GARBAGE_TIME: return "garbage time";
        case SubstitutionReason::COMEBACK_REINSERT: return "lead shrinking, starters back in";
        case SubstitutionReason::CLOSER_INSERT: return "closer in for a close finish";
        case SubstitutionReason::Q4_PLAN_SUB_OUT: return "planned rest before fatigue";
        case SubstitutionReason::Q4_PLAN_INSERT: return "planned fourth-quarter return";
        case SubstitutionReason::FOULED_OUT: return "fouled out";
        case SubstitutionReason::INJURY: return "injury";
        case SubstitutionReason::MANUAL: return "coach's decision";
        default: return "unknown";
    }
}

// ============================================================================
// APPEND / QUERY
// ============================================================================

void EventLog::append(const SubstitutionEvent& event) {
    events_.push_back(event);
}

void EventLog::append(const std::vector<SubstitutionEvent>& events) {
    events_.insert(events_.end(), events.begin(), events.end());
}

std::vector<SubstitutionEvent> EventLog::for_team(TeamSide team) const {
    std::vector<SubstitutionEvent> out;
    for (const auto& event : events_) {
        if (event.team == team) {
            out.push_back(event);
        }
    }
    return out;
}

std::vector<SubstitutionEvent> EventLog::with_reason(SubstitutionReason reason) const {
    std::vector<SubstitutionEvent> out;
    for (const auto& event : events_) {
        if (event.reason == reason) {
            out.push_back(event);
        }
    }
    return out;
}

// ============================================================================
// FORMATTING
// ============================================================================

std::string EventLog::format_event(const SubstitutionEvent& event) {
    std::ostringstream line;
    line << std::fixed << std::setprecision(1);
    line << "Q" << event.quarter << " " << event.game_time()
         << " [" << to_string(event.team) << "]"
         << " OUT " << event.player_out << " (" << event.stamina_out << ")"
         << " IN " << event.player_in << " (" << event.stamina_in << ")"
         << " - " << describe_reason(event.reason);
    return line.str();
}

std::string EventLog::format() const {
    std::ostringstream out;
    for (const auto& event : events_) {
        out << format_event(event) << "\n";
    }
    return out.str();
}

json EventLog::to_json() const {
    json out = json::array();
    for (const auto& event : events_) {
        out.push_back({
            {"team", to_string(event.team)},
            {"quarter", event.quarter},
            {"game_time", event.game_time()},
            {"seconds_remaining", event.seconds_remaining},
            {"player_out", event.player_out},
            {"player_in", event.player_in},
            {"reason", to_string(event.reason)},
            {"description", describe_reason(event.reason)},
            {"stamina_out", event.stamina_out},
            {"stamina_in", event.stamina_in}
        });
    }
    return out;
}

std::string EventLog::to_json_string(int indent) const {
    return to_json().dump(indent);
}

} // namespace hoops
