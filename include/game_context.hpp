/**
 * Hoops Rotation Engine - Game Context
 *
 * The shared, read-only snapshot (quarter, clock, score) both teams'
 * rotation checks are evaluated against.
 */

#pragma once

#include "types.hpp"
#include "rotation_config.hpp"
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace hoops {

/**
 * Format seconds remaining as a game clock ("6:32").
 */
inline std::string format_clock(int seconds_remaining) {
    if (seconds_remaining < 0) {
        seconds_remaining = 0;
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%d:%02d", seconds_remaining / 60, seconds_remaining % 60);
    return buffer;
}

/**
 * Parse a game clock ("6:32") into seconds. Returns nullopt on bad input.
 */
inline std::optional<int> parse_clock(const std::string& clock) {
    auto colon = clock.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= clock.size()) {
        return std::nullopt;
    }
    try {
        int minutes = std::stoi(clock.substr(0, colon));
        int seconds = std::stoi(clock.substr(colon + 1));
        if (minutes < 0 || seconds < 0 || seconds >= 60) {
            return std::nullopt;
        }
        return minutes * 60 + seconds;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

struct GameContext {
    int quarter = 1;
    int seconds_remaining = 720;
    int home_score = 0;
    int away_score = 0;

    GameContext() = default;

    GameContext(int quarter_, int seconds_remaining_, int home_score_, int away_score_)
        : quarter(quarter_)
        , seconds_remaining(seconds_remaining_)
        , home_score(home_score_)
        , away_score(away_score_)
    {}

    // Positive when `side` leads
    int differential(TeamSide side) const {
        return side == TeamSide::HOME ? home_score - away_score : away_score - home_score;
    }

    double minutes_remaining() const { return seconds_remaining / 60.0; }

    std::string clock() const { return format_clock(seconds_remaining); }

    bool is_final_quarter(const RotationConfig& config) const {
        return quarter >= config.quarters;
    }

    /**
     * Crunch time: final quarter, <= 2:00, one-possession-class margin.
     */
    bool is_crunch_time(const RotationConfig& config) const {
        return is_final_quarter(config) &&
               seconds_remaining <= config.crunch_seconds &&
               std::abs(home_score - away_score) <= config.crunch_margin;
    }

    /**
     * Close-game bands used to keep closers on the floor:
     * <=5 min & +-10, <=3 min & +-8, <=2 min & +-5.
     */
    bool is_close_game(const RotationConfig& config) const {
        if (!is_final_quarter(config)) {
            return false;
        }
        const double minutes = minutes_remaining();
        const int margin = std::abs(home_score - away_score);
        return (minutes <= 5.0 && margin <= 10) ||
               (minutes <= 3.0 && margin <= 8) ||
               (minutes <= 2.0 && margin <= 5);
    }

    /**
     * Closers are inserted (not only kept) in the final two minutes of a
     * close game.
     */
    bool is_closer_window(const RotationConfig& config) const {
        return is_close_game(config) && minutes_remaining() <= 2.0;
    }

    /**
     * Blowout regime for the leading side. Garbage time (<=2:00, +30) is
     * checked first; otherwise the rest bands <=6:00 & +20, <=4:00 & +18,
     * <=2:00 & +15.
     */
    BlowoutLevel blowout_level(TeamSide side, const RotationConfig& config) const {
        if (!is_final_quarter(config)) {
            return BlowoutLevel::NONE;
        }
        const int lead = differential(side);
        if (lead <= 0) {
            return BlowoutLevel::NONE;
        }
        const double minutes = minutes_remaining();
        if (minutes <= 2.0 && lead >= 30) return BlowoutLevel::GARBAGE_TIME;
        if (minutes <= 6.0 && lead >= 20) return BlowoutLevel::REST_STARTERS;
        if (minutes <= 4.0 && lead >= 18) return BlowoutLevel::REST_STARTERS;
        if (minutes <= 2.0 && lead >= 15) return BlowoutLevel::REST_STARTERS;
        return BlowoutLevel::NONE;
    }
};

} // namespace hoops
