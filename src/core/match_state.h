/**
 * @file match_state.h
 * @brief Snapshot of a running autopong match
 */

#pragma once

#include <cstdint>

/**
 * @brief Complete dynamic state of one match
 *
 * Plain value type. The transition function reads one snapshot and returns
 * the next; nothing mutates a snapshot in place while a step is computed.
 */
struct MatchState {
    std::uint64_t tick = 0;  ///< Frame counter, +1 per step
    int paddle_a_y = 1;      ///< Left paddle top row
    int paddle_b_y = 1;      ///< Right paddle top row
    int ball_x = 0;          ///< Ball column
    int ball_y = 0;          ///< Ball row
    int vx = 1;              ///< Horizontal direction, -1 or +1
    int vy = 0;              ///< Vertical speed, -2..+2
    int score_a = 0;         ///< Left player score
    int score_b = 0;         ///< Right player score
};

inline bool operator==(const MatchState &a, const MatchState &b) {
    return a.tick == b.tick && a.paddle_a_y == b.paddle_a_y && a.paddle_b_y == b.paddle_b_y &&
           a.ball_x == b.ball_x && a.ball_y == b.ball_y && a.vx == b.vx && a.vy == b.vy &&
           a.score_a == b.score_a && a.score_b == b.score_b;
}

inline bool operator!=(const MatchState &a, const MatchState &b) { return !(a == b); }
