/**
 * @file paddle_ai.cpp
 * @brief Trick shot and defensive tracking decisions
 */

#include "core/paddle_ai.h"
#include <algorithm>

std::size_t pick_weighted_bucket(const double *cumulative, std::size_t count, RandomSource &rng) {
    double r = rng.next_unit();
    for (std::size_t i = 0; i < count; ++i) {
        if (r < cumulative[i]) return i;
    }
    return count - 1;
}

bool in_trigger_zone(const MatchState &s, const FieldConfig &cfg, Side side) {
    if (side == Side::A) return s.vx < 0 && s.ball_x <= kTriggerZone;
    return s.vx > 0 && s.ball_x >= cfg.width - 1 - kTriggerZone;
}

int decide_paddle(const MatchState &s, const FieldConfig &cfg, Side side, RandomSource &rng) {
    const int lo = cfg.paddle_min_y();
    const int hi = cfg.paddle_max_y();
    const int y = std::min(std::max(side == Side::A ? s.paddle_a_y : s.paddle_b_y, lo), hi);

    if (in_trigger_zone(s, cfg, side)) {
        std::size_t bucket = pick_weighted_bucket(kTrickCumulative.data(), kTrickCumulative.size(), rng);
        return std::min(std::max(s.ball_y - kTrickAimOffsets[bucket], lo), hi);
    }

    if (rng.next_unit() >= kTrackProbability) return y; // miss a frame

    // dead zone: rows [y+2, y+paddle_h-3] need no correction
    // step limited by the distance to the bound, so the sum cannot overflow
    if (s.ball_y < y + 2) return y - std::min(cfg.paddle_speed, y - lo);
    if (s.ball_y > y + cfg.paddle_h - 3) return y + std::min(cfg.paddle_speed, hi - y);
    return y;
}
