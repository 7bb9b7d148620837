/**
 * @file match_core.cpp
 * @brief Implementation of the match transition function
 */

#include "core/match_core.h"
#include "core/paddle_ai.h"
#include <algorithm>

namespace {

constexpr int kServeRowSpread = 3;
constexpr int kMaxVy = 2;

int clampi(int v, int lo, int hi) { return std::min(std::max(v, lo), hi); }

int serve_row(const FieldConfig &cfg, RandomSource &rng) {
    int y = cfg.height / 2 + rng.next_int(-kServeRowSpread, kServeRowSpread);
    return clampi(y, 1, cfg.height - 2);
}

bool hits_paddle(int ny, int top, int paddle_h) { return ny >= top && ny <= top + paddle_h - 1; }

} // namespace

int bounce_vy_for_offset(int offset) {
    if (offset <= 0) return -2;
    if (offset <= 2) return -1;
    if (offset <= 4) return 0;
    if (offset <= 5) return 1;
    return 2;
}

MatchState initial_match(const FieldConfig &cfg, RandomSource &rng) {
    MatchState s;
    s.tick = 0;
    s.paddle_a_y = clampi((cfg.height - cfg.paddle_h) / 2, cfg.paddle_min_y(), cfg.paddle_max_y());
    s.paddle_b_y = s.paddle_a_y;
    s.ball_x = cfg.width / 2;
    s.ball_y = serve_row(cfg, rng);
    s.vx = rng.next_unit() < 0.5 ? 1 : -1;
    s.vy = rng.next_int(-kMaxVy, kMaxVy);
    s.score_a = 0;
    s.score_b = 0;
    return s;
}

void apply_serve(MatchState &next, PointTo scorer, const FieldConfig &cfg, RandomSource &rng) {
    if (scorer == PointTo::None) return;
    if (scorer == PointTo::A) { next.ball_x = cfg.width / 2 + 1; next.vx = -1; }
    else { next.ball_x = cfg.width / 2 - 1; next.vx = 1; }
    next.ball_y = serve_row(cfg, rng);
    next.vy = rng.next_int(-kMaxVy, kMaxVy);
}

MatchState step_match(const MatchState &s, const FieldConfig &cfg, RandomSource &rng) {
    const int W = cfg.width, H = cfg.height;

    // 1. AI
    const int a2 = decide_paddle(s, cfg, Side::A, rng);
    const int b2 = decide_paddle(s, cfg, Side::B, rng);

    // 2. advance (entry values clamped so a hand-built state cannot escape)
    const int vx = s.vx < 0 ? -1 : 1;
    const int vy = clampi(s.vy, -kMaxVy, kMaxVy);
    const int nx = s.ball_x + vx;
    int ny = s.ball_y + vy;

    // 3. walls: bounce only when ny leaves [1, H-2]; landing on row 1 or
    // H-2 keeps vy and the bounce happens on the following tick
    int vx1 = vx, vy1 = vy;
    if (ny < 1) { ny = 1; vy1 = -vy1; }
    else if (ny > H - 2) { ny = H - 2; vy1 = -vy1; }

    // 4. paddles
    int vx2 = vx1, vy2 = vy1;
    if (nx <= cfg.left_paddle_x() && vx1 < 0 && hits_paddle(ny, a2, cfg.paddle_h)) {
        vx2 = 1;
        vy2 = bounce_vy_for_offset(ny - a2);
    } else if (nx >= cfg.right_paddle_x() && vx1 > 0 && hits_paddle(ny, b2, cfg.paddle_h)) {
        vx2 = -1;
        vy2 = bounce_vy_for_offset(ny - b2);
    }

    // 5. scoring
    PointTo point = PointTo::None;
    if (nx < 1) point = PointTo::B;
    else if (nx > W - 2) point = PointTo::A;

    // 6. assemble
    MatchState next = s;
    next.tick = s.tick + 1;
    next.paddle_a_y = a2;
    next.paddle_b_y = b2;
    if (point == PointTo::None) {
        next.ball_x = nx;
        next.ball_y = ny;
        next.vx = vx2;
        next.vy = vy2;
    } else {
        if (point == PointTo::A) ++next.score_a;
        else ++next.score_b;
        apply_serve(next, point, cfg, rng);
    }
    return next;
}

StepEvent classify_step(const MatchState &before, const MatchState &after) {
    if (after.score_a != before.score_a || after.score_b != before.score_b) return StepEvent::Score;
    if (after.vx * before.vx < 0) return StepEvent::PaddleBounce;
    return StepEvent::None;
}
