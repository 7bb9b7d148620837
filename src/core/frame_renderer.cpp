#include "core/frame_renderer.h"

FrameRenderer::FrameRenderer(const MatchState &state, const FieldConfig &cfg) : state(state), cfg(cfg) {}

Cell FrameRenderer::cell(int x, int y) const {
    if (x < 0 || x >= cfg.width || y < 0 || y >= cfg.height) return Cell::Empty;
    if (y == 0 || y == cfg.height - 1) return Cell::Border;
    if (x == cfg.left_paddle_x() && y >= state.paddle_a_y && y < state.paddle_a_y + cfg.paddle_h) return Cell::Paddle;
    if (x == cfg.right_paddle_x() && y >= state.paddle_b_y && y < state.paddle_b_y + cfg.paddle_h) return Cell::Paddle;
    if (x == state.ball_x && y == state.ball_y) return Cell::Ball;
    if (x == cfg.width / 2 && y % 3 == 1) return Cell::CenterLine;
    return Cell::Empty;
}

std::string FrameRenderer::row(int y) const {
    if (y < 0 || y >= cfg.height) return {};
    std::string out;
    out.reserve(cfg.width);
    for (int x = 0; x < cfg.width; ++x) out.push_back(static_cast<char>(cell(x, y)));
    return out;
}

std::vector<std::string> FrameRenderer::grid() const {
    std::vector<std::string> rows;
    rows.reserve(cfg.height);
    for (auto it = begin(); it != end(); ++it) rows.push_back(*it);
    return rows;
}
