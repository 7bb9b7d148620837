/**
 * @file console/frame_painter.cpp
 * @brief Glyph mapping, score overlay and status rows
 */

#include "console/frame_painter.h"
#include "core/frame_renderer.h"
#include "core/score_glyphs.h"
#include <cstddef>

const char *const kTitleText = "autopong - the terminal playing Pong against itself";

namespace {

const char *const kSolid = "\xE2\x96\x88";    // U+2588 full block
const char *const kUpperHalf = "\xE2\x96\x80"; // U+2580 upper half block

void paint_cell(ScreenBuffer &out, int x, int y, Cell c) {
    switch (c) {
        case Cell::Border: out.put(x, y, kUpperHalf, Attr::Dim); break;
        case Cell::Paddle:
        case Cell::Ball: out.put(x, y, kSolid, Attr::Bold); break;
        case Cell::CenterLine: out.put(x, y, kSolid, Attr::Dim); break;
        case Cell::Empty: break;
    }
}

void paint_score_at(ScreenBuffer &out, int score, int x, int y) {
    std::vector<std::string> rows = render_score(score);
    for (std::size_t r = 0; r < rows.size(); ++r) {
        // spaces in a glyph are transparent so the centre line stays visible
        int col = x;
        const std::string &line = rows[r];
        std::size_t i = 0;
        while (i < line.size()) {
            if (line[i] == ' ') { ++i; ++col; continue; }
            out.put(col, y + static_cast<int>(r), kSolid, Attr::Dim);
            i += 3;
            ++col;
        }
    }
}

} // namespace

void paint_score_right_aligned(ScreenBuffer &out, int score, int right_x, int y) {
    paint_score_at(out, score, right_x - score_width(score) + 1, y);
}

void paint_score_left_aligned(ScreenBuffer &out, int score, int left_x, int y) {
    paint_score_at(out, score, left_x, y);
}

std::string format_rate(const StatusInfo &status) {
    if (status.uncapped) return std::to_string(static_cast<int>(status.measured_fps)) + " fps MAX";
    return std::to_string(status.fps) + " fps";
}

void paint_frame(ScreenBuffer &out, const MatchState &s, const FieldConfig &cfg, const StatusInfo &status) {
    out.clear();

    FrameRenderer renderer(s, cfg);
    int y = 0;
    for (const std::string &row : renderer) {
        for (int x = 0; x < static_cast<int>(row.size()); ++x) paint_cell(out, x, y, static_cast<Cell>(row[x]));
        ++y;
    }

    // scores sit either side of the centre line, below the top border
    paint_score_right_aligned(out, s.score_a, cfg.width / 2 - 2, 1);
    paint_score_left_aligned(out, s.score_b, cfg.width / 2 + 3, 1);

    out.text(0, cfg.height, kTitleText, Attr::Accent);

    int x = out.text(0, cfg.height + 1, "Press ESC to exit, S for sound [", Attr::Dim);
    x = out.text(x, cfg.height + 1, status.sound ? "ON" : "OFF", Attr::Accent);
    x = out.text(x, cfg.height + 1, "], +/- for framerate [", Attr::Dim);
    x = out.text(x, cfg.height + 1, format_rate(status), Attr::Accent);
    out.text(x, cfg.height + 1, "]", Attr::Dim);
}
