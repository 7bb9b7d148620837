/**
 * @file console/frame_painter.h
 * @brief Composes a full terminal frame from a match snapshot
 *
 * Maps renderer cell codes to block glyphs and attributes, overlays the
 * large score digits and writes the two status rows under the field.
 */
#pragma once

#include "core/field_config.h"
#include "core/match_state.h"
#include "platform/screen_buffer.h"

#include <string>

/// Rows below the field used for the title and the command line
constexpr int kStatusRows = 2;

/**
 * @brief Values shown on the command line
 */
struct StatusInfo {
    bool sound = false;        ///< Sound alerts enabled
    bool uncapped = false;     ///< Pacer in uncapped mode
    int fps = 30;              ///< Target rate when capped
    double measured_fps = 0;   ///< Measured rate, shown when uncapped
};

/// Title line drawn in the accent colour
extern const char *const kTitleText;

/**
 * @brief Draw field, scores and status rows into @p out
 *
 * @p out is cleared first. Anything that does not fit is clipped.
 */
void paint_frame(ScreenBuffer &out, const MatchState &s, const FieldConfig &cfg, const StatusInfo &status);

/**
 * @brief Draw a score with its right edge at column @p right_x
 */
void paint_score_right_aligned(ScreenBuffer &out, int score, int right_x, int y);

/**
 * @brief Draw a score starting at column @p left_x
 */
void paint_score_left_aligned(ScreenBuffer &out, int score, int left_x, int y);

/**
 * @brief Format the bracketed rate value ("30 fps" or "212 fps MAX")
 */
std::string format_rate(const StatusInfo &status);
