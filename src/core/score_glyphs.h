/**
 * @file score_glyphs.h
 * @brief Large 3x5 block digits for the score display
 */

#pragma once

#include <array>
#include <string>
#include <vector>

constexpr int kGlyphWidth = 3;    ///< Columns per digit
constexpr int kGlyphHeight = 5;   ///< Rows per digit
constexpr int kGlyphSpacing = 1;  ///< Blank columns between digits

/// One digit bitmap: five UTF-8 rows, each three cells wide
using DigitGlyph = std::array<const char *, kGlyphHeight>;

/**
 * @brief Bitmap for a decimal digit
 * @return Pointer into the static table, or nullptr when @p d is not 0-9
 */
const DigitGlyph *digit_glyph(int d);

/**
 * @brief Render a non-negative score as kGlyphHeight rows of block glyphs
 *
 * Digits are concatenated left to right with kGlyphSpacing blank columns
 * between them. Negative input renders as 0.
 */
std::vector<std::string> render_score(int score);

/**
 * @brief Width in cells of render_score(score)
 */
int score_width(int score);
