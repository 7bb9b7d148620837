/**
 * @file frame_renderer.h
 * @brief Converts a MatchState snapshot into a grid of cell codes
 *
 * Each row is produced on demand, one cell at a time, with a fixed
 * precedence: border, left paddle, right paddle, ball, centre line, empty.
 * Cell codes are single ASCII characters so a row string is exactly W
 * characters long; the console maps codes to glyphs and colours.
 */

#pragma once

#include "core/field_config.h"
#include "core/match_state.h"

#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

/**
 * @brief Cell codes emitted by the renderer
 */
enum class Cell : char {
    Empty = ' ',
    Border = '=',
    Paddle = '#',
    Ball = 'O',
    CenterLine = ':'
};

/**
 * @brief Stateless per-cell renderer over an immutable snapshot
 *
 * Holds copies of the state and configuration, so the snapshot it renders
 * cannot change underneath it. Rows can be requested any number of times.
 */
class FrameRenderer {
public:
    /**
     * @brief Input iterator yielding one row string per step
     */
    class RowIterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string *;
        using reference = std::string;

        RowIterator(const FrameRenderer *r, int y) : renderer(r), y(y) {}
        std::string operator*() const { return renderer->row(y); }
        RowIterator &operator++() { ++y; return *this; }
        RowIterator operator++(int) { RowIterator t = *this; ++y; return t; }
        bool operator==(const RowIterator &o) const { return renderer == o.renderer && y == o.y; }
        bool operator!=(const RowIterator &o) const { return !(*this == o); }

    private:
        const FrameRenderer *renderer;
        int y;
    };

    FrameRenderer(const MatchState &state, const FieldConfig &cfg);

    /// Cell code at column @p x, row @p y (Empty outside the field)
    Cell cell(int x, int y) const;

    /// Row @p y as a string of W cell codes (empty string outside the field)
    std::string row(int y) const;

    /// Number of rows (H)
    int rows() const { return cfg.height; }

    RowIterator begin() const { return RowIterator(this, 0); }
    RowIterator end() const { return RowIterator(this, cfg.height); }

    /// Materialize all rows
    std::vector<std::string> grid() const;

    const MatchState &snapshot() const { return state; }

private:
    MatchState state;
    FieldConfig cfg;
};
