/**
 * @file platform/screen_buffer.h
 * @brief Off-screen character buffer for flicker-free terminal drawing
 *
 * The console game draws a whole frame into a ScreenBuffer, then converts it
 * to one ANSI string and writes it in a single operation. Cells hold UTF-8
 * glyphs plus a text attribute. Writes outside the buffer are ignored: an
 * off-screen write is cosmetic and never an error.
 */

#pragma once

#include <string>
#include <vector>

/// Text attribute of a cell
enum class Attr { Normal, Dim, Bold, Accent };

class ScreenBuffer {
public:
    ScreenBuffer(int cols, int rows);

    /// Reset every cell to a blank, normal space
    void clear();

    /**
     * @brief Put one glyph at (x, y)
     * @return false when (x, y) is outside the buffer (nothing written)
     */
    bool put(int x, int y, const std::string &glyph, Attr attr);

    /**
     * @brief Write UTF-8 text starting at (x, y), one code point per cell
     *
     * Cells past the right edge are dropped.
     *
     * @return Column after the last code point, whether drawn or not
     */
    int text(int x, int y, const std::string &utf8, Attr attr);

    const std::string &glyph_at(int x, int y) const;
    Attr attr_at(int x, int y) const;

    int cols() const { return w; }
    int rows() const { return h; }

    /// Whole buffer as one ANSI string (cursor home, attributes, rows)
    std::string to_ansi() const;

    /// One row without attributes, for tests and diagnostics
    std::string plain_row(int y) const;

private:
    struct Cell {
        std::string glyph = " ";
        Attr attr = Attr::Normal;
    };

    int w, h;
    std::vector<Cell> cells;
    static const std::string kEmpty;
};
