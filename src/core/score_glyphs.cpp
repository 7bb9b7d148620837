#include "core/score_glyphs.h"
#include <cstddef>

namespace {

const std::array<DigitGlyph, 10> kDigits = {{
    {{"███", "█ █", "█ █", "█ █", "███"}},
    {{" █ ", "██ ", " █ ", " █ ", "███"}},
    {{"███", "  █", "███", "█  ", "███"}},
    {{"███", "  █", "███", "  █", "███"}},
    {{"█ █", "█ █", "███", "  █", "  █"}},
    {{"███", "█  ", "███", "  █", "███"}},
    {{"███", "█  ", "███", "█ █", "███"}},
    {{"███", "  █", "  █", "  █", "  █"}},
    {{"███", "█ █", "███", "█ █", "███"}},
    {{"███", "█ █", "███", "  █", "███"}},
}};

} // namespace

const DigitGlyph *digit_glyph(int d) {
    if (d < 0 || d > 9) return nullptr;
    return &kDigits[d];
}

std::vector<std::string> render_score(int score) {
    std::string digits = std::to_string(score < 0 ? 0 : score);
    std::vector<std::string> rows(kGlyphHeight);
    for (std::size_t i = 0; i < digits.size(); ++i) {
        const DigitGlyph *g = digit_glyph(digits[i] - '0');
        if (!g) continue;
        for (int r = 0; r < kGlyphHeight; ++r) {
            if (i > 0) rows[r].append(kGlyphSpacing, ' ');
            rows[r] += (*g)[r];
        }
    }
    return rows;
}

int score_width(int score) {
    int n = static_cast<int>(std::to_string(score < 0 ? 0 : score).size());
    return n * (kGlyphWidth + kGlyphSpacing) - kGlyphSpacing;
}
