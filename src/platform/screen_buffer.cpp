#include "platform/screen_buffer.h"
#include <cstddef>

const std::string ScreenBuffer::kEmpty;

namespace {

const char *sgr(Attr a) {
    switch (a) {
        case Attr::Dim: return "\x1b[0;90m";
        case Attr::Bold: return "\x1b[0;1;97m";
        case Attr::Accent: return "\x1b[0;33m";
        case Attr::Normal: break;
    }
    return "\x1b[0m";
}

// byte length of the UTF-8 sequence starting with lead byte c
std::size_t utf8_len(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c >> 5) == 0x6) return 2;
    if ((c >> 4) == 0xE) return 3;
    if ((c >> 3) == 0x1E) return 4;
    return 1;
}

} // namespace

ScreenBuffer::ScreenBuffer(int cols, int rows)
: w(cols > 0 ? cols : 0), h(rows > 0 ? rows : 0), cells(static_cast<std::size_t>(w) * h) {}

void ScreenBuffer::clear() {
    for (auto &c : cells) { c.glyph = " "; c.attr = Attr::Normal; }
}

bool ScreenBuffer::put(int x, int y, const std::string &glyph, Attr attr) {
    if (x < 0 || y < 0 || x >= w || y >= h) return false;
    Cell &c = cells[static_cast<std::size_t>(y) * w + x];
    c.glyph = glyph;
    c.attr = attr;
    return true;
}

int ScreenBuffer::text(int x, int y, const std::string &utf8, Attr attr) {
    std::size_t i = 0;
    while (i < utf8.size()) {
        std::size_t n = utf8_len(static_cast<unsigned char>(utf8[i]));
        put(x, y, utf8.substr(i, n), attr);
        i += n;
        ++x;
    }
    return x;
}

const std::string &ScreenBuffer::glyph_at(int x, int y) const {
    if (x < 0 || y < 0 || x >= w || y >= h) return kEmpty;
    return cells[static_cast<std::size_t>(y) * w + x].glyph;
}

Attr ScreenBuffer::attr_at(int x, int y) const {
    if (x < 0 || y < 0 || x >= w || y >= h) return Attr::Normal;
    return cells[static_cast<std::size_t>(y) * w + x].attr;
}

std::string ScreenBuffer::to_ansi() const {
    std::string out;
    out.reserve(static_cast<std::size_t>(w) * h * 4 + 64);
    out += "\x1b[H";
    for (int y = 0; y < h; ++y) {
        Attr cur = Attr::Normal;
        out += sgr(cur);
        for (int x = 0; x < w; ++x) {
            const Cell &c = cells[static_cast<std::size_t>(y) * w + x];
            if (c.attr != cur) { cur = c.attr; out += sgr(cur); }
            out += c.glyph;
        }
        out += "\x1b[0m";
        if (y + 1 < h) out += "\r\n";
    }
    return out;
}

std::string ScreenBuffer::plain_row(int y) const {
    std::string out;
    if (y < 0 || y >= h) return out;
    for (int x = 0; x < w; ++x) out += cells[static_cast<std::size_t>(y) * w + x].glyph;
    return out;
}
