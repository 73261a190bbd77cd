// ========================= src/ui/Terminal.cpp =========================
#include "Terminal.hpp"
#include "Palette.hpp"
#include <sstream>

namespace tumble {

    static const char* kReset = "\x1b[0m";
    static const char* kReverse = "\x1b[7m";

    static std::string repeat(const char* s, uint32_t n) {
        std::string out;
        for (uint32_t i = 0; i < n; ++i) out += s;
        return out;
    }

    std::string Terminal::paint(const std::string& text, int index, bool ansi) {
        if (!ansi) return text;
        return "\x1b[38;5;" + std::to_string(index) + "m" + text + kReset;
    }

    std::string Terminal::frame(const Board& board, const std::map<char, int>& colors,
        std::optional<Point> highlight, bool ansi) {
        std::ostringstream oss;
        oss << paint("Turn " + std::to_string(board.turn()), 15, ansi) << "\n";

        const uint32_t w = board.width();
        oss << "┌" << repeat("─", w * 3) << "┐\n";
        for (uint32_t y = 0; y < board.height(); ++y) {
            oss << "│";
            for (uint32_t x = 0; x < w; ++x) {
                Point p{ x, y };
                Stone s = board.materializedAt(p);
                std::string glyph(1, glyphOf(s));
                bool lit = highlight && *highlight == p;
                if (!ansi) {
                    oss << (lit ? "[" : " ") << glyph << (lit ? "]" : " ");
                }
                else if (lit) {
                    oss << kReverse << " " << "\x1b[38;5;" << paletteIndex(s, colors) << "m" << glyph << " " << kReset;
                }
                else if (isEmpty(s)) {
                    oss << "   ";
                }
                else {
                    oss << " " << paint(glyph, paletteIndex(s, colors), true) << " ";
                }
            }
            oss << "│\n";
        }
        oss << "└" << repeat("─", w * 3) << "┘\n";

        if (highlight) oss << "Move " << toString(*highlight) << "\n";
        return oss.str();
    }

} // namespace tumble
