// ========================= src/ui/Terminal.hpp =========================
#pragma once
#include "../core/Board.hpp"
#include <map>
#include <optional>
#include <string>

namespace tumble {

    struct Terminal {
        // Box-drawn grid of materialized stones plus a "Turn N" header. With a
        // highlight, that cell is marked and a "Move (x, y)" footer is added.
        // ansi = false emits no escape sequences.
        static std::string frame(const Board& board, const std::map<char, int>& colors,
            std::optional<Point> highlight, bool ansi);

        // text in a 256-color foreground (plain text when !ansi)
        static std::string paint(const std::string& text, int index, bool ansi);
    };

} // namespace tumble
