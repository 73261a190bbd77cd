// ========================= src/core/Solver.hpp =========================
#pragma once
#include "Board.hpp"
#include <vector>

namespace tumble {

    struct SolveResult {
        bool solved{ false };
        std::vector<Point> moves;   // length is a multiple of three when solved
        uint64_t nodes{ 0 };        // search calls made
    };

    class Solver {
    public:
        // Depth-first search for a full clear. The board is mutated during the
        // search and restored before returning.
        SolveResult solve(Board& board);

        // Reachable stones passing the color filter, column by column, bottom-up.
        static std::vector<Point> frontier(const Board& board, Color filter, bool allowWild);
    };

} // namespace tumble
