// ========================= src/core/Solver.cpp =========================
#include "Solver.hpp"
#include <functional>
#include <utility>

namespace tumble {

    std::vector<Point> Solver::frontier(const Board& board, Color filter, bool allowWild) {
        std::vector<Point> out;
        for (uint32_t x = 0; x < board.width(); ++x) {
            for (uint32_t y = board.height(); y-- > 0;) {
                Point p{ x, y };
                Stone s = board.materializedAt(p);
                if (const auto* o = std::get_if<OrdinaryStone>(&s)) {
                    if (filter == kWildcard || o->color == filter) out.push_back(p);
                    break;
                }
                if (std::holds_alternative<WildStone>(s)) {
                    if (allowWild && (filter == kWildcard || (filter & board.wildColors()) != 0)) out.push_back(p);
                    break;
                }
                if (const auto* t = std::get_if<ToggleStone>(&s)) {
                    if (!t->isOpen()) break;
                }
                // empty, survivor, open toggle: look further up
            }
        }
        return out;
    }

    SolveResult Solver::solve(Board& board) {
        SolveResult result;
        if (board.removableCount() % 3 != 0) return result;

        std::vector<Point> moves;
        moves.reserve(board.removableCount());

        // One step: remove p asserting the active filter, then search on.
        // A wild keeps the filter (kWildcard when it opens a triplet) and
        // closes the triplet to further wilds.
        std::function<bool(Color, bool)> dfs;
        auto tryMove = [&](Point p, Color filter, bool allowWild) {
            Undo u = board.remove(p, filter);
            moves.push_back(p);

            Color nextFilter = filter;
            bool nextAllowWild = allowWild;
            if (moves.size() % 3 == 0) { nextFilter = kWildcard; nextAllowWild = true; }
            else if (std::holds_alternative<WildStone>(u.prior)) { nextAllowWild = false; }
            else { nextFilter = colorOf(u.prior); }

            bool ok = dfs(nextFilter, nextAllowWild);
            board.undo(u);
            if (!ok) moves.pop_back();
            return ok;
        };

        dfs = [&](Color filter, bool allowWild) -> bool {
            ++result.nodes;
            if (board.isSolved()) return true; // callers restore the board

            for (const Point& p : frontier(board, filter, allowWild)) {
                if (tryMove(p, filter, allowWild)) return true;
            }
            return false;
        };

        bool found = dfs(kWildcard, true);
        if (found && moves.size() % 3 == 0) {
            result.solved = true;
            result.moves = std::move(moves);
        }
        return result;
    }

} // namespace tumble
