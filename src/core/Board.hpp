// ========================= src/core/Board.hpp =========================
#pragma once
#include "Stone.hpp"
#include <vector>

namespace tumble {

    // Everything needed to reverse one Board::remove.
    struct Undo {
        Point at;
        Stone prior;
        Color clearedWild{ 0 };          // wild bit claimed by this removal, if any
        std::vector<Point> survivors;    // survivors cleared by the row cascade
    };

    class Board {
    public:
        // Throws std::invalid_argument on an inconsistent grid (see Board.cpp).
        Board(uint32_t width, std::vector<Stone> grid, Color wildColors, bool colorLock = false);

        uint32_t width() const { return width_; }
        uint32_t height() const { return height_; }
        uint32_t turn() const { return turn_; }
        Color wildColors() const { return wildColors_; }
        bool colorLock() const { return colorLock_; } // carried, not consulted by the solver
        int removableCount() const { return removable_; }
        bool isSolved() const { return removable_ == 0; }
        const std::vector<Stone>& grid() const { return grid_; }

        bool contains(Point p) const { return p.x < width_ && p.y < height_; }
        const Stone& stoneAt(Point p) const { return grid_[index(p)]; }
        Stone materializedAt(Point p) const { return forTurn(stoneAt(p), turn_); }

        // Removes a removable stone. assertedColor is kWildcard, the stone's own
        // color (ordinary) or a color in wildColors() (wild; the bit is claimed).
        // Undo records must be replayed through undo() in reverse order.
        // Contract violations throw std::logic_error.
        Undo remove(Point p, Color assertedColor);
        void undo(const Undo& u);

        // Irreversible; for replaying a finished solution, never during search.
        void forceRemove(Point p);

    private:
        uint32_t turn_{ 0 };
        Color wildColors_{ 0 };
        bool colorLock_{ false };
        uint32_t width_{ 0 };
        uint32_t height_{ 0 };
        std::vector<Stone> grid_;   // row * width + column
        int removable_{ 0 };

        size_t index(Point p) const { return size_t(p.y) * width_ + p.x; }
        bool rowHasRemovable(uint32_t row) const;
        void cascade(uint32_t row, std::vector<Point>* cleared);
    };

} // namespace tumble
