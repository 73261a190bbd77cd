// ========================= src/core/Board.cpp =========================
#include "Board.hpp"
#include <stdexcept>
#include <utility>

namespace tumble {

    Board::Board(uint32_t width, std::vector<Stone> grid, Color wildColors, bool colorLock)
        : wildColors_(wildColors), colorLock_(colorLock), width_(width), grid_(std::move(grid)) {
        if (width_ == 0) throw std::invalid_argument("board width must be positive");
        if (grid_.empty() || grid_.size() % width_ != 0)
            throw std::invalid_argument("grid size is not a positive multiple of the width");
        height_ = uint32_t(grid_.size() / width_);

        int wilds = 0;
        for (const auto& s : grid_) {
            if (const auto* o = std::get_if<OrdinaryStone>(&s)) {
                if (popCount(o->color) != 1)
                    throw std::invalid_argument(std::string("stone '") + o->glyph + "' must have exactly one color bit");
            }
            if (std::holds_alternative<WildStone>(s)) ++wilds;
            if (isRemovable(s)) ++removable_;
        }
        if (wilds != popCount(wildColors_))
            throw std::invalid_argument("wild stone count differs from the number of wild colors");

        // Survivors only make sense beside something removable.
        for (uint32_t row = 0; row < height_; ++row) {
            if (!rowHasRemovable(row)) cascade(row, nullptr);
        }
    }

    bool Board::rowHasRemovable(uint32_t row) const {
        for (uint32_t x = 0; x < width_; ++x) {
            if (isRemovable(grid_[size_t(row) * width_ + x])) return true;
        }
        return false;
    }

    void Board::cascade(uint32_t row, std::vector<Point>* cleared) {
        if (rowHasRemovable(row)) return;
        for (uint32_t x = 0; x < width_; ++x) {
            auto& s = grid_[size_t(row) * width_ + x];
            if (std::holds_alternative<SurvivorStone>(s)) {
                s = NoStone{};
                if (cleared) cleared->push_back(Point{ x, row });
            }
        }
    }

    Undo Board::remove(Point p, Color assertedColor) {
        if (!contains(p)) throw std::logic_error("remove: point " + toString(p) + " is off the board");
        Stone stone = materializedAt(p);
        if (!isRemovable(stone)) throw std::logic_error("remove: stone at " + toString(p) + " is not removable");

        Undo u;
        u.at = p;
        u.prior = grid_[index(p)];

        if (const auto* o = std::get_if<OrdinaryStone>(&stone)) {
            if (assertedColor != kWildcard && assertedColor != o->color)
                throw std::logic_error("remove: asserted color does not match stone at " + toString(p));
        }
        else if (assertedColor != kWildcard) {
            // wild
            if (popCount(assertedColor) != 1 || (wildColors_ & assertedColor) == 0)
                throw std::logic_error("remove: wild at " + toString(p) + " cannot claim that color");
            wildColors_ &= ~assertedColor;
            u.clearedWild = assertedColor;
        }

        grid_[index(p)] = NoStone{};
        ++turn_;
        --removable_;
        cascade(p.y, &u.survivors);
        return u;
    }

    void Board::undo(const Undo& u) {
        for (const auto& sp : u.survivors) grid_[index(sp)] = SurvivorStone{};
        grid_[index(u.at)] = u.prior;
        wildColors_ |= u.clearedWild;
        ++removable_;
        --turn_;
    }

    void Board::forceRemove(Point p) {
        if (!contains(p)) throw std::logic_error("forceRemove: point " + toString(p) + " is off the board");
        auto& s = grid_[index(p)];
        if (!isRemovable(s)) throw std::logic_error("forceRemove: stone at " + toString(p) + " is not removable");
        s = NoStone{};
        ++turn_;
        --removable_;
        cascade(p.y, nullptr);
    }

} // namespace tumble
