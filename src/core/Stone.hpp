// ========================= src/core/Stone.hpp =========================
#pragma once
#include "Types.hpp"
#include <variant>

namespace tumble {

    struct NoStone {
        bool operator==(const NoStone&) const { return true; }
    };

    struct OrdinaryStone {
        char glyph{ '?' };
        Color color{ 0 };   // exactly one bit set

        bool operator==(const OrdinaryStone& o) const { return glyph == o.glyph && color == o.color; }
    };

    // Left behind by a row; cleared once nothing removable remains in that row.
    struct SurvivorStone {
        bool operator==(const SurvivorStone&) const { return true; }
    };

    // Colorless; the colors it may stand for live on the Board (wild mask).
    struct WildStone {
        bool operator==(const WildStone&) const { return true; }
    };

    // Obstructs the column while the (materialized) phase is odd.
    struct ToggleStone {
        uint32_t phase{ 0 };

        bool isOpen() const { return (phase & 1u) == 0; }
        bool operator==(const ToggleStone& o) const { return phase == o.phase; }
    };

    using Stone = std::variant<NoStone, OrdinaryStone, SurvivorStone, WildStone, ToggleStone>;

    bool isRemovable(const Stone& s);
    Stone forTurn(const Stone& s, uint32_t turn);
    char glyphOf(const Stone& s);
    Color colorOf(const Stone& s);

    inline bool isEmpty(const Stone& s) { return std::holds_alternative<NoStone>(s); }

} // namespace tumble
