// ========================= src/core/Stone.cpp =========================
#include "Stone.hpp"

namespace tumble {

    namespace {

        struct RemovableVisitor {
            bool operator()(const NoStone&) const { return false; }
            bool operator()(const OrdinaryStone&) const { return true; }
            bool operator()(const SurvivorStone&) const { return false; }
            bool operator()(const WildStone&) const { return true; }
            bool operator()(const ToggleStone&) const { return false; }
        };

        struct ForTurnVisitor {
            uint32_t turn;
            Stone operator()(const NoStone& s) const { return s; }
            Stone operator()(const OrdinaryStone& s) const { return s; }
            Stone operator()(const SurvivorStone& s) const { return s; }
            Stone operator()(const WildStone& s) const { return s; }
            Stone operator()(const ToggleStone& s) const { return ToggleStone{ s.phase + turn }; }
        };

        struct GlyphVisitor {
            char operator()(const NoStone&) const { return ' '; }
            char operator()(const OrdinaryStone& s) const { return s.glyph; }
            char operator()(const SurvivorStone&) const { return '@'; }
            char operator()(const WildStone&) const { return '*'; }
            // only meaningful on a materialized toggle
            char operator()(const ToggleStone& s) const { return s.isOpen() ? 'O' : 'X'; }
        };

        struct ColorVisitor {
            Color operator()(const NoStone&) const { return 0; }
            Color operator()(const OrdinaryStone& s) const { return s.color; }
            Color operator()(const SurvivorStone&) const { return 0; }
            Color operator()(const WildStone&) const { return 0; }
            Color operator()(const ToggleStone&) const { return 0; }
        };

    } // namespace

    bool isRemovable(const Stone& s) { return std::visit(RemovableVisitor{}, s); }

    Stone forTurn(const Stone& s, uint32_t turn) { return std::visit(ForTurnVisitor{ turn }, s); }

    char glyphOf(const Stone& s) { return std::visit(GlyphVisitor{}, s); }

    Color colorOf(const Stone& s) { return std::visit(ColorVisitor{}, s); }

} // namespace tumble
