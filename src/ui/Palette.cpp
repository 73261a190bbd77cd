// ========================= src/ui/Palette.cpp =========================
#include "Palette.hpp"
#include <array>

namespace tumble {

    static int defaultIndex(const Stone& s) {
        static const std::array<int, 16> table = {
            196, 33, 46, 226, 201, 208, 51, 93, 118, 214, 39, 160, 165, 190, 27, 130
        };
        if (const auto* o = std::get_if<OrdinaryStone>(&s)) {
            int i = bitIndex(o->color);
            return i < 0 ? 15 : table[size_t(i) % table.size()];
        }
        if (std::holds_alternative<WildStone>(s)) return 15;
        if (std::holds_alternative<SurvivorStone>(s)) return 250;
        if (const auto* t = std::get_if<ToggleStone>(&s)) return t->isOpen() ? 244 : 240;
        return 0;
    }

    int paletteIndex(const Stone& s, const std::map<char, int>& overrides) {
        auto it = overrides.find(glyphOf(s));
        if (it != overrides.end() && !isEmpty(s)) return it->second;
        return defaultIndex(s);
    }

    Rgb xtermRgb(int index) {
        static const std::array<Rgb, 16> system = { {
            {0,0,0}, {128,0,0}, {0,128,0}, {128,128,0}, {0,0,128}, {128,0,128}, {0,128,128}, {192,192,192},
            {128,128,128}, {255,0,0}, {0,255,0}, {255,255,0}, {0,0,255}, {255,0,255}, {0,255,255}, {255,255,255}
        } };
        if (index < 0) index = 0;
        if (index > 255) index = 255;
        if (index < 16) return system[size_t(index)];
        if (index >= 232) {
            uint8_t v = uint8_t(8 + (index - 232) * 10);
            return Rgb{ v, v, v };
        }
        int i = index - 16;
        auto level = [](int c) -> uint8_t { return c == 0 ? 0 : uint8_t(55 + c * 40); };
        return Rgb{ level(i / 36), level((i / 6) % 6), level(i % 6) };
    }

} // namespace tumble
