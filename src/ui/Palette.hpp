// ========================= src/ui/Palette.hpp =========================
#pragma once
#include "../core/Stone.hpp"
#include <map>

namespace tumble {

    struct Rgb { uint8_t r{ 0 }, g{ 0 }, b{ 0 }; };

    // 256-color terminal index for a (materialized) stone; legend overrides win.
    int paletteIndex(const Stone& s, const std::map<char, int>& overrides);

    // xterm 256-color index -> RGB
    Rgb xtermRgb(int index);

} // namespace tumble
