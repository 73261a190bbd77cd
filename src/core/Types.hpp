// ========================= src/core/Types.hpp =========================
#pragma once
#include <cstdint>
#include <vector>
#include <string>

namespace tumble {

    using Color = uint32_t;         // single bit per color; 0 = no color / wildcard

    constexpr Color kWildcard = 0;
    constexpr int kMaxColors = 32;  // one bit each in Color

    // x = column, y = row, origin top-left
    struct Point {
        uint32_t x{ 0 };
        uint32_t y{ 0 };

        bool operator==(const Point& o) const { return x == o.x && y == o.y; }
        bool operator!=(const Point& o) const { return !(*this == o); }
    };

    inline int popCount(Color c) {
        int n = 0;
        while (c) { c &= c - 1; ++n; }
        return n;
    }

    // index of the lowest set bit; -1 for 0
    inline int bitIndex(Color c) {
        if (c == 0) return -1;
        int i = 0;
        while ((c & 1u) == 0) { c >>= 1; ++i; }
        return i;
    }

    inline std::string toString(const Point& p) {
        return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
    }

} // namespace tumble
