// ========================= src/io/BoardFile.hpp =========================
#pragma once
#include "../core/Board.hpp"
#include <map>
#include <optional>
#include <string>

namespace tumble {

    enum class ParseErrorKind : uint8_t {
        None = 0,
        FileNotFound,
        MissingSeparator,   // no "---" line between legend and grid
        MalformedLegend,    // legend line is not "key: value"
        UnknownProperty,
        InvalidProperty,
        MissingWidth,
        InvalidTile,
        TooManyColors,
        WildCountMismatch,
        IncompleteGrid,
    };

    struct ParseError {
        ParseErrorKind kind{ ParseErrorKind::None };
        int line{ 0 };          // 1-based; 0 when not tied to a line
        std::string message;
    };

    const char* parseErrorName(ParseErrorKind kind);

    struct Legend {
        uint32_t width{ 0 };
        std::string wild;               // wild color glyphs
        bool lock{ false };
        std::map<char, int> colors;     // per-glyph terminal color (0..255)
    };

    struct Puzzle {
        Board board;
        Legend legend;
    };

    // Text layout:
    //   key: value        legend properties (width, wild, lock, color <glyph>)
    //   ---               separator
    //   R G . *           grid tokens, row-major, `width` per row
    struct BoardFile {
        static std::optional<Puzzle> parse(const std::string& text, ParseError* err = nullptr);
        static std::optional<Puzzle> load(const std::string& path, ParseError* err = nullptr);
    };

} // namespace tumble
