// ========================= src/io/BoardFile.cpp =========================
#include "BoardFile.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>
#include <vector>

namespace tumble {

    const char* parseErrorName(ParseErrorKind kind) {
        switch (kind) {
        case ParseErrorKind::None: return "none";
        case ParseErrorKind::FileNotFound: return "file not found";
        case ParseErrorKind::MissingSeparator: return "missing separator";
        case ParseErrorKind::MalformedLegend: return "malformed legend";
        case ParseErrorKind::UnknownProperty: return "unknown property";
        case ParseErrorKind::InvalidProperty: return "invalid property";
        case ParseErrorKind::MissingWidth: return "missing width";
        case ParseErrorKind::InvalidTile: return "invalid tile";
        case ParseErrorKind::TooManyColors: return "too many colors";
        case ParseErrorKind::WildCountMismatch: return "wild count mismatch";
        case ParseErrorKind::IncompleteGrid: return "incomplete grid";
        }
        return "unknown";
    }

    static std::nullopt_t fail(ParseError* err, ParseErrorKind kind, int line, const std::string& msg) {
        if (err) *err = ParseError{ kind, line, msg };
        return std::nullopt;
    }

    static std::string trim(const std::string& s) {
        size_t b = s.find_first_not_of(" \t\r");
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(" \t\r");
        return s.substr(b, e - b + 1);
    }

    static bool isSeparator(const std::string& s) {
        return s.size() >= 3 && s.find_first_not_of('-') == std::string::npos;
    }

    // non-negative decimal, at most 6 digits
    static bool parseUnsigned(const std::string& s, int& out) {
        if (s.empty() || s.size() > 6) return false;
        for (char c : s) if (c < '0' || c > '9') return false;
        out = std::stoi(s);
        return true;
    }

    static bool parseFlag(const std::string& s, bool& out) {
        if (s == "yes" || s == "true" || s == "on" || s == "1") { out = true; return true; }
        if (s == "no" || s == "false" || s == "off" || s == "0") { out = false; return true; }
        return false;
    }

    static bool isReserved(char c) {
        return c == '.' || c == '*' || c == 'O' || c == 'X' || c == '@' || c == '#';
    }

    static bool isGlyph(char c) { return c > ' ' && c < 127; }

    struct Token { char c; int line; };

    std::optional<Puzzle> BoardFile::parse(const std::string& text, ParseError* err) {
        Legend legend;
        std::vector<Token> tokens;
        std::set<std::string> seenKeys;
        bool inGrid = false;

        std::istringstream iss(text);
        std::string raw;
        int lineNo = 0;
        while (std::getline(iss, raw)) {
            ++lineNo;
            std::string line = trim(raw);
            if (line.empty() || line[0] == '#') continue;

            if (inGrid) {
                std::istringstream row(line);
                std::string tok;
                while (row >> tok) {
                    if (tok.size() != 1 || !isGlyph(tok[0]) || tok[0] == '#')
                        return fail(err, ParseErrorKind::InvalidTile, lineNo, "bad tile '" + tok + "'");
                    tokens.push_back(Token{ tok[0], lineNo });
                }
                continue;
            }

            if (isSeparator(line)) { inGrid = true; continue; }

            size_t colon = line.find(':');
            if (colon == std::string::npos)
                return fail(err, ParseErrorKind::MalformedLegend, lineNo, "expected 'key: value'");
            std::string key = trim(line.substr(0, colon));
            std::string value = trim(line.substr(colon + 1));
            if (key.empty())
                return fail(err, ParseErrorKind::MalformedLegend, lineNo, "empty key");
            if (!seenKeys.insert(key).second)
                return fail(err, ParseErrorKind::InvalidProperty, lineNo, "property '" + key + "' repeated");

            if (key == "width") {
                int w = 0;
                if (!parseUnsigned(value, w) || w == 0)
                    return fail(err, ParseErrorKind::InvalidProperty, lineNo, "width must be a positive integer");
                legend.width = uint32_t(w);
            }
            else if (key == "wild") {
                std::string glyphs;
                for (char c : value) {
                    if (c == ' ' || c == '\t') continue;
                    if (!isGlyph(c) || isReserved(c))
                        return fail(err, ParseErrorKind::InvalidProperty, lineNo, std::string("'") + c + "' cannot be a wild color");
                    if (glyphs.find(c) != std::string::npos)
                        return fail(err, ParseErrorKind::InvalidProperty, lineNo, std::string("wild color '") + c + "' repeated");
                    glyphs.push_back(c);
                }
                legend.wild = glyphs;
            }
            else if (key == "lock") {
                if (!parseFlag(value, legend.lock))
                    return fail(err, ParseErrorKind::InvalidProperty, lineNo, "lock must be yes or no");
            }
            else if (key.compare(0, 6, "color ") == 0) {
                std::string glyph = trim(key.substr(6));
                int index = 0;
                if (glyph.size() != 1 || !isGlyph(glyph[0]))
                    return fail(err, ParseErrorKind::InvalidProperty, lineNo, "color needs a single glyph");
                if (!parseUnsigned(value, index) || index > 255)
                    return fail(err, ParseErrorKind::InvalidProperty, lineNo, "color must be 0..255");
                legend.colors[glyph[0]] = index;
            }
            else {
                return fail(err, ParseErrorKind::UnknownProperty, lineNo, "unknown property '" + key + "'");
            }
        }

        if (!inGrid) return fail(err, ParseErrorKind::MissingSeparator, lineNo, "no '---' line before the grid");
        if (legend.width == 0) return fail(err, ParseErrorKind::MissingWidth, 0, "legend has no width");
        if (tokens.empty() || tokens.size() % legend.width != 0) {
            return fail(err, ParseErrorKind::IncompleteGrid, tokens.empty() ? lineNo : tokens.back().line,
                std::to_string(tokens.size()) + " tiles do not fill rows of " + std::to_string(legend.width));
        }

        // color bits by first appearance: grid, then wild glyphs
        std::map<char, Color> bits;
        auto colorFor = [&](char c) -> Color {
            auto it = bits.find(c);
            if (it != bits.end()) return it->second;
            if ((int)bits.size() >= kMaxColors) return 0;
            Color bit = Color(1) << bits.size();
            bits.emplace(c, bit);
            return bit;
        };

        std::vector<Stone> grid;
        grid.reserve(tokens.size());
        size_t wilds = 0;
        for (const auto& t : tokens) {
            switch (t.c) {
            case '.': grid.push_back(NoStone{}); break;
            case '*': grid.push_back(WildStone{}); ++wilds; break;
            case 'O': grid.push_back(ToggleStone{ 0 }); break;
            case 'X': grid.push_back(ToggleStone{ 1 }); break;
            case '@': grid.push_back(SurvivorStone{}); break;
            default: {
                Color c = colorFor(t.c);
                if (c == 0)
                    return fail(err, ParseErrorKind::TooManyColors, t.line, "more than " + std::to_string(kMaxColors) + " colors");
                grid.push_back(OrdinaryStone{ t.c, c });
            }
            }
        }

        Color wildColors = 0;
        for (char c : legend.wild) {
            Color bit = colorFor(c);
            if (bit == 0)
                return fail(err, ParseErrorKind::TooManyColors, 0, "more than " + std::to_string(kMaxColors) + " colors");
            wildColors |= bit;
        }
        if (wilds != legend.wild.size()) {
            return fail(err, ParseErrorKind::WildCountMismatch, 0,
                std::to_string(wilds) + " wild stones but " + std::to_string(legend.wild.size()) + " wild colors");
        }

        Board board(legend.width, std::move(grid), wildColors, legend.lock);
        return Puzzle{ std::move(board), std::move(legend) };
    }

    std::optional<Puzzle> BoardFile::load(const std::string& path, ParseError* err) {
        namespace fs = std::filesystem;
        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
            return fail(err, ParseErrorKind::FileNotFound, 0, "no such file: " + path);
        std::ifstream f(path);
        if (!f) return fail(err, ParseErrorKind::FileNotFound, 0, "cannot read " + path);
        std::ostringstream oss;
        oss << f.rdbuf();
        return parse(oss.str(), err);
    }

} // namespace tumble
