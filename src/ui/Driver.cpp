// ========================= src/ui/Driver.cpp =========================
#include "Driver.hpp"
#include "../core/Solver.hpp"
#include "../io/BoardFile.hpp"
#include "Terminal.hpp"
#include <istream>
#include <ostream>

namespace tumble {

    Driver::Driver(std::istream& in, std::ostream& out, std::ostream& err)
        : in(in), out(out), err(err) {}

    void Driver::usage(const std::string& exe) {
        err << "Usage: " << exe << " [--batch] [--plain] <board-file>\n"
            << "  --batch   print every hint without waiting for Enter\n"
            << "  --plain   no terminal colors\n";
    }

    bool Driver::parseArgs(const std::vector<std::string>& args, Options& opt) {
        for (size_t i = 1; i < args.size(); ++i) {
            const std::string& a = args[i];
            if (a == "--batch") opt.interactive = false;
            else if (a == "--plain") opt.ansi = false;
            else if (!a.empty() && a[0] == '-') { err << "error: unknown option '" << a << "'\n"; return false; }
            else if (opt.path.empty()) opt.path = a;
            else { err << "error: more than one board file given\n"; return false; }
        }
        if (opt.path.empty()) { err << "error: no board file given\n"; return false; }
        return true;
    }

    int Driver::run(const std::vector<std::string>& args) {
        Options opt;
        if (!parseArgs(args, opt)) {
            usage(args.empty() ? "tumble" : args[0]);
            return kExitUsage;
        }

        ParseError perr;
        auto puzzle = BoardFile::load(opt.path, &perr);
        if (!puzzle) {
            if (perr.kind == ParseErrorKind::FileNotFound) {
                err << "error: " << perr.message << "\n";
                return kExitFile;
            }
            err << "error: " << opt.path;
            if (perr.line > 0) err << ":" << perr.line;
            err << ": " << parseErrorName(perr.kind) << ": " << perr.message << "\n";
            return kExitParse;
        }

        Board& board = puzzle->board;
        const auto& colors = puzzle->legend.colors;

        Solver solver;
        SolveResult r = solver.solve(board);
        if (!r.solved) {
            out << Terminal::paint("No solution exists.", 11, opt.ansi) << "\n";
            return kExitOk;
        }
        err << "solved: " << r.moves.size() << " moves, " << r.nodes << " nodes searched\n";

        for (const Point& m : r.moves) {
            out << Terminal::frame(board, colors, m, opt.ansi) << std::endl;
            board.forceRemove(m);
            if (opt.interactive) {
                out << "Press " << Terminal::paint("[Enter]", 15, opt.ansi) << " for next hint." << std::endl;
                std::string ignored;
                if (!std::getline(in, ignored)) opt.interactive = false; // input closed: run to the end
            }
        }
        out << Terminal::frame(board, colors, std::nullopt, opt.ansi) << std::endl;
        return kExitOk;
    }

} // namespace tumble
