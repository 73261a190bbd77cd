// ========================= src/ui/Driver.hpp =========================
#pragma once
#include <iosfwd>
#include <string>
#include <vector>

namespace tumble {

    enum ExitCode { kExitOk = 0, kExitUsage = 1, kExitFile = 2, kExitParse = 3 };

    // Terminal hint driver: parse flags, load a board file, solve it and walk
    // the solution one highlighted frame at a time.
    class Driver {
    public:
        Driver(std::istream& in, std::ostream& out, std::ostream& err);

        // args[0] is the program name. Returns an ExitCode; an unsolvable
        // board still counts as a normal run.
        int run(const std::vector<std::string>& args);

    private:
        struct Options {
            std::string path;
            bool interactive{ true };   // wait for Enter between hints
            bool ansi{ true };
        };

        bool parseArgs(const std::vector<std::string>& args, Options& opt);
        void usage(const std::string& exe);

        std::istream& in;
        std::ostream& out;
        std::ostream& err;
    };

} // namespace tumble
