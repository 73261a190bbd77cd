#include "Check.hpp"
#include "../src/ui/Driver.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tumble;

struct Run {
    int code{ -1 };
    std::string out;
    std::string err;
};

static Run runDriver(const std::vector<std::string>& args, const std::string& input = "") {
    std::istringstream in(input);
    std::ostringstream out, err;
    Driver driver(in, out, err);
    Run r;
    r.code = driver.run(args);
    r.out = out.str();
    r.err = err.str();
    return r;
}

static std::string board(const std::string& name) {
    return std::string(TUMBLE_BOARDS_DIR) + "/" + name;
}

static size_t count(const std::string& text, const std::string& what) {
    size_t n = 0;
    for (size_t at = text.find(what); at != std::string::npos; at = text.find(what, at + what.size())) ++n;
    return n;
}

static void test_usage_errors() {
    Run r = runDriver({ "tumble" });
    CHECK(r.code == kExitUsage);
    CHECK(r.err.find("error: no board file given") != std::string::npos);
    CHECK(r.err.find("Usage: tumble") != std::string::npos);
    CHECK(r.out.empty());

    r = runDriver({ "tumble", "--fast", board("toggles.tsb") });
    CHECK(r.code == kExitUsage);
    CHECK(r.err.find("unknown option '--fast'") != std::string::npos);

    r = runDriver({ "tumble", board("toggles.tsb"), board("wild.tsb") });
    CHECK(r.code == kExitUsage);
    CHECK(r.err.find("more than one board file") != std::string::npos);
}

static void test_missing_file() {
    Run r = runDriver({ "tumble", "--batch", "/nonexistent/dir/board.tsb" });
    CHECK(r.code == kExitFile);
    CHECK(r.err.find("error: no such file: /nonexistent/dir/board.tsb") != std::string::npos);
    CHECK(r.out.empty());
}

static void test_malformed_file() {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "tumble_driver_malformed.tsb";
    {
        std::ofstream f(path);
        f << "width: 3\nheight: 2\n---\nA A A\n";
    }
    Run r = runDriver({ "tumble", "--batch", path.string() });
    fs::remove(path);
    CHECK(r.code == kExitParse);
    CHECK(r.err.find(path.string() + ":2: unknown property") != std::string::npos);
    CHECK(r.out.empty());
}

static void test_unsolvable_board() {
    Run r = runDriver({ "tumble", "--batch", "--plain", board("unsolvable.tsb") });
    CHECK(r.code == kExitOk);
    CHECK(r.out == "No solution exists.\n");

    r = runDriver({ "tumble", "--batch", board("unsolvable.tsb") });
    CHECK(r.code == kExitOk);
    CHECK(r.out == "\x1b[38;5;11mNo solution exists.\x1b[0m\n");
}

static void test_batch_plain_walks_the_solution() {
    Run r = runDriver({ "tumble", "--batch", "--plain", board("toggles.tsb") });
    CHECK(r.code == kExitOk);
    CHECK(r.err.find("solved: 6 moves") != std::string::npos);
    CHECK(r.out.find('\x1b') == std::string::npos);
    CHECK(r.out.find("Press") == std::string::npos);
    CHECK(count(r.out, "Turn ") == 7);
    CHECK(count(r.out, "Move (") == 6);
    CHECK(r.out.find("Turn 0\n") == 0);
    CHECK(r.out.find("Move (0, 2)\n") < r.out.find("Move (0, 0)\n"));
    CHECK(r.out.find("Turn 6\n") != std::string::npos);

    r = runDriver({ "tumble", "--plain", "--batch", board("wild.tsb") });
    CHECK(r.code == kExitOk);
    CHECK(count(r.out, "Move (") == 9);
    CHECK(r.out.find("No solution") == std::string::npos);
}

static void test_interactive_waits_for_enter() {
    // one Enter, then end of input: the rest runs without prompting
    Run r = runDriver({ "tumble", "--plain", board("toggles.tsb") }, "\n");
    CHECK(r.code == kExitOk);
    CHECK(count(r.out, "Press [Enter] for next hint.") == 2);
    CHECK(count(r.out, "Move (") == 6);

    r = runDriver({ "tumble", "--plain", board("toggles.tsb") }, "\n\n\n\n\n\n");
    CHECK(count(r.out, "Press [Enter] for next hint.") == 6);
}

int main() {
    test_usage_errors();
    test_missing_file();
    test_malformed_file();
    test_unsolvable_board();
    test_batch_plain_walks_the_solution();
    test_interactive_waits_for_enter();
    std::cout << "test_driver: ok" << std::endl;
    return 0;
}
