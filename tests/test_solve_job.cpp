#include "Check.hpp"
#include "../src/ui/SolveJob.hpp"

using namespace tumble;

static void test_result_is_handed_out_once() {
    Board b = makeBoard("width: 3\n---\nA A A\nB B B\n");
    const Board before = b;
    SolveJob job;
    CHECK(!job.take());
    CHECK(job.start(b));
    job.wait();
    CHECK(!job.busy());

    auto r = job.take();
    CHECK(r.has_value());
    CHECK(r->solved);
    CHECK(r->moves.size() == 6);
    CHECK(!job.take());
    CHECK(b.grid() == before.grid());
    CHECK(b.turn() == 0);
}

static void test_restart_after_finish() {
    SolveJob job;
    CHECK(job.start(makeBoard("width: 3\n---\nA A A\nB B C\n")));
    job.wait();
    // a second start drops the result nobody took
    CHECK(job.start(makeBoard("width: 3\n---\nA A A\n")));
    job.wait();
    auto r = job.take();
    CHECK(r.has_value());
    CHECK(r->solved);
    CHECK(r->moves.size() == 3);
}

static void test_unsolvable_result() {
    SolveJob job;
    CHECK(job.start(makeBoard("width: 3\n---\nA A A\nB B C\n")));
    job.wait();
    auto r = job.take();
    CHECK(r.has_value());
    CHECK(!r->solved);
    CHECK(r->moves.empty());
}

static void test_destructor_waits_for_the_search() {
    {
        SolveJob job;
        CHECK(job.start(makeBoard("width: 3\n---\nA A A\nB B B\nC C C\n")));
    }
    // reaching here means the worker was joined, not left running
    SolveJob again;
    CHECK(!again.busy());
    CHECK(!again.take());
}

int main() {
    test_result_is_handed_out_once();
    test_restart_after_finish();
    test_unsolvable_result();
    test_destructor_waits_for_the_search();
    std::cout << "test_solve_job: ok" << std::endl;
    return 0;
}
