// ========================= src/ui/SolveJob.cpp =========================
#include "SolveJob.hpp"
#include <utility>

namespace tumble {

    SolveJob::~SolveJob() {
        wait();
    }

    bool SolveJob::start(const Board& board) {
        if (running.load()) return false;
        if (worker.joinable()) worker.join();
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            pending.reset();
        }
        running.store(true);

        Board work = board; // the search mutates its board
        worker = std::thread([this, work]() mutable {
            Solver solver;
            SolveResult r = solver.solve(work);
            {
                std::lock_guard<std::mutex> lock(pendingMutex);
                pending = std::move(r);
            }
            running.store(false);
        });
        return true;
    }

    std::optional<SolveResult> SolveJob::take() {
        if (!running.load() && worker.joinable()) {
            worker.join();
        }
        std::optional<SolveResult> done;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            done.swap(pending);
        }
        return done;
    }

    void SolveJob::wait() {
        if (worker.joinable()) worker.join();
    }

} // namespace tumble
