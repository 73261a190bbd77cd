// ========================= src/ui/SolveJob.hpp =========================
#pragma once
#include "../core/Solver.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace tumble {

    // One background search at a time. The search cannot be interrupted, so
    // the destructor blocks until a running search returns.
    class SolveJob {
    public:
        SolveJob() = default;
        ~SolveJob();
        SolveJob(const SolveJob&) = delete;
        SolveJob& operator=(const SolveJob&) = delete;

        // Searches a copy of board. Returns false while a search is running.
        bool start(const Board& board);
        bool busy() const { return running.load(); }
        // The finished result, handed out once.
        std::optional<SolveResult> take();
        // Blocks until the running search (if any) returns.
        void wait();

    private:
        std::thread worker;
        std::atomic<bool> running{ false };
        std::mutex pendingMutex;
        std::optional<SolveResult> pending;
    };

} // namespace tumble
