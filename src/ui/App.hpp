// ========================= src/ui/App.hpp =========================
#pragma once
#include "../io/BoardFile.hpp"
#include "SolveJob.hpp"
#include <array>
#include <mutex>
#include <optional>
#include <string>

namespace tumble {

    class AppUI {
    public:
        explicit AppUI(const std::string& initialPath = "");
        ~AppUI();
        int run(); // SDL2 + ImGui main loop

    private:
        std::array<char, 512> pathBuf{};
        std::optional<Puzzle> puzzle;       // as loaded; never mutated
        std::optional<SolveResult> solution;
        int playbackStep{ 0 };
        float cell{ 36.0f };

        SolveJob job;
        bool quitRequested{ false };        // window closed while a search runs
        std::mutex statusMutex;
        std::string statusMessage;

        void setStatus(const std::string& msg);
        std::string getStatus();

        void load();
        void startSolve();
        void collectSolved();

        void drawControls();
        void drawViewer();
        void drawClosing();
    };

} // namespace tumble
