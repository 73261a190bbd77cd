// ========================= src/ui/App.cpp =========================
#include "App.hpp"
#include "Palette.hpp"
#include <SDL.h>
#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"
#include <algorithm> // for std::clamp
#include <cstdio>
#include <cstring>

namespace tumble {

    AppUI::AppUI(const std::string& initialPath) {
        std::strncpy(pathBuf.data(), initialPath.c_str(), pathBuf.size() - 1);
    }

    AppUI::~AppUI() {
        if (job.busy()) {
            printf("[viewer] waiting for the running solve to finish\n");
        }
    }

    void AppUI::setStatus(const std::string& msg) {
        std::lock_guard<std::mutex> lock(statusMutex);
        statusMessage = msg;
    }

    std::string AppUI::getStatus() {
        std::lock_guard<std::mutex> lock(statusMutex);
        return statusMessage;
    }

    static bool InputIntClamped(const char* label, int* value, int minValue, int maxValue, int step = 1, int stepFast = 5) {
        if (minValue > maxValue) std::swap(minValue, maxValue);
        int before = *value;
        bool interacted = ImGui::InputInt(label, value, step, stepFast);
        if (*value < minValue) *value = minValue;
        if (*value > maxValue) *value = maxValue;

        return interacted || *value != before;
    }

    void AppUI::load() {
        ParseError err;
        auto loaded = BoardFile::load(pathBuf.data(), &err);
        solution.reset();
        playbackStep = 0;
        if (!loaded) {
            puzzle.reset();
            std::string where = err.line > 0 ? " (line " + std::to_string(err.line) + ")" : "";
            setStatus(std::string(parseErrorName(err.kind)) + where + ": " + err.message);
            return;
        }
        puzzle = std::move(loaded);
        setStatus("Loaded " + std::to_string(puzzle->board.width()) + "x" + std::to_string(puzzle->board.height()) +
            " board, " + std::to_string(puzzle->board.removableCount()) + " stones.");
    }

    void AppUI::startSolve() {
        if (!puzzle || !job.start(puzzle->board)) return;
        solution.reset();
        playbackStep = 0;
        setStatus("");
    }

    void AppUI::collectSolved() {
        std::optional<SolveResult> done = job.take();
        if (!done) return;

        if (done->solved) setStatus("Solved: " + std::to_string(done->moves.size()) + " moves, " + std::to_string(done->nodes) + " nodes.");
        else setStatus("No solution exists (" + std::to_string(done->nodes) + " nodes).");
        solution = std::move(done);
    }

    void AppUI::drawControls() {
        collectSolved();

        ImGui::Begin("Controls");
        ImGui::InputText("Board file", pathBuf.data(), pathBuf.size());
        bool busy = job.busy();
        if (busy) ImGui::BeginDisabled();
        if (ImGui::Button("Load")) load();
        ImGui::SameLine();
        if (!puzzle) ImGui::BeginDisabled();
        if (ImGui::Button("Solve")) startSolve();
        if (!puzzle) ImGui::EndDisabled();
        if (busy) ImGui::EndDisabled();

        if (job.busy()) {
            ImGui::SameLine();
            ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "Solving...");
        }

        std::string status = getStatus();
        if (!status.empty()) {
            ImGui::TextColored(ImVec4(0.9f, 0.6f, 0.5f, 1.0f), "%s", status.c_str());
        }

        if (puzzle) {
            const auto& b = puzzle->board;
            ImGui::Separator();
            ImGui::Text("Width %u  Height %u  Wild colors %d  Lock %s", b.width(), b.height(),
                popCount(b.wildColors()), b.colorLock() ? "on" : "off");
        }
        ImGui::End();
    }

    void AppUI::drawViewer() {
        ImGui::Begin("Viewer");
        if (!puzzle) { ImGui::Text("No board loaded"); ImGui::End(); return; }

        static const std::vector<Point> kNoMoves;
        const auto& moves = (solution && solution->solved) ? solution->moves : kNoMoves;
        int maxStep = (int)moves.size();
        playbackStep = std::clamp(playbackStep, 0, maxStep);
        if (moves.empty()) {
            ImGui::TextDisabled("No solution to step through.");
        }
        else {
            ImGui::Text("Hint: %d / %d", playbackStep, maxStep);
            bool canPrev = playbackStep > 0;
            bool canNext = playbackStep < maxStep;
            if (!canPrev) ImGui::BeginDisabled();
            if (ImGui::Button("Prev")) { --playbackStep; }
            if (!canPrev) ImGui::EndDisabled();
            ImGui::SameLine();
            if (!canNext) ImGui::BeginDisabled();
            if (ImGui::Button("Next")) { ++playbackStep; }
            if (!canNext) ImGui::EndDisabled();
            ImGui::SameLine();
            if (ImGui::Button("Reset")) { playbackStep = 0; }
            int stepInput = playbackStep;
            if (InputIntClamped("Step", &stepInput, 0, maxStep)) {
                playbackStep = stepInput;
            }
        }

        Board view = puzzle->board;
        for (int i = 0; i < playbackStep && i < maxStep; ++i) {
            view.forceRemove(moves[i]);
        }
        std::optional<Point> next;
        if (playbackStep < maxStep) next = moves[playbackStep];

        ImGui::Text("Turn %u", view.turn());
        if (next) {
            ImGui::SameLine();
            ImGui::Text("  Next: %s", toString(*next).c_str());
        }
        else if (maxStep > 0) {
            ImGui::SameLine();
            ImGui::Text("  Cleared.");
        }
        ImGui::Separator();

        ImDrawList* dl = ImGui::GetWindowDrawList();
        ImVec2 origin = ImGui::GetCursorScreenPos();
        const auto& colors = puzzle->legend.colors;
        for (uint32_t y = 0; y < view.height(); ++y) {
            for (uint32_t x = 0; x < view.width(); ++x) {
                Point p{ x, y };
                Stone s = view.materializedAt(p);
                ImVec2 a(origin.x + x * cell, origin.y + y * cell);
                ImVec2 b(a.x + cell, a.y + cell);
                dl->AddRect(a, b, IM_COL32(70, 70, 70, 255));
                if (!isEmpty(s)) {
                    Rgb c = xtermRgb(paletteIndex(s, colors));
                    dl->AddRectFilled(ImVec2(a.x + 3, a.y + 3), ImVec2(b.x - 3, b.y - 3), IM_COL32(c.r, c.g, c.b, 255), 4.0f);
                    char text[2] = { glyphOf(s), 0 };
                    ImVec2 ts = ImGui::CalcTextSize(text);
                    dl->AddText(ImVec2(a.x + (cell - ts.x) * 0.5f, a.y + (cell - ts.y) * 0.5f), IM_COL32(20, 20, 20, 255), text);
                }
                if (next && *next == p) {
                    dl->AddRect(ImVec2(a.x + 1, a.y + 1), ImVec2(b.x - 1, b.y - 1), IM_COL32(250, 220, 120, 255), 4.0f, 0, 3.0f);
                }
            }
        }
        ImGui::Dummy(ImVec2(view.width() * cell, view.height() * cell));

        ImGui::End();
    }

    void AppUI::drawClosing() {
        const ImGuiViewport* vp = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos(vp->GetCenter(), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
        ImGui::Begin("Closing", nullptr, ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove);
        ImGui::Text("Waiting for the running solve to finish...");
        ImGui::TextDisabled("The search cannot be interrupted; the window closes when it returns.");
        ImGui::End();
    }

    int AppUI::run() {
        // SDL2 init
        if (SDL_Init(SDL_INIT_VIDEO) != 0) {
            printf("[viewer] SDL_Init failed: %s\n", SDL_GetError());
            return 1;
        }
        SDL_Window* window = SDL_CreateWindow("Tumblestone Solver", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1100, 800, SDL_WINDOW_SHOWN);
        if (!window) {
            printf("[viewer] SDL_CreateWindow failed: %s\n", SDL_GetError());
            SDL_Quit();
            return 1;
        }
        SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer) {
            printf("[viewer] SDL_CreateRenderer failed: %s\n", SDL_GetError());
            SDL_DestroyWindow(window);
            SDL_Quit();
            return 1;
        }

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();

        ImGuiIO& io = ImGui::GetIO(); (void)io;
        ImGui::StyleColorsDark();

        ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
        ImGui_ImplSDLRenderer2_Init(renderer);

        if (pathBuf[0] != '\0') load();

        bool running = true; SDL_Event e;
        while (running) {
            while (SDL_PollEvent(&e)) {
                ImGui_ImplSDL2_ProcessEvent(&e);
                if (e.type == SDL_QUIT) {
                    if (job.busy()) quitRequested = true;
                    else running = false;
                }
            }
            if (quitRequested && !job.busy()) running = false;
            ImGui_ImplSDLRenderer2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            drawControls();
            drawViewer();
            if (quitRequested) drawClosing();

            ImGui::Render();
            SDL_SetRenderDrawColor(renderer, 20, 20, 24, 255);
            SDL_RenderClear(renderer);
            ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
            SDL_RenderPresent(renderer);
        }

        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }

} // namespace tumble
