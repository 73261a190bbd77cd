// ========================= src/viewer.cpp =========================
#include "ui/App.hpp"
#include <SDL.h>

int main(int argc, char* argv[]) {
    tumble::AppUI app(argc > 1 ? argv[1] : "");
    return app.run();
}
