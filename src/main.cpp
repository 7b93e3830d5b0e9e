// ========================= src/main.cpp =========================
#include "ui/App.hpp"
#include "log/Log.hpp"
#include <SDL.h>

int main(int argc, char* argv[]) {
    (void)argc; (void)argv;
    lp::logsys::init(spdlog::level::info, "lanepuzzle_maptool.log");
    lp::AppUI app;
    return app.run();
}
