#include "raylib.h"
#include "games/MazeChase.h"
#include "services/configuration/ConfigurationManager.h"
#include "services/logger/LogManager.h"
#include "sim/Layout.h"
#include "sim/Tuning.h"

using mz2d::ConfigurationManager;
using mz2d::logging::LogManager;

int main(void)
{
    const bool loaded = ConfigurationManager::load();

    mz2d::logging::Config logCfg;
    logCfg.level = mz2d::logging::parse_level(ConfigurationManager::getString("logging.level", "info"))
                       .value_or(mz2d::logging::Level::info);
    logCfg.pattern = ConfigurationManager::getString("logging.pattern", logCfg.pattern);
    if (LogManager::init(logCfg) == mz2d::logging::Status::already_initialized) {
        (void)LogManager::reconfigure(logCfg);
    }
    if (!loaded) {
        LogManager::info("no usable config.json, running with defaults");
    }

    mz2d::sim::Tuning tuning = mz2d::sim::Tuning::fromConfiguration();
    const int width = mz2d::games::MazeChase::preferredWidth(tuning, mz2d::sim::defaultLayout());
    const int height = mz2d::games::MazeChase::preferredHeight(tuning, mz2d::sim::defaultLayout());

    mz2d::games::MazeChase game(tuning);
    InitWindow(width, height, game.name());
    SetTargetFPS(tuning.fps);

    game.init(width, height);
    if (!game.ready()) {
        CloseWindow();
        LogManager::shutdown();
        return 1;
    }

    while (!WindowShouldClose())
    {
        game.update(GetFrameTime(), width, height, true);

        BeginDrawing();
        game.render(width, height);
        EndDrawing();
    }

    game.unload();
    CloseWindow();
    LogManager::shutdown();
    return 0;
}
