#pragma once
#include "games/Game.h"
#include "sim/RoundController.h"
#include "sim/Tuning.h"
#include <raylib.h>
#include <memory>

namespace mz2d::games {

// Window-side wrapper around the simulation: feeds keyboard intents into the
// round controller, runs it at a fixed tick rate and draws its snapshots.
class MazeChase final : public Game {
public:
    explicit MazeChase(sim::Tuning tuning);
    ~MazeChase() override = default;

    const char* name() const override { return "Maze Chase"; }

    void init(int width, int height) override;
    void update(float dt, int width, int height, bool acceptInput) override;
    void render(int width, int height) override;
    void unload() override;

    bool ready() const { return controller_ != nullptr; }

    // Window size that fits the maze plus the HUD band.
    static int preferredWidth(const sim::Tuning& tuning, const sim::LevelLayout& layout);
    static int preferredHeight(const sim::Tuning& tuning, const sim::LevelLayout& layout);

private:
    void pollInput();
    void drawMaze(const sim::RenderSnapshot& snap) const;
    void drawActors(const sim::RenderSnapshot& snap) const;
    void drawHud(const sim::RenderSnapshot& snap, int width) const;
    void drawEndScreen(const sim::RenderSnapshot& snap, int width, int height) const;

    sim::Tuning tuning_;
    std::unique_ptr<sim::RoundController> controller_{};
    float accumulator_{0.0f};
    int width_{0};
    int height_{0};
};

} // namespace mz2d::games
