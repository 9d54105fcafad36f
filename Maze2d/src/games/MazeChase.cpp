#include "games/MazeChase.h"
#include "services/logger/LogManager.h"
#include "mz2d/sim/status_codes.h"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace mz2d::games {

namespace {

constexpr Color kHudBackground{0, 0, 0, 255};
constexpr Color kPlayfield{0, 30, 80, 255};
constexpr Color kWall{0, 100, 255, 255};
constexpr Color kPellet{255, 255, 255, 255};
constexpr Color kPowerPellet{255, 140, 0, 255};
constexpr Color kGhostNormal{100, 100, 100, 255};
constexpr Color kGhostFrightened{0, 100, 255, 255};
constexpr Color kWinText{50, 220, 120, 255};
constexpr Color kLoseText{255, 60, 60, 255};

// Ticks run per frame at most, so a long stall does not freeze the window catching up.
constexpr int kMaxTicksPerFrame = 5;

} // namespace

MazeChase::MazeChase(sim::Tuning tuning) : tuning_(std::move(tuning)) {}

int MazeChase::preferredWidth(const sim::Tuning& tuning, const sim::LevelLayout& layout) {
    const int cols = layout.rows.empty() ? 0 : static_cast<int>(layout.rows.front().size());
    return cols * tuning.tileSize;
}

int MazeChase::preferredHeight(const sim::Tuning& tuning, const sim::LevelLayout& layout) {
    return static_cast<int>(layout.rows.size()) * tuning.tileSize + static_cast<int>(tuning.hudHeight);
}

void MazeChase::init(int width, int height) {
    width_ = width;
    height_ = height;
    accumulator_ = 0.0f;

    sim::StatusCode status = sim::StatusCode::OK;
    controller_ = sim::RoundController::create(tuning_, sim::defaultLayout(), nullptr, &status);
    if (!controller_) {
        logging::LogManager::error("maze-chase: could not start: {}", sim::to_string(status));
    }
}

void MazeChase::unload() {
    controller_.reset();
}

void MazeChase::pollInput() {
    sim::Direction intent = sim::Direction::Stop;
    bool pressed = false;
    if (IsKeyPressed(KEY_LEFT)) { intent = sim::Direction::Left; pressed = true; }
    if (IsKeyPressed(KEY_RIGHT)) { intent = sim::Direction::Right; pressed = true; }
    if (IsKeyPressed(KEY_UP)) { intent = sim::Direction::Up; pressed = true; }
    if (IsKeyPressed(KEY_DOWN)) { intent = sim::Direction::Down; pressed = true; }
    if (pressed) {
        (void)controller_->submitInput(intent); // GAME_OVER is expected while the end screen shows
    }
}

void MazeChase::update(float dt, int width, int height, bool acceptInput) {
    width_ = width;
    height_ = height;
    if (!controller_) return;

    if (acceptInput) {
        if (controller_->session().gameOver && IsKeyPressed(KEY_R)) {
            controller_->restartGame();
            accumulator_ = 0.0f;
            return;
        }
        pollInput();
    }

    const float step = 1.0f / static_cast<float>(std::max(1, tuning_.fps));
    accumulator_ = std::min(accumulator_ + dt, step * kMaxTicksPerFrame);
    while (accumulator_ >= step) {
        controller_->tick();
        accumulator_ -= step;
    }
}

void MazeChase::render(int width, int height) {
    if (!controller_) {
        ClearBackground(kHudBackground);
        DrawText("Maze failed to load", 16, 16, 22, RAYWHITE);
        return;
    }
    const sim::RenderSnapshot snap = controller_->snapshot();

    ClearBackground(kHudBackground);
    drawMaze(snap);
    if (!snap.gameOver) {
        drawActors(snap);
    } else {
        drawEndScreen(snap, width, height);
    }
    drawHud(snap, width);
}

void MazeChase::drawMaze(const sim::RenderSnapshot& snap) const {
    const int t = snap.tileSize;
    const int top = static_cast<int>(snap.hudHeight);
    DrawRectangle(0, top, snap.cols * t, snap.rows * t, kPlayfield);

    for (int r = 0; r < snap.rows; ++r) {
        for (int c = 0; c < snap.cols; ++c) {
            if (snap.kindAt(sim::Cell{c, r}) == sim::CellKind::Wall) {
                DrawRectangle(c * t, top + r * t, t, t, kWall);
            }
        }
    }

    for (const auto& p : snap.pellets) {
        Vector2 center{ p.col * t + t * 0.5f, top + p.row * t + t * 0.5f };
        DrawCircleV(center, static_cast<float>(std::max(4, t / 12)), kPellet);
    }

    const float pulse = 2.0f + std::trunc(2.0f * std::sin(static_cast<float>(GetTime()) * 1000.0f / 150.0f));
    for (const auto& p : snap.powerPellets) {
        Vector2 center{ p.col * t + t * 0.5f, top + p.row * t + t * 0.5f };
        DrawCircleV(center, static_cast<float>(std::max(8, t / 6)) + pulse, kPowerPellet);
    }
}

void MazeChase::drawActors(const sim::RenderSnapshot& snap) const {
    const int t = snap.tileSize;
    for (const auto& ghost : snap.ghosts) {
        switch (ghost.look) {
            case sim::ActorLook::GhostNormal:
                DrawCircleV(ghost.position, ghost.radius, kGhostNormal);
                break;
            case sim::ActorLook::GhostFrightened:
                DrawCircleV(ghost.position, ghost.radius, kGhostFrightened);
                break;
            case sim::ActorLook::GhostDead: {
                // eyes marker waiting at the respawn cell
                Vector2 home{ ghost.spawn.col * t + t * 0.5f, snap.hudHeight + ghost.spawn.row * t + t * 0.5f };
                DrawCircleV(home, t * 0.15f, RAYWHITE);
                break;
            }
            case sim::ActorLook::Player:
                break;
        }
    }
    DrawCircleV(snap.player.position, snap.player.radius, snap.player.color);
}

void MazeChase::drawHud(const sim::RenderSnapshot& snap, int width) const {
    DrawRectangle(0, 0, width, static_cast<int>(snap.hudHeight), kHudBackground);

    std::string scoreText = "Score: " + std::to_string(snap.score);
    DrawText(scoreText.c_str(), 16, 16, 28, RAYWHITE);

    std::string livesText = "Lives: " + std::to_string(std::max(0, snap.lives));
    int livesWidth = MeasureText(livesText.c_str(), 28);
    DrawText(livesText.c_str(), width - 16 - livesWidth, 16, 28, RAYWHITE);

    if (snap.powerActive) {
        std::string powerText = "Power: " + std::to_string(snap.powerSecondsRemaining) + "s";
        int w = MeasureText(powerText.c_str(), 28);
        DrawText(powerText.c_str(), width / 2 - w / 2, 16, 28, kPowerPellet);
    }
}

void MazeChase::drawEndScreen(const sim::RenderSnapshot& snap, int width, int height) const {
    const int top = static_cast<int>(snap.hudHeight);
    DrawRectangle(0, top, width, height - top, Color{0, 0, 0, 150});

    const char* msg = snap.win ? "YOU WIN!" : "GAME OVER";
    const Color color = snap.win ? kWinText : kLoseText;
    int w = MeasureText(msg, 40);
    DrawText(msg, width / 2 - w / 2, height / 2 - 40, 40, color);

    const char* sub = "Press R to Restart or ESC to Quit";
    int sw = MeasureText(sub, 20);
    DrawText(sub, width / 2 - sw / 2, height / 2 + 10, 20, RAYWHITE);
}

} // namespace mz2d::games
