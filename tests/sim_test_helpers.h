#pragma once
// sim_test_helpers.h
// Deterministic randomness and small board builders shared by the simulation tests.

#include "sim/RandomSource.h"
#include "sim/RoundController.h"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mz2d::testing {

// Replays a fixed list of picks (clamped to the requested range), then repeats the last one.
class ScriptedRandom final : public sim::RandomSource {
public:
    explicit ScriptedRandom(std::vector<std::size_t> picks = {0}) : picks_(std::move(picks)) {}

    std::size_t pick(std::size_t count) override {
        std::size_t v = picks_.empty() ? 0 : picks_[std::min(next_, picks_.size() - 1)];
        if (next_ < picks_.size()) ++next_;
        ++calls_;
        return count == 0 ? 0 : v % count;
    }

    std::size_t calls() const { return calls_; }

private:
    std::vector<std::size_t> picks_;
    std::size_t next_{0};
    std::size_t calls_{0};
};

inline sim::LevelLayout makeLayout(std::vector<std::string> rows, sim::Cell player, std::vector<sim::Cell> ghosts) {
    sim::LevelLayout layout;
    layout.rows = std::move(rows);
    layout.playerSpawn = player;
    for (const auto& g : ghosts) {
        layout.ghosts.push_back(sim::GhostSpawn{ g, Color{255, 0, 0, 255} });
    }
    return layout;
}

inline std::unique_ptr<sim::RoundController> makeRound(const sim::LevelLayout& layout,
                                                       const sim::Tuning& tuning = {},
                                                       std::vector<std::size_t> picks = {0}) {
    return sim::RoundController::create(tuning, layout, std::make_unique<ScriptedRandom>(std::move(picks)));
}

inline void runTicks(sim::RoundController& rc, int n) {
    for (int i = 0; i < n; ++i) rc.tick();
}

} // namespace mz2d::testing
