#include "sim/Layout.h"

namespace mz2d::sim {

const LevelLayout& defaultLayout() {
    static const LevelLayout layout = [](){
        LevelLayout l;
        l.rows = {
            "#######",
            "#..o..#",
            "#.###.#",
            "#.....#",
            "#o###o#",
            "#.....#",
            "#######",
        };
        l.playerSpawn = Cell{3, 3};
        l.ghosts.push_back(GhostSpawn{ Cell{3, 1}, Color{255, 105, 180, 255} });
        l.ghosts.push_back(GhostSpawn{ Cell{3, 5}, Color{0, 255, 255, 255} });
        return l;
    }();
    return layout;
}

} // namespace mz2d::sim
