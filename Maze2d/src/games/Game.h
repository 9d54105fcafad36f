#pragma once

namespace mz2d::games {

class Game {
public:
    virtual ~Game() = default;

    virtual const char* name() const = 0;

    virtual void init(int width, int height) = 0;
    virtual void update(float dt, int width, int height, bool acceptInput) = 0;
    virtual void render(int width, int height) = 0;
    virtual void unload() = 0;
};

} // namespace mz2d::games
