#ifndef BRICKCONTEXT_H
#define BRICKCONTEXT_H

#include <cstdint>
#include <random>

#include "BrickBomb.h"
#include "BrickCell.h"

// Everything a running game shares between its sub-systems: the live bomb
// registry, the id allocator and the random engine. One per game instance.
class SimulationContext {
public:
    SimulationContext();
    explicit SimulationContext(uint32_t seed);

    EntityPtr makeCell(const Position &pos, uint32_t color = LINE_COLOR,
                       Direction d = Direction::None);
    EntityPtr makeBlinkingCell(const Position &pos, Direction d = Direction::None);

    void seed(uint32_t s) { rng.seed(s); }
    int randomInt(int lo, int hi);
    bool chance(double p);

    EntityId lastId() const { return nextId - 1; }

    BombField bombs;
    std::mt19937 rng;

private:
    EntityId nextId = 1;
};

#endif
