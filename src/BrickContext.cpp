#include "BrickContext.h"

#include <ctime>

SimulationContext::SimulationContext() {
    rng.seed((unsigned)time(nullptr) ^ (uintptr_t)this);
}

SimulationContext::SimulationContext(uint32_t s) {
    rng.seed(s);
}

EntityPtr SimulationContext::makeCell(const Position &pos, uint32_t color, Direction d) {
    return std::make_shared<Cell>(nextId++, pos, color, d);
}

EntityPtr SimulationContext::makeBlinkingCell(const Position &pos, Direction d) {
    return std::make_shared<BlinkingCell>(nextId++, pos, d);
}

int SimulationContext::randomInt(int lo, int hi) {
    std::uniform_int_distribution<int> d(lo, hi);
    return d(rng);
}

bool SimulationContext::chance(double p) {
    if (p <= 0.0) {
        return false;
    }
    if (p >= 1.0) {
        return true;
    }
    std::bernoulli_distribution d(p);
    return d(rng);
}
