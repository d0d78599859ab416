#ifndef BRICKTICKS_H
#define BRICKTICKS_H

#include <cstdint>

// Number of ticks between two actions of something that should happen
// `rate` times per second. Never less than 1.
int64_t actionDivisor(double rate);

// True on the ticks where an action running at `rate` per second fires.
bool isActionTick(uint64_t tick, double rate);

// One monotonically increasing counter for the whole simulation. Every
// periodic behavior is a divisibility test against it.
class TickScheduler {
public:
    TickScheduler() = default;

    uint64_t advance() { return ++counter; }
    uint64_t ticks() const { return counter; }
    bool isDue(double rate) const { return isActionTick(counter, rate); }
    int frameMs() const;
    void restart() { counter = 0; }

private:
    uint64_t counter = 0;
};

#endif
