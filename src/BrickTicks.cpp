#include "BrickTicks.h"
#include "BrickGrid.h"

#include <cmath>

int64_t actionDivisor(double rate) {
    if (rate <= 0.0) {
        return 0;
    }
    int64_t d = std::llround(static_cast<double>(TICKS_PER_SECOND) / rate);
    return d < 1 ? 1 : d;
}

bool isActionTick(uint64_t tick, double rate) {
    if (rate <= 0.0) {
        return false;
    }
    return tick % static_cast<uint64_t>(actionDivisor(rate)) == 0;
}

int TickScheduler::frameMs() const {
    return FRAME_MS;
}
