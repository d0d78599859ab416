#include "BrickCell.h"
#include "BrickTicks.h"

#include <algorithm>

void eraseEntities(EntityGroup &group, const EntityGroup &gone) {
    if (gone.empty()) {
        return;
    }
    group.erase(std::remove_if(group.begin(), group.end(), [&](const EntityPtr &e) {
        return std::find(gone.begin(), gone.end(), e) != gone.end();
    }), group.end());
}

Cell::Cell(EntityId i, const Position &p, uint32_t c, Direction d)
    : GridEntity(i), pos(p), cellColor(c) {
    setDirection(d);
}

void Cell::update(uint64_t tick, double rate) {
    if (dir == Direction::None || rate <= 0.0) {
        return;
    }
    if (isActionTick(tick, rate)) {
        pos = pos + pendingDisplacement;
    }
}

void Cell::setDirection(Direction d) {
    dir = d;
    pendingDisplacement = directionStep(d);
}

BlinkingCell::BlinkingCell(EntityId i, const Position &pos, Direction d)
    : GridEntity(i), primary(i, pos, LINE_COLOR, d), shade(i, pos, SHADE_COLOR, d) {
}

void BlinkingCell::update(uint64_t tick, double rate) {
    if (tick > 0) {
        if (tick % TICKS_PER_SECOND == 0) {
            active = true;
        } else if (tick % TICKS_PER_SECOND == TICKS_PER_SECOND / 2) {
            active = false;
        }
    }
    shade.update(tick, rate);
    primary.update(tick, rate);
}

void BlinkingCell::setPosition(const Position &p) {
    shade.setPosition(p);
    primary.setPosition(p);
}

void BlinkingCell::setDirection(Direction d) {
    shade.setDirection(d);
    primary.setDirection(d);
}
