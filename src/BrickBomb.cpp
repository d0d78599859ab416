#include "BrickBomb.h"
#include "BrickContext.h"

#include <spdlog/spdlog.h>

bool Bomb::covers(const Position &p) const {
    const Position &a = anchor();
    return a.col <= p.col && p.col <= a.col + BombField::SIZE - 1 &&
           a.row <= p.row && p.row <= a.row + BombField::SIZE - 1;
}

bool Bomb::inBlast(const Position &p) const {
    const Position &a = anchor();
    int lo = -BombField::BLAST;
    int hi = BombField::SIZE - 1 + BombField::BLAST;
    return a.col + lo <= p.col && p.col <= a.col + hi &&
           a.row + lo <= p.row && p.row <= a.row + hi;
}

const Bomb &BombField::spawn(SimulationContext &ctx, const Position &anchor, EntityGroup &group) {
    int i = anchor.col;
    int j = anchor.row;
    Bomb bomb;
    bomb.members = {
        ctx.makeBlinkingCell(Position(i, j)),
        ctx.makeBlinkingCell(Position(i, j + 3)),
        ctx.makeBlinkingCell(Position(i + 3, j)),
        ctx.makeBlinkingCell(Position(i + 3, j + 3)),
        ctx.makeCell(Position(i + 1, j + 1)),
        ctx.makeCell(Position(i + 1, j + 2)),
        ctx.makeCell(Position(i + 2, j + 1)),
        ctx.makeCell(Position(i + 2, j + 2)),
        ctx.makeCell(Position(i, j + 1), SHADE_COLOR),
        ctx.makeCell(Position(i, j + 2), SHADE_COLOR),
        ctx.makeCell(Position(i + 3, j + 1), SHADE_COLOR),
        ctx.makeCell(Position(i + 3, j + 2), SHADE_COLOR),
        ctx.makeCell(Position(i + 1, j), SHADE_COLOR),
        ctx.makeCell(Position(i + 2, j), SHADE_COLOR),
        ctx.makeCell(Position(i + 1, j + 3), SHADE_COLOR),
        ctx.makeCell(Position(i + 2, j + 3), SHADE_COLOR),
    };
    group.insert(group.end(), bomb.members.begin(), bomb.members.end());
    bombs.push_back(std::move(bomb));
    spdlog::debug("[Bomb] spawned at ({}, {}), live={}", i, j, bombs.size());
    return bombs.back();
}

void BombField::move(Direction d, EntityGroup &group) {
    Position step = directionStep(d);
    for (size_t idx = bombs.size(); idx-- > 0;) {
        for (auto &m : bombs[idx].members) {
            m->setPosition(m->position() + step);
        }
        int row = bombs[idx].anchor().row;
        if ((d == Direction::Up && row < 0) ||
            (d == Direction::Down && row >= GRID_ROWS - SIZE + 1)) {
            spdlog::debug("[Bomb] left the grid at row {}", row);
            release(idx, group);
        }
    }
}

std::vector<size_t> BombField::findExplosions(const EntityGroup &targets) const {
    std::vector<size_t> hits;
    for (size_t idx = 0; idx < bombs.size(); idx++) {
        for (auto &t : targets) {
            if (bombs[idx].covers(t->position())) {
                hits.push_back(idx);
                break;
            }
        }
    }
    return hits;
}

int BombField::explode(EntityGroup &targets, size_t index, EntityGroup &group) {
    if (index >= bombs.size()) {
        return 0;
    }
    EntityGroup hit;
    for (auto &t : targets) {
        if (bombs[index].inBlast(t->position())) {
            hit.push_back(t);
        }
    }
    eraseEntities(targets, hit);
    spdlog::debug("[Bomb] exploded at ({}, {}), targets destroyed={}",
                  bombs[index].anchor().col, bombs[index].anchor().row, hit.size());
    release(index, group);
    return static_cast<int>(hit.size());
}

bool BombField::checkExplosion(EntityGroup &targets, EntityGroup &group) {
    if (targets.empty()) {
        return false;
    }
    std::vector<size_t> hits = findExplosions(targets);
    for (auto it = hits.rbegin(); it != hits.rend(); ++it) {
        explode(targets, *it, group);
    }
    return !hits.empty();
}

std::vector<Position> BombField::footprint(size_t index) const {
    std::vector<Position> cells;
    for (auto &m : bombs.at(index).members) {
        cells.push_back(m->position());
    }
    return cells;
}

void BombField::release(size_t index, EntityGroup &group) {
    eraseEntities(group, bombs[index].members);
    bombs.erase(bombs.begin() + index);
}
