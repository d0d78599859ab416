#ifndef BRICKBOMB_H
#define BRICKBOMB_H

#include <vector>

#include "BrickCell.h"

class SimulationContext;

// A rigid 4x4 cluster shaped like a sea mine: blinking corners, a solid
// 2x2 core and shaded edges. members[0] is the top-left corner.
struct Bomb {
    EntityGroup members;

    const Position &anchor() const { return members.front()->position(); }
    bool covers(const Position &p) const;
    bool inBlast(const Position &p) const;
};

// Registry of live bombs. Owned by a SimulationContext; the drawable members
// also live in the group passed in by the owning game.
class BombField {
public:
    static constexpr int SIZE = 4;
    static constexpr int BLAST = 2;

    BombField() = default;

    const Bomb &spawn(SimulationContext &ctx, const Position &anchor, EntityGroup &group);
    void move(Direction d, EntityGroup &group);

    std::vector<size_t> findExplosions(const EntityGroup &targets) const;
    int explode(EntityGroup &targets, size_t index, EntityGroup &group);
    bool checkExplosion(EntityGroup &targets, EntityGroup &group);

    std::vector<Position> footprint(size_t index) const;
    size_t size() const { return bombs.size(); }
    bool empty() const { return bombs.empty(); }
    const Bomb &at(size_t index) const { return bombs.at(index); }
    void clear() { bombs.clear(); }

private:
    void release(size_t index, EntityGroup &group);

    std::vector<Bomb> bombs;
};

#endif
