#ifndef BRICKCELL_H
#define BRICKCELL_H

#include <cstdint>
#include <memory>
#include <vector>

#include "BrickGrid.h"

typedef uint32_t EntityId;

// Anything that lives on the grid. Games only talk to entities through
// this interface; the presentation layer correlates its own handles with id().
class GridEntity {
public:
    explicit GridEntity(EntityId i) : entityId(i) {}
    virtual ~GridEntity() = default;

    EntityId id() const { return entityId; }

    virtual const Position &position() const = 0;
    virtual Direction direction() const = 0;
    virtual const Position &displacement() const = 0;
    virtual uint32_t color() const = 0;

    virtual void update(uint64_t tick, double rate) = 0;
    virtual void setPosition(const Position &pos) = 0;
    virtual void setDirection(Direction d) = 0;

private:
    EntityId entityId;
};

typedef std::shared_ptr<GridEntity> EntityPtr;
typedef std::vector<EntityPtr> EntityGroup;

// Removes every member of `gone` from `group`, keeping the order of the rest.
void eraseEntities(EntityGroup &group, const EntityGroup &gone);

class Cell : public GridEntity {
public:
    Cell(EntityId i, const Position &pos, uint32_t c = LINE_COLOR, Direction d = Direction::None);
    ~Cell() override = default;

    const Position &position() const override { return pos; }
    Direction direction() const override { return dir; }
    const Position &displacement() const override { return pendingDisplacement; }
    uint32_t color() const override { return cellColor; }

    void update(uint64_t tick, double rate) override;
    void setPosition(const Position &p) override { pos = p; }
    void setDirection(Direction d) override;

private:
    Position pos;
    uint32_t cellColor;
    Direction dir = Direction::None;
    Position pendingDisplacement;
};

// A cell that alternates with a shaded copy of itself twice per second.
// Both halves always share position and direction.
class BlinkingCell : public GridEntity {
public:
    BlinkingCell(EntityId i, const Position &pos, Direction d = Direction::None);
    ~BlinkingCell() override = default;

    const Position &position() const override { return primary.position(); }
    Direction direction() const override { return primary.direction(); }
    const Position &displacement() const override { return primary.displacement(); }
    uint32_t color() const override { return active ? primary.color() : shade.color(); }

    void update(uint64_t tick, double rate) override;
    void setPosition(const Position &p) override;
    void setDirection(Direction d) override;

    bool isActive() const { return active; }
    const Cell &shadeCell() const { return shade; }

private:
    Cell primary;
    Cell shade;
    bool active = true;
};

#endif
