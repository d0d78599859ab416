#include "BrickSnake.h"
#include "BrickTicks.h"

#include <algorithm>
#include <unordered_set>

#include <spdlog/spdlog.h>

BrickSnake::BrickSnake(Json::Value &config, GridSurface *surface, HighScoreStore *scores)
    : BrickArcadeGame(config, surface, scores) {
    reset();
}

const std::string &BrickSnake::getName() const {
    static const std::string name = "Snake";
    return name;
}

void BrickSnake::initEntities() {
    direction = Direction::Down;
    keyEnabled = false;
    accelerating = false;
    currentSpeed = BASE_SPEED;

    EntityGroup &segments = entities(EntityKind::Body);
    for (auto &p : {Position(4, 5), Position(4, 4), Position(4, 3)}) {
        segments.push_back(ctx.makeCell(p));
    }
    entities(EntityKind::Food).push_back(ctx.makeBlinkingCell(Position(0, 0)));
    respawnFood();
}

void BrickSnake::handleInput(GameKey key, bool press) {
    BrickArcadeGame::handleInput(key, press);
    if (!isRunning() || (isPaused() && press)) {
        return;
    }

    if (key == GameKey::Accelerate) {
        accelerating = press;
        currentSpeed = press ? BASE_SPEED * 2 : BASE_SPEED;
        return;
    }
    if (!press || !keyEnabled) {
        return;
    }

    Direction wanted = Direction::None;
    switch (key) {
        case GameKey::Up:
            wanted = Direction::Up;
            break;
        case GameKey::Down:
            wanted = Direction::Down;
            break;
        case GameKey::Left:
            wanted = Direction::Left;
            break;
        case GameKey::Right:
            wanted = Direction::Right;
            break;
        default:
            return;
    }
    const EntityGroup &segments = group(EntityKind::Body);
    if (segments.size() > 1 &&
        segments[0]->position() + directionStep(wanted) == segments[1]->position()) {
        // would turn back into the neck
        return;
    }
    direction = wanted;
    keyEnabled = false;
}

void BrickSnake::manageRound(uint64_t counter) {
    if (isActionTick(counter, currentSpeed)) {
        step();
        keyEnabled = true;
    }
}

void BrickSnake::step() {
    EntityGroup &segments = entities(EntityKind::Body);
    if (segments.empty()) {
        return;
    }
    size_t length = segments.size();
    Position head = segments.front()->position() + directionStep(direction);
    segments.insert(segments.begin(), ctx.makeCell(head));

    if (head == food()) {
        addScore(growthPoints(length));
        respawnFood();
        spdlog::debug("[Snake] ate at ({}, {}), length={}", head.col, head.row, segments.size());
    } else {
        segments.pop_back();
    }
}

int BrickSnake::growthPoints(size_t n) const {
    if (3 < n && n <= 25) {
        return 15;
    } else if (25 < n && n <= 50) {
        return 45;
    } else if (50 < n && n <= 100) {
        return 100;
    } else if (100 < n && n < static_cast<size_t>(GRID_CELLS)) {
        return 250;
    }
    return 0;
}

void BrickSnake::respawnFood() {
    EntityGroup &f = entities(EntityKind::Food);
    const EntityGroup &segments = group(EntityKind::Body);
    if (f.empty() || segments.size() >= static_cast<size_t>(GRID_CELLS)) {
        return;
    }
    std::unordered_set<Position, PositionHash> taken;
    for (auto &s : segments) {
        taken.insert(s->position());
    }
    Position p;
    do {
        p = Position(ctx.randomInt(0, GRID_COLS - 1), ctx.randomInt(0, GRID_ROWS - 1));
    } while (taken.count(p));
    f.front()->setPosition(p);
}

bool BrickSnake::checkVictory() const {
    return group(EntityKind::Body).size() >= static_cast<size_t>(GRID_CELLS);
}

bool BrickSnake::checkDefeat() const {
    const EntityGroup &segments = group(EntityKind::Body);
    if (segments.empty()) {
        return false;
    }
    const Position &head = segments.front()->position();
    if (!insideGrid(head)) {
        return true;
    }
    return std::any_of(segments.begin() + 1, segments.end(), [&](const EntityPtr &s) {
        return s->position() == head;
    });
}

std::vector<Position> BrickSnake::body() const {
    std::vector<Position> out;
    for (auto &s : group(EntityKind::Body)) {
        out.push_back(s->position());
    }
    return out;
}

Position BrickSnake::food() const {
    const EntityGroup &f = group(EntityKind::Food);
    if (f.empty()) {
        return Position(-1, -1);
    }
    return f.front()->position();
}

void BrickSnake::setBody(const std::vector<Position> &positions, Direction d) {
    EntityGroup &segments = entities(EntityKind::Body);
    segments.clear();
    for (auto &p : positions) {
        segments.push_back(ctx.makeCell(p));
    }
    direction = d;
}

void BrickSnake::placeFood(const Position &pos) {
    EntityGroup &f = entities(EntityKind::Food);
    if (f.empty()) {
        f.push_back(ctx.makeBlinkingCell(pos));
    } else {
        f.front()->setPosition(pos);
    }
}
