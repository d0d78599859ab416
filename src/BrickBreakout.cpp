#include "BrickBreakout.h"
#include "BrickTicks.h"

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>

// '#' is a brick. Rows below the last string stay empty.
static const std::vector<std::vector<std::string>> LEVEL_LAYOUTS = {
    {   // Level 1: frame with a solid core
        "##########",
        "#........#",
        "#........#",
        "#..####..#",
        "#..####..#",
        "#..####..#",
        "#..####..#",
        "#........#",
        "#........#",
        "##########",
    },
    {   // Level 2: hourglass
        "##......##",
        "###....###",
        ".###..###.",
        "..######..",
        ".###..###.",
        "###....###",
        "##......##",
    },
    {   // Level 3: ladder
        "##########",
        "#...##...#",
        "##########",
        "#...##...#",
        "##########",
        "#...##...#",
        "##########",
    },
};

static const Position BALL_START(4, GRID_ROWS - 2);

BrickBreakout::BrickBreakout(Json::Value &config, GridSurface *surface, HighScoreStore *scores)
    : BrickArcadeGame(config, surface, scores) {
    reset();
}

const std::string &BrickBreakout::getName() const {
    static const std::string name = "Breakout";
    return name;
}

void BrickBreakout::initEntities() {
    currentLevel = 1;
    paddleSize = std::clamp(optionInt("Paddle Size", 3), 1, GRID_COLS);
    paddleDirection = Direction::None;
    accelerating = false;
    launchRequested = false;
    currentSpeed = BASE_SPEED;

    loadLevel(currentLevel);
    spawnBallAndPaddle();
}

void BrickBreakout::loadLevel(int lvl) {
    bricks.clear();
    EntityGroup &targets = entities(EntityKind::Target);
    targets.clear();
    if (lvl < 1 || lvl > (int)LEVEL_LAYOUTS.size()) {
        return;
    }
    const auto &layout = LEVEL_LAYOUTS[lvl - 1];
    for (int row = 0; row < (int)layout.size(); row++) {
        for (int col = 0; col < (int)layout[row].size() && col < GRID_COLS; col++) {
            if (layout[row][col] == '#') {
                Position p(col, row);
                EntityPtr brick = ctx.makeCell(p);
                bricks[p] = brick;
                targets.push_back(brick);
            }
        }
    }
    spdlog::debug("[Breakout] level {} loaded with {} bricks", lvl, bricks.size());
}

void BrickBreakout::spawnBallAndPaddle() {
    EntityGroup &b = entities(EntityKind::Ball);
    EntityGroup &pad = entities(EntityKind::Paddle);
    b.clear();
    pad.clear();

    EntityPtr ballCell = ctx.makeCell(BALL_START);
    b.push_back(ballCell);

    int start = std::clamp(BALL_START.col - paddleSize / 2, 0, GRID_COLS - paddleSize);
    for (int i = 0; i < paddleSize; i++) {
        pad.push_back(ctx.makeCell(Position(start + i, GRID_ROWS - 1)));
    }
    // The ball rides on the paddle until it is launched.
    pad.push_back(ballCell);

    attached = true;
    dragging = false;
    velocity = Position(0, 0);
    displacement = Position(0, 0);
}

void BrickBreakout::handleInput(GameKey key, bool press) {
    BrickArcadeGame::handleInput(key, press);
    // Releases are applied even while paused.
    if (!isRunning() || (isPaused() && press)) {
        return;
    }

    switch (key) {
        case GameKey::Left:
            if (press) {
                paddleDirection = Direction::Left;
            } else if (paddleDirection == Direction::Left) {
                paddleDirection = Direction::None;
            }
            break;
        case GameKey::Right:
            if (press) {
                paddleDirection = Direction::Right;
            } else if (paddleDirection == Direction::Right) {
                paddleDirection = Direction::None;
            }
            break;
        case GameKey::Accelerate:
            accelerating = press;
            currentSpeed = press ? BASE_SPEED * 2 : BASE_SPEED;
            break;
        case GameKey::Confirm:
            if (press && attached) {
                launchRequested = true;
            }
            break;
        default:
            break;
    }
}

void BrickBreakout::manageRound(uint64_t counter) {
    if (!isActionTick(counter, currentSpeed)) {
        return;
    }
    EntityGroup &b = entities(EntityKind::Ball);
    if (b.empty()) {
        return;
    }
    b.front()->setPosition(b.front()->position() + displacement);

    if (scoreAndAdvance(checkHit())) {
        return;
    }
    checkBorderReflect();

    // A border bounce can put the ball straight against another brick.
    if (scoreAndAdvance(checkHit())) {
        return;
    }

    checkPaddleDrag();
    checkPaddleReflect();
    checkBorderReflect();
    movePaddle();
}

int BrickBreakout::checkHit() {
    int a = velocity.col;
    int b = velocity.row;
    int destroyed = 0;
    if (a != 0 || b != 0) {
        Position p = ball();
        Position side(p.col + a, p.row);
        Position front(p.col, p.row + b);
        Position corner(p.col + a, p.row + b);

        if (hasBrick(side) && hasBrick(front)) {
            velocity = Position(-a, -b);
            removeBrick(side);
            removeBrick(front);
            destroyed = 2;
            if (hasBrick(corner)) {
                removeBrick(corner);
                destroyed++;
            }
        } else if (hasBrick(side)) {
            velocity = Position(-a, b);
            removeBrick(side);
            destroyed = 1;
        } else if (hasBrick(front)) {
            velocity = Position(a, -b);
            removeBrick(front);
            destroyed = 1;
        } else if (hasBrick(corner)) {
            velocity = Position(-a, -b);
            removeBrick(corner);
            destroyed = 1;
        }
    }
    displacement = velocity;
    return destroyed;
}

void BrickBreakout::checkBorderReflect() {
    Position p = ball();
    if ((p.col == 0 && velocity.col == -1) || (p.col == GRID_COLS - 1 && velocity.col == 1)) {
        velocity.col = -velocity.col;
    }
    if (p.row == 0 && velocity.row == -1) {
        velocity.row = 1;
    }
    if (!dragging) {
        displacement = velocity;
    }
}

void BrickBreakout::checkPaddleDrag() {
    Position p = ball();
    Position below(p.col, p.row + velocity.row);
    if (!isPaddleCell(below)) {
        displacement = velocity;
        return;
    }
    // Caught from above: the ball rides with the paddle for one step.
    displacement = Position(0, 0);
    dragging = !dragging;
    EntityGroup &pad = entities(EntityKind::Paddle);
    if (dragging) {
        pad.push_back(entities(EntityKind::Ball).front());
    } else if ((int)pad.size() > paddleSize) {
        pad.pop_back();
    }
}

void BrickBreakout::checkPaddleReflect() {
    if (dragging) {
        return;
    }
    Position p = ball();
    Position below(p.col, p.row + velocity.row);
    Position corner(p.col + velocity.col, p.row + velocity.row);
    if (!isPaddleCell(below) && !isPaddleCell(corner)) {
        return;
    }
    const EntityGroup &pad = group(EntityKind::Paddle);
    const Position &leftEnd = pad.front()->position();
    const Position &rightEnd = pad[paddleSize - 1]->position();

    velocity.row = -1;
    if (below == leftEnd || corner == leftEnd) {
        velocity.col = -1;
    } else if (below == rightEnd || corner == rightEnd) {
        velocity.col = 1;
    }
    displacement = velocity;
}

void BrickBreakout::movePaddle() {
    EntityGroup &pad = entities(EntityKind::Paddle);
    if (pad.empty()) {
        return;
    }
    Position step = directionStep(paddleDirection);
    int left = pad.front()->position().col + step.col;
    if (step.col != 0 && left >= 0 && left <= GRID_COLS - paddleSize) {
        for (auto &cell : pad) {
            cell->setPosition(cell->position() + step);
        }
    }

    if (attached && (launchRequested || accelerating)) {
        attached = false;
        if ((int)pad.size() > paddleSize) {
            pad.pop_back();
        }
        velocity = Position(1, -1);
        displacement = velocity;
        spdlog::debug("[Breakout] ball launched from ({}, {})", ball().col, ball().row);
    }
    launchRequested = false;
}

bool BrickBreakout::scoreAndAdvance(int destroyed) {
    if (destroyed > 0) {
        addScore(destroyed * brickPoints());
    }
    if (!bricks.empty()) {
        return false;
    }
    spdlog::info("[Breakout] Stage {} cleared", currentLevel);
    currentLevel++;
    addScore(3000 + 3000 * (currentLevel - 1));
    if (currentLevel <= LAST_LEVEL) {
        loadLevel(currentLevel);
        spawnBallAndPaddle();
    }
    return true;
}

int BrickBreakout::brickPoints() const {
    switch (currentLevel) {
        case 1:
            return 15;
        case 2:
            return 20;
        default:
            return 30;
    }
}

void BrickBreakout::removeBrick(const Position &p) {
    auto it = bricks.find(p);
    if (it == bricks.end()) {
        return;
    }
    eraseEntities(entities(EntityKind::Target), {it->second});
    bricks.erase(it);
}

bool BrickBreakout::isPaddleCell(const Position &p) const {
    const EntityGroup &pad = group(EntityKind::Paddle);
    for (int i = 0; i < paddleSize && i < (int)pad.size(); i++) {
        if (pad[i]->position() == p) {
            return true;
        }
    }
    return false;
}

bool BrickBreakout::checkVictory() const {
    return currentLevel > LAST_LEVEL;
}

bool BrickBreakout::checkDefeat() const {
    return ball().row > GRID_ROWS - 1;
}

Position BrickBreakout::ball() const {
    const EntityGroup &b = group(EntityKind::Ball);
    if (b.empty()) {
        return BALL_START;
    }
    return b.front()->position();
}

std::vector<Position> BrickBreakout::paddle() const {
    std::vector<Position> out;
    const EntityGroup &pad = group(EntityKind::Paddle);
    for (int i = 0; i < paddleSize && i < (int)pad.size(); i++) {
        out.push_back(pad[i]->position());
    }
    return out;
}

void BrickBreakout::setBall(const Position &pos, const Position &v) {
    EntityGroup &pad = entities(EntityKind::Paddle);
    if ((int)pad.size() > paddleSize) {
        pad.pop_back();
    }
    attached = false;
    dragging = false;
    EntityGroup &b = entities(EntityKind::Ball);
    if (b.empty()) {
        b.push_back(ctx.makeCell(pos));
    } else {
        b.front()->setPosition(pos);
    }
    velocity = v;
    displacement = v;
}

void BrickBreakout::setBricks(const std::vector<Position> &positions) {
    bricks.clear();
    EntityGroup &targets = entities(EntityKind::Target);
    targets.clear();
    for (auto &p : positions) {
        EntityPtr brick = ctx.makeCell(p);
        bricks[p] = brick;
        targets.push_back(brick);
    }
}
