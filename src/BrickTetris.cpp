#include "BrickTetris.h"
#include "BrickTicks.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <unordered_set>

#include <spdlog/spdlog.h>

const std::string BrickTetris::SHAPES = "TJLSZIO";

struct RotationState {
    int next;
    std::array<Position, 4> cells;  // offsets from the anchor
};

// Rotation ids start at 1; entry k describes rotation k + 1.
static const std::map<char, std::vector<RotationState>> ROTATIONS = {
    {'T', {
        {2, {{{-1, 0}, {0, 0}, {1, 0}, {0, -1}}}},
        {3, {{{-1, 0}, {0, 0}, {0, -1}, {0, 1}}}},
        {4, {{{-1, 0}, {0, 0}, {1, 0}, {0, 1}}}},
        {1, {{{0, -1}, {0, 0}, {1, 0}, {0, 1}}}},
    }},
    {'J', {
        {2, {{{-1, -1}, {-1, 0}, {0, 0}, {1, 0}}}},
        {3, {{{0, -1}, {0, 0}, {0, 1}, {-1, 1}}}},
        {4, {{{-1, -1}, {0, -1}, {1, -1}, {1, 0}}}},
        {1, {{{-1, -1}, {0, -1}, {-1, 0}, {-1, 1}}}},
    }},
    {'L', {
        {2, {{{-1, 0}, {0, 0}, {1, 0}, {1, -1}}}},
        {3, {{{-1, -1}, {0, -1}, {0, 0}, {0, 1}}}},
        {4, {{{-1, 0}, {-1, -1}, {0, -1}, {1, -1}}}},
        {1, {{{-1, -1}, {-1, 0}, {-1, 1}, {0, 1}}}},
    }},
    {'S', {
        {2, {{{-1, 0}, {0, 0}, {0, -1}, {1, -1}}}},
        {1, {{{0, 1}, {0, 0}, {-1, 0}, {-1, -1}}}},
    }},
    {'Z', {
        {2, {{{-1, -1}, {0, -1}, {0, 0}, {1, 0}}}},
        {1, {{{0, -1}, {0, 0}, {-1, 0}, {-1, 1}}}},
    }},
    {'I', {
        {2, {{{-1, 0}, {0, 0}, {1, 0}, {2, 0}}}},
        {1, {{{0, -1}, {0, 0}, {0, 1}, {0, 2}}}},
    }},
    {'O', {
        {1, {{{0, 0}, {0, 1}, {1, 0}, {1, 1}}}},
    }},
};

static const Position SPAWN_ANCHOR(4, 0);
static const int LINE_BASE[] = {0, 2, 6, 12, 20};

static const RotationState *findRotation(char shape, int rot) {
    auto it = ROTATIONS.find(shape);
    if (it == ROTATIONS.end() || rot < 1 || rot > (int)it->second.size()) {
        return nullptr;
    }
    return &it->second[rot - 1];
}

std::vector<Position> BrickTetris::shapeCells(char shape, const Position &at, int rot) {
    std::vector<Position> cells;
    const RotationState *state = findRotation(shape, rot);
    if (state) {
        for (auto &offset : state->cells) {
            cells.push_back(at + offset);
        }
    }
    return cells;
}

int BrickTetris::nextRotation(char shape, int rot) {
    const RotationState *state = findRotation(shape, rot);
    return state ? state->next : rot;
}

BrickTetris::BrickTetris(Json::Value &config, GridSurface *surface, HighScoreStore *scores)
    : BrickArcadeGame(config, surface, scores) {
    reset();
}

const std::string &BrickTetris::getName() const {
    static const std::string name = "Tetris";
    return name;
}

void BrickTetris::initEntities() {
    elapsed = 0;
    currentSpeed = BASE_SPEED;
    held = Direction::None;
    upcoming = 0;
    stackHeight = 0;
    toppedOut = false;
    spawnPiece();
}

char BrickTetris::randomShape() {
    return SHAPES[ctx.randomInt(0, (int)SHAPES.size() - 1)];
}

void BrickTetris::spawnPiece() {
    active = upcoming ? upcoming : randomShape();
    upcoming = randomShape();
    swapLocked = false;
    placePiece(SPAWN_ANCHOR, 1);
    if (!isFree(piece())) {
        // No room left at the spawn point.
        toppedOut = true;
    }
    spdlog::debug("[Tetris] next piece: {}", upcoming);
}

void BrickTetris::placePiece(const Position &at, int rot) {
    pieceAnchor = at;
    rotationId = rot;
    height = GRID_ROWS - 1;
    std::vector<Position> cells = shapeCells(active, at, rot);
    EntityGroup &p = entities(EntityKind::Piece);
    if (p.size() != cells.size()) {
        p.clear();
        for (auto &c : cells) {
            p.push_back(ctx.makeCell(c));
        }
        return;
    }
    for (size_t i = 0; i < cells.size(); i++) {
        p[i]->setPosition(cells[i]);
    }
}

void BrickTetris::handleInput(GameKey key, bool press) {
    BrickArcadeGame::handleInput(key, press);
    // Releases are applied even while paused.
    if (!isRunning() || (isPaused() && press)) {
        return;
    }

    Direction d = Direction::None;
    switch (key) {
        case GameKey::Up:
            if (press) {
                rotate();
            }
            return;
        case GameKey::InstantDrop:
            if (press) {
                instantDrop();
            }
            return;
        case GameKey::HoldSwap:
            if (press) {
                holdSwap();
            }
            return;
        case GameKey::Down:
            d = Direction::Down;
            break;
        case GameKey::Left:
            d = Direction::Left;
            break;
        case GameKey::Right:
            d = Direction::Right;
            break;
        default:
            return;
    }
    if (press) {
        held = d;
    } else if (held == d) {
        held = Direction::None;
    }
}

void BrickTetris::manageRound(uint64_t counter) {
    elapsed++;

    if (isActionTick(counter, currentSpeed)) {
        movePiece(Direction::Down);
        // Uses the height measured before the move, so a piece that just
        // landed gets one more fall tick to slide.
        if (height == 0) {
            lockPiece();
        }
    }
    if (currentSpeed <= MAX_SPEED && elapsed % (30 * TICKS_PER_SECOND) == 0) {
        currentSpeed *= std::pow(10.0, 0.05);
        spdlog::debug("[Tetris] speed up to {:.2f}", currentSpeed);
    }
    if (isActionTick(counter, 7 + 3 * currentSpeed)) {
        movePiece(held);
    }
}

int BrickTetris::pieceHeight() {
    const EntityGroup &p = group(EntityKind::Piece);
    if (p.empty()) {
        return height;
    }
    // Lowest piece row for each column the piece spans, counted from row 0
    // for cells still above the grid.
    std::map<int, int> bottoms;
    for (auto &c : p) {
        const Position &pos = c->position();
        int row = std::max(0, pos.row);
        auto it = bottoms.find(pos.col);
        if (it == bottoms.end()) {
            bottoms[pos.col] = row;
        } else {
            it->second = std::max(it->second, row);
        }
    }
    int result = GRID_ROWS;
    for (auto &b : bottoms) {
        int gap = GRID_ROWS - 1 - b.second;
        for (auto &f : group(EntityKind::Fallen)) {
            const Position &fp = f->position();
            if (fp.col == b.first && fp.row > b.second) {
                gap = std::min(gap, fp.row - b.second - 1);
            }
        }
        result = std::min(result, gap);
    }
    height = result;
    return height;
}

bool BrickTetris::isFree(const std::vector<Position> &cells) const {
    std::unordered_set<Position, PositionHash> taken;
    for (auto &f : group(EntityKind::Fallen)) {
        taken.insert(f->position());
    }
    for (auto &c : cells) {
        if (c.col < 0 || c.col >= GRID_COLS || c.row >= GRID_ROWS || taken.count(c)) {
            return false;
        }
    }
    return true;
}

bool BrickTetris::movePiece(Direction d) {
    pieceHeight();
    if (d == Direction::None || d == Direction::Up) {
        return false;
    }
    Position step = directionStep(d);
    std::vector<Position> cells;
    for (auto &c : group(EntityKind::Piece)) {
        cells.push_back(c->position() + step);
    }
    if (cells.empty() || !isFree(cells)) {
        return false;
    }
    pieceAnchor = pieceAnchor + step;
    EntityGroup &p = entities(EntityKind::Piece);
    for (size_t i = 0; i < p.size(); i++) {
        p[i]->setPosition(cells[i]);
    }
    return true;
}

bool BrickTetris::rotate() {
    int next = nextRotation(active, rotationId);
    std::vector<Position> cells = shapeCells(active, pieceAnchor, next);
    if (cells.empty() || !isFree(cells)) {
        return false;
    }
    rotationId = next;
    EntityGroup &p = entities(EntityKind::Piece);
    for (size_t i = 0; i < p.size() && i < cells.size(); i++) {
        p[i]->setPosition(cells[i]);
    }
    return true;
}

void BrickTetris::instantDrop() {
    int drop = pieceHeight();
    if (drop > 0) {
        Position step(0, drop);
        pieceAnchor = pieceAnchor + step;
        for (auto &c : entities(EntityKind::Piece)) {
            c->setPosition(c->position() + step);
        }
    }
    lockPiece();
}

bool BrickTetris::holdSwap() {
    if (swapLocked || upcoming == 0 || !isFree(shapeCells(upcoming, SPAWN_ANCHOR, 1))) {
        return false;
    }
    std::swap(active, upcoming);
    placePiece(SPAWN_ANCHOR, 1);
    swapLocked = true;
    spdlog::debug("[Tetris] swapped to {}, next piece: {}", active, upcoming);
    return true;
}

void BrickTetris::lockPiece() {
    EntityGroup &p = entities(EntityKind::Piece);
    EntityGroup &f = entities(EntityKind::Fallen);
    std::unordered_set<Position, PositionHash> taken;
    for (auto &c : f) {
        taken.insert(c->position());
    }
    for (auto &c : p) {
        if (taken.insert(c->position()).second) {
            f.push_back(c);
        }
    }
    p.clear();

    int top = GRID_ROWS;
    for (auto &c : f) {
        top = std::min(top, c->position().row);
    }
    stackHeight = GRID_ROWS - top;

    int lines = removeFullLines();
    if (lines > 0) {
        addScore(linePoints(lines));
    }
    spawnPiece();
}

int BrickTetris::linePoints(int lines) const {
    if (lines < 1 || lines > 4) {
        return 0;
    }
    return (int)(LINE_BASE[lines] + currentSpeed * stackHeight) * 15;
}

int BrickTetris::removeFullLines() {
    EntityGroup &f = entities(EntityKind::Fallen);
    std::vector<int> full;
    for (int row = 0; row < GRID_ROWS; row++) {
        int n = (int)std::count_if(f.begin(), f.end(),
                                   [row](const EntityPtr &c) { return c->position().row == row; });
        if (n == GRID_COLS) {
            full.push_back(row);
        }
    }
    for (int row : full) {
        EntityGroup line;
        for (auto &c : f) {
            if (c->position().row == row) {
                line.push_back(c);
            }
        }
        eraseEntities(f, line);
        for (auto &c : f) {
            if (c->position().row < row) {
                c->setPosition(c->position() + directionStep(Direction::Down));
            }
        }
    }
    if (!full.empty()) {
        spdlog::debug("[Tetris] cleared {} line(s)", full.size());
    }
    return (int)full.size();
}

void BrickTetris::addFallen(const Position &pos) {
    entities(EntityKind::Fallen).push_back(ctx.makeCell(pos));
}

void BrickTetris::setPiece(char shape, const Position &at, int rot) {
    if (!findRotation(shape, rot)) {
        return;
    }
    active = shape;
    placePiece(at, rot);
}

bool BrickTetris::checkVictory() const {
    return false;
}

bool BrickTetris::checkDefeat() const {
    return toppedOut || stackHeight > GRID_ROWS;
}

std::vector<Position> BrickTetris::piece() const {
    std::vector<Position> out;
    for (auto &c : group(EntityKind::Piece)) {
        out.push_back(c->position());
    }
    return out;
}

std::vector<Position> BrickTetris::fallen() const {
    std::vector<Position> out;
    for (auto &c : group(EntityKind::Fallen)) {
        out.push_back(c->position());
    }
    return out;
}
