#include "BrickAsteroids.h"
#include "BrickTicks.h"

#include <algorithm>

#include <spdlog/spdlog.h>

BrickAsteroids::BrickAsteroids(Json::Value &config, GridSurface *surface, HighScoreStore *scores)
    : BrickArcadeGame(config, surface, scores) {
    std::string bombs = findOption("Use Bombs", "1");
    useBombs = !(bombs == "0" || bombs == "false" || bombs == "off");
    reset();
}

const std::string &BrickAsteroids::getName() const {
    static const std::string name = "Asteroids";
    return name;
}

double BrickAsteroids::spawnProbability(uint64_t t) {
    if (t >= RAMP_TICKS) {
        return 0.45;
    }
    return 0.30 + 0.15 * (double)t / (double)RAMP_TICKS;
}

double BrickAsteroids::bombSpawnRate(uint64_t t) {
    return t < RAMP_TICKS ? 1.0 / 3000.0 : 1.0 / 2000.0;
}

void BrickAsteroids::initEntities() {
    elapsed = 0;
    shooterDirection = Direction::None;
    currentSpeed = ASTEROID_SPEED;
    entities(EntityKind::Shooter).push_back(ctx.makeCell(Position(4, GRID_ROWS - 1)));
}

double BrickAsteroids::rateFor(EntityKind kind) const {
    // Bullets climb one row every tick.
    if (kind == EntityKind::Bullet) {
        return TICKS_PER_SECOND;
    }
    return currentSpeed;
}

void BrickAsteroids::handleInput(GameKey key, bool press) {
    BrickArcadeGame::handleInput(key, press);
    if (!isRunning() || (isPaused() && press)) {
        return;
    }
    Direction d = Direction::None;
    if (key == GameKey::Left) {
        d = Direction::Left;
    } else if (key == GameKey::Right) {
        d = Direction::Right;
    } else {
        return;
    }
    if (press) {
        shooterDirection = d;
    } else if (shooterDirection == d) {
        shooterDirection = Direction::None;
    }
}

void BrickAsteroids::manageRound(uint64_t counter) {
    elapsed++;
    dropOffscreenBullets();

    int hits = checkHit();
    if (hits > 0) {
        addScore(5 * hits);
        spdlog::debug("[Asteroids] {} asteroids shot down", hits);
    }

    if (isActionTick(counter, ASTEROID_SPEED)) {
        moveAsteroids();
        EntityGroup &bombGroup = entities(EntityKind::Bomb);
        ctx.bombs.move(Direction::Up, bombGroup);
        ctx.bombs.checkExplosion(entities(EntityKind::Asteroid), bombGroup);
    }
    if (isActionTick(counter, SHOOTER_SPEED)) {
        fire();
        trySpawnBomb();
        moveShooter();
    }
}

void BrickAsteroids::dropOffscreenBullets() {
    EntityGroup &bullets = entities(EntityKind::Bullet);
    bullets.erase(std::remove_if(bullets.begin(), bullets.end(),
                                 [](const EntityPtr &b) { return b->position().row < 0; }),
                  bullets.end());
}

int BrickAsteroids::checkHit() {
    EntityGroup &rocks = entities(EntityKind::Asteroid);
    EntityGroup &bullets = entities(EntityKind::Bullet);
    EntityGroup spentBullets;
    EntityGroup destroyed;
    for (auto &bullet : bullets) {
        const Position &p = bullet->position();
        Position below(p.col, p.row + 1);
        bool hit = false;
        for (auto &rock : rocks) {
            const Position &r = rock->position();
            if ((r == p || r == below) &&
                std::find(destroyed.begin(), destroyed.end(), rock) == destroyed.end()) {
                destroyed.push_back(rock);
                hit = true;
            }
        }
        if (hit) {
            spentBullets.push_back(bullet);
        }
    }
    eraseEntities(bullets, spentBullets);
    eraseEntities(rocks, destroyed);
    return static_cast<int>(destroyed.size());
}

void BrickAsteroids::moveAsteroids() {
    EntityGroup &rocks = entities(EntityKind::Asteroid);
    for (auto &rock : rocks) {
        rock->setPosition(rock->position() + directionStep(Direction::Down));
    }
    double r = spawnProbability(elapsed);
    for (int col = 0; col < GRID_COLS; col++) {
        if (ctx.chance(r)) {
            rocks.push_back(ctx.makeCell(Position(col, 0)));
        }
    }
}

void BrickAsteroids::fire() {
    EntityGroup &s = entities(EntityKind::Shooter);
    if (s.empty()) {
        return;
    }
    entities(EntityKind::Bullet).push_back(ctx.makeCell(s.front()->position(), LINE_COLOR, Direction::Up));
}

void BrickAsteroids::moveShooter() {
    EntityGroup &s = entities(EntityKind::Shooter);
    if (s.empty()) {
        return;
    }
    Position next = s.front()->position() + directionStep(shooterDirection);
    if (next.col >= 0 && next.col < GRID_COLS) {
        s.front()->setPosition(next);
    }
}

void BrickAsteroids::trySpawnBomb() {
    if (!useBombs || !ctx.chance(bombSpawnRate(elapsed))) {
        return;
    }
    launchBomb(ctx.randomInt(0, GRID_COLS - BombField::SIZE));
}

void BrickAsteroids::launchBomb(int col) {
    ctx.bombs.spawn(ctx, Position(col, GRID_ROWS - 1), entities(EntityKind::Bomb));
}

bool BrickAsteroids::checkVictory() const {
    return false;
}

bool BrickAsteroids::checkDefeat() const {
    const EntityGroup &rocks = group(EntityKind::Asteroid);
    Position s = shooter();
    int lowest = 1;
    for (auto &rock : rocks) {
        if (rock->position() == s) {
            return true;
        }
        lowest = std::max(lowest, rock->position().row);
    }
    return lowest >= GRID_ROWS;
}

Position BrickAsteroids::shooter() const {
    const EntityGroup &s = group(EntityKind::Shooter);
    if (s.empty()) {
        return Position(4, GRID_ROWS - 1);
    }
    return s.front()->position();
}

std::vector<Position> BrickAsteroids::asteroids() const {
    std::vector<Position> out;
    for (auto &rock : group(EntityKind::Asteroid)) {
        out.push_back(rock->position());
    }
    return out;
}

void BrickAsteroids::addAsteroid(const Position &pos) {
    entities(EntityKind::Asteroid).push_back(ctx.makeCell(pos));
}
