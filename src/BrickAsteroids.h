#ifndef BRICKASTEROIDS_H
#define BRICKASTEROIDS_H

#include <vector>

#include "BrickArcadeGame.h"

class BrickAsteroids : public BrickArcadeGame {
public:
    static constexpr double ASTEROID_SPEED = 2.0;
    static constexpr double SHOOTER_SPEED = 10.0;
    static constexpr uint64_t RAMP_TICKS = 180 * TICKS_PER_SECOND;

    BrickAsteroids(Json::Value &config, GridSurface *surface, HighScoreStore *scores = nullptr);
    ~BrickAsteroids() override = default;

    const std::string &getName() const override;
    void handleInput(GameKey key, bool press) override;

    // Chance for each column to spawn an asteroid, growing from 0.30 to
    // 0.45 over the first three minutes of play.
    static double spawnProbability(uint64_t gameTicks);
    static double bombSpawnRate(uint64_t gameTicks);

    uint64_t gameTicks() const { return elapsed; }
    Position shooter() const;
    std::vector<Position> asteroids() const;
    bool bombsEnabled() const { return useBombs; }

    void addAsteroid(const Position &pos);
    void launchBomb(int col);
    void fire();
    int checkHit();
    void moveAsteroids();

protected:
    void initEntities() override;
    void manageRound(uint64_t counter) override;
    bool checkVictory() const override;
    bool checkDefeat() const override;
    double rateFor(EntityKind kind) const override;

private:
    void dropOffscreenBullets();
    void moveShooter();
    void trySpawnBomb();

    uint64_t elapsed = 0;
    Direction shooterDirection = Direction::None;
    bool useBombs = true;
};

#endif
