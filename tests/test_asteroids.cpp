#include "BrickAsteroids.h"
#include "BrickSurface.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <vector>

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static bool has(const std::vector<Position> &cells, const Position &p) {
    return std::find(cells.begin(), cells.end(), p) != cells.end();
}

int main() {
    printf("=== asteroids test suite ===\n");

    // --- Difficulty ramp ---
    {
        const uint64_t ramp = BrickAsteroids::RAMP_TICKS;
        assert(ramp == 180u * TICKS_PER_SECOND);
        assert(near(BrickAsteroids::spawnProbability(0), 0.30));
        assert(near(BrickAsteroids::spawnProbability(ramp / 2), 0.375));
        assert(near(BrickAsteroids::spawnProbability(ramp), 0.45));
        assert(near(BrickAsteroids::spawnProbability(ramp * 10), 0.45));
        double last = 0.0;
        for (uint64_t t = 0; t <= ramp + 100; t += 97) {
            double p = BrickAsteroids::spawnProbability(t);
            assert(p >= last);
            assert(p >= 0.30 && p <= 0.45);
            last = p;
        }
        assert(near(BrickAsteroids::bombSpawnRate(0), 1.0 / 3000.0));
        assert(near(BrickAsteroids::bombSpawnRate(ramp), 1.0 / 2000.0));
        printf("  [OK] Difficulty ramp\n");
    }

    // --- Initial state ---
    {
        Json::Value config;
        FrameBuffer fb;
        BrickAsteroids game(config, &fb);
        assert(game.shooter() == Position(4, 19));
        assert(game.asteroids().empty());
        assert(game.entityCount() == 1);
        assert(game.speed() == BrickAsteroids::ASTEROID_SPEED);
        assert(game.gameTicks() == 0);
        assert(game.bombsEnabled());

        Json::Value off;
        off["options"]["Use Bombs"] = "0";
        BrickAsteroids quiet(off, &fb);
        assert(!quiet.bombsEnabled());
        printf("  [OK] Initial state\n");
    }

    // --- A bullet takes out what sits on it and just below it ---
    {
        Json::Value config;
        FrameBuffer fb;
        BrickAsteroids game(config, &fb);
        game.fire();
        assert(game.group(EntityKind::Bullet).size() == 1);
        game.updateEntities(1);
        game.updateEntities(2);
        assert(game.group(EntityKind::Bullet).front()->position() == Position(4, 17));
        game.addAsteroid(Position(4, 17));
        game.addAsteroid(Position(4, 18));
        game.addAsteroid(Position(5, 17));
        assert(game.checkHit() == 2);
        assert(game.group(EntityKind::Bullet).empty());
        std::vector<Position> left = game.asteroids();
        assert(left.size() == 1 && left[0] == Position(5, 17));
        assert(game.checkHit() == 0);
        printf("  [OK] Bullet hit\n");
    }

    // --- Hits score five points each ---
    {
        Json::Value config;
        FrameBuffer fb;
        BrickAsteroids game(config, &fb);
        game.fire();
        game.updateEntities(1);
        game.updateEntities(2);
        game.addAsteroid(Position(4, 16));
        game.tick(3);
        assert(game.currentScore() == 5);
        assert(game.asteroids().empty());
        assert(game.gameTicks() == 1);
        printf("  [OK] Scoring\n");
    }

    // --- Bullets leave through the top ---
    {
        Json::Value config;
        FrameBuffer fb;
        BrickAsteroids game(config, &fb);
        game.fire();
        for (uint64_t t = 1; t <= 20; t++) {
            game.updateEntities(t);
        }
        assert(game.group(EntityKind::Bullet).front()->position().row == -1);
        game.tick(21);
        assert(game.group(EntityKind::Bullet).empty());
        printf("  [OK] Bullets despawn\n");
    }

    // --- Asteroid rows shift down and a new row appears on top ---
    {
        Json::Value config;
        config["options"]["Seed"] = "5";
        FrameBuffer fb;
        BrickAsteroids game(config, &fb);
        game.addAsteroid(Position(0, 0));
        game.moveAsteroids();
        std::vector<Position> rocks = game.asteroids();
        assert(rocks[0] == Position(0, 1));
        for (size_t i = 1; i < rocks.size(); i++) {
            assert(rocks[i].row == 0);
        }
        printf("  [OK] Asteroid field\n");
    }

    // --- The shooter fires and walks, staying on the grid ---
    {
        Json::Value config;
        FrameBuffer fb;
        BrickAsteroids game(config, &fb);
        game.button("Right - Pressed");
        for (uint64_t t = 1; t <= 6; t++) {
            game.tick(t);
        }
        assert(game.shooter() == Position(5, 19));
        assert(game.group(EntityKind::Bullet).size() == 1);
        assert(game.group(EntityKind::Bullet).front()->position() == Position(4, 19));
        for (uint64_t t = 7; t <= 30; t++) {
            game.tick(t);
        }
        assert(game.shooter() == Position(9, 19));
        game.button("Right - Released");
        game.button("Left - Pressed");
        game.tick(36);
        assert(game.shooter() == Position(8, 19));
        printf("  [OK] Shooter\n");
    }

    // --- A release during a pause stops the shooter ---
    {
        Json::Value config;
        config["options"]["Use Bombs"] = "off";
        FrameBuffer fb;
        BrickAsteroids game(config, &fb);
        game.button("Right - Pressed");
        game.button("Start - Pressed");
        game.button("Right - Released");
        game.button("Start - Pressed");
        for (uint64_t t = 1; t <= 6; t++) {
            game.tick(t);
        }
        assert(game.shooter() == Position(4, 19));
        printf("  [OK] Release while paused\n");
    }

    // --- Bombs rise and clear the asteroids around them ---
    {
        Json::Value config;
        config["options"]["Seed"] = "9";
        FrameBuffer fb;
        BrickAsteroids game(config, &fb);
        game.launchBomb(2);
        assert(game.group(EntityKind::Bomb).size() == 16);
        assert(game.context().bombs.size() == 1);
        game.addAsteroid(Position(3, 17));
        game.addAsteroid(Position(9, 5));
        game.tick(31);
        assert(game.context().bombs.empty());
        assert(game.group(EntityKind::Bomb).empty());
        std::vector<Position> rocks = game.asteroids();
        assert(!has(rocks, Position(3, 18)));
        assert(has(rocks, Position(9, 6)));
        assert(game.isRunning());
        printf("  [OK] Bombs\n");
    }

    // --- Defeat ---
    {
        Json::Value config;
        FrameBuffer fb;
        BrickAsteroids crash(config, &fb);
        crash.addAsteroid(Position(4, 19));
        crash.tick(1);
        assert(crash.outcome() == GameOutcome::Defeat);

        BrickAsteroids floor(config, &fb);
        floor.addAsteroid(Position(0, 20));
        floor.tick(1);
        assert(floor.outcome() == GameOutcome::Defeat);

        BrickAsteroids fine(config, &fb);
        fine.tick(1);
        assert(fine.isRunning());
        printf("  [OK] Defeat\n");
    }

    // --- Endless until the field wins ---
    {
        Json::Value config;
        config["options"]["Seed"] = "21";
        config["options"]["Use Bombs"] = "0";
        FrameBuffer fb;
        BrickAsteroids game(config, &fb);
        uint64_t t = 1;
        for (; t < 20000 && game.isRunning(); t++) {
            game.tick(t);
            assert(game.currentScore() % 5 == 0);
            assert(game.group(EntityKind::Bomb).empty());
        }
        assert(game.outcome() == GameOutcome::Defeat);
        printf("  [OK] Endless play\n");
    }

    // --- Reset ---
    {
        Json::Value config;
        FrameBuffer fb;
        BrickAsteroids game(config, &fb);
        game.button("Left - Pressed");
        for (uint64_t t = 1; t <= 62; t++) {
            game.tick(t);
        }
        game.reset();
        size_t n = game.entityCount();
        Position s = game.shooter();
        game.reset();
        assert(game.entityCount() == n && n == 1);
        assert(game.shooter() == s && s == Position(4, 19));
        assert(game.gameTicks() == 0);
        printf("  [OK] Reset\n");
    }

    printf("\n=== All tests passed ===\n");
    return 0;
}
