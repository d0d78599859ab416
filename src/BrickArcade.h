#ifndef BRICKARCADE_H
#define BRICKARCADE_H

#include <memory>
#include <string>
#include <vector>

#include <json/json.h>

#include "BrickArcadeGame.h"
#include "BrickScores.h"
#include "BrickTicks.h"

/**
 * The cabinet: owns one instance of every configured game, the shared
 * high-score file and the tick scheduler, and routes buttons to whichever
 * game is on screen. With no game selected the arcade sits in its menu.
 *
 * config:
 *   { "options": { "High Score File": "high-scores.json" },
 *     "games": [ { "name": "Snake", "options": { "Seed": "42" } }, ... ] }
 */
class BrickArcade {
public:
    BrickArcade(Json::Value &config, GridSurface *surface);
    ~BrickArcade() = default;

    bool selectGame(const std::string &name);
    void returnToMenu();

    void button(const std::string &button);
    void tick();

    BrickArcadeGame *activeGame() const { return current; }
    BrickArcadeGame *game(const std::string &name) const;
    std::vector<std::string> gameNames() const;
    TickScheduler &scheduler() { return ticks; }
    HighScoreStore &scores() { return highScores; }

private:
    std::unique_ptr<BrickArcadeGame> createGame(Json::Value &row);

    GridSurface *surface;
    TickScheduler ticks;
    HighScoreStore highScores;
    std::vector<std::unique_ptr<BrickArcadeGame>> games;
    BrickArcadeGame *current = nullptr;
};

#endif
