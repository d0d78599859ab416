#ifndef BRICKARCADEGAME_H
#define BRICKARCADEGAME_H

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

#include <json/json.h>

#include "BrickCell.h"
#include "BrickContext.h"
#include "BrickSurface.h"

class HighScoreStore;

enum class GameKey {
    Unknown,
    Up,
    Down,
    Left,
    Right,
    Confirm,
    Accelerate,
    HoldSwap,
    InstantDrop,
    Pause,
    Reset,
    Menu
};

enum class GameOutcome { None, Victory, Defeat };

// What an entity is for. Drawing only cares about the entity itself, the
// game rules look entities up by kind.
enum class EntityKind {
    Body,
    Food,
    Target,
    Ball,
    Paddle,
    Asteroid,
    Bullet,
    Shooter,
    Bomb,
    Piece,
    Fallen
};

class MissingSurfaceError : public std::runtime_error {
public:
    explicit MissingSurfaceError(const std::string &game)
        : std::runtime_error(game + ": a drawing surface is required") {}
};

// "Left - Pressed", "Left - Released" or a bare "Fire" (a press).
// Returns false for buttons no game knows about.
bool parseButton(const std::string &button, GameKey &key, bool &press);

/**
 * Lifecycle shared by every game on the 10x20 grid.
 *
 *   Initializing -> Running <-> Paused -> Victory | Defeat -> reset()
 *
 * Each scheduler tick the host calls tick(), which advances every entity
 * and then lets the game apply its rules through manageRound(). A round
 * ends as soon as checkVictory() or checkDefeat() reports it; the entity
 * groups are torn down and the game stays idle until reset().
 */
class BrickArcadeGame {
public:
    static constexpr int MAX_SCORE = 99999999;

    BrickArcadeGame(Json::Value &config, GridSurface *surface, HighScoreStore *scores = nullptr);
    virtual ~BrickArcadeGame() = default;

    virtual const std::string &getName() const = 0;

    void button(const std::string &button);
    virtual void handleInput(GameKey key, bool press);

    void tick(uint64_t counter);
    void updateEntities(uint64_t counter);
    void manage(uint64_t counter);
    void reset();

    bool isRunning() const { return running; }
    bool isPaused() const { return paused; }
    GameOutcome outcome() const { return result; }
    int currentScore() const { return score; }
    int highestScore() const { return highest; }
    double speed() const { return currentSpeed; }

    const EntityGroup &group(EntityKind kind) const;
    size_t entityCount() const;
    SimulationContext &context() { return ctx; }

    void CopyToModel();
    std::string findOption(const std::string &name, const std::string &def) const;

protected:
    virtual void initEntities() = 0;
    virtual void manageRound(uint64_t counter) = 0;
    virtual bool checkVictory() const = 0;
    virtual bool checkDefeat() const = 0;
    virtual double rateFor(EntityKind kind) const;

    void addScore(int points);
    void updateScore();
    void endRound(GameOutcome o);
    EntityGroup &entities(EntityKind kind);
    int optionInt(const std::string &name, int def) const;

    SimulationContext ctx;
    double currentSpeed = 1.0;
    int score = 0;

private:
    void clearEntities();

    Json::Value config;
    GridSurface *surface;
    HighScoreStore *scores;
    std::map<EntityKind, EntityGroup> groups;
    int highest = 0;
    bool paused = false;
    bool running = true;
    GameOutcome result = GameOutcome::None;
};

#endif
