#ifndef BRICKSNAKE_H
#define BRICKSNAKE_H

#include <vector>

#include "BrickArcadeGame.h"

class BrickSnake : public BrickArcadeGame {
public:
    static constexpr double BASE_SPEED = 10.0;

    BrickSnake(Json::Value &config, GridSurface *surface, HighScoreStore *scores = nullptr);
    ~BrickSnake() override = default;

    const std::string &getName() const override;
    void handleInput(GameKey key, bool press) override;

    std::vector<Position> body() const;
    Position food() const;
    Direction heading() const { return direction; }

    // Scenario setup for hosts and tests: replace the body (head first),
    // the heading and the food position.
    void setBody(const std::vector<Position> &segments, Direction d);
    void placeFood(const Position &pos);

    // One movement step: new head, growth on food, tail drop otherwise.
    void step();

protected:
    void initEntities() override;
    void manageRound(uint64_t counter) override;
    bool checkVictory() const override;
    bool checkDefeat() const override;

private:
    void respawnFood();
    int growthPoints(size_t length) const;

    Direction direction = Direction::Down;
    bool keyEnabled = false;
    bool accelerating = false;
};

#endif
