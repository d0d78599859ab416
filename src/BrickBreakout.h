#ifndef BRICKBREAKOUT_H
#define BRICKBREAKOUT_H

#include <unordered_map>
#include <vector>

#include "BrickArcadeGame.h"

class BrickBreakout : public BrickArcadeGame {
public:
    static constexpr double BASE_SPEED = 20.0;
    static constexpr int LAST_LEVEL = 3;

    BrickBreakout(Json::Value &config, GridSurface *surface, HighScoreStore *scores = nullptr);
    ~BrickBreakout() override = default;

    const std::string &getName() const override;
    void handleInput(GameKey key, bool press) override;

    int level() const { return currentLevel; }
    Position ball() const;
    const Position &ballVelocity() const { return velocity; }
    std::vector<Position> paddle() const;
    bool isAttached() const { return attached; }
    bool isDragging() const { return dragging; }
    size_t bricksLeft() const { return bricks.size(); }
    bool hasBrick(const Position &p) const { return bricks.count(p) != 0; }

    // Scenario setup: a free ball at `pos` moving by `v`, and an arbitrary
    // brick layout replacing the current one.
    void setBall(const Position &pos, const Position &v);
    void setBricks(const std::vector<Position> &positions);

    // Brick collision around the ball. Reflects the ball and destroys the
    // bricks it touched; returns how many were destroyed (0 to 3).
    int checkHit();
    void checkBorderReflect();

protected:
    void initEntities() override;
    void manageRound(uint64_t counter) override;
    bool checkVictory() const override;
    bool checkDefeat() const override;

private:
    void loadLevel(int lvl);
    void spawnBallAndPaddle();
    void removeBrick(const Position &p);
    bool scoreAndAdvance(int destroyed);
    void checkPaddleDrag();
    void checkPaddleReflect();
    void movePaddle();
    bool isPaddleCell(const Position &p) const;
    int brickPoints() const;

    std::unordered_map<Position, EntityPtr, PositionHash> bricks;
    int currentLevel = 1;
    int paddleSize = 3;
    Position velocity;
    Position displacement;
    Direction paddleDirection = Direction::None;
    bool attached = true;
    bool dragging = false;
    bool accelerating = false;
    bool launchRequested = false;
};

#endif
