#ifndef BRICKTETRIS_H
#define BRICKTETRIS_H

#include <vector>

#include "BrickArcadeGame.h"

class BrickTetris : public BrickArcadeGame {
public:
    static constexpr double BASE_SPEED = 1.0;
    static constexpr double MAX_SPEED = 10.0;
    static const std::string SHAPES;

    BrickTetris(Json::Value &config, GridSurface *surface, HighScoreStore *scores = nullptr);
    ~BrickTetris() override = default;

    const std::string &getName() const override;
    void handleInput(GameKey key, bool press) override;

    char activeShape() const { return active; }
    char nextShape() const { return upcoming; }
    int rotation() const { return rotationId; }
    const Position &anchor() const { return pieceAnchor; }
    std::vector<Position> piece() const;
    std::vector<Position> fallen() const;
    int fallenHeight() const { return stackHeight; }
    uint64_t gameTicks() const { return elapsed; }

    // Rows the active piece can still fall before it rests on the floor or
    // the fallen set. Refreshed before every move attempt.
    int pieceHeight();

    bool movePiece(Direction d);
    bool rotate();
    void instantDrop();
    bool holdSwap();

    // Clears every full row, shifting whatever lies above it down by one.
    // Returns the number of rows cleared.
    int removeFullLines();

    // Scenario setup: put a block into the fallen set, or replace the
    // active piece.
    void addFallen(const Position &pos);
    void setPiece(char shape, const Position &at, int rot = 1);

    static std::vector<Position> shapeCells(char shape, const Position &at, int rot);
    static int nextRotation(char shape, int rot);

protected:
    void initEntities() override;
    void manageRound(uint64_t counter) override;
    bool checkVictory() const override;
    bool checkDefeat() const override;

private:
    char randomShape();
    void spawnPiece();
    void placePiece(const Position &at, int rot);
    bool isFree(const std::vector<Position> &cells) const;
    void lockPiece();
    int linePoints(int lines) const;

    Position pieceAnchor;
    int rotationId = 1;
    char active = 0;
    char upcoming = 0;
    bool swapLocked = false;
    Direction held = Direction::None;
    int height = GRID_ROWS - 1;
    int stackHeight = 0;
    bool toppedOut = false;
    uint64_t elapsed = 0;
};

#endif
