#ifndef BRICKGRID_H
#define BRICKGRID_H

#include <cstddef>
#include <cstdint>
#include <functional>

constexpr int GRID_COLS = 10;
constexpr int GRID_ROWS = 20;
constexpr int GRID_CELLS = GRID_COLS * GRID_ROWS;

constexpr int FRAME_MS = 16;
constexpr int TICKS_PER_SECOND = 1000 / FRAME_MS;  // ~60 Hz

constexpr uint32_t LINE_COLOR = 0x000000;
constexpr uint32_t SHADE_COLOR = 0x61705B;
constexpr uint32_t BACK_COLOR = 0x6D785C;

struct Position {
    int col = 0;
    int row = 0;

    Position() = default;
    Position(int c, int r) : col(c), row(r) {}

    Position operator+(const Position &o) const { return Position(col + o.col, row + o.row); }
    bool operator==(const Position &o) const { return col == o.col && row == o.row; }
    bool operator!=(const Position &o) const { return !(*this == o); }
    bool operator<(const Position &o) const {
        return row < o.row || (row == o.row && col < o.col);
    }
};

struct PositionHash {
    size_t operator()(const Position &p) const {
        return std::hash<int>()(p.col) ^ (std::hash<int>()(p.row) << 8);
    }
};

enum class Direction { None, Up, Down, Left, Right };

inline Position directionStep(Direction d) {
    switch (d) {
        case Direction::Up:
            return Position(0, -1);
        case Direction::Down:
            return Position(0, 1);
        case Direction::Left:
            return Position(-1, 0);
        case Direction::Right:
            return Position(1, 0);
        case Direction::None:
        default:
            return Position(0, 0);
    }
}

inline bool insideGrid(const Position &p) {
    return p.col >= 0 && p.col < GRID_COLS && p.row >= 0 && p.row < GRID_ROWS;
}

#endif
