#include "BrickSurface.h"

FrameBuffer::FrameBuffer() {
    cells.fill(BACK_COLOR);
}

void FrameBuffer::clearBuffer() {
    cells.fill(BACK_COLOR);
}

void FrameBuffer::setCell(int col, int row, uint32_t color) {
    if (col < 0 || row < 0 || col >= GRID_COLS || row >= GRID_ROWS) {
        return;
    }
    cells[row * GRID_COLS + col] = color;
}

uint32_t FrameBuffer::cell(int col, int row) const {
    if (col < 0 || row < 0 || col >= GRID_COLS || row >= GRID_ROWS) {
        return BACK_COLOR;
    }
    return cells[row * GRID_COLS + col];
}

int FrameBuffer::litCells() const {
    int n = 0;
    for (auto c : cells) {
        if (c != BACK_COLOR) {
            n++;
        }
    }
    return n;
}

std::string FrameBuffer::toText() const {
    std::string frame;
    frame.reserve((GRID_COLS + 1) * GRID_ROWS);
    for (int r = 0; r < GRID_ROWS; r++) {
        for (int c = 0; c < GRID_COLS; c++) {
            uint32_t v = cells[r * GRID_COLS + c];
            if (v == BACK_COLOR) {
                frame += '.';
            } else if (v == LINE_COLOR) {
                frame += '#';
            } else {
                frame += '+';
            }
        }
        frame += '\n';
    }
    return frame;
}
