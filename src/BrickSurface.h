#ifndef BRICKSURFACE_H
#define BRICKSURFACE_H

#include <array>
#include <cstdint>
#include <string>

#include "BrickGrid.h"

// Whatever the host draws on. Games only ever address whole grid cells.
class GridSurface {
public:
    virtual ~GridSurface() = default;

    virtual void clearBuffer() = 0;
    virtual void setCell(int col, int row, uint32_t color) = 0;
    virtual void flushBuffer() = 0;
};

// In-memory 10x20 surface, used by the headless host.
class FrameBuffer : public GridSurface {
public:
    FrameBuffer();
    ~FrameBuffer() override = default;

    void clearBuffer() override;
    void setCell(int col, int row, uint32_t color) override;
    void flushBuffer() override { ++flushes; }

    uint32_t cell(int col, int row) const;
    int flushCount() const { return flushes; }
    int litCells() const;
    std::string toText() const;

private:
    std::array<uint32_t, GRID_CELLS> cells;
    int flushes = 0;
};

#endif
