// Projects the simulation onto the 5x5 LED matrix.
//
// Each display cell covers one fifth of the interior fluid domain on each
// axis; row 0 is the top row of the physical matrix. Frames are computed
// wholly from the current state and returned by value, so the same state
// always yields the same frame and nothing leaks from one frame to the next.
#pragma once
#include <array>
#include <cstdint>
#include "vec2.h"

struct SimulationState;

struct DisplayFrame {
    static constexpr int kWidth = 5;
    static constexpr int kHeight = 5;

    std::array<uint8_t, kWidth * kHeight> cells{};

    uint8_t at(int col, int row) const { return cells[col + kWidth * row]; }
    uint8_t& at(int col, int row) { return cells[col + kWidth * row]; }
    bool operator==(const DisplayFrame& o) const { return cells == o.cells; }
    bool operator!=(const DisplayFrame& o) const { return cells != o.cells; }
};

enum class RenderMode {
    Occupancy,  // any particle lights the cell at full intensity
    Density,    // particle count, saturating at particlesForFull
    FluidCells  // fraction of Fluid grid cells under the display cell
};

struct RenderSettings {
    RenderMode mode = RenderMode::Occupancy;
    uint8_t maxIntensity = 9; // micro:bit brightness levels 0..9
    int particlesForFull = 3;
};

class MatrixRenderer {
public:
    static DisplayFrame project(const SimulationState& state, const RenderSettings& rs = {});

    // Display cell containing a world position (clamped onto the matrix).
    // Returns false for non-finite positions.
    static bool displayCellOf(const SimulationState& state, const Vec2& pos, int& col, int& row);
    // World-space rectangle covered by a display cell.
    static void displayCellRegion(const SimulationState& state, int col, int row, Vec2& minPt, Vec2& maxPt);

private:
    static uint8_t quantize(float fraction, uint8_t maxIntensity);
    static void projectParticles(const SimulationState& state, const RenderSettings& rs, DisplayFrame& frame);
    static void projectFluidCells(const SimulationState& state, const RenderSettings& rs, DisplayFrame& frame);
};
