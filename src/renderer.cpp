#include "renderer.h"
#include "simulation.h"
#include <algorithm>
#include <cmath>

bool MatrixRenderer::displayCellOf(const SimulationState& state, const Vec2& pos, int& col, int& row) {
    if (!isFinite(pos)) return false;
    const Vec2 lo = state.grid.domainMin();
    const Vec2 hi = state.grid.domainMax();
    float fx = (pos.x - lo.x) / (hi.x - lo.x) * DisplayFrame::kWidth;
    float fy = (pos.y - lo.y) / (hi.y - lo.y) * DisplayFrame::kHeight;
    col = (int)clampf(std::floor(fx), 0.0f, (float)(DisplayFrame::kWidth - 1));
    int rowFromBottom = (int)clampf(std::floor(fy), 0.0f, (float)(DisplayFrame::kHeight - 1));
    row = DisplayFrame::kHeight - 1 - rowFromBottom;
    return true;
}

void MatrixRenderer::displayCellRegion(const SimulationState& state, int col, int row, Vec2& minPt, Vec2& maxPt) {
    const Vec2 lo = state.grid.domainMin();
    const Vec2 hi = state.grid.domainMax();
    float cw = (hi.x - lo.x) / DisplayFrame::kWidth;
    float ch = (hi.y - lo.y) / DisplayFrame::kHeight;
    int rowFromBottom = DisplayFrame::kHeight - 1 - row;
    minPt = Vec2(lo.x + col * cw, lo.y + rowFromBottom * ch);
    maxPt = Vec2(minPt.x + cw, minPt.y + ch);
}

uint8_t MatrixRenderer::quantize(float fraction, uint8_t maxIntensity) {
    float f = clampf(fraction, 0.0f, 1.0f);
    return (uint8_t)std::lround(f * (float)maxIntensity);
}

DisplayFrame MatrixRenderer::project(const SimulationState& state, const RenderSettings& rs) {
    DisplayFrame frame;
    if (state.grid.width() < 3 || state.grid.height() < 3) return frame;
    if (rs.mode == RenderMode::FluidCells) projectFluidCells(state, rs, frame);
    else projectParticles(state, rs, frame);
    return frame;
}

void MatrixRenderer::projectParticles(const SimulationState& state, const RenderSettings& rs, DisplayFrame& frame) {
    std::array<int, DisplayFrame::kWidth * DisplayFrame::kHeight> counts{};
    for (const auto& prt : state.particles) {
        int col, row;
        if (!displayCellOf(state, prt.p, col, row)) continue;
        counts[col + DisplayFrame::kWidth * row]++;
    }
    const int full = std::max(1, rs.particlesForFull);
    for (size_t c = 0; c < counts.size(); ++c) {
        if (rs.mode == RenderMode::Occupancy) {
            frame.cells[c] = counts[c] > 0 ? rs.maxIntensity : 0;
        } else {
            frame.cells[c] = quantize((float)counts[c] / (float)full, rs.maxIntensity);
        }
    }
}

void MatrixRenderer::projectFluidCells(const SimulationState& state, const RenderSettings& rs, DisplayFrame& frame) {
    const Grid& grid = state.grid;
    const float h = grid.spacing();
    std::array<int, DisplayFrame::kWidth * DisplayFrame::kHeight> fluid{};
    std::array<int, DisplayFrame::kWidth * DisplayFrame::kHeight> total{};
    for (int j = 1; j < grid.height() - 1; ++j) {
        for (int i = 1; i < grid.width() - 1; ++i) {
            int col, row;
            if (!displayCellOf(state, Vec2((i + 0.5f) * h, (j + 0.5f) * h), col, row)) continue;
            int c = col + DisplayFrame::kWidth * row;
            total[c]++;
            if (grid.cellType(i, j) == CellType::Fluid) fluid[c]++;
        }
    }
    for (int row = 0; row < DisplayFrame::kHeight; ++row) {
        for (int col = 0; col < DisplayFrame::kWidth; ++col) {
            int c = col + DisplayFrame::kWidth * row;
            if (total[c] > 0) {
                frame.cells[c] = quantize((float)fluid[c] / (float)total[c], rs.maxIntensity);
                continue;
            }
            // Grid coarser than the matrix: sample the grid cell under the display cell center
            Vec2 a, b;
            displayCellRegion(state, col, row, a, b);
            int i, j;
            bool isFluid = grid.cellOf((a + b) * 0.5f, i, j) && grid.cellType(i, j) == CellType::Fluid;
            frame.cells[c] = isFluid ? rs.maxIntensity : 0;
        }
    }
}
