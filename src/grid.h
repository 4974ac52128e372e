// Staggered (MAC) grid for the LED-matrix FLIP/PIC solver.
//
// Layout, with h = cell spacing and cell (i,j) covering [i*h,(i+1)*h] x [j*h,(j+1)*h]:
//  - u(i,j) is the horizontal velocity on the left face of cell (i,j), at (i*h, (j+0.5)*h)
//  - v(i,j) is the vertical velocity on the bottom face of cell (i,j), at ((i+0.5)*h, j*h)
// The outermost ring of cells is solid for the lifetime of the grid, so the
// fluid domain is [h, (width-1)*h] x [h, (height-1)*h]. All storage is fixed-capacity.
#pragma once
#include <array>
#include <cstdint>
#include "vec2.h"
#include "sim_config.h"

class ParticleSet;

enum class CellType : uint8_t { Air = 0, Fluid = 1, Solid = 2 };

enum class Axis { X, Y };

class Grid {
public:
    Grid() = default;

    // Sizes the grid, zeroes every field and marks the boundary ring solid.
    // Returns false if the dimensions exceed the compile-time capacity.
    bool init(int width, int height, float spacing);

    // Zeroes velocities, splat accumulators and pressure; every non-solid cell
    // becomes Air. Solid tags and the pre-projection snapshot are untouched.
    void resetFields();
    // Marks every non-solid cell containing at least one particle as Fluid.
    void classifyFromParticles(const ParticleSet& particles);

    // Bilinear sample of one velocity component. Positions outside the grid
    // are clamped to the nearest valid sample location.
    float sampleVelocity(const Vec2& pos, Axis axis) const;
    // Same stencil, sampled from the snapshot taken by snapshotVelocities().
    float sampleSnapshotVelocity(const Vec2& pos, Axis axis) const;
    Vec2 sampleVelocity(const Vec2& pos) const;

    // Two-pass transfer: splat accumulates weighted momentum and weight per
    // face, normalize divides them. Faces that received no weight keep the
    // value they had before the splat.
    void splatVelocity(const Vec2& pos, float velocity, Axis axis);
    void normalizeVelocities();

    // Zero every face that touches a solid cell.
    void applySolidBoundaries();
    void snapshotVelocities();

    // Net outflow of cell (i,j); only meaningful for interior cells.
    float divergence(int i, int j) const;
    // Sum of |divergence| over Fluid cells.
    float totalFluidDivergence() const;

    int width() const { return width_; }
    int height() const { return height_; }
    float spacing() const { return h_; }
    Vec2 domainMin() const { return Vec2(h_, h_); }
    Vec2 domainMax() const { return Vec2((width_ - 1) * h_, (height_ - 1) * h_); }

    CellType cellType(int i, int j) const { return type_[idx(i,j)]; }
    bool isSolid(int i, int j) const { return type_[idx(i,j)] == CellType::Solid; }
    // 1 for cells that can carry flow, 0 for solids.
    float openness(int i, int j) const { return isSolid(i,j) ? 0.0f : 1.0f; }
    // Returns false for positions outside the grid.
    bool cellOf(const Vec2& pos, int& i, int& j) const;
    int fluidCellCount() const;

    float& u(int i, int j) { return u_[idx(i,j)]; }
    float& v(int i, int j) { return v_[idx(i,j)]; }
    float u(int i, int j) const { return u_[idx(i,j)]; }
    float v(int i, int j) const { return v_[idx(i,j)]; }
    float& pressure(int i, int j) { return p_[idx(i,j)]; }
    float pressure(int i, int j) const { return p_[idx(i,j)]; }
    // Direct classification override, used by tests to build solver setups.
    void setCellType(int i, int j, CellType t);

private:
    using Field = std::array<float, kMaxGridCells>;

    struct Stencil {
        int i0, j0;
        float fx, fy;
    };

    int width_{0}, height_{0};
    float h_{1.0f};

    Field u_{}, v_{}, uPrev_{}, vPrev_{};
    Field uAccum_{}, vAccum_{}, uW_{}, vW_{};
    Field p_{};
    std::array<CellType, kMaxGridCells> type_{};

    inline int idx(int i, int j) const { return i + width_ * j; }
    bool onRing(int i, int j) const { return i == 0 || i == width_ - 1 || j == 0 || j == height_ - 1; }
    Stencil stencilFor(const Vec2& pos, Axis axis) const;
    float sampleField(const Vec2& pos, Axis axis, const Field& u, const Field& v) const;
};
