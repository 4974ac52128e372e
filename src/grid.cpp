#include "grid.h"
#include "particle_set.h"
#include <algorithm>

bool Grid::init(int width, int height, float spacing) {
    if (width < 3 || height < 3 || width > kMaxGridWidth || height > kMaxGridHeight) return false;
    if (!(spacing > 0.0f)) return false;
    width_ = width;
    height_ = height;
    h_ = spacing;

    u_.fill(0.0f); v_.fill(0.0f);
    uPrev_.fill(0.0f); vPrev_.fill(0.0f);
    resetFields();
    return true;
}

void Grid::resetFields() {
    const int n = width_ * height_;
    std::fill(u_.begin(), u_.begin() + n, 0.0f);
    std::fill(v_.begin(), v_.begin() + n, 0.0f);
    std::fill(uAccum_.begin(), uAccum_.begin() + n, 0.0f);
    std::fill(vAccum_.begin(), vAccum_.begin() + n, 0.0f);
    std::fill(uW_.begin(), uW_.begin() + n, 0.0f);
    std::fill(vW_.begin(), vW_.begin() + n, 0.0f);
    std::fill(p_.begin(), p_.begin() + n, 0.0f);
    // Solid ring: 0th and last column and row
    for (int j = 0; j < height_; ++j)
        for (int i = 0; i < width_; ++i)
            type_[idx(i,j)] = onRing(i,j) ? CellType::Solid : CellType::Air;
}

bool Grid::cellOf(const Vec2& pos, int& i, int& j) const {
    if (!isFinite(pos)) return false;
    float gx = std::floor(pos.x / h_);
    float gy = std::floor(pos.y / h_);
    if (gx < 0.0f || gy < 0.0f || gx >= (float)width_ || gy >= (float)height_) return false;
    i = (int)gx; j = (int)gy;
    return true;
}

void Grid::classifyFromParticles(const ParticleSet& particles) {
    for (const auto& prt : particles) {
        int i, j;
        if (!cellOf(prt.p, i, j)) continue;
        if (type_[idx(i,j)] != CellType::Solid) type_[idx(i,j)] = CellType::Fluid;
    }
}

void Grid::setCellType(int i, int j, CellType t) {
    type_[idx(i,j)] = t;
}

int Grid::fluidCellCount() const {
    int n = 0;
    for (int c = 0; c < width_ * height_; ++c) if (type_[c] == CellType::Fluid) ++n;
    return n;
}

Grid::Stencil Grid::stencilFor(const Vec2& pos, Axis axis) const {
    // U samples sit at (i*h, (j+0.5)*h), V samples at ((i+0.5)*h, j*h)
    float x = pos.x / h_;
    float y = pos.y / h_;
    if (axis == Axis::X) y -= 0.5f; else x -= 0.5f;
    if (!std::isfinite(x)) x = 0.0f;
    if (!std::isfinite(y)) y = 0.0f;
    x = clampf(x, 0.0f, (float)(width_ - 1));
    y = clampf(y, 0.0f, (float)(height_ - 1));
    Stencil s;
    s.i0 = std::min((int)std::floor(x), width_ - 2);
    s.j0 = std::min((int)std::floor(y), height_ - 2);
    s.fx = x - (float)s.i0;
    s.fy = y - (float)s.j0;
    return s;
}

float Grid::sampleField(const Vec2& pos, Axis axis, const Field& u, const Field& v) const {
    const Field& f = (axis == Axis::X) ? u : v;
    Stencil s = stencilFor(pos, axis);
    float val = 0.0f;
    for (int dj = 0; dj <= 1; ++dj) for (int di = 0; di <= 1; ++di) {
        float w = (di ? s.fx : 1.0f - s.fx) * (dj ? s.fy : 1.0f - s.fy);
        val += f[idx(s.i0 + di, s.j0 + dj)] * w;
    }
    return val;
}

float Grid::sampleVelocity(const Vec2& pos, Axis axis) const {
    return sampleField(pos, axis, u_, v_);
}

float Grid::sampleSnapshotVelocity(const Vec2& pos, Axis axis) const {
    return sampleField(pos, axis, uPrev_, vPrev_);
}

Vec2 Grid::sampleVelocity(const Vec2& pos) const {
    return Vec2(sampleVelocity(pos, Axis::X), sampleVelocity(pos, Axis::Y));
}

void Grid::splatVelocity(const Vec2& pos, float velocity, Axis axis) {
    Field& acc = (axis == Axis::X) ? uAccum_ : vAccum_;
    Field& wsum = (axis == Axis::X) ? uW_ : vW_;
    Stencil s = stencilFor(pos, axis);
    for (int dj = 0; dj <= 1; ++dj) for (int di = 0; di <= 1; ++di) {
        float w = (di ? s.fx : 1.0f - s.fx) * (dj ? s.fy : 1.0f - s.fy);
        int c = idx(s.i0 + di, s.j0 + dj);
        acc[c] += velocity * w;
        wsum[c] += w;
    }
}

void Grid::normalizeVelocities() {
    const int n = width_ * height_;
    for (int c = 0; c < n; ++c) {
        if (uW_[c] > 0.0f) u_[c] = uAccum_[c] / uW_[c];
        if (vW_[c] > 0.0f) v_[c] = vAccum_[c] / vW_[c];
    }
}

void Grid::applySolidBoundaries() {
    for (int j = 0; j < height_; ++j) {
        for (int i = 0; i < width_; ++i) {
            if (type_[idx(i,j)] != CellType::Solid) continue;
            u_[idx(i,j)] = 0.0f;
            v_[idx(i,j)] = 0.0f;
            if (i < width_ - 1) u_[idx(i+1,j)] = 0.0f;
            if (j < height_ - 1) v_[idx(i,j+1)] = 0.0f;
        }
    }
}

void Grid::snapshotVelocities() {
    uPrev_ = u_;
    vPrev_ = v_;
}

float Grid::divergence(int i, int j) const {
    return u_[idx(i+1,j)] - u_[idx(i,j)] + v_[idx(i,j+1)] - v_[idx(i,j)];
}

float Grid::totalFluidDivergence() const {
    float sum = 0.0f;
    for (int j = 1; j < height_ - 1; ++j)
        for (int i = 1; i < width_ - 1; ++i)
            if (type_[idx(i,j)] == CellType::Fluid) sum += std::fabs(divergence(i,j));
    return sum;
}
