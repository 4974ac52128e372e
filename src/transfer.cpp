#include "transfer.h"
#include "grid.h"
#include "particle_set.h"

void particlesToGrid(Grid& grid, const ParticleSet& particles) {
    for (const auto& prt : particles) {
        grid.splatVelocity(prt.p, prt.v.x, Axis::X);
        grid.splatVelocity(prt.p, prt.v.y, Axis::Y);
    }
    grid.normalizeVelocities();
    grid.applySolidBoundaries();
}

static float blendAxis(const Grid& grid, const Vec2& pos, float particleVel, Axis axis, float blend) {
    float pic = grid.sampleVelocity(pos, axis);
    float delta = pic - grid.sampleSnapshotVelocity(pos, axis);
    float flip = particleVel + delta;
    return blend * flip + (1.0f - blend) * pic;
}

void gridToParticles(const Grid& grid, ParticleSet& particles, float blend) {
    for (auto& prt : particles) {
        float vx = blendAxis(grid, prt.p, prt.v.x, Axis::X, blend);
        float vy = blendAxis(grid, prt.p, prt.v.y, Axis::Y, blend);
        prt.v = Vec2(vx, vy);
    }
}
