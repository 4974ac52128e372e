#include "simulation.h"
#include "transfer.h"
#include "projection_solver.h"
#include <cstdio>

bool initializeState(SimulationState& state) {
    const SimConfig& c = state.config;
    if (!state.grid.init(c.gridWidth, c.gridHeight, c.cellSpacing)) return false;

    // Seed region is given as fractions of the interior domain
    Vec2 lo = state.grid.domainMin();
    Vec2 hi = state.grid.domainMax();
    Vec2 ext = hi - lo;
    Vec2 seedLo = Vec2(lo.x + c.seedMin.x * ext.x, lo.y + c.seedMin.y * ext.y);
    Vec2 seedHi = Vec2(lo.x + c.seedMax.x * ext.x, lo.y + c.seedMax.y * ext.y);
    if (!state.particles.seed(c.particleCount, seedLo, seedHi)) return false;

    clampToBounds(state.particles, lo, hi, c.particleRadius, c.boundaryPolicy, c.wallRestitution);
    state.tickCount = 0;
    state.tiltActive = false;
    state.tilt = Vec2(0, 0);
    return true;
}

void stepSimulation(SimulationState& state, float dt) {
    const SimConfig& c = state.config;
    Grid& grid = state.grid;
    ParticleSet& particles = state.particles;

    grid.resetFields();
    grid.classifyFromParticles(particles);
    particlesToGrid(grid, particles);
    grid.snapshotVelocities();
    solveIncompressibility(grid, c.projectionIterations, c.overrelaxation);
    gridToParticles(grid, particles, c.flipPicBlend);

    if (state.tiltActive) applyAcceleration(particles, dt, state.tilt);
    else applyGravity(particles, dt, c.gravity);
    if (c.velocityDamping < 1.0f) applyDamping(particles, c.velocityDamping);

    advect(particles, dt);

    const Vec2 lo = grid.domainMin();
    const Vec2 hi = grid.domainMax();
    for (int it = 0; it < c.collisionIterations; ++it) {
        resolveParticleCollisions(particles, c.minSeparation, c.collisionVelocityPolicy,
                                  state.buckets, lo, hi - lo);
    }
    clampToBounds(particles, lo, hi, c.particleRadius, c.boundaryPolicy, c.wallRestitution);
    state.tickCount++;
}

bool Simulation::init(const SimConfig& config) {
    const char* reason = nullptr;
    if (!validateConfig(config, &reason)) {
        std::fprintf(stderr, "Simulation config rejected: %s\n", reason ? reason : "unknown");
        state_ = State::Uninitialized;
        return false;
    }
    sim_.config = config;
    if (!initializeState(sim_)) {
        std::fprintf(stderr, "Simulation init failed: could not size grid or seed particles\n");
        state_ = State::Uninitialized;
        return false;
    }
    state_ = State::Ready;
    std::printf("FLIP/PIC simulation ready: %dx%d grid, %d particles, dt=%.4f s\n",
                config.gridWidth, config.gridHeight, config.particleCount, config.timestep);
    return true;
}

bool Simulation::tick() {
    return tick(sim_.config.timestep);
}

bool Simulation::tick(float dtOverride) {
    if (state_ == State::Uninitialized) return false;
    float dt = (std::isfinite(dtOverride) && dtOverride > 0.0f) ? dtOverride : sim_.config.timestep;
    state_ = State::Ticking;
    stepSimulation(sim_, dt);
    state_ = State::Ready;
    return true;
}

void Simulation::setTilt(const Vec2& accel) {
    if (!isFinite(accel)) return;
    sim_.tilt = accel;
    sim_.tiltActive = true;
}

void Simulation::clearTilt() {
    sim_.tiltActive = false;
    sim_.tilt = Vec2(0, 0);
}
