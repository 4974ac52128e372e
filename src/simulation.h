// Fixed-timestep FLIP/PIC simulation driving the LED matrix.
//
// One tick runs, in this order:
//   reset grid -> classify fluid cells -> P2G (splat + normalize) -> snapshot
//   -> projection -> G2P (FLIP/PIC blend) -> gravity -> damping -> advect
//   -> particle separation -> clamp to bounds
// Gravity applied in tick k reaches the grid through tick k+1's splat.
#pragma once
#include <cstdint>
#include "vec2.h"
#include "sim_config.h"
#include "grid.h"
#include "particle_set.h"
#include "integrator.h"

// All mutable simulation data. Components receive it (or parts of it)
// explicitly; nothing is global, so tests can run several side by side.
struct SimulationState {
    SimConfig config;
    Grid grid;
    ParticleSet particles;
    ParticleBuckets buckets;
    uint64_t tickCount = 0;
    bool tiltActive = false;
    Vec2 tilt{0, 0};
};

// Seeds particles and grid from state.config. The config must already be valid.
bool initializeState(SimulationState& state);
// Advances the state by one tick of length dt.
void stepSimulation(SimulationState& state, float dt);

class Simulation {
public:
    enum class State { Uninitialized, Ready, Ticking };

    Simulation() = default;

    // Validates the config and seeds the simulation. On failure the reason is
    // logged to stderr and the simulation stays Uninitialized.
    bool init(const SimConfig& config);

    // Advance one tick with the configured timestep, or with dtOverride when
    // it is finite and positive. Returns false (and does nothing) before init.
    bool tick();
    bool tick(float dtOverride);

    // Replace the vertical gravity with an arbitrary acceleration (e.g. board
    // tilt from an accelerometer) until clearTilt().
    void setTilt(const Vec2& accel);
    void clearTilt();

    State state() const { return state_; }
    uint64_t tickCount() const { return sim_.tickCount; }
    const SimConfig& config() const { return sim_.config; }
    const Grid& grid() const { return sim_.grid; }
    const ParticleSet& particles() const { return sim_.particles; }
    const SimulationState& snapshot() const { return sim_; }

private:
    SimulationState sim_;
    State state_{State::Uninitialized};
};
