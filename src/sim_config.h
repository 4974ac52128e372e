// Fixed simulation configuration for the LED-matrix FLIP/PIC core.
//
// Everything here is read once by Simulation::init and never changed by the
// core afterwards. Buffer capacities are compile-time constants so the grid
// and particle storage can live in static memory on the board.
#pragma once
#include "vec2.h"

constexpr int kMaxGridWidth = 16;
constexpr int kMaxGridHeight = 16;
constexpr int kMaxGridCells = kMaxGridWidth * kMaxGridHeight;
constexpr int kMaxParticles = 128;

// What happens to two overlapping particles' velocities after they are pushed apart.
enum class CollisionVelocityPolicy {
    Keep,          // push positions only
    ZeroApproach   // also remove the approaching part of the relative velocity
};

// Response of a particle that hits the domain walls.
enum class BoundaryPolicy {
    Zero,    // kill the normal component
    Reflect  // flip the normal component, scaled by wallRestitution
};

struct SimConfig {
    int particleCount = 25;
    // Grid dimensions include the one-cell solid ring: 7x7 gives a 5x5 interior.
    int gridWidth = 7;
    int gridHeight = 7;
    float cellSpacing = 1.0f;
    float gravity = -9.8f; // y-direction downwards
    float timestep = 1.0f / 30.0f;
    int projectionIterations = 30;
    float overrelaxation = 1.9f; // in (1,2), higher converges faster
    float flipPicBlend = 0.8f; // 1 = pure FLIP, 0 = pure PIC
    float particleRadius = 0.2f;
    float minSeparation = 0.4f;
    int collisionIterations = 8;
    float velocityDamping = 1.0f; // per-tick velocity multiplier, 1 = off
    CollisionVelocityPolicy collisionVelocityPolicy = CollisionVelocityPolicy::Keep;
    BoundaryPolicy boundaryPolicy = BoundaryPolicy::Zero;
    float wallRestitution = 0.5f; // only used by BoundaryPolicy::Reflect
    // Fill region for the initial particle block, as fractions of the interior domain.
    Vec2 seedMin{0.0f, 0.0f};
    Vec2 seedMax{1.0f, 1.0f};
};

// Returns true when every field is in range. On failure *reason (if given)
// points at a static description of the first offending field.
bool validateConfig(const SimConfig& config, const char** reason = nullptr);
