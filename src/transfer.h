// Particle <-> grid velocity transfer.
#pragma once

class Grid;
class ParticleSet;

// P2G: splat every particle's velocity onto the staggered faces, normalize,
// then zero faces touching solids. Expects resetFields() and
// classifyFromParticles() to have run first.
void particlesToGrid(Grid& grid, const ParticleSet& particles);

// G2P: blend * (v_particle + (v_grid - v_snapshot)) + (1 - blend) * v_grid,
// per axis. blend = 1 is pure FLIP, blend = 0 pure PIC. Expects the grid's
// snapshot to hold the pre-projection velocities.
void gridToParticles(const Grid& grid, ParticleSet& particles, float blend);
